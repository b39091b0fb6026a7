#include "kinship/key.hpp"
#include "kinship/errors.hpp"
#include <cstdio>
#include <sstream>
#include <vector>

namespace kinship {

namespace {

// Ids are zero padded so that lexical path order matches numeric order.
constexpr int id_width = 19;

std::string escape_segment(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '%': out += "%25"; break;
            case '/': out += "%2F"; break;
            case ':': out += "%3A"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string unescape_segment(const std::string& s, const std::string& path) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') {
            out += s[i];
            continue;
        }
        if (i + 2 >= s.size()) {
            throw kinship_error("Malformed key path: " + path);
        }
        std::string code = s.substr(i + 1, 2);
        if (code == "25") out += '%';
        else if (code == "2F") out += '/';
        else if (code == "3A") out += ':';
        else throw kinship_error("Malformed key path: " + path);
        i += 2;
    }
    return out;
}

std::string segment_path(const key& k) {
    std::string out = escape_segment(k.kind()) + ":";
    if (k.has_name()) {
        out += "s" + escape_segment(k.name());
    } else if (k.id() != 0) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "i%0*lld", id_width, static_cast<long long>(k.id()));
        out += buf;
    } else {
        out += "p";
    }
    return out;
}

} // namespace

key::key(std::string kind) : kind_(std::move(kind)) {}

key::key(std::string kind, const key& parent)
    : kind_(std::move(kind)), parent_(std::make_shared<const key>(parent)) {}

key key::from_id(std::string kind, int64_t id) {
    if (id <= 0) {
        throw kinship_error("Key ids must be positive (kind " + kind + ")");
    }
    key k(std::move(kind));
    k.id_ = id;
    return k;
}

key key::from_id(std::string kind, int64_t id, const key& parent) {
    return from_id(std::move(kind), id).with_parent(parent);
}

key key::from_name(std::string kind, std::string name) {
    if (name.empty()) {
        throw kinship_error("Key names must not be empty (kind " + kind + ")");
    }
    key k(std::move(kind));
    k.name_ = std::move(name);
    return k;
}

key key::from_name(std::string kind, std::string name, const key& parent) {
    return from_name(std::move(kind), std::move(name)).with_parent(parent);
}

key key::root() const {
    const key* k = this;
    while (k->parent_) {
        k = k->parent_.get();
    }
    return *k;
}

size_t key::depth() const {
    size_t d = 1;
    for (const key* k = parent_.get(); k != nullptr; k = k->parent_.get()) {
        ++d;
    }
    return d;
}

key key::with_parent(const key& parent) const {
    if (!parent.is_complete()) {
        throw kinship_error("Cannot place " + to_string() + " under incomplete key " + parent.to_string());
    }
    key k = *this;
    k.parent_ = std::make_shared<const key>(parent);
    return k;
}

key key::without_parent() const {
    key k = *this;
    k.parent_.reset();
    return k;
}

key key::with_id(int64_t id) const {
    if (is_complete()) {
        throw kinship_error("Key " + to_string() + " is already complete");
    }
    key k = *this;
    k.id_ = id;
    return k;
}

std::string key::to_path() const {
    std::string out;
    if (parent_) {
        out = parent_->to_path() + "/";
    }
    return out + segment_path(*this);
}

key key::from_path(const std::string& path) {
    if (path.empty()) {
        throw kinship_error("Malformed key path: empty");
    }

    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            segments.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    segments.push_back(current);

    key result;
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& segment = segments[i];
        auto colon = segment.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= segment.size()) {
            throw kinship_error("Malformed key path: " + path);
        }
        std::string kind = unescape_segment(segment.substr(0, colon), path);
        char tag = segment[colon + 1];
        std::string body = segment.substr(colon + 2);

        key k(kind);
        if (tag == 's') {
            k.name_ = unescape_segment(body, path);
            if (k.name_.empty()) throw kinship_error("Malformed key path: " + path);
        } else if (tag == 'i') {
            try {
                size_t used = 0;
                k.id_ = std::stoll(body, &used);
                if (used != body.size() || k.id_ <= 0) {
                    throw kinship_error("Malformed key path: " + path);
                }
            } catch (const std::logic_error&) {
                throw kinship_error("Malformed key path: " + path);
            }
        } else if (tag != 'p' || !body.empty() || i + 1 != segments.size()) {
            // Only the last segment may be incomplete.
            throw kinship_error("Malformed key path: " + path);
        }

        if (i > 0) {
            k.parent_ = std::make_shared<const key>(result);
        }
        result = std::move(k);
    }
    return result;
}

std::string key::to_string() const {
    std::ostringstream ss;
    if (parent_) {
        ss << parent_->to_string() << "/";
    }
    ss << kind_ << "(";
    if (has_name()) {
        ss << "\"" << name_ << "\"";
    } else if (id_ != 0) {
        ss << id_;
    } else {
        ss << "?";
    }
    ss << ")";
    return ss.str();
}

bool key::operator==(const key& other) const {
    if (kind_ != other.kind_ || id_ != other.id_ || name_ != other.name_) {
        return false;
    }
    if (!parent_ || !other.parent_) {
        return !parent_ && !other.parent_;
    }
    return *parent_ == *other.parent_;
}

} // namespace kinship

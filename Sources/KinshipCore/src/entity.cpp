#include "kinship/entity.hpp"
#include "kinship/errors.hpp"
#include <nlohmann/json.hpp>

namespace kinship {

using json = nlohmann::json;

namespace {

constexpr const char* key_tag = "$key";

template<typename V>
json value_to_json(const V& value) {
    return std::visit([](auto&& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, key>) {
            return json{{key_tag, v.to_path()}};
        } else if constexpr (std::is_same_v<T, std::vector<scalar_value>>) {
            json arr = json::array();
            for (const auto& item : v) {
                arr.push_back(value_to_json(item));
            }
            return arr;
        } else {
            return v;
        }
    }, value);
}

scalar_value scalar_from_json(const json& j) {
    if (j.is_null()) {
        return nullptr;
    } else if (j.is_boolean()) {
        return j.get<bool>();
    } else if (j.is_number_integer()) {
        return j.get<int64_t>();
    } else if (j.is_number_float()) {
        return j.get<double>();
    } else if (j.is_string()) {
        return j.get<std::string>();
    } else if (j.is_object() && j.contains(key_tag) && j[key_tag].is_string()) {
        return key::from_path(j[key_tag].get<std::string>());
    }
    throw kinship_error("Unsupported property encoding: " + j.dump());
}

property_value property_from_json(const json& j) {
    if (j.is_array()) {
        std::vector<scalar_value> list;
        list.reserve(j.size());
        for (const auto& item : j) {
            list.push_back(scalar_from_json(item));
        }
        return list;
    }
    return std::visit([](auto&& v) -> property_value { return v; }, scalar_from_json(j));
}

} // namespace

bool entity::set_property(const std::string& name, property_value value) {
    auto it = properties_.find(name);
    if (it != properties_.end() && it->second == value) {
        return false;
    }
    properties_[name] = std::move(value);
    return true;
}

bool entity::remove_property(const std::string& name) {
    return properties_.erase(name) > 0;
}

bool entity::has_property(const std::string& name) const {
    return properties_.count(name) > 0;
}

const property_value* entity::property(const std::string& name) const {
    auto it = properties_.find(name);
    return it == properties_.end() ? nullptr : &it->second;
}

void entity::recreate_with_parent(const key& parent) {
    key fresh = key_.has_name()
        ? key::from_name(key_.kind(), key_.name(), parent)
        : key(key_.kind(), parent);
    key_ = std::move(fresh);
}

std::string properties_to_json(const property_map& properties) {
    json j = json::object();
    for (const auto& [name, value] : properties) {
        j[name] = value_to_json(value);
    }
    return j.dump();
}

property_map properties_from_json(const std::string& text) {
    property_map result;
    if (text.empty()) return result;

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw kinship_error(std::string("Corrupt property document: ") + e.what());
    }
    if (!j.is_object()) {
        throw kinship_error("Corrupt property document: expected an object");
    }
    for (auto& [name, value] : j.items()) {
        result[name] = property_from_json(value);
    }
    return result;
}

std::string describe(const property_value& value) {
    return value_to_json(value).dump();
}

} // namespace kinship

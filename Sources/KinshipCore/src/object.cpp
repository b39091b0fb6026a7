#include "kinship/object.hpp"

namespace kinship {

namespace {
const object_list empty_list;
}

persistent_object::persistent_object(std::string kind) : kind_(std::move(kind)) {}

void persistent_object::touch() {
    if (state_ == object_state::persistent_clean) {
        state_ = object_state::persistent_dirty;
    }
}

void persistent_object::set(const std::string& field, property_value value) {
    scalars_[field] = std::move(value);
    touch();
}

const property_value* persistent_object::get(const std::string& field) const {
    auto it = scalars_.find(field);
    return it == scalars_.end() ? nullptr : &it->second;
}

void persistent_object::set_object(const std::string& field, object_ptr value) {
    objects_[field] = std::move(value);
    loaded_.insert(field);
    touch();
}

object_ptr persistent_object::object(const std::string& field) const {
    auto it = objects_.find(field);
    return it == objects_.end() ? nullptr : it->second;
}

void persistent_object::set_collection(const std::string& field, object_list values) {
    collections_[field] = std::move(values);
    loaded_.insert(field);
    touch();
}

void persistent_object::add_to(const std::string& field, object_ptr value) {
    collections_[field].push_back(std::move(value));
    loaded_.insert(field);
    touch();
}

const object_list& persistent_object::collection(const std::string& field) const {
    auto it = collections_.find(field);
    return it == collections_.end() ? empty_list : it->second;
}

related_value persistent_object::related(const std::string& field) const {
    if (auto it = collections_.find(field); it != collections_.end()) {
        return it->second;
    }
    if (auto it = objects_.find(field); it != objects_.end() && it->second) {
        return it->second;
    }
    return std::monostate{};
}

void persistent_object::store_fetched(const std::string& field, related_value value) {
    if (auto* list = std::get_if<object_list>(&value)) {
        collections_[field] = std::move(*list);
    } else if (auto* obj = std::get_if<object_ptr>(&value)) {
        objects_[field] = std::move(*obj);
    } else {
        objects_[field] = nullptr;
    }
    loaded_.insert(field);
}

bool persistent_object::has_field(const std::string& field) const {
    return scalars_.count(field) || objects_.count(field) || collections_.count(field);
}

} // namespace kinship

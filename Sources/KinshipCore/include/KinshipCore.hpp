#pragma once

// KinshipCore - object graphs over an ancestor-keyed datastore
//
// Usage:
//   #include <KinshipCore.hpp>
//
//   int main() {
//       kinship::persistence_manager pm;  // in-memory, or pm(kinship::configuration("app.db"))
//
//       pm.register_class(kinship::class_builder("Parent")
//                             .scalar("title")
//                             .relation("child", "Child", kinship::relation_type::one_to_one_uni)
//                             .build());
//       pm.register_class(kinship::class_builder("Child").scalar("name").build());
//
//       auto child = kinship::persistent_object::make("Child");
//       child->set("name", std::string("x"));
//       auto parent = kinship::persistent_object::make("Parent");
//       parent->set_object("child", child);
//
//       pm.make_persistent(parent);   // Child is stored under Parent's key
//   }

#include "kinship/log.hpp"
#include "kinship/errors.hpp"
#include "kinship/key.hpp"
#include "kinship/entity.hpp"
#include "kinship/db.hpp"
#include "kinship/datastore.hpp"
#include "kinship/sqlite_datastore.hpp"
#include "kinship/configuration.hpp"
#include "kinship/schema.hpp"
#include "kinship/object.hpp"
#include "kinship/key_registry.hpp"
#include "kinship/relation_writer.hpp"
#include "kinship/parent_key_resolver.hpp"
#include "kinship/inline_mapping.hpp"
#include "kinship/mapping_callbacks.hpp"
#include "kinship/relation_field_manager.hpp"
#include "kinship/relation_fetch_resolver.hpp"
#include "kinship/persistence_manager.hpp"

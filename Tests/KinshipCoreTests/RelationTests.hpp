#pragma once

#include "RecordingDatastore.hpp"
#include <KinshipCore.hpp>
#include <cassert>
#include <iostream>

namespace relation_tests {

using kinship::class_builder;
using kinship::persistent_object;
using kinship::relation_type;
using test_support::test_env;

// Book owns one Chapter; the Chapter does not point back.
inline void register_books(kinship::persistence_manager& pm) {
    pm.register_class(class_builder("Book")
        .scalar("title")
        .relation("chapter", "Chapter", relation_type::one_to_one_uni)
        .build());
    pm.register_class(class_builder("Chapter").scalar("name").build());
}

// Parent owns one Child (bidirectional) and many Kids.
inline void register_family(kinship::persistence_manager& pm,
                            kinship::null_policy child_nulls = kinship::null_policy::none) {
    pm.register_class(class_builder("Parent")
        .scalar("name")
        .relation("child", "Child", relation_type::one_to_one_bi, "", child_nulls)
        .collection("kids", "Kid", relation_type::one_to_many_bi, "parent")
        .build());
    pm.register_class(class_builder("Child")
        .scalar("name")
        .relation("parent", "Parent", relation_type::one_to_one_bi, "child")
        .build());
    pm.register_class(class_builder("Kid")
        .scalar("name")
        .relation("parent", "Parent", relation_type::many_to_one_bi)
        .build());
}

inline kinship::object_ptr make(const std::string& kind, const std::string& name) {
    auto obj = persistent_object::make(kind);
    obj->set("name", name);
    return obj;
}

// ============================================================================
// Insert ordering
// ============================================================================

void test_parent_first_insert() {
    std::cout << "  test_parent_first_insert..." << std::flush;

    test_env env;
    register_books(env.pm);

    auto chapter = make("Chapter", "x");
    auto book = persistent_object::make("Book");
    book->set("title", std::string("Dune"));
    book->set_object("chapter", chapter);

    auto book_key = env.pm.make_persistent(book);

    // Book, then Chapter under the Book's final key, then Book again once
    assert(env.store->puts().size() == 3);
    assert(env.store->puts()[0].kind() == "Book");
    assert(env.store->puts()[1].kind() == "Chapter");
    assert(env.store->puts()[2].kind() == "Book");
    assert(env.store->puts_of("Book") == 2);
    assert(env.store->puts_of("Chapter") == 1);

    const auto& chapter_key = *chapter->object_key();
    assert(chapter_key.has_parent());
    assert(*chapter_key.parent() == book_key);

    auto stored = env.backing->get(book_key);
    assert(std::get<kinship::key>(*stored->property("chapter")) == chapter_key);

    assert(book->state() == kinship::object_state::persistent_clean);
    assert(chapter->state() == kinship::object_state::persistent_clean);

    std::cout << " OK" << std::endl;
}

void test_child_first_insert() {
    std::cout << "  test_child_first_insert..." << std::flush;

    test_env env;
    register_family(env.pm);

    auto parent = make("Parent", "p");
    auto child = make("Child", "c");
    child->set_object("parent", parent);
    parent->set_object("child", child);

    auto child_key = env.pm.make_persistent(child);

    const auto& parent_key = *parent->object_key();
    assert(*child_key.parent() == parent_key);
    assert(env.store->puts_of("Parent") == 2);
    assert(env.store->puts_of("Child") == 1);

    auto stored_parent = env.backing->get(parent_key);
    assert(std::get<kinship::key>(*stored_parent->property("child")) == child_key);

    std::cout << " OK" << std::endl;
}

void test_unchanged_relation_is_not_rewritten() {
    std::cout << "  test_unchanged_relation_is_not_rewritten..." << std::flush;

    test_env env;
    register_books(env.pm);

    auto book = persistent_object::make("Book");
    book->set_object("chapter", make("Chapter", "one"));
    auto book_key = env.pm.make_persistent(book);

    env.pm.evict_all();
    env.store->reset();

    auto loaded = env.pm.get_object(book_key);
    loaded->set("title", std::string("Renamed"));
    assert(loaded->is_dirty());
    env.pm.make_persistent(loaded);

    assert(env.store->puts().size() == 1);
    assert(test_support::text(env.backing->get(book_key)->property("title")) == "Renamed");
    assert(env.backing->get(book_key)->has_property("chapter"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Entity group rules
// ============================================================================

void test_parent_switch_rejected() {
    std::cout << "  test_parent_switch_rejected..." << std::flush;

    test_env env;
    register_family(env.pm);

    auto first = make("Parent", "first");
    auto child = make("Child", "c");
    first->set_object("child", child);
    auto first_key = env.pm.make_persistent(first);

    auto second = make("Parent", "second");
    auto second_key = env.pm.make_persistent(second);

    auto child_key = *child->object_key();
    assert(*child_key.parent() == first_key);

    env.store->reset();
    child->set_object("parent", second);

    bool threw = false;
    try {
        env.pm.make_persistent(child);
    } catch (const kinship::child_with_wrong_parent_error& e) {
        threw = true;
        assert(e.parent_key() == second_key);
        assert(e.child_key() == child_key);
        assert(std::string(e.what()).find("is already a child of") != std::string::npos);
    }
    assert(threw);

    // Nothing was written and the child stayed where it was
    assert(env.store->puts().empty());
    assert(env.backing->get(child_key).has_value());
    assert(env.backing->query("Child", second_key).empty());

    std::cout << " OK" << std::endl;
}

void test_child_without_parent_rejected() {
    std::cout << "  test_child_without_parent_rejected..." << std::flush;

    test_env env;
    register_family(env.pm);

    auto child = make("Child", "orphan");
    auto child_key = env.pm.make_persistent(child);
    assert(!child_key.has_parent());

    // Adopted through the parent's owned field
    auto parent = make("Parent", "late");
    parent->set_object("child", child);
    bool threw = false;
    try {
        env.pm.make_persistent(parent);
    } catch (const kinship::child_without_parent_error& e) {
        threw = true;
        assert(e.child_key() == child_key);
        assert(e.parent_key() == *parent->object_key());
    }
    assert(threw);

    // Adopted through the child's own parent field
    auto other = make("Parent", "other");
    env.pm.make_persistent(other);
    env.store->reset();
    child->set_object("parent", other);
    threw = false;
    try {
        env.pm.make_persistent(child);
    } catch (const kinship::child_without_parent_error&) {
        threw = true;
    }
    assert(threw);
    assert(env.store->puts().empty());
    assert(!env.backing->get(child_key)->get_key().has_parent());

    std::cout << " OK" << std::endl;
}

void test_new_children_accept_any_parent() {
    std::cout << "  test_new_children_accept_any_parent..." << std::flush;

    kinship::key_registry registry;
    auto fresh = persistent_object::make("Child");
    auto anywhere = kinship::key::from_id("Parent", 42);

    kinship::check_for_parent_switch(nullptr, anywhere, registry);
    kinship::check_for_parent_switch(fresh.get(), anywhere, registry);

    // A stored child is only accepted by its own parent
    auto stored = persistent_object::make("Child");
    stored->set_object_key(kinship::key::from_id("Child", 1, kinship::key::from_id("Parent", 7)));
    stored->set_state(kinship::object_state::persistent_clean);
    kinship::check_for_parent_switch(stored.get(), kinship::key::from_id("Parent", 7), registry);

    bool threw = false;
    try {
        kinship::check_for_parent_switch(stored.get(), anywhere, registry);
    } catch (const kinship::child_with_wrong_parent_error&) {
        threw = true;
    }
    assert(threw);

    // Inserted in this write under another parent: validated like a stored one
    auto inserted = persistent_object::make("Child");
    inserted->set_state(kinship::object_state::persistent_new);
    registry.register_key(inserted.get(), kinship::key::from_id("Child", 2));
    threw = false;
    try {
        kinship::check_for_parent_switch(inserted.get(), anywhere, registry);
    } catch (const kinship::child_without_parent_error&) {
        threw = true;
    }
    assert(threw);

    // End to end: a brand new child goes under whichever parent claims it
    test_env env;
    register_family(env.pm);
    auto parent = make("Parent", "p");
    auto child = make("Child", "c");
    parent->set_object("child", child);
    env.pm.make_persistent(parent);
    assert(*child->object_key()->parent() == *parent->object_key());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Not-yet-flushed references
// ============================================================================

void test_not_yet_flushed_exception() {
    std::cout << "  test_not_yet_flushed_exception..." << std::flush;

    test_env env;
    register_family(env.pm, kinship::null_policy::exception);

    auto parent = make("Parent", "p");
    auto child = make("Child", "c");
    child->set_object("parent", parent);
    parent->set_object("child", child);

    bool threw = false;
    try {
        env.pm.make_persistent(child);
    } catch (const kinship::not_yet_flushed_error& e) {
        threw = true;
        assert(e.field() == "Parent.child");
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void test_pending_parent_relocation() {
    std::cout << "  test_pending_parent_relocation..." << std::flush;

    test_env env;
    env.pm.register_class(class_builder("League")
        .scalar("name")
        .unowned("star", "Player")
        .build());
    env.pm.register_class(class_builder("Team")
        .scalar("name")
        .relation("league", "League", relation_type::many_to_one_bi)
        .build());
    env.pm.register_class(class_builder("Player")
        .scalar("name")
        .relation("team", "Team", relation_type::many_to_one_bi)
        .build());

    // Storing the team stores its league first, which stores its star, whose
    // team has no key yet.
    auto league = make("League", "l");
    auto team = make("Team", "t");
    auto player = make("Player", "s");
    team->set_object("league", league);
    player->set_object("team", team);
    league->set_object("star", player);

    auto team_key = env.pm.make_persistent(team);
    assert(*team_key.parent() == *league->object_key());

    const auto& player_key = *player->object_key();
    assert(player_key.has_parent());
    assert(*player_key.parent() == team_key);
    assert(!env.backing->get(player_key)->has_property(kinship::parent_key_marker));

    // The first, parentless copy is gone
    assert(env.store->removes().size() == 1);
    assert(!env.store->removes()[0].has_parent());
    assert(!env.backing->get(env.store->removes()[0]).has_value());
    assert(env.backing->query("Player", player_key.root()).size() == 1);

    // The league's reference follows the move
    auto stored_league = env.backing->get(*league->object_key());
    assert(std::get<kinship::key>(*stored_league->property("star")) == player_key);

    env.pm.evict_all();
    auto fetched = env.pm.get_object(player_key);
    auto fetched_team = test_support::single(env.pm.fetch_relation_field(*fetched, "team"));
    assert(fetched_team && *fetched_team->object_key() == team_key);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Other relation shapes
// ============================================================================

void test_foreign_key_relation() {
    std::cout << "  test_foreign_key_relation..." << std::flush;

    test_env env;
    env.pm.register_class(class_builder("Company").scalar("name").build());
    env.pm.register_class(class_builder("Person")
        .scalar("name")
        .unowned("employer", "Company")
        .build());

    auto company = make("Company", "Acme");
    auto person = make("Person", "Ann");
    person->set_object("employer", company);
    auto person_key = env.pm.make_persistent(person);

    // Unowned targets are separate entity groups
    assert(!person_key.has_parent());
    assert(!company->object_key()->has_parent());
    assert(std::get<kinship::key>(*env.backing->get(person_key)->property("employer")) ==
           *company->object_key());

    env.pm.evict_all();
    auto loaded = env.pm.get_object(person_key);
    auto employer = test_support::single(env.pm.fetch_relation_field(*loaded, "employer"));
    assert(employer);
    assert(test_support::text(employer->get("name")) == "Acme");
    assert(loaded->is_loaded("employer"));
    assert(loaded->object("employer") == employer);

    // Clearing the field drops the key property
    loaded->set_object("employer", nullptr);
    env.pm.make_persistent(loaded);
    assert(!env.backing->get(person_key)->has_property("employer"));
    assert(env.backing->get(*company->object_key()).has_value());

    std::cout << " OK" << std::endl;
}

void test_inline_values() {
    std::cout << "  test_inline_values..." << std::flush;

    test_env env;
    env.pm.register_class(class_builder("Person")
        .scalar("name")
        .embedded("address", "Address", "addr_")
        .serialized("prefs")
        .build());

    auto address = persistent_object::make("Address");
    address->set("city", std::string("Lyon"));
    address->set("zip", int64_t(69001));
    auto prefs = persistent_object::make("Prefs");
    prefs->set("theme", std::string("dark"));

    auto person = make("Person", "Ann");
    person->set_object("address", address);
    person->set_object("prefs", prefs);
    auto k = env.pm.make_persistent(person);

    // One write: inline values need no second pass
    assert(env.store->puts().size() == 1);
    auto record = env.backing->get(k);
    assert(test_support::text(record->property("addr_city")) == "Lyon");
    assert(std::holds_alternative<std::string>(*record->property("prefs")));

    env.pm.evict_all();
    auto loaded = env.pm.get_object(k);
    auto loaded_address = loaded->object("address");
    assert(loaded_address);
    assert(test_support::text(loaded_address->get("city")) == "Lyon");
    assert(std::get<int64_t>(*loaded_address->get("zip")) == 69001);
    auto loaded_prefs = test_support::single(env.pm.fetch_relation_field(*loaded, "prefs"));
    assert(loaded_prefs && loaded_prefs->kind() == "Prefs");
    assert(test_support::text(loaded_prefs->get("theme")) == "dark");

    // Dropping the embedded value removes its columns
    loaded->set_object("address", nullptr);
    env.pm.make_persistent(loaded);
    assert(!env.backing->get(k)->has_property("addr_city"));

    std::cout << " OK" << std::endl;
}

void test_owned_collection() {
    std::cout << "  test_owned_collection..." << std::flush;

    test_env env;
    register_family(env.pm);

    auto parent = make("Parent", "p");
    auto first = make("Kid", "a");
    auto second = make("Kid", "b");
    parent->add_to("kids", first);
    parent->add_to("kids", second);
    auto parent_key = env.pm.make_persistent(parent);

    // Collection members are found by ancestor query, the parent is not rewritten
    assert(env.store->puts_of("Parent") == 1);
    assert(env.store->puts_of("Kid") == 2);
    assert(*first->object_key()->parent() == parent_key);
    assert(*second->object_key()->parent() == parent_key);

    env.pm.evict_all();
    auto loaded = env.pm.get_object(parent_key);
    auto kids = std::get<kinship::object_list>(env.pm.fetch_relation_field(*loaded, "kids"));
    assert(kids.size() == 2);
    assert(*kids[0]->object_key() == *first->object_key());
    assert(*kids[1]->object_key() == *second->object_key());

    // Replace the first kid with a new one
    auto third = make("Kid", "c");
    loaded->set_collection("kids", {kids[1], third});
    env.pm.make_persistent(loaded);

    assert(!env.backing->get(*first->object_key()).has_value());
    assert(*third->object_key()->parent() == parent_key);
    assert(env.backing->query("Kid", parent_key).size() == 2);

    // The kids point back at their parent through their ancestor
    auto back = test_support::single(env.pm.fetch_relation_field(*third, "parent"));
    assert(back && *back->object_key() == parent_key);

    std::cout << " OK" << std::endl;
}

// Owner keeps one House and a list of pets that may be Dogs or Cats.
inline void register_household(kinship::persistence_manager& pm) {
    kinship::field_metadata pets;
    pets.name = "pets";
    pets.kind = kinship::field_kind::collection;
    pets.interface_kinds = {"Dog", "Cat"};
    pets.relation = relation_type::one_to_many_uni;

    pm.register_class(class_builder("Owner")
        .scalar("name")
        .relation("house", "House", relation_type::one_to_one_uni)
        .field(pets)
        .build());
    pm.register_class(class_builder("House").scalar("name").build());
    pm.register_class(class_builder("Dog").scalar("name").build());
    pm.register_class(class_builder("Cat").scalar("name").build());
}

void test_polymorphic_collection() {
    std::cout << "  test_polymorphic_collection..." << std::flush;

    test_env env;
    register_household(env.pm);

    auto owner = make("Owner", "o");
    auto house = make("House", "h");
    auto dog = make("Dog", "rex");
    auto cat = make("Cat", "tom");
    owner->set_object("house", house);
    owner->set_collection("pets", {dog, cat});
    auto owner_key = env.pm.make_persistent(owner);

    assert(*dog->object_key()->parent() == owner_key);
    assert(*cat->object_key()->parent() == owner_key);
    auto house_key = *house->object_key();

    // Dropping the cat leaves the house, held by another field, alone
    owner->set_collection("pets", {dog});
    env.pm.make_persistent(owner);

    assert(env.backing->get(house_key).has_value());
    assert(env.backing->get(*dog->object_key()).has_value());
    assert(!env.backing->get(*cat->object_key()).has_value());
    assert(cat->state() == kinship::object_state::deleted);

    env.pm.evict_all();
    auto loaded = env.pm.get_object(owner_key);
    auto pets = std::get<kinship::object_list>(env.pm.fetch_relation_field(*loaded, "pets"));
    assert(pets.size() == 1);
    assert(pets[0]->kind() == "Dog");
    auto loaded_house = test_support::single(env.pm.fetch_relation_field(*loaded, "house"));
    assert(loaded_house && *loaded_house->object_key() == house_key);

    std::cout << " OK" << std::endl;
}

class counting_callbacks : public kinship::mapping_callbacks {
public:
    int inserts = 0;
    int updates = 0;
    bool post_insert(const kinship::mapping_context&) override { ++inserts; return false; }
    bool post_update(const kinship::mapping_context&) override { ++updates; return false; }
};

void test_custom_mapping_callbacks() {
    std::cout << "  test_custom_mapping_callbacks..." << std::flush;

    test_env env;
    register_family(env.pm);
    auto callbacks = std::make_shared<counting_callbacks>();
    env.pm.callbacks().register_callbacks("Parent", "kids", callbacks);

    auto parent = make("Parent", "p");
    parent->add_to("kids", make("Kid", "a"));
    auto k = env.pm.make_persistent(parent);
    assert(callbacks->inserts == 1);
    assert(callbacks->updates == 0);

    // The replacement callbacks did not store anything
    assert(env.backing->query("Kid", k).empty());

    parent->set("name", std::string("renamed"));
    env.pm.make_persistent(parent);
    assert(callbacks->updates == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// relation_field_manager directly
// ============================================================================

void test_apply_requires_stored_owner() {
    std::cout << "  test_apply_requires_stored_owner..." << std::flush;

    test_env env;
    register_books(env.pm);
    const auto& meta = env.schema.get("Book");

    auto book = persistent_object::make("Book");
    kinship::entity record(kinship::key("Book"));
    kinship::relation_field_manager relations(*book, record, meta, env.pm);
    relations.defer_relation_store(*meta.field("chapter"), make("Chapter", "x"), true);

    kinship::key_registry registry;
    bool threw = false;
    try {
        relations.apply_deferred_relations(registry);
    } catch (const kinship::kinship_error&) {
        threw = true;
    }
    assert(threw);
    assert(env.store->puts().empty());

    std::cout << " OK" << std::endl;
}

void test_queue_cleared_after_failure() {
    std::cout << "  test_queue_cleared_after_failure..." << std::flush;

    test_env env;
    register_family(env.pm);

    auto first = make("Parent", "first");
    auto child = make("Child", "c");
    first->set_object("child", child);
    env.pm.make_persistent(first);
    auto second = make("Parent", "second");
    auto second_key = env.pm.make_persistent(second);

    const auto& meta = env.schema.get("Parent");
    auto record = *env.backing->get(second_key);
    kinship::relation_field_manager relations(*second, record, meta, env.pm);
    relations.defer_relation_store(*meta.field("child"), child, false);
    relations.defer_relation_store(*meta.field("kids"), kinship::object_list{}, false);
    assert(relations.pending_events() == 2);

    kinship::key_registry registry;
    bool threw = false;
    try {
        relations.apply_deferred_relations(registry);
    } catch (const kinship::child_with_wrong_parent_error&) {
        threw = true;
    }
    assert(threw);
    assert(relations.pending_events() == 0);

    // Nothing left to replay
    assert(!relations.apply_deferred_relations(registry));

    std::cout << " OK" << std::endl;
}

void test_pending_patch_registered() {
    std::cout << "  test_pending_patch_registered..." << std::flush;

    test_env env;
    register_books(env.pm);
    const auto& meta = env.schema.get("Book");

    auto book = persistent_object::make("Book");
    kinship::entity record(kinship::key("Book"));
    env.backing->put(record);

    auto chapter = make("Chapter", "in flight");
    kinship::key_registry registry;
    registry.begin_insert(chapter.get());

    kinship::relation_field_manager relations(*book, record, meta, env.pm);
    relations.defer_relation_store(*meta.field("chapter"), chapter, true);
    assert(!relations.apply_deferred_relations(registry));
    assert(registry.pending_patch_count() == 1);

    auto patches = registry.take_pending_patches(chapter.get());
    assert(patches.size() == 1);
    assert(patches[0].owner == book.get());
    assert(patches[0].field == meta.field("chapter"));
    assert(registry.pending_patch_count() == 0);

    std::cout << " OK" << std::endl;
}

} // namespace relation_tests

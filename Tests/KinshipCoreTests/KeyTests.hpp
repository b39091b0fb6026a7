#pragma once

#include <KinshipCore.hpp>
#include <cassert>
#include <iostream>

namespace key_tests {

void test_key_identity() {
    std::cout << "  test_key_identity..." << std::flush;

    auto parent = kinship::key::from_id("Parent", 12);
    auto child = kinship::key::from_name("Child", "x", parent);

    assert(parent.is_complete());
    assert(!parent.has_parent());
    assert(child.has_parent());
    assert(*child.parent() == parent);
    assert(child.root() == parent);
    assert(child.depth() == 2);
    assert(child.to_string() == "Parent(12)/Child(\"x\")");

    // Same identity under a different parent is a different key
    auto other = kinship::key::from_name("Child", "x", kinship::key::from_id("Parent", 13));
    assert(child != other);
    assert(child.without_parent() == kinship::key::from_name("Child", "x"));

    kinship::key pending("Child", parent);
    assert(!pending.is_complete());
    assert(pending.to_string() == "Parent(12)/Child(?)");
    assert(pending.with_id(7) == kinship::key::from_id("Child", 7, parent));

    bool threw = false;
    try {
        child.with_id(3);
    } catch (const kinship::kinship_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void test_key_paths() {
    std::cout << "  test_key_paths..." << std::flush;

    auto grand = kinship::key::from_id("Child", 5,
        kinship::key::from_name("Mid", "a/b:c%", kinship::key::from_id("Root", 1)));
    std::string path = grand.to_path();

    assert(path.find("a%2Fb%3Ac%25") != std::string::npos);
    assert(kinship::key::from_path(path) == grand);

    // Descendant paths extend their ancestor's path
    auto root_path = grand.root().to_path();
    assert(path.compare(0, root_path.size() + 1, root_path + "/") == 0);

    // Zero padded ids keep path order numeric
    assert(kinship::key::from_id("K", 9).to_path() < kinship::key::from_id("K", 10).to_path());

    for (const char* bad : {"", "NoColon", "K:x", "K:i12x", "K:p/Child:i1", "K:s", "K:i0"}) {
        bool threw = false;
        try {
            kinship::key::from_path(bad);
        } catch (const kinship::kinship_error&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << " OK" << std::endl;
}

void test_key_factories_reject_bad_input() {
    std::cout << "  test_key_factories_reject_bad_input..." << std::flush;

    int failures = 0;
    try { kinship::key::from_id("K", 0); } catch (const kinship::kinship_error&) { ++failures; }
    try { kinship::key::from_name("K", ""); } catch (const kinship::kinship_error&) { ++failures; }
    try { kinship::key::from_id("K", 1, kinship::key("P")); } catch (const kinship::kinship_error&) { ++failures; }
    assert(failures == 3);

    std::cout << " OK" << std::endl;
}

void test_property_codec() {
    std::cout << "  test_property_codec..." << std::flush;

    auto ref = kinship::key::from_id("Other", 4);
    kinship::property_map props{
        {"flag", true},
        {"count", int64_t(3)},
        {"ratio", 0.5},
        {"title", std::string("Dune")},
        {"ref", ref},
        {"nothing", nullptr},
        {"tags", std::vector<kinship::scalar_value>{std::string("a"), int64_t(2), ref}},
    };

    auto decoded = kinship::properties_from_json(kinship::properties_to_json(props));
    assert(decoded == props);
    assert(std::get<kinship::key>(decoded["ref"]) == ref);

    bool threw = false;
    try {
        kinship::properties_from_json("[1, 2]");
    } catch (const kinship::kinship_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void test_entity_recreate_with_parent() {
    std::cout << "  test_entity_recreate_with_parent..." << std::flush;

    auto parent = kinship::key::from_id("Parent", 2);

    kinship::entity named(kinship::key::from_name("Child", "x"));
    named.recreate_with_parent(parent);
    assert(named.get_key() == kinship::key::from_name("Child", "x", parent));

    kinship::entity numbered(kinship::key::from_id("Child", 9));
    numbered.set_property("name", std::string("y"));
    numbered.recreate_with_parent(parent);
    assert(!numbered.get_key().is_complete());
    assert(*numbered.parent() == parent);
    assert(numbered.has_property("name"));

    assert(numbered.set_property("name", std::string("z")));
    assert(!numbered.set_property("name", std::string("z")));
    assert(numbered.remove_property("name"));
    assert(!numbered.remove_property("name"));

    std::cout << " OK" << std::endl;
}

} // namespace key_tests

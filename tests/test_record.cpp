#include <catch2/catch_test_macros.hpp>
#include "paramscript/errors.h"
#include "paramscript/record.h"
#include <stdexcept>

using paramscript::FieldNotFound;
using paramscript::List;
using paramscript::Record;
using paramscript::Value;

// ============================================================================
// Field access
// ============================================================================

TEST_CASE("Record field access", "[record]") {
    Record r{{"a", 1}, {"b", "text"}};

    SECTION("Get existing fields") {
        REQUIRE(r.get("a") == Value(1));
        REQUIRE(r.get("b").asText() == "text");
        REQUIRE(r.size() == 2);
    }

    SECTION("Missing field raises FieldNotFound") {
        REQUIRE_THROWS_AS(r.get("zz"), FieldNotFound);
        REQUIRE(r.find("zz") == nullptr);
        REQUIRE_FALSE(r.has("zz"));
    }

    SECTION("Set replaces in place") {
        r.set("a", 10);
        REQUIRE(r.keys() == std::vector<std::string>{"a", "b"});
        REQUIRE(r.get("a").asNumber() == 10.0);
    }

    SECTION("New fields are appended") {
        r.set("c", true);
        REQUIRE(r.keyAt(2) == "c");
        REQUIRE(r.indexOf("c") == 2);
        REQUIRE(r.indexOf("missing") == -1);
    }

    SECTION("Empty list deletes an existing field") {
        r.set("a", List{});
        REQUIRE_FALSE(r.has("a"));
        REQUIRE(r.size() == 1);
        REQUIRE(r.keyAt(0) == "b");
        REQUIRE(r.indexOf("b") == 0);
    }

    SECTION("Empty list on a new name is stored") {
        r.set("c", List{});
        REQUIRE(r.has("c"));
        REQUIRE(r.get("c").isEmptyList());
    }

    SECTION("Remove") {
        r.remove("a");
        REQUIRE(r.keys() == std::vector<std::string>{"b"});
        REQUIRE_THROWS_AS(r.remove("a"), FieldNotFound);
    }
}

TEST_CASE("Record reserved names", "[record]") {
    Record r;
    REQUIRE(Record::isReserved("_type"));
    REQUIRE(Record::isReserved("_debug"));
    for (const char* name : {"_fulltype", "_ftype", "_excludedattr", "_evaluation", "_protection"}) {
        REQUIRE(Record::isReserved(name));
    }
    REQUIRE_FALSE(Record::isReserved("type"));

    REQUIRE_THROWS_AS(r.set("_type", 1), std::invalid_argument);
    REQUIRE_THROWS_AS(r.set("", 1), std::invalid_argument);
    REQUIRE_THROWS_AS(r.remove("_protection"), FieldNotFound);
    REQUIRE(r.empty());
}

TEST_CASE("Record positional access", "[record]") {
    Record r{{"a", 1}, {"b", 2}, {"c", 3}, {"d", 4}};

    REQUIRE(r.at(1) == Value(2));
    REQUIRE_THROWS_AS(r.at(4), std::out_of_range);
    REQUIRE_THROWS_AS(r.keyAt(10), std::out_of_range);

    SECTION("Slice is clamped") {
        Record s = r.slice(2, 100);
        REQUIRE(s.keys() == std::vector<std::string>{"c", "d"});
        REQUIRE(r.slice(3, 1).empty());
    }

    SECTION("Select by index and by name keeps the requested order") {
        Record byIndex = r.select(std::vector<size_t>{3, 0});
        REQUIRE(byIndex.keys() == std::vector<std::string>{"d", "a"});

        Record byName = r.select(std::vector<std::string>{"c", "b"});
        REQUIRE(byName.keys() == std::vector<std::string>{"c", "b"});
        REQUIRE_THROWS_AS(r.select(std::vector<std::string>{"x"}), FieldNotFound);
    }

    SECTION("Items mirror keys and values") {
        auto items = r.items();
        REQUIRE(items.size() == 4);
        REQUIRE(items[2].first == "c");
        REQUIRE(items[2].second == Value(3));
    }
}

// ============================================================================
// Set algebra
// ============================================================================

TEST_CASE("Record concatenation is right-biased", "[record]") {
    Record a{{"x", 1}, {"y", 2}};
    Record b{{"y", 20}, {"z", 30}};

    Record c = a.concat(b);
    REQUIRE(c.get("y") == b.get("y"));
    REQUIRE(c.size() == a.size() + b.size() - 1);
    REQUIRE(c.keys() == std::vector<std::string>{"x", "y", "z"});

    // Operators are thin wrappers
    REQUIRE((a + b) == c);

    Record d = a;
    d += b;
    REQUIRE(d == c);

    // Operands are untouched
    REQUIRE(a.get("y") == Value(2));
}

TEST_CASE("Record concat then difference keeps order", "[record]") {
    Record ab{{"a", 1}, {"b", 2}};
    Record c{{"c", 3}};
    Record onlyA{{"a", 1}};

    Record result = ab.concat(c).difference(onlyA);
    Record expected{{"b", 2}, {"c", 3}};
    REQUIRE(result == expected);
    REQUIRE((ab + c - onlyA) == expected);

    Record inPlace = ab;
    inPlace -= Record{{"b", 0}, {"missing", 0}};
    REQUIRE(inPlace.keys() == std::vector<std::string>{"a"});
}

TEST_CASE("Record check fills defaults", "[record]") {
    Record r{{"a", 1}, {"b", Value()}, {"c", List{}}};
    Record defaults{{"a", 100}, {"b", 200}, {"c", 300}, {"d", 400}};

    r.check(defaults);
    REQUIRE(r.get("a") == Value(1));
    REQUIRE(r.get("b") == Value(200));
    REQUIRE(r.get("c") == Value(300));
    REQUIRE(r.get("d") == Value(400));
    REQUIRE(r.keys() == std::vector<std::string>{"a", "b", "c", "d"});
}

TEST_CASE("Record from keys and values", "[record]") {
    SECTION("Last value repeats") {
        Record r = Record::fromKeysValues({"a", "b", "c"}, {Value(1), Value(2)});
        REQUIRE(r.get("a") == Value(1));
        REQUIRE(r.get("b") == Value(2));
        REQUIRE(r.get("c") == Value(2));
    }

    SECTION("Extra values get generated names") {
        Record r = Record::fromKeysValues({"a"}, {Value(1), Value(2), Value(3)});
        REQUIRE(r.keys() == std::vector<std::string>{"a", "key1", "key2"});
        REQUIRE(r.get("key2") == Value(3));
    }
}

TEST_CASE("Record equality and text form", "[record]") {
    Record a{{"a", 1}, {"b", "x"}};
    Record b{{"b", "x"}, {"a", 1}};

    REQUIRE(a != b);  // order matters
    REQUIRE(a == Record{{"a", 1}, {"b", "x"}});
    REQUIRE(a.toString() == "{a=1, b='x'}");

    // Nested records compare by content
    Record outer1{{"inner", Value(a)}};
    Record outer2{{"inner", Value(Record{{"a", 1}, {"b", "x"}})}};
    REQUIRE(outer1 == outer2);
}

#include "../test_helpers.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace FormFusion;
using namespace TestHelpers;

struct Tagged {
    std::string title;
    std::vector<std::string> tags;
};

struct Member {
    std::string name;
    int age;
};

struct Team {
    std::string name;
    std::vector<Member> members;
};

struct Address {
    std::string city;
    std::string zip;
};

struct Contact {
    std::string email;
    std::optional<int> age;
    std::optional<Address> address;
    std::optional<bool> verified;
};

struct Scores {
    std::vector<int> values;
};

// ============================================================================
// Sequences of leaves
// ============================================================================

void repeated_name_appends() {
    auto r = Parse<Tagged>({{"title", "t"}, {"tags", "a"}, {"tags", "b"}, {"tags", "c"}});
    assert(r);
    assert((r.value().tags == std::vector<std::string>{"a", "b", "c"}));
}

void indexed_and_empty_keys_append_in_arrival_order() {
    auto indexed = Parse<Tagged>({{"title", "t"}, {"tags[1]", "b"}, {"tags[0]", "a"}});
    assert(indexed);
    assert((indexed.value().tags == std::vector<std::string>{"b", "a"}));

    auto empty = Parse<Tagged>({{"title", "t"}, {"tags[]", "x"}, {"tags[]", "y"}});
    assert(empty);
    assert((empty.value().tags == std::vector<std::string>{"x", "y"}));
}

void absent_sequence_is_empty() {
    auto r = Parse<Tagged>({{"title", "t"}});
    assert(r);
    assert(r.value().tags.empty());
}

void element_errors_are_merged() {
    auto r = Parse<Scores>({{"values", "1"}, {"values", "x"}, {"values", "3"}, {"values", "y"}});
    assert(!r);
    assert(r.errors().size() == 2);
    assert(r.errors().count(ErrorKind::Conversion) == 2);
    assert(*r.errors()[0].value() == "x");
    assert(*r.errors()[1].value() == "y");
    assert(*r.errors()[0].name() == "values");
}

void repeated_index_is_a_duplicate_in_strict_mode() {
    auto r = Parse<Scores>({{"values[0]", "1"}, {"values[0]", "2"}});
    assert(!r);
    assert(r.errors()[0].kind() == ErrorKind::Duplicate);

    auto lenient = Parse<Scores>({{"values[0]", "1"}, {"values[0]", "2"}}, Options::Lenient);
    assert(lenient);
    assert((lenient.value().values == std::vector<int>{1}));
}

// ============================================================================
// Sequences of structs
// ============================================================================

void consecutive_events_share_an_element() {
    auto r = Parse<Team>({
        {"name", "core"},
        {"members[0].name", "Ann"}, {"members[0].age", "31"},
        {"members[1].name", "Bob"}, {"members[1].age", "27"},
    });
    assert(r);
    const auto& m = r.value().members;
    assert(m.size() == 2);
    assert(m[0].name == "Ann" && m[0].age == 31);
    assert(m[1].name == "Bob" && m[1].age == 27);
}

void element_errors_carry_the_element_path() {
    auto r = Parse<Team>({
        {"name", "core"},
        {"members[0].name", "Ann"}, {"members[0].age", "31"},
        {"members[1].name", "Bob"}, {"members[1].age", "old"},
        {"members[2].name", "Eve"},
    });
    assert(!r);
    assert(r.errors().size() == 2);
    assert(ErrorAt(r.errors(), "members[1].age").kind() == ErrorKind::Conversion);
    assert(ErrorAt(r.errors(), "members[2].age").kind() == ErrorKind::Missing);
}

void interleaved_index_starts_new_elements() {
    auto r = Parse<Team>({
        {"name", "core"},
        {"members[0].name", "Ann"},
        {"members[1].name", "Bob"},
        {"members[0].age", "31"},
    });
    assert(!r);
    // Three elements were opened, none complete
    assert(r.errors().count(ErrorKind::Missing) == 3);
}

// ============================================================================
// Optional
// ============================================================================

void absent_optionals_are_nullopt() {
    auto r = Parse<Contact>({{"email", "a@b.c"}});
    assert(r);
    assert(!r.value().age);
    assert(!r.value().address);
    assert(!r.value().verified);
}

void present_optionals_bind() {
    auto r = Parse<Contact>({
        {"email", "a@b.c"}, {"age", "40"},
        {"address.city", "Oslo"}, {"address.zip", "0150"},
        {"verified", "off"},
    });
    assert(r);
    assert(r.value().age == 40);
    assert(r.value().address && r.value().address->city == "Oslo");
    assert(r.value().verified == false);
}

void failed_optionals_are_nullopt() {
    auto r = Parse<Contact>({{"email", "a@b.c"}, {"age", "forty"}, {"address.city", "Oslo"}});
    assert(r);
    assert(!r.value().age);
    assert(!r.value().address);
}

int main() {
    repeated_name_appends();
    indexed_and_empty_keys_append_in_arrival_order();
    absent_sequence_is_empty();
    element_errors_are_merged();
    repeated_index_is_a_duplicate_in_strict_mode();

    consecutive_events_share_an_element();
    element_errors_carry_the_element_path();
    interleaved_index_starts_new_elements();

    absent_optionals_are_nullopt();
    present_optionals_bind();
    failed_optionals_are_nullopt();
    return 0;
}

#include "../test_helpers.hpp"

#include <cstdint>
#include <string>

using namespace FormFusion;
using namespace TestHelpers;

struct Person {
    std::string name;
    std::uint16_t age;
};

struct Prefs {
    std::string name;
    bool newsletter;
};

struct Consent {
    bool agree;
};

struct Inner {
    int b;
};

struct Outer {
    Inner a;
    int c;
};

struct Deep {
    Outer x;
};

struct Note {
    Capped<std::string> body;
};

struct Attachment {
    Capped<TempFile> file;
};

// ============================================================================
// Scenarios
// ============================================================================

void scenario_a_binds_every_field() {
    auto r = Parse<Person>({{"name", "Max"}, {"age", "3"}});
    assert(r);
    assert(r.value().name == "Max");
    assert(r.value().age == 3);
}

void scenario_b_reports_conversion_and_missing() {
    auto r = Parse<Person>({{"age", "three"}});
    assert(!r);
    assert(r.errors().size() == 2);

    const Error& age = ErrorAt(r.errors(), "age");
    assert(age.kind() == ErrorKind::Conversion);
    assert(age.value() && *age.value() == "three");

    const Error& name = ErrorAt(r.errors(), "name");
    assert(name.kind() == ErrorKind::Missing);
    assert(!name.value());
}

void scenario_c_boolean_tokens() {
    auto yes = Parse<Consent>({{"agree", "YES"}});
    assert(yes);
    assert(yes.value().agree == true);

    auto nope = Parse<Consent>({{"agree", "nope"}});
    assert(!nope);
    assert(nope.errors().size() == 1);
    assert(nope.errors()[0].kind() == ErrorKind::Conversion);
    assert(*nope.errors()[0].name() == "agree");
    assert(*nope.errors()[0].value() == "nope");
}

void scenario_d_persist_twice_moves_from_new_location() {
    ScopedDir dir("scenario-d");
    FormConfig config;
    config.temp_dir = dir.path();

    BufferDataStream stream("hello, world");
    auto r = TempFile::from(config, stream, "greeting", ContentType::Plain());
    assert(r);
    TempFile file = std::move(r.take_value()).into_inner();
    auto staging = *file.path();
    assert(std::filesystem::exists(staging));

    auto first = dir / "first.txt";
    assert(!file.persist_to(first));
    assert(!std::filesystem::exists(staging));
    assert(std::filesystem::exists(first));
    assert(*file.path() == first);

    auto second = dir / "second.txt";
    assert(!file.persist_to(second));
    assert(!std::filesystem::exists(first));
    assert(!std::filesystem::exists(staging));
    assert(ReadFile(second) == "hello, world");
    assert(*file.path() == second);
    assert(file.len() == 12);
}

// ============================================================================
// Properties
// ============================================================================

void p1_absent_leaf_with_default_binds_default() {
    auto r = Parse<Prefs>({{"name", "Max"}});
    assert(r);
    assert(r.value().newsletter == false);

    auto lenient = Parse<Prefs>({{"name", "Max"}}, Options::Lenient);
    assert(lenient);
    assert(lenient.value().newsletter == false);
}

void p2_strict_duplicate_is_reported() {
    auto r = Parse<Person>({{"name", "Ann"}, {"name", "Bob"}, {"age", "30"}});
    assert(!r);
    assert(r.errors().size() == 1);
    assert(r.errors()[0].kind() == ErrorKind::Duplicate);
    assert(*r.errors()[0].name() == "name");

    // Both values are valid on their own
    auto ann = Parse<Person>({{"name", "Ann"}, {"age", "30"}});
    assert(ann);
}

void p3_lenient_unknown_is_dropped() {
    auto r = Parse<Person>({{"name", "Max"}, {"nickname", "M"}, {"age", "3"}}, Options::Lenient);
    assert(r);
    assert(r.value().name == "Max");
    assert(r.value().age == 3);
}

void p4_conversion_error_carries_full_path() {
    auto outer = Parse<Outer>({{"a.b", "zz"}, {"c", "1"}});
    assert(!outer);
    assert(outer.errors().size() == 1);
    assert(ErrorAt(outer.errors(), "a.b").kind() == ErrorKind::Conversion);

    auto deep = Parse<Deep>({{"x.a.b", "zz"}, {"x.c", "1"}});
    assert(!deep);
    assert(deep.errors().size() == 1);
    const Error& e = ErrorAt(deep.errors(), "x.a.b");
    assert(e.kind() == ErrorKind::Conversion);
    assert(*e.value() == "zz");

    auto bracketed = Parse<Deep>({{"x[a][b]", "zz"}, {"x.c", "1"}});
    assert(!bracketed);
    assert(ErrorAt(bracketed.errors(), "x[a][b]").kind() == ErrorKind::Conversion);
}

void p5_truncated_text_is_success() {
    FormConfig config;
    config.limits.limit("string", 16);

    std::string body(100, 'x');
    BufferDataStream stream(body);
    FormParser<Note> parser;
    parser.push_data(DataField<BufferDataStream>::make("body", std::nullopt, ContentType::Plain(), config, stream));
    auto r = std::move(parser).finalize();
    assert(r);

    const Capped<std::string>& text = r.value().body;
    assert(!text.is_complete());
    assert(text.n().written == 16);
    assert(text.get().size() == 16);
    assert(text.limit() == 16u);
}

void p5_text_exactly_at_limit_is_complete() {
    FormConfig config;
    config.limits.limit("string", 16);

    std::string body(16, 'y');
    BufferDataStream stream(body);
    FormParser<Note> parser;
    parser.push_data(DataField<BufferDataStream>::make("body", std::nullopt, ContentType::Plain(), config, stream));
    auto r = std::move(parser).finalize();
    assert(r);
    assert(r.value().body.is_complete());
    assert(r.value().body.n().written == 16);
}

void p5_text_cut_inside_a_code_point_is_success() {
    FormConfig config;
    config.limits.limit("string", 5);

    // Three two-byte characters; the limit falls inside the third
    BufferDataStream stream("\xC3\xA9\xC3\xA9\xC3\xA9");
    FormParser<Note> parser;
    parser.push_data(DataField<BufferDataStream>::make("body", std::nullopt, ContentType::Plain(), config, stream));
    auto r = std::move(parser).finalize();
    assert(r);

    const Capped<std::string>& text = r.value().body;
    assert(!text.is_complete());
    assert(text.n().written == 5);
    assert(text.get() == "\xC3\xA9\xC3\xA9");
}

void p5_text_cut_after_a_code_point_keeps_it() {
    FormConfig config;
    config.limits.limit("string", 4);

    BufferDataStream stream("\xC3\xA9\xC3\xA9\xC3\xA9");
    FormParser<Note> parser;
    parser.push_data(DataField<BufferDataStream>::make("body", std::nullopt, ContentType::Plain(), config, stream));
    auto r = std::move(parser).finalize();
    assert(r);
    assert(!r.value().body.is_complete());
    assert(r.value().body.get() == "\xC3\xA9\xC3\xA9");
}

void p5_truncated_file_is_success() {
    ScopedDir dir("p5");
    FormConfig config;
    config.temp_dir = dir.path();
    config.limits.limit("file", 10);

    std::string body(64, 'z');
    ChunkedStream stream(body, 7);
    FormParser<Attachment> parser;
    parser.push_data(DataField<ChunkedStream>::make("file", "big.bin", ContentType::Binary(), config, stream));
    auto r = std::move(parser).finalize();
    assert(r);

    const Capped<TempFile>& file = r.value().file;
    assert(!file.is_complete());
    assert(file.n().written == 10);
    assert(file->len() == 10);
    assert(std::filesystem::file_size(*file->path()) == 10);
}

int main() {
    scenario_a_binds_every_field();
    scenario_b_reports_conversion_and_missing();
    scenario_c_boolean_tokens();
    scenario_d_persist_twice_moves_from_new_location();

    p1_absent_leaf_with_default_binds_default();
    p2_strict_duplicate_is_reported();
    p3_lenient_unknown_is_dropped();
    p4_conversion_error_carries_full_path();
    p5_truncated_text_is_success();
    p5_text_exactly_at_limit_is_complete();
    p5_text_cut_inside_a_code_point_is_success();
    p5_text_cut_after_a_code_point_keeps_it();
    p5_truncated_file_is_success();
    return 0;
}

#pragma once
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "static_schema.hpp"
#include "config.hpp"
#include "log.hpp"

namespace FormFusion {

namespace field_parsers_detail {

constexpr char to_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

constexpr bool iequals(std::string_view a, std::string_view b) {
    if(a.size() != b.size()) return false;
    for(std::size_t i = 0; i < a.size(); i ++) {
        if(to_lower(a[i]) != to_lower(b[i])) return false;
    }
    return true;
}

/// `on`, `yes`, `true` / `off`, `no`, `false`, any case.
constexpr std::optional<bool> parse_bool_token(std::string_view v) {
    if(iequals(v, "on") || iequals(v, "yes") || iequals(v, "true")) return true;
    if(iequals(v, "off") || iequals(v, "no") || iequals(v, "false")) return false;
    return std::nullopt;
}

constexpr bool is_valid_utf8(std::string_view s) {
    std::size_t i = 0;
    while(i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        std::size_t len;
        std::uint32_t cp;
        if(c < 0x80)                { i ++; continue; }
        else if((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if(i + len > s.size()) return false;
        for(std::size_t k = 1; k < len; k ++) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if(cp >= 0xD800 && cp <= 0xDFFF) return false;
        if(cp > 0x10FFFF) return false;
        i += len;
    }
    return true;
}

/// Length of a multi-byte sequence left unfinished at the end of `s`, or 0.
/// Only a lead byte followed by fewer continuation bytes than it announces
/// counts; anything else is left for is_valid_utf8 to reject.
constexpr std::size_t incomplete_utf8_tail(std::string_view s) {
    for(std::size_t back = 1; back <= 3 && back <= s.size(); back ++) {
        const auto c = static_cast<unsigned char>(s[s.size() - back]);
        if((c & 0xC0) == 0x80) continue;
        std::size_t len = 0;
        if((c & 0xE0) == 0xC0)      len = 2;
        else if((c & 0xF0) == 0xE0) len = 3;
        else if((c & 0xF8) == 0xF0) len = 4;
        return len > back ? back : 0;
    }
    return 0;
}

template<class T>
BindResult<T> parse_integer(std::string_view text) {
    if(text.empty()) {
        return Error::conversion("cannot parse integer from empty string");
    }
    if(text.front() == '+' && text.size() > 1 && text[1] != '-') {
        text.remove_prefix(1);
    }
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 10);
    if(ec == std::errc::result_out_of_range) {
        if(text.front() == '-') {
            return Error::conversion("number too small to fit in target type");
        }
        return Error::conversion("number too large to fit in target type");
    }
    if(ec != std::errc() || ptr != text.data() + text.size()) {
        return Error::conversion("invalid digit found in string");
    }
    return value;
}

template<class T>
BindResult<T> parse_float(std::string_view text) {
    if(!text.empty() && text.front() == '+' && text.size() > 1 && text[1] != '-') {
        text.remove_prefix(1);
    }
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, std::chars_format::general);
    if(text.empty() || ec == std::errc::invalid_argument || ptr != text.data() + text.size()) {
        return Error::conversion("invalid float literal");
    }
    if(ec == std::errc::result_out_of_range) {
        return Error::conversion("number out of range for target type");
    }
    return value;
}

/// Resolves the `string` limit and reads the field as UTF-8 text.
template<DataStreamLike S>
BindResult<Capped<std::string>> read_text(DataField<S>& f) {
    const std::uint64_t limit = f.request.limits.get("string").value_or(Limits::STRING).as_u64();
    log::debug("reading data field '{}' as text, limit {} bytes", f.name.source(), limit);

    std::string text;
    StreamOutcome out = read_capped_into(f.data, text, limit);
    if(!out) {
        return Error::io(out.error).with_entity(Entity::DataField);
    }
    // A limit can cut a code point in half; the partial bytes are dropped
    if(!out.n.complete) {
        text.resize(text.size() - incomplete_utf8_tail(text));
    }
    if(!is_valid_utf8(text)) {
        return Error(ErrorKind::Conversion, "stream did not contain valid UTF-8").with_entity(Entity::DataField);
    }
    return Capped<std::string>(std::move(text), out.n, limit);
}

} // namespace field_parsers_detail

template<class T>
    requires (std::is_integral_v<T> && !std::is_same_v<T, bool>
              && !std::is_same_v<T, char> && !std::is_same_v<T, wchar_t>
              && !std::is_same_v<T, char8_t> && !std::is_same_v<T, char16_t> && !std::is_same_v<T, char32_t>)
struct FieldParser<T> {
    static BindResult<T> from_value(const ValueField& f) {
        return field_parsers_detail::parse_integer<T>(f.value);
    }
};

template<class T>
    requires std::is_floating_point_v<T>
struct FieldParser<T> {
    static BindResult<T> from_value(const ValueField& f) {
        return field_parsers_detail::parse_float<T>(f.value);
    }
};

/// The only built-in leaf that is optional by default: an unchecked
/// checkbox sends nothing and binds false.
template<>
struct FieldParser<bool> {
    static BindResult<bool> from_value(const ValueField& f) {
        if(auto v = field_parsers_detail::parse_bool_token(f.value)) {
            return *v;
        }
        return Error::conversion("provided string was not `true` or `false`");
    }

    static std::optional<bool> default_value() {
        return false;
    }
};

template<>
struct FieldParser<Capped<std::string>> {
    static BindResult<Capped<std::string>> from_value(const ValueField& f) {
        return Capped<std::string>::complete(std::string(f.value), f.value.size());
    }

    template<DataStreamLike S>
    static BindResult<Capped<std::string>> from_data(DataField<S> f) {
        return field_parsers_detail::read_text(f);
    }
};

/// Like Capped<std::string>, but text cut off at the `string` limit is an
/// error.
template<>
struct FieldParser<std::string> {
    static BindResult<std::string> from_value(const ValueField& f) {
        return std::string(f.value);
    }

    template<DataStreamLike S>
    static BindResult<std::string> from_data(DataField<S> f) {
        auto capped = field_parsers_detail::read_text(f);
        if(!capped) {
            return capped.take_errors();
        }
        if(!capped.value().is_complete()) {
            return Error::truncated(*capped.value().limit());
        }
        return std::move(capped.take_value()).into_inner();
    }
};

} // namespace FormFusion

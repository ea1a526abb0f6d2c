#pragma once

#include <optional>
#include <string_view>
#include <utility>

#include "name.hpp"
#include "content_type.hpp"
#include "config.hpp"
#include "data_stream.hpp"

namespace FormFusion {

/// Reduces a client supplied file name to something safe to use as a file
/// name: the last path component, without any extension. Names that are
/// empty, start with `*`, or end with `:`, `>` or `<` are rejected.
///
///     "../../etc/passwd"  -> "passwd"
///     "C:\\docs\\cv.pdf"  -> "cv"
///     ".bashrc"           -> nullopt
constexpr std::optional<std::string_view> sanitize_file_name(std::string_view raw) {
    std::size_t sep = raw.find_last_of("/\\");
    std::string_view name = sep == std::string_view::npos ? raw : raw.substr(sep + 1);
    name = name.substr(0, name.find('.'));
    if(name.empty()) return std::nullopt;
    if(name.front() == '*') return std::nullopt;
    char last = name.back();
    if(last == ':' || last == '>' || last == '<') return std::nullopt;
    return name;
}

/// An inline text field: `name=value` after percent-decoding.
struct ValueField {
    NameView name;
    std::string_view value;
    std::string_view raw;   // text before decoding, equal to value when not decoded

    ValueField() = default;
    ValueField(NameView n, std::string_view v) : name(n), value(v), raw(v) {}
    ValueField(NameView n, std::string_view v, std::string_view r) : name(n), value(v), raw(r) {}

    /// Splits `a=b` at the first `=` without decoding. A field without `=`
    /// has an empty value.
    static ValueField parse(std::string_view field) {
        std::size_t eq = field.find('=');
        if(eq == std::string_view::npos) {
            return ValueField(NameView(field), std::string_view{});
        }
        return ValueField(NameView(field.substr(0, eq)), field.substr(eq + 1));
    }

    /// A nameless field carrying `value`.
    static ValueField from_value(std::string_view value) {
        return ValueField(NameView(std::string_view{}), value);
    }

    ValueField shift() const {
        return ValueField(name.shift(), value, raw);
    }
};

/// A streamed field. The stream can be read exactly once; binders that
/// cannot consume it leave it alone.
template<DataStreamLike S>
struct DataField {
    NameView name;
    std::optional<std::string_view> file_name;
    ContentType content_type;
    const FormConfig& request;
    S& data;

    /// Builds a field from a transport supplied file name, sanitizing it.
    static DataField make(std::string_view name, std::optional<std::string_view> raw_file_name,
                          ContentType content_type, const FormConfig& request, S& data) {
        std::optional<std::string_view> file_name;
        if(raw_file_name) {
            file_name = sanitize_file_name(*raw_file_name);
        }
        return DataField{NameView(name), file_name, std::move(content_type), request, data};
    }

    DataField shift() const {
        return DataField{name.shift(), file_name, content_type, request, data};
    }
};

} // namespace FormFusion

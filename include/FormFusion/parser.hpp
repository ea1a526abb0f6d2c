#pragma once
#include <concepts>
#include <initializer_list>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "binder.hpp"
#include "object_binder.hpp"
#include "field_parsers.hpp"
#include "date_time.hpp"
#include "address.hpp"
#include "temp_file.hpp"
#include "error_formatting.hpp"
#include "log.hpp"

namespace FormFusion {

/// Incremental binder for one T. Feed events in arrival order, then call
/// finalize() once.
///
///     FormParser<Signup> parser(Options::Lenient);
///     parser.push_value("user.name", "Max");
///     parser.push_data(DataField<BufferDataStream>::make("avatar", "me.png", ct, config, stream));
///     auto result = std::move(parser).finalize();
template<class T>
class FormParser {
    using B = Binder<T>;
    typename B::Context m_ctx;

public:
    explicit FormParser(Options opts = Options::Strict) : m_ctx(B::init(opts)) {}

    static FormParser init(Options opts) {
        return FormParser(opts);
    }

    void push_value(ValueField field) {
        B::push_value(m_ctx, field);
    }

    void push_value(std::string_view name, std::string_view value) {
        B::push_value(m_ctx, ValueField(NameView(name), value));
    }

    template<DataStreamLike S>
    void push_data(DataField<S> field) {
        B::push_data(m_ctx, std::move(field));
    }

    BindResult<T> finalize() && {
        return B::finalize(std::move(m_ctx));
    }
};

namespace parser_detail {

template<class E>
ValueField to_value_field(const E& e) {
    if constexpr (std::is_convertible_v<const E&, ValueField>) {
        return e;
    } else if constexpr (requires { std::string_view(e.first); std::string_view(e.second); }) {
        return ValueField(NameView(std::string_view(e.first)), std::string_view(e.second));
    } else {
        static_assert(std::is_convertible_v<const E&, std::string_view>,
                      "[[[ FormFusion ]]] Parse expects ValueFields, (name, value) pairs or \"name=value\" strings");
        return ValueField::parse(std::string_view(e));
    }
}

constexpr int hex_value(char c) {
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace parser_detail

/// Decodes `application/x-www-form-urlencoded` text: `+` becomes a space and
/// `%XX` a byte. Malformed escapes are kept literally.
inline std::string url_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for(std::size_t i = 0; i < in.size(); i ++) {
        char c = in[i];
        if(c == '+') {
            out.push_back(' ');
        } else if(c == '%' && i + 2 < in.size()
                  && parser_detail::hex_value(in[i + 1]) >= 0 && parser_detail::hex_value(in[i + 2]) >= 0) {
            int hi = parser_detail::hex_value(in[i + 1]);
            int lo = parser_detail::hex_value(in[i + 2]);
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

/// Binds T from already split value fields.
template<class T, std::ranges::input_range R>
BindResult<T> Parse(const R& fields, Options opts = Options::Strict) {
    FormParser<T> parser(opts);
    for(const auto& f : fields) {
        parser.push_value(parser_detail::to_value_field(f));
    }
    return std::move(parser).finalize();
}

template<class T>
BindResult<T> Parse(std::initializer_list<std::pair<std::string_view, std::string_view>> fields,
                    Options opts = Options::Strict) {
    FormParser<T> parser(opts);
    for(const auto& [name, value] : fields) {
        parser.push_value(name, value);
    }
    return std::move(parser).finalize();
}

/// Binds T from an urlencoded body such as `name=Max&tags%5B0%5D=a+b`.
/// Empty pairs are skipped; errors report the undecoded value.
template<class T>
BindResult<T> ParseUrlEncoded(std::string_view body, Options opts = Options::Strict) {
    FormParser<T> parser(opts);
    while(!body.empty()) {
        std::size_t amp = body.find('&');
        std::string_view pair = body.substr(0, amp);
        body = amp == std::string_view::npos ? std::string_view{} : body.substr(amp + 1);
        if(pair.empty()) continue;

        std::size_t eq = pair.find('=');
        std::string_view raw_name = pair.substr(0, eq);
        std::string_view raw_value = eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1);

        std::string name = url_decode(raw_name);
        std::string value = url_decode(raw_value);
        parser.push_value(ValueField(NameView(name), value, raw_value));
    }
    return std::move(parser).finalize();
}

} // namespace FormFusion

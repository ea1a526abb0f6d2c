#pragma once
#include <string_view>
#include <type_traits>
#include <optional>
#include "annotated.hpp"
#include "const_string.hpp"

namespace FormFusion {

/// Per-parse strictness policy.
///
/// strict:  unknown fields, duplicate leaf fields and structurally unexpected
///          events are reported as errors.
/// lenient: unknown fields are dropped, duplicates keep the first value and
///          Unexpected outcomes are swallowed.
struct Options {
    bool strict = true;

    static const Options Strict;
    static const Options Lenient;

    constexpr bool operator==(const Options&) const = default;
};

inline constexpr Options Options::Strict{true};
inline constexpr Options Options::Lenient{false};

namespace options {

namespace detail {

struct key_tag{};

}

/// Overrides the form key a struct field is matched against.
template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ FormFusion ]]] form key contains control characters or path separators");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

namespace detail {

template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};

template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

struct no_options {
    template<class Tag>
    static constexpr bool has_option = false;

    template<class Tag>
    using get_option = void;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;
};

template<class Field>
struct annotation_meta {
    using value_t  = Field;
    using options  = no_options;
    using OptionsP = OptionsPack<>;
    static constexpr decltype(auto) getRef(Field & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const Field & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ FormFusion ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using OptionsP = OptionsPack<Opts...>;
    using value_t  = T;
    using options  = field_options<OptionsPack<Opts...>>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

} // namespace detail

} // namespace options

} // namespace FormFusion

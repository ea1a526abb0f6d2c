#pragma once
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <fmt/format.h>

#include "options.hpp"
#include "capped.hpp"
#include "content_type.hpp"

namespace FormFusion {

namespace validators {

namespace validators_detail {

struct ValidationCtx {
    bool m_failed = false;
    std::string m_message;

    /// Marks the value invalid. Only the first failure is kept.
    void fail(std::string message) {
        if(m_failed) return;
        m_failed = true;
        m_message = std::move(message);
    }

    bool failed() const { return m_failed; }
    const std::string& message() const { return m_message; }
};

namespace validation_events_tags {

// The field's own value was bound; validators see (value).
struct value_bound{};
// The enclosing struct was constructed; validators see (value, struct).
struct struct_bound{};

}

template<class T>
struct always_false : std::false_type {};

template<class T>
std::uint64_t length_of(const T& v) {
    if constexpr (is_capped<T>::value) {
        return length_of(*v);
    } else if constexpr (requires { v.len(); }) {
        return static_cast<std::uint64_t>(v.len());
    } else if constexpr (requires { v.size(); }) {
        return static_cast<std::uint64_t>(v.size());
    } else {
        static_assert(always_false<T>::value, "[[[ FormFusion ]]] length validator is not applicable to field");
        return 0;
    }
}

template<class T>
std::optional<ContentType> content_type_of(const T& v) {
    if constexpr (is_capped<T>::value) {
        return content_type_of(*v);
    } else if constexpr (requires { v.content_type(); }) {
        return v.content_type();
    } else {
        static_assert(always_false<T>::value, "[[[ FormFusion ]]] file_ext is only applicable to file fields");
        return std::nullopt;
    }
}

template<class T>
std::string_view text_of(const T& v) {
    if constexpr (is_capped<T>::value) {
        return text_of(*v);
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return std::string_view(v);
    } else {
        static_assert(always_false<T>::value, "[[[ FormFusion ]]] one_of is only applicable to text fields");
        return {};
    }
}

template <class FieldOpts, class Storage>
struct validator_state {

};

template<class... Opts, class Storage>
struct validator_state<options::detail::field_options<OptionsPack<Opts...>>, Storage> {
    static constexpr std::size_t OptsCount = sizeof...(Opts);
    using OptsTuple = std::tuple<Opts...>;

    /// Runs every option that reacts to Tag, stopping at the first failure.
    template<class Tag, class... Args>
    static bool validate(const Storage& storage, ValidationCtx& ctx, const Args&... args) {
        return validate_impl<Tag>(std::make_index_sequence<OptsCount>{}, storage, ctx, args...);
    }

private:
    template<class Tag, class... Args, std::size_t... I>
    static bool validate_impl(std::index_sequence<I...>, const Storage& storage,
                              ValidationCtx& ctx, const Args&... args)
    {
        bool ok = true;
        ( (ok = ok && call_one<Tag, std::tuple_element_t<I, OptsTuple>>(storage, ctx, args...)), ... );
        return ok;
    }

    template<class Tag, class Opt, class... Args>
    static bool call_one(const Storage& storage, ValidationCtx& ctx, const Args&... args) {
        if constexpr (requires { Opt::template validate<Tag>(storage, ctx, args...); }) {
            return Opt::template validate<Tag>(storage, ctx, args...);
        } else {
            return true;
        }
    }
};

template<class Storage>
struct validator_state<options::detail::no_options, Storage> {
    template<class Tag, class... Args>
    static bool validate(const Storage&, ValidationCtx&, const Args&...) {
        return true;
    }
};

} // namespace validators_detail

using ValidationCtx = validators_detail::ValidationCtx;
using validators_detail::validation_events_tags::value_bound;
using validators_detail::validation_events_tags::struct_bound;

template<auto Min, auto Max>
struct range {
    constexpr static auto min = Min;
    constexpr static auto max = Max;

    template<class Tag, class Storage>
        requires std::is_same_v<Tag, value_bound>
    static bool validate(const Storage& val, ValidationCtx& ctx) {
        if constexpr (std::is_floating_point_v<Storage>) {
            static_assert(
                std::numeric_limits<Storage>::lowest() <= Min && Min <= std::numeric_limits<Storage>::max() &&
                std::numeric_limits<Storage>::lowest() <= Max && Max <= std::numeric_limits<Storage>::max(),
                "[[[ FormFusion ]]] range: Provided min or max values are outside of field's storage type range");
        } else if constexpr (std::is_integral_v<Storage>) {
            static_assert(std::in_range<Storage>(Min) && std::in_range<Storage>(Max),
                "[[[ FormFusion ]]] range: Provided min or max values are outside of field's storage type range");
        } else {
            static_assert(!sizeof(Storage), "[[[ FormFusion ]]] Option is not applicable to field");
        }
        if(val < Min || val > Max) {
            ctx.fail(fmt::format("value must be between {} and {}", Min, Max));
            return false;
        }
        return true;
    }

    static constexpr std::string_view to_string() {
        return "range";
    }
};

/// Minimum length: bytes for text, elements for sequences, file size for
/// uploaded files.
template<std::size_t N>
struct min_length {
    constexpr static std::size_t value = N;

    template<class Tag, class Storage>
        requires std::is_same_v<Tag, value_bound>
    static bool validate(const Storage& val, ValidationCtx& ctx) {
        if(validators_detail::length_of(val) < N) {
            ctx.fail(fmt::format("length must be at least {}", N));
            return false;
        }
        return true;
    }

    static constexpr std::string_view to_string() {
        return "min_length";
    }
};

template<std::size_t N>
struct max_length {
    constexpr static std::size_t value = N;

    template<class Tag, class Storage>
        requires std::is_same_v<Tag, value_bound>
    static bool validate(const Storage& val, ValidationCtx& ctx) {
        if(validators_detail::length_of(val) > N) {
            ctx.fail(fmt::format("length must be at most {}", N));
            return false;
        }
        return true;
    }

    static constexpr std::string_view to_string() {
        return "max_length";
    }
};

template<ConstString... Values>
struct one_of {
    static_assert(sizeof...(Values) > 0, "[[[ FormFusion ]]] one_of needs at least one value");

    template<class Tag, class Storage>
        requires std::is_same_v<Tag, value_bound>
    static bool validate(const Storage& val, ValidationCtx& ctx) {
        std::string_view text = validators_detail::text_of(val);
        if(((text == Values.toStringView()) || ...)) {
            return true;
        }
        std::string allowed;
        ((allowed += (allowed.empty() ? "" : ", "), allowed += Values.toStringView()), ...);
        ctx.fail(fmt::format("value must be one of: {}", allowed));
        return false;
    }

    static constexpr std::string_view to_string() {
        return "one_of";
    }
};

/// Accepts an uploaded file only if its declared content type maps to one
/// of the given extensions.
template<ConstString... Exts>
struct file_ext {
    static_assert(sizeof...(Exts) > 0, "[[[ FormFusion ]]] file_ext needs at least one extension");

    template<class Tag, class Storage>
        requires std::is_same_v<Tag, value_bound>
    static bool validate(const Storage& val, ValidationCtx& ctx) {
        auto ct = validators_detail::content_type_of(val);
        std::optional<std::string_view> ext = ct ? ct->extension() : std::nullopt;
        if(ext && ((*ext == Exts.toStringView()) || ...)) {
            return true;
        }
        std::string allowed;
        ((allowed += (allowed.empty() ? "." : ", ."), allowed += Exts.toStringView()), ...);
        ctx.fail(fmt::format("invalid file type: {}, must be {}",
                         ext ? fmt::format(".{}", *ext) : std::string("unknown"), allowed));
        return false;
    }

    static constexpr std::string_view to_string() {
        return "file_ext";
    }
};

/// A user supplied check. The phase is picked from the callable's signature:
///
///     (const T&)                        field value, right after binding
///     (const T&, ValidationCtx&)        same, with a custom message
///     (const T&, const S&)              after the enclosing struct S is built
///     (const T&, ValidationCtx&, const S&)
///
/// Returning false without calling ctx.fail() reports a generic message.
template<auto Fn>
struct fn_validator {
    template<class Tag, class Storage, class... PhaseArgs>
    static bool validate(const Storage& val, ValidationCtx& ctx, const PhaseArgs&... args)
        requires (std::is_invocable_r_v<bool, decltype(Fn), const Storage&, ValidationCtx&, const PhaseArgs&...>
                  || std::is_invocable_r_v<bool, decltype(Fn), const Storage&, const PhaseArgs&...>)
    {
        bool ok;
        if constexpr (std::is_invocable_r_v<bool, decltype(Fn), const Storage&, ValidationCtx&, const PhaseArgs&...>) {
            ok = std::invoke(Fn, val, ctx, args...);
        } else {
            ok = std::invoke(Fn, val, args...);
        }
        if(!ok && !ctx.failed()) {
            ctx.fail("value failed validation");
        }
        return ok;
    }

    static constexpr std::string_view to_string() {
        return "fn_validator";
    }
};

} // namespace validators

} // namespace FormFusion

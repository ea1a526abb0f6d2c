#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "const_string.hpp"
#include "annotated.hpp"

namespace FormFusion {

/// Explicit field list for types PFR cannot introspect (non-aggregates,
/// classes with private members) or for forms whose field order and keys
/// are declared by hand:
///
///     template<> struct StructMeta<Login> {
///         using Fields = StructFields<
///             Field<&Login::user, "user">,
///             Field<&Login::password, "pass", validators::min_length<8>>
///         >;
///     };
template <class T>
struct StructMeta {

};

template <auto MPtr, ConstString key, class ... Opts>
struct Field;

template <typename C, typename T, T C::*MPtr, ConstString key, class ... Opts>
struct Field<MPtr, key, Opts...>{
    using ClassT = C;
    using ValueT = T;
    using OptionsP = OptionsPack<Opts...>;
    static constexpr ConstString Name  = key;
    static constexpr  T C::* MemberP = MPtr;
};

template <class ... F>
struct StructFields{
    using FieldsTuple = std::tuple<F...>;
};


namespace introspection {

namespace detail {

template<class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(StructT & s) {
        return (pfr::get<Index>(s));
    }

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template<std::size_t Index>
    using structureElementTypeByIndex = pfr::tuple_element_t<Index, StructT>;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, StructT>();
};

template<class T>
struct is_fields_pack : std::false_type {};

template<class... F>
struct is_fields_pack<StructFields<F...>> : std::true_type {};

template<class T, class = void>
struct has_struct_meta_specialization_impl : std::false_type {};

template<class T>
struct has_struct_meta_specialization_impl<T,
                                          std::void_t<typename StructMeta<T>::Fields>
                                          > : std::bool_constant<
                                                  is_fields_pack<typename StructMeta<T>::Fields>::value
                                                  > {};

template<class T>
inline constexpr bool has_struct_meta_specialization =
    has_struct_meta_specialization_impl<T>::value;

template <class T>
    requires (has_struct_meta_specialization<T>)
struct IntrospectionImpl<T> {
    using Fields = typename StructMeta<T>::Fields::FieldsTuple;
    static constexpr std::size_t structureElementsCount = std::tuple_size_v<Fields>;

    template<std::size_t Index, class StructT>
    static constexpr decltype(auto) getStructElementByIndex(StructT & s) {
        using F = std::tuple_element_t<Index, Fields>;
        return (s.*(F::MemberP));
    }

    // The declared member type; options listed in Field<> are applied on top
    // of it by the binder, see fieldOptionsByIndex.
    template<std::size_t Index>
    using structureElementTypeByIndex = typename std::tuple_element_t<Index, Fields>::ValueT;

    template<std::size_t Index>
    static constexpr std::string_view structureElementNameByIndex =
        std::tuple_element_t<Index, Fields>::Name.toStringView();

    template<std::size_t Index>
    using fieldOptionsByIndex = typename std::tuple_element_t<Index, Fields>::OptionsP;
};

} // namespace detail

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return (Impl::template getStructElementByIndex<Index>(s));
}

template<class StructT>
static constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementTypeByIndex<Index>;

template<std::size_t Index, class StructT>
static constexpr std::string_view structureElementNameByIndex = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementNameByIndex<Index>;

/// Options declared out-of-line through StructMeta's Field<...>; empty for
/// PFR-introspected aggregates, which carry their options in Annotated<>.
template<std::size_t Index, class StructT>
struct external_field_options {
    using type = OptionsPack<>;
};

template<std::size_t Index, class StructT>
    requires detail::has_struct_meta_specialization<std::remove_cv_t<StructT>>
struct external_field_options<Index, StructT> {
    using type = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template fieldOptionsByIndex<Index>;
};

} // namespace introspection
} // namespace FormFusion

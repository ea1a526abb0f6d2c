#pragma once
#include <concepts>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "annotated.hpp"
#include "bind_result.hpp"
#include "capped.hpp"
#include "field.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"

namespace FormFusion {

/// Leaf customization point. Specializations provide
///
///     static BindResult<T> from_value(const ValueField&);              required
///     template<DataStreamLike S>
///     static BindResult<T> from_data(DataField<S>);                     optional
///     static std::optional<T> default_value();                         optional
///
/// A missing from_data makes data fields an Unexpected outcome; a missing
/// default_value makes the field required.
template<class T>
struct FieldParser {};

namespace static_schema {

namespace input_checks {

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cvref_t<T>, Template>::value;

} // namespace input_checks

template<class T>
concept FormLeaf = requires(const ValueField& f) {
    { FieldParser<T>::from_value(f) } -> std::same_as<BindResult<T>>;
};

template<class T, class S>
concept LeafAcceptsData = FormLeaf<T> && DataStreamLike<S> && requires(DataField<S> f) {
    { FieldParser<T>::from_data(f) } -> std::same_as<BindResult<T>>;
};

template<class T>
concept LeafHasDefault = FormLeaf<T> && requires {
    { FieldParser<T>::default_value() } -> std::same_as<std::optional<T>>;
};

template<class T>
concept FormVector = input_checks::is_specialization_of_v<T, std::vector>;

template<class T>
concept FormOptional = input_checks::is_specialization_of_v<T, std::optional>;

template<class T>
struct is_annotated : std::false_type {};

template<class T, class... Opts>
struct is_annotated<Annotated<T, Opts...>> : std::true_type {};

template<class T>
concept FormAnnotated = is_annotated<std::remove_cvref_t<T>>::value;

/// Structs bound field by field: aggregates introspected by PFR, or any
/// default constructible class with a StructMeta<T> field list. Aggregates
/// are built by aggregate initialization, so their members need not be
/// default constructible.
template<class T>
concept FormStruct = std::is_class_v<T>
    && !FormLeaf<T>
    && !FormVector<T>
    && !FormOptional<T>
    && !FormAnnotated<T>
    && ((introspection::detail::has_struct_meta_specialization<T> && std::is_default_constructible_v<T>)
        || std::is_aggregate_v<T>);

} // namespace static_schema

} // namespace FormFusion

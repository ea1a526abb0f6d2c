#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string_view>
#include <utility>

#include "annotated.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"

namespace FormFusion {

namespace struct_fields_helper {

template<class Member, class Extra>
struct apply_options;

template<class Member>
struct apply_options<Member, OptionsPack<>> {
    using type = Member;
};

template<class Member, class... Extra>
    requires (sizeof...(Extra) > 0)
struct apply_options<Member, OptionsPack<Extra...>> {
    using type = Annotated<Member, Extra...>;
};

template<class V, class... Own, class... Extra>
    requires (sizeof...(Extra) > 0)
struct apply_options<Annotated<V, Own...>, OptionsPack<Extra...>> {
    using type = Annotated<V, Own..., Extra...>;
};

/// The declared member type of field I.
template<class T, std::size_t I>
using member_type = introspection::structureElementTypeByIndex<I, T>;

/// The type field I is bound as: the member type, wrapped in Annotated
/// when StructMeta lists options for it.
template<class T, std::size_t I>
using bind_type = typename apply_options<
    member_type<T, I>,
    typename introspection::external_field_options<I, T>::type
    >::type;

template<class T, std::size_t I>
using field_opts = options::detail::field_options<
    typename options::detail::annotation_meta_getter<bind_type<T, I>>::OptionsP>;

struct FieldDescr {
    std::string_view name;
    std::size_t index;
};

template<class T>
struct FieldsHelper {
    static constexpr std::size_t fieldsCount = introspection::structureElementsCount<T>;

    template<std::size_t I>
    static consteval std::string_view fieldName() {
        using Opts = field_opts<T, I>;
        if constexpr (Opts::template has_option<options::detail::key_tag>) {
            using KeyOpt = typename Opts::template get_option<options::detail::key_tag>;
            return KeyOpt::desc.toStringView();
        } else {
            return introspection::structureElementNameByIndex<I, T>;
        }
    }

    static constexpr std::array<FieldDescr, fieldsCount> fieldIndexesToFieldNames =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            return std::array<FieldDescr, fieldsCount>{ FieldDescr{ fieldName<I>(), I }... };
        }(std::make_index_sequence<fieldsCount>{});

    static constexpr bool fieldsAreUnique = [](std::array<FieldDescr, fieldsCount> inputArr) consteval {
        auto sortedArr = inputArr;
        std::ranges::sort(sortedArr, {}, &FieldDescr::name);
        return std::ranges::adjacent_find(sortedArr, {}, &FieldDescr::name) == sortedArr.end();
    }(fieldIndexesToFieldNames);

    static constexpr bool namesAreValid = []() consteval {
        for(const auto& f : fieldIndexesToFieldNames) {
            if(f.name.empty()) return false;
            for(char c : f.name) {
                if(c == '.' || c == '[' || c == ']') return false;
            }
        }
        return true;
    }();

    /// Declaration index of the field named `name`, or fieldsCount.
    static constexpr std::size_t indexOf(std::string_view name) {
        for(const auto& f : fieldIndexesToFieldNames) {
            if(f.name == name) return f.index;
        }
        return fieldsCount;
    }
};

} // namespace struct_fields_helper

} // namespace FormFusion

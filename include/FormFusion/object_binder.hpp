#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include "binder.hpp"
#include "struct_fields_helper.hpp"
#include "struct_introspection.hpp"
#include "validators.hpp"
#include "log.hpp"

namespace FormFusion {

namespace object_binder_detail {

template<class T, class Seq>
struct child_slots;

template<class T, std::size_t... I>
struct child_slots<T, std::index_sequence<I...>> {
    using type = std::tuple<
        std::optional<typename Binder<struct_fields_helper::bind_type<T, I>>::Context>...>;
};

inline constexpr std::string_view MethodOverrideKey = "_method";

} // namespace object_binder_detail

/// Accumulator for a struct: one lazily created child context per declared
/// field, the struct level errors, and the path of the struct itself.
template<class T>
struct ObjectContext {
    using Slots = typename object_binder_detail::child_slots<
        T, std::make_index_sequence<introspection::structureElementsCount<T>>>::type;

    Options opts;
    Slots slots{};
    Errors errors;
    std::optional<std::string> parent;
};

template<class T>
    requires static_schema::FormStruct<T>
struct Binder<T> {
    using Fields  = struct_fields_helper::FieldsHelper<T>;
    using Context = ObjectContext<T>;

    static constexpr std::size_t fieldsCount = Fields::fieldsCount;

    static_assert(fieldsCount > 0, "[[[ FormFusion ]]] A form struct must declare at least one field");
    static_assert(Fields::fieldsAreUnique, "[[[ FormFusion ]]] Form struct field names (or key<> overrides) must be unique");
    static_assert(Fields::namesAreValid, "[[[ FormFusion ]]] Form struct field names must be non-empty and free of '.', '[' and ']'");

    template<std::size_t I>
    using FieldBinder = Binder<struct_fields_helper::bind_type<T, I>>;

    static Context init(Options opts) {
        return Context{opts};
    }

    static void push_value(Context& ctx, ValueField field) {
        ctx.parent = owned_parent(field.name);
        if(field.name.exhausted()) {
            // `address=x` where address is a struct
            unexpected(ctx, field.name, field.raw);
            return;
        }
        const std::size_t index = Fields::indexOf(field.name.key_lossy().as_str());
        if(index == fieldsCount) {
            unknown(ctx, field.name, Entity::ValueField, field.raw);
            return;
        }
        dispatch(index, [&]<std::size_t I>() {
            FieldBinder<I>::push_value(slot<I>(ctx), field.shift());
        });
    }

    template<DataStreamLike S>
    static void push_data(Context& ctx, DataField<S> field) {
        ctx.parent = owned_parent(field.name);
        if(field.name.exhausted()) {
            unexpected(ctx, field.name, std::nullopt);
            return;
        }
        const std::size_t index = Fields::indexOf(field.name.key_lossy().as_str());
        if(index == fieldsCount) {
            unknown(ctx, field.name, Entity::DataField, std::nullopt);
            return;
        }
        dispatch(index, [&]<std::size_t I>() {
            FieldBinder<I>::push_data(slot<I>(ctx), field.shift());
        });
    }

    static BindResult<T> finalize(Context&& ctx) {
        return finalize_impl(ctx, std::make_index_sequence<fieldsCount>{});
    }

private:
    static std::optional<std::string> owned_parent(const NameView& name) {
        if(auto p = name.parent()) return std::string(*p);
        return std::nullopt;
    }

    template<std::size_t I>
    static auto& slot(Context& ctx) {
        auto& s = std::get<I>(ctx.slots);
        if(!s) {
            s.emplace(FieldBinder<I>::init(ctx.opts));
        }
        return *s;
    }

    template<class F, std::size_t... I>
    static void dispatch_impl(std::size_t index, F&& f, std::index_sequence<I...>) {
        ((index == I ? (f.template operator()<I>(), true) : false) || ...);
    }

    template<class F>
    static void dispatch(std::size_t index, F&& f) {
        dispatch_impl(index, std::forward<F>(f), std::make_index_sequence<fieldsCount>{});
    }

    static void unknown(Context& ctx, const NameView& name, Entity entity, std::optional<std::string_view> value) {
        if(name.key_lossy() == object_binder_detail::MethodOverrideKey) {
            return;
        }
        if(!ctx.opts.strict) {
            log::debug("dropping unknown form field '{}'", name.source());
            return;
        }
        Error e(ErrorKind::Unknown);
        e.set_entity(entity);
        e.set_name(name.source());
        if(value) e.set_value(*value);
        ctx.errors.push(std::move(e));
    }

    static void unexpected(Context& ctx, const NameView& name, std::optional<std::string_view> value) {
        if(!ctx.opts.strict) {
            log::debug("dropping form field '{}': a nested form needs a key", name.source());
            return;
        }
        Error e = Error::unexpected(Entity::Name);
        if(!name.source().empty()) e.set_name(name.source());
        if(value) e.set_value(*value);
        ctx.errors.push(std::move(e));
    }

    /// Full display name of field I under this struct.
    template<std::size_t I>
    static std::string child_name(const Context& ctx) {
        return join_name(ctx.parent, Fields::template fieldName<I>());
    }

    /// Finalizes field I. An absent field is finalized from a fresh context,
    /// so leaves fall back to their default and nested structs report each
    /// missing member under its full path.
    template<std::size_t I>
    static BindResult<struct_fields_helper::bind_type<T, I>> finalize_child(Context& ctx) {
        auto& s = std::get<I>(ctx.slots);
        if(!s) {
            s.emplace(FieldBinder<I>::init(ctx.opts));
            if constexpr (requires { s->parent; }) {
                s->parent = child_name<I>(ctx);
            }
        }
        return FieldBinder<I>::finalize(std::move(*s));
    }

    template<std::size_t I, class Results>
    static void collect_errors(Context& ctx, Results& results) {
        auto& r = std::get<I>(results);
        if(!r) {
            Errors errs = r.take_errors();
            errs.set_name(child_name<I>(ctx));
            ctx.errors.extend(std::move(errs));
        }
    }

    template<std::size_t I, class Results>
    static decltype(auto) take_member(Results& results) {
        using Member = struct_fields_helper::member_type<T, I>;
        using Bound  = struct_fields_helper::bind_type<T, I>;
        if constexpr (std::is_same_v<Member, Bound>) {
            return std::get<I>(results).take_value();
        } else {
            return Member(std::get<I>(results).take_value().value);
        }
    }

    template<class Results, std::size_t... I>
    static T construct(Results& results, std::index_sequence<I...>) {
        if constexpr (introspection::detail::has_struct_meta_specialization<T>) {
            T obj{};
            ((introspection::getStructElementByIndex<I>(obj) = take_member<I>(results)), ...);
            return obj;
        } else {
            return T{ take_member<I>(results)... };
        }
    }

    /// Runs validators that look at the field together with the finished
    /// struct: fn_validator callables taking (const FieldT&, const T&).
    template<std::size_t I>
    static void validate_in_struct(Context& ctx, T& obj) {
        using Bound = struct_fields_helper::bind_type<T, I>;
        using Meta  = options::detail::annotation_meta_getter<Bound>;
        using Value = typename Meta::value_t;
        using State = validators::validators_detail::validator_state<
            struct_fields_helper::field_opts<T, I>, Value>;

        const auto& member = introspection::getStructElementByIndex<I>(obj);
        const Value* value;
        if constexpr (std::is_same_v<std::remove_cvref_t<decltype(member)>, Value>) {
            value = &member;
        } else {
            value = &Meta::getRef(member);
        }

        validators::ValidationCtx vctx;
        if(!State::template validate<validators::struct_bound>(*value, vctx, std::as_const(obj))) {
            ctx.errors.push(Error::validation(vctx.message()).with_name(child_name<I>(ctx)));
        }
    }

    template<std::size_t... I>
    static BindResult<T> finalize_impl(Context& ctx, std::index_sequence<I...> seq) {
        auto results = std::tuple<BindResult<struct_fields_helper::bind_type<T, I>>...>{
            finalize_child<I>(ctx)...
        };
        (collect_errors<I>(ctx, results), ...);
        if(!ctx.errors.empty()) {
            return std::move(ctx.errors);
        }

        T obj = construct(results, seq);
        (validate_in_struct<I>(ctx, obj), ...);
        if(!ctx.errors.empty()) {
            return std::move(ctx.errors);
        }
        return obj;
    }
};

} // namespace FormFusion

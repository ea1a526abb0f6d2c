#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "static_schema.hpp"
#include "field_parsers.hpp"
#include "validators.hpp"
#include "options.hpp"
#include "log.hpp"

namespace FormFusion {

/// The binding protocol. Every bindable type T has a Binder<T> with
///
///     using Context = ...;
///     static Context init(Options);
///     static void push_value(Context&, ValueField);
///     template<DataStreamLike S>
///     static void push_data(Context&, DataField<S>);
///     static BindResult<T> finalize(Context&&);
///
/// Events are pushed in arrival order, finalize runs exactly once.
template<class T>
struct Binder {
    static_assert(!sizeof(T), "[[[ FormFusion ]]] Type is not bindable: provide a FieldParser<T> specialization or a StructMeta<T> field list");
};

/// Per-leaf accumulator. Only the first stored outcome counts; in lenient
/// mode an Unexpected outcome is not stored, so a later push can still bind.
template<class T>
struct FieldContext {
    Options opts;
    std::size_t pushes = 0;
    std::optional<std::string> field_name;
    std::optional<std::string> field_value;
    std::optional<BindResult<T>> value;

    bool can_push() {
        pushes ++;
        return !value.has_value();
    }

    void push(std::string_view name, BindResult<T> result) {
        if(!name.empty()) {
            field_name.emplace(name);
        }
        if(!result && !opts.strict && result.errors().last_is(ErrorKind::Unexpected)) {
            return;
        }
        value.emplace(std::move(result));
    }
};

template<class T>
    requires static_schema::FormLeaf<T>
struct Binder<T> {
    using Context = FieldContext<T>;

    static Context init(Options opts) {
        return Context{opts};
    }

    static void push_value(Context& ctx, ValueField field) {
        if(!ctx.can_push()) return;
        ctx.field_value.emplace(field.raw);
        if(!field.name.exhausted()) {
            // A leaf has no keys left to consume: `age.years` for an integer.
            ctx.push(field.name.source(), Error::unexpected(Entity::Name));
            return;
        }
        ctx.push(field.name.source(), FieldParser<T>::from_value(field));
    }

    template<DataStreamLike S>
    static void push_data(Context& ctx, DataField<S> field) {
        if(!ctx.can_push()) return;
        if(!field.name.exhausted()) {
            ctx.push(field.name.source(), Error::unexpected(Entity::Name));
            return;
        }
        if constexpr (static_schema::LeafAcceptsData<T, S>) {
            ctx.push(field.name.source(), FieldParser<T>::from_data(std::move(field)));
        } else {
            ctx.push(field.name.source(), Error::unexpected(Entity::DataField));
        }
    }

    static BindResult<T> finalize(Context&& ctx) {
        Errors errors;
        if(ctx.value) {
            if(*ctx.value && (!ctx.opts.strict || ctx.pushes <= 1)) {
                return std::move(*ctx.value);
            }
            if(*ctx.value) {
                errors = Error::duplicate();
            } else {
                errors = ctx.value->take_errors();
            }
        } else {
            if constexpr (static_schema::LeafHasDefault<T>) {
                if(auto d = FieldParser<T>::default_value()) {
                    return std::move(*d);
                }
            }
            errors = Error::missing();
        }

        if(ctx.field_name) errors.set_name(*ctx.field_name);
        if(ctx.field_value) errors.set_value(*ctx.field_value);
        return errors;
    }
};

/// Binds as T, then runs T's value validators. Validators stop at the first
/// failure; errors carry the leaf's name and raw value when it has them.
template<class T, class... Opts>
struct Binder<Annotated<T, Opts...>> {
    using Inner = Binder<T>;
    using Context = typename Inner::Context;
    using Validators = validators::validators_detail::validator_state<
        options::detail::field_options<OptionsPack<Opts...>>, T>;

    static Context init(Options opts) {
        return Inner::init(opts);
    }

    static void push_value(Context& ctx, ValueField field) {
        Inner::push_value(ctx, field);
    }

    template<DataStreamLike S>
    static void push_data(Context& ctx, DataField<S> field) {
        Inner::push_data(ctx, std::move(field));
    }

    static BindResult<Annotated<T, Opts...>> finalize(Context&& ctx) {
        std::optional<std::string> name;
        std::optional<std::string> value;
        if constexpr (requires { ctx.field_name; ctx.field_value; }) {
            name = ctx.field_name;
            value = ctx.field_value;
        }

        BindResult<T> r = Inner::finalize(std::move(ctx));
        if(!r) {
            return r.take_errors();
        }

        validators::ValidationCtx vctx;
        if(!Validators::template validate<validators::value_bound>(r.value(), vctx)) {
            Error e = Error::validation(vctx.message());
            if(name) e.set_name(*name);
            if(value) e.set_value(*value);
            return e;
        }
        return Annotated<T, Opts...>{r.take_value()};
    }
};

/// Consecutive events with the same leading key feed the same element; a
/// different, empty or missing key starts the next element.
template<class T>
struct VectorContext {
    using Element = Binder<T>;

    Options opts;
    std::optional<std::string> last_key;
    std::optional<typename Element::Context> current;
    Errors errors;
    std::vector<T> items;

    void flush() {
        if(!current) return;
        BindResult<T> r = Element::finalize(std::move(*current));
        current.reset();
        if(r) {
            items.push_back(r.take_value());
        } else {
            errors.extend(r.take_errors());
        }
    }

    typename Element::Context& context(const NameView& name) {
        std::optional<Key> key = name.key();
        bool same = key && !key->empty() && last_key && *last_key == key->as_str();
        if(!same || !current) {
            flush();
            current.emplace(Element::init(opts));
        }
        if(key && !key->empty()) {
            last_key.emplace(key->as_str());
        } else {
            last_key.reset();
        }
        return *current;
    }
};

template<class T, class Alloc>
struct Binder<std::vector<T, Alloc>> {
    using Context = VectorContext<T>;

    static Context init(Options opts) {
        return Context{opts};
    }

    static void push_value(Context& ctx, ValueField field) {
        Binder<T>::push_value(ctx.context(field.name), field.shift());
    }

    template<DataStreamLike S>
    static void push_data(Context& ctx, DataField<S> field) {
        auto& element = ctx.context(field.name);
        Binder<T>::push_data(element, field.shift());
    }

    /// A sequence that never received an event is empty, not missing.
    static BindResult<std::vector<T, Alloc>> finalize(Context&& ctx) {
        ctx.flush();
        if(!ctx.errors.empty()) {
            return std::move(ctx.errors);
        }
        return std::vector<T, Alloc>(std::make_move_iterator(ctx.items.begin()),
                                     std::make_move_iterator(ctx.items.end()));
    }
};

/// nullopt when absent or when the inner value fails to bind; the inner
/// errors are dropped.
template<class T>
struct OptionalContext {
    typename Binder<T>::Context inner;
    bool pushed = false;
};

template<class T>
struct Binder<std::optional<T>> {
    using Context = OptionalContext<T>;

    static Context init(Options opts) {
        return Context{Binder<T>::init(opts)};
    }

    static void push_value(Context& ctx, ValueField field) {
        ctx.pushed = true;
        Binder<T>::push_value(ctx.inner, field);
    }

    template<DataStreamLike S>
    static void push_data(Context& ctx, DataField<S> field) {
        ctx.pushed = true;
        Binder<T>::push_data(ctx.inner, std::move(field));
    }

    static BindResult<std::optional<T>> finalize(Context&& ctx) {
        if(!ctx.pushed) {
            return std::optional<T>{};
        }
        BindResult<T> r = Binder<T>::finalize(std::move(ctx.inner));
        if(!r) {
            log::debug("optional field failed to bind, {} error(s) dropped", r.errors().size());
            return std::optional<T>{};
        }
        return std::optional<T>(r.take_value());
    }
};

} // namespace FormFusion

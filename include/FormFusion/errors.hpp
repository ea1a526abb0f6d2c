#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace FormFusion {

enum class ErrorKind {
    Missing,        // required field never bound
    Duplicate,      // field bound more than once under strict mode
    Unknown,        // no declared field matches the key
    Unexpected,     // the binder cannot accept this event shape
    Conversion,     // leaf parse failure
    Validation,     // a validator rejected the bound value
    Truncated,      // the data stream exceeded its limit
    IO              // reading or staging the data failed
};

constexpr std::string_view error_to_string(ErrorKind e) {
    switch(e) {
    case ErrorKind::Missing: return "missing"; break;
    case ErrorKind::Duplicate: return "duplicate"; break;
    case ErrorKind::Unknown: return "unknown"; break;
    case ErrorKind::Unexpected: return "unexpected"; break;
    case ErrorKind::Conversion: return "conversion"; break;
    case ErrorKind::Validation: return "validation"; break;
    case ErrorKind::Truncated: return "truncated"; break;
    case ErrorKind::IO: return "io"; break;
    }
    return "N/A";
}

/// What an error is about.
enum class Entity {
    Form,
    Field,
    ValueField,
    DataField,
    Name,
    Value,
    Key,
    Index
};

constexpr std::string_view entity_to_string(Entity e) {
    switch(e) {
    case Entity::Form: return "form"; break;
    case Entity::Field: return "field"; break;
    case Entity::ValueField: return "value field"; break;
    case Entity::DataField: return "data field"; break;
    case Entity::Name: return "name"; break;
    case Entity::Value: return "value"; break;
    case Entity::Key: return "key"; break;
    case Entity::Index: return "index"; break;
    }
    return "N/A";
}

/// A single binding failure.
///
/// The name, value and entity annotations are monotonic: once set they are
/// never replaced, so the innermost binder's location survives the trip
/// through every enclosing composite.
class Error {
    ErrorKind m_kind;
    std::string m_message;
    std::optional<std::uint64_t> m_limit;
    std::optional<std::string> m_name;
    std::optional<std::string> m_value;
    std::optional<Entity> m_entity;

public:
    explicit Error(ErrorKind kind) : m_kind(kind) {}
    Error(ErrorKind kind, std::string message) : m_kind(kind), m_message(std::move(message)) {}

    static Error missing() { return Error(ErrorKind::Missing).with_entity(Entity::Field); }
    static Error duplicate() { return Error(ErrorKind::Duplicate).with_entity(Entity::Field); }
    static Error unknown() { return Error(ErrorKind::Unknown).with_entity(Entity::Field); }
    static Error unexpected(Entity e) { return Error(ErrorKind::Unexpected).with_entity(e); }
    static Error conversion(std::string cause) { return Error(ErrorKind::Conversion, std::move(cause)).with_entity(Entity::Value); }
    static Error validation(std::string message) { return Error(ErrorKind::Validation, std::move(message)).with_entity(Entity::Value); }
    static Error io(const std::error_code& ec) { return Error(ErrorKind::IO, ec.message()); }

    static Error truncated(std::uint64_t limit) {
        Error e(ErrorKind::Truncated, "data limit exceeded");
        e.m_limit = limit;
        return std::move(e).with_entity(Entity::Value);
    }

    ErrorKind kind() const { return m_kind; }
    const std::string& message() const { return m_message; }
    std::optional<std::uint64_t> limit() const { return m_limit; }
    const std::optional<std::string>& name() const { return m_name; }
    const std::optional<std::string>& value() const { return m_value; }
    std::optional<Entity> entity() const { return m_entity; }

    bool set_name(std::string_view name) {
        if(m_name) return false;
        m_name.emplace(name);
        return true;
    }
    bool set_value(std::string_view value) {
        if(m_value) return false;
        m_value.emplace(value);
        return true;
    }
    bool set_entity(Entity e) {
        if(m_entity) return false;
        m_entity = e;
        return true;
    }

    Error&& with_name(std::string_view name) && { set_name(name); return std::move(*this); }
    Error&& with_value(std::string_view value) && { set_value(value); return std::move(*this); }
    Error&& with_entity(Entity e) && { set_entity(e); return std::move(*this); }
};

/// An ordered collection of errors. Empty means success.
class Errors {
    std::vector<Error> m_errors;

public:
    Errors() = default;
    Errors(Error e) { m_errors.push_back(std::move(e)); }
    Errors(ErrorKind kind) { m_errors.emplace_back(kind); }
    Errors(std::initializer_list<Error> errors) : m_errors(errors) {}

    bool empty() const { return m_errors.empty(); }
    std::size_t size() const { return m_errors.size(); }

    const Error& operator[](std::size_t i) const { return m_errors[i]; }
    const Error& back() const { return m_errors.back(); }

    auto begin() const { return m_errors.begin(); }
    auto end() const { return m_errors.end(); }

    void push(Error e) { m_errors.push_back(std::move(e)); }

    void extend(Errors&& other) {
        if(m_errors.empty()) {
            m_errors = std::move(other.m_errors);
            return;
        }
        m_errors.reserve(m_errors.size() + other.m_errors.size());
        for(auto& e : other.m_errors) {
            m_errors.push_back(std::move(e));
        }
        other.m_errors.clear();
    }

    /// Annotates every error that has no name yet.
    void set_name(std::string_view name) {
        for(auto& e : m_errors) e.set_name(name);
    }
    void set_value(std::string_view value) {
        for(auto& e : m_errors) e.set_value(value);
    }
    void set_entity(Entity entity) {
        for(auto& e : m_errors) e.set_entity(entity);
    }

    Errors&& with_name(std::string_view name) && { set_name(name); return std::move(*this); }
    Errors&& with_value(std::string_view value) && { set_value(value); return std::move(*this); }

    bool last_is(ErrorKind kind) const {
        return !m_errors.empty() && m_errors.back().kind() == kind;
    }

    std::size_t count(ErrorKind kind) const {
        std::size_t n = 0;
        for(const auto& e : m_errors) {
            if(e.kind() == kind) n ++;
        }
        return n;
    }

    /// First error carrying exactly this name, if any.
    const Error* find(std::string_view name) const {
        for(const auto& e : m_errors) {
            if(e.name() && *e.name() == name) return &e;
        }
        return nullptr;
    }
};

} // namespace FormFusion

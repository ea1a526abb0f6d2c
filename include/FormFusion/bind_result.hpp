#pragma once

#include <optional>
#include <utility>

#include "errors.hpp"

namespace FormFusion {

/// Outcome of finalizing a binder: either a value or a non-empty error set,
/// never both.
template <class T>
class BindResult {
    std::optional<T> m_value;
    Errors m_errors;

public:
    using value_type = T;

    BindResult(T value) : m_value(std::move(value)) {}

    BindResult(Errors errors) : m_errors(std::move(errors)) {
        // A failure must always say why.
        if(m_errors.empty()) {
            m_errors.push(Error::unknown());
        }
    }

    BindResult(Error error) : m_errors(std::move(error)) {}

    explicit operator bool() const {
        return m_value.has_value();
    }

    T& value() { return *m_value; }
    const T& value() const { return *m_value; }
    T take_value() { return std::move(*m_value); }

    const Errors& errors() const { return m_errors; }
    Errors take_errors() { return std::move(m_errors); }
};

} // namespace FormFusion

#pragma once

#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>

#include "data_stream.hpp"

namespace FormFusion {

/// A value read from a stream that may have been cut off at a data limit.
///
/// Truncation is not an error: `Capped<T>` binds successfully either way and
/// lets the caller decide. The plain `T` binders for the same types report
/// truncation as ErrorKind::Truncated instead.
template<class T>
class Capped {
    T m_value;
    N m_n;
    std::optional<std::uint64_t> m_limit;

public:
    using value_type = T;

    Capped(T value, N n, std::optional<std::uint64_t> limit = std::nullopt)
        : m_value(std::move(value)), m_n(n), m_limit(limit) {}

    /// A value that never went through a limited stream.
    static Capped complete(T value, std::uint64_t len) {
        return Capped(std::move(value), N{len, true});
    }

    bool is_complete() const { return m_n.complete; }
    const N& n() const { return m_n; }

    /// The limit that applied while reading, if any.
    std::optional<std::uint64_t> limit() const { return m_limit; }

    T&       operator*()       { return m_value; }
    const T& operator*() const { return m_value; }
    T*       operator->()       { return &m_value; }
    const T* operator->() const { return &m_value; }

    T&       get()       { return m_value; }
    const T& get() const { return m_value; }
    T into_inner() && { return std::move(m_value); }
};

template<class T>
struct is_capped : std::false_type {};

template<class T>
struct is_capped<Capped<T>> : std::true_type {};

} // namespace FormFusion

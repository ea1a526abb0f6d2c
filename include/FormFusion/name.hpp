#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace FormFusion {

/// One segment of a field name: `b` in `a.b`, `0` in `a[0]`.
///
/// A key may itself carry colon-separated indices (`a[k:v]`), which sequence
/// and map-like binders can use; struct binders compare the whole key.
class Key {
    std::string_view m_key;
public:
    constexpr Key() = default;
    constexpr explicit Key(std::string_view key) : m_key(key) {}

    constexpr std::string_view as_str() const { return m_key; }
    constexpr bool empty() const { return m_key.empty(); }

    /// Number of `:`-separated indices.
    constexpr std::size_t indices_count() const {
        std::size_t n = 1;
        for(char c : m_key) {
            if(c == ':') n ++;
        }
        return n;
    }

    /// The i-th `:`-separated index, or an empty view when out of range.
    constexpr std::string_view index(std::size_t i) const {
        std::size_t start = 0;
        for(std::size_t k = 0; k < i; k ++) {
            std::size_t p = m_key.find(':', start);
            if(p == std::string_view::npos) return {};
            start = p + 1;
        }
        std::size_t stop = m_key.find(':', start);
        return m_key.substr(start, stop == std::string_view::npos ? std::string_view::npos : stop - start);
    }

    /// Numeric value of an all-digit key; `a[12]` gives 12.
    constexpr std::optional<std::size_t> as_index() const {
        if(m_key.empty()) return std::nullopt;
        std::size_t v = 0;
        for(char c : m_key) {
            if(c < '0' || c > '9') return std::nullopt;
            std::size_t d = static_cast<std::size_t>(c - '0');
            if(v > (std::numeric_limits<std::size_t>::max() - d) / 10) return std::nullopt;
            v = v * 10 + d;
        }
        return v;
    }

    constexpr bool operator==(const Key& other) const { return m_key == other.m_key; }
    constexpr bool operator==(std::string_view other) const { return m_key == other; }
};

namespace name_detail {

struct KeyBounds {
    std::size_t sep_start;   // where the separator before the key begins
    std::size_t key_start;
    std::size_t key_end;
    std::size_t next;        // first position after the key (and its `]`)
};

/// Locates the key that starts at or after `pos`. Never fails: an
/// unterminated `[` swallows the rest of the input as a single key.
constexpr KeyBounds next_key(std::string_view src, std::size_t pos) {
    const std::size_t sep_start = pos;
    if(pos < src.size() && src[pos] == '.') {
        pos ++;
    }
    if(pos < src.size() && src[pos] == '[') {
        std::size_t close = src.find(']', pos + 1);
        if(close == std::string_view::npos) {
            return {sep_start, pos + 1, src.size(), src.size()};
        }
        return {sep_start, pos + 1, close, close + 1};
    }
    std::size_t stop = pos;
    while(stop < src.size() && src[stop] != '.' && src[stop] != '[') {
        stop ++;
    }
    return {sep_start, pos, stop, stop};
}

} // namespace name_detail

/// A cursor over a full field name such as `user.tags[0].value`.
///
/// The view starts on the first key; shift() moves to the next one. A view is
/// a cheap non-owning value: the referenced name must outlive it.
class NameView {
    std::string_view m_src;
    std::size_t m_sep_start = 0;
    std::size_t m_key_start = 0;
    std::size_t m_key_end   = 0;
    std::size_t m_next      = 0;
    bool m_exhausted = true;

    constexpr NameView(std::string_view src, const name_detail::KeyBounds& b)
        : m_src(src), m_sep_start(b.sep_start), m_key_start(b.key_start),
          m_key_end(b.key_end), m_next(b.next), m_exhausted(false) {}

    static constexpr NameView positioned(std::string_view src, std::size_t pos) {
        if(pos >= src.size()) {
            NameView v;
            v.m_src = src;
            v.m_sep_start = v.m_key_start = v.m_key_end = v.m_next = src.size();
            return v;
        }
        return NameView(src, name_detail::next_key(src, pos));
    }

public:
    constexpr NameView() = default;
    constexpr explicit NameView(std::string_view name) : NameView(positioned(name, 0)) {}

    /// Current key, std::nullopt once every key was consumed.
    constexpr std::optional<Key> key() const {
        if(m_exhausted) return std::nullopt;
        return Key(m_src.substr(m_key_start, m_key_end - m_key_start));
    }

    /// Current key, or the empty key once exhausted. Struct fields are matched
    /// against this form.
    constexpr Key key_lossy() const {
        if(m_exhausted) return Key{};
        return Key(m_src.substr(m_key_start, m_key_end - m_key_start));
    }

    constexpr bool exhausted() const { return m_exhausted; }

    /// View positioned on the next key.
    constexpr NameView shift() const {
        if(m_exhausted) return *this;
        return positioned(m_src, m_next);
    }

    /// Everything up to and including the current key: `a.b` for the view on
    /// `b` in `a.b.c`. The full name once exhausted.
    constexpr std::string_view as_name() const {
        return m_src.substr(0, m_exhausted ? m_src.size() : m_next);
    }

    /// Everything before the current key, without the separator.
    constexpr std::optional<std::string_view> parent() const {
        if(m_sep_start == 0) return std::nullopt;
        return m_src.substr(0, m_sep_start);
    }

    constexpr std::string_view source() const { return m_src; }
};

/// A full, immutable field name.
class Name {
    std::string_view m_name;
public:
    constexpr Name() = default;
    constexpr Name(std::string_view name) : m_name(name) {}
    constexpr Name(const char* name) : m_name(name) {}

    constexpr NameView view() const { return NameView(m_name); }
    constexpr std::string_view as_str() const { return m_name; }

    /// Number of keys; `a.b[0]` has three.
    constexpr std::size_t keys_count() const {
        std::size_t n = 0;
        for(NameView v = view(); !v.exhausted(); v = v.shift()) n ++;
        return n;
    }

    constexpr bool operator==(const Name& other) const { return m_name == other.m_name; }
};

/// Builds the display name `parent.key`, or `key` when there is no parent.
inline std::string join_name(std::optional<std::string_view> parent, std::string_view key) {
    if(!parent || parent->empty()) return std::string(key);
    std::string out;
    out.reserve(parent->size() + 1 + key.size());
    out.append(*parent);
    out.push_back('.');
    out.append(key);
    return out;
}

} // namespace FormFusion

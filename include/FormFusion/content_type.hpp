#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace FormFusion {

namespace content_type_detail {

constexpr char to_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

constexpr bool iequals(std::string_view a, std::string_view b) {
    if(a.size() != b.size()) return false;
    for(std::size_t i = 0; i < a.size(); i ++) {
        if(to_lower(a[i]) != to_lower(b[i])) return false;
    }
    return true;
}

constexpr std::string_view trim(std::string_view s) {
    while(!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while(!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

inline std::string lowered(std::string_view s) {
    std::string out(s);
    for(auto& c : out) c = to_lower(c);
    return out;
}

struct KnownType {
    std::string_view top;
    std::string_view sub;
    std::string_view ext;
};

// First entry wins when several extensions share a media type.
inline constexpr std::array<KnownType, 28> known_types = {{
    {"text",        "plain",                     "txt"},
    {"text",        "html",                      "html"},
    {"text",        "css",                       "css"},
    {"text",        "csv",                       "csv"},
    {"text",        "javascript",                "js"},
    {"text",        "xml",                       "xml"},
    {"text",        "markdown",                  "md"},
    {"text",        "calendar",                  "ics"},
    {"application", "json",                      "json"},
    {"application", "xml",                       "xml"},
    {"application", "pdf",                       "pdf"},
    {"application", "zip",                       "zip"},
    {"application", "gzip",                      "gz"},
    {"application", "x-tar",                     "tar"},
    {"application", "wasm",                      "wasm"},
    {"application", "octet-stream",              "bin"},
    {"application", "msgpack",                   "msgpack"},
    {"image",       "png",                       "png"},
    {"image",       "jpeg",                      "jpeg"},
    {"image",       "gif",                       "gif"},
    {"image",       "webp",                      "webp"},
    {"image",       "svg+xml",                   "svg"},
    {"image",       "bmp",                       "bmp"},
    {"image",       "x-icon",                    "ico"},
    {"audio",       "mpeg",                      "mp3"},
    {"audio",       "wav",                       "wav"},
    {"video",       "mp4",                       "mp4"},
    {"video",       "webm",                      "webm"},
}};

} // namespace content_type_detail

/// A media type as declared by a data field: `image/png; charset=...`.
///
/// Top level type, subtype and parameter names are stored lowercased;
/// parameter values keep their case.
class ContentType {
    std::string m_top;
    std::string m_sub;
    std::vector<std::pair<std::string, std::string>> m_params;

public:
    ContentType() : m_top("text"), m_sub("plain") {}
    ContentType(std::string_view top, std::string_view sub)
        : m_top(content_type_detail::lowered(top)), m_sub(content_type_detail::lowered(sub)) {}

    static ContentType Plain()  { return ContentType("text", "plain"); }
    static ContentType Binary() { return ContentType("application", "octet-stream"); }
    static ContentType Any()    { return ContentType("*", "*"); }

    /// Parses `top/sub[; k=v]*`. Malformed input gives std::nullopt.
    static std::optional<ContentType> parse(std::string_view text) {
        using content_type_detail::trim;
        std::size_t semi = text.find(';');
        std::string_view media = trim(text.substr(0, semi));
        std::size_t slash = media.find('/');
        if(slash == std::string_view::npos) return std::nullopt;

        std::string_view top = trim(media.substr(0, slash));
        std::string_view sub = trim(media.substr(slash + 1));
        if(top.empty() || sub.empty() || sub.find('/') != std::string_view::npos) {
            return std::nullopt;
        }

        ContentType ct(top, sub);
        while(semi != std::string_view::npos) {
            std::string_view rest = text.substr(semi + 1);
            semi = rest.find(';');
            std::string_view param = trim(rest.substr(0, semi));
            if(semi != std::string_view::npos) {
                text = rest;
            }
            if(param.empty()) continue;
            std::size_t eq = param.find('=');
            if(eq == std::string_view::npos) return std::nullopt;
            std::string_view value = trim(param.substr(eq + 1));
            if(value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            ct.m_params.emplace_back(content_type_detail::lowered(trim(param.substr(0, eq))), std::string(value));
        }
        return ct;
    }

    const std::string& top() const { return m_top; }
    const std::string& sub() const { return m_sub; }

    std::optional<std::string_view> param(std::string_view name) const {
        for(const auto& [k, v] : m_params) {
            if(content_type_detail::iequals(k, name)) return std::string_view(v);
        }
        return std::nullopt;
    }

    /// The conventional file extension for known media types, e.g. `pdf` for
    /// `application/pdf`.
    std::optional<std::string_view> extension() const {
        for(const auto& k : content_type_detail::known_types) {
            if(k.top == m_top && k.sub == m_sub) return k.ext;
        }
        return std::nullopt;
    }

    std::string to_string() const {
        std::string out = m_top + "/" + m_sub;
        for(const auto& [k, v] : m_params) {
            out += "; ";
            out += k;
            out += '=';
            out += v;
        }
        return out;
    }

    /// Media type equality; parameters are ignored.
    bool operator==(const ContentType& other) const {
        return m_top == other.m_top && m_sub == other.m_sub;
    }
};

} // namespace FormFusion

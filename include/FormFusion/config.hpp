#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "log.hpp"

namespace FormFusion {

/// A byte count. Parses human-readable sizes such as `512`, `64 KiB` or
/// `1.5MB`.
class ByteSize {
    std::uint64_t m_bytes = 0;

    static constexpr char lower(char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    static constexpr bool unit_is(std::string_view unit, std::string_view expected) {
        if(unit.size() != expected.size()) return false;
        for(std::size_t i = 0; i < unit.size(); i ++) {
            if(lower(unit[i]) != expected[i]) return false;
        }
        return true;
    }

public:
    constexpr ByteSize() = default;
    constexpr ByteSize(std::uint64_t bytes) : m_bytes(bytes) {}

    static constexpr ByteSize B(std::uint64_t n)   { return n; }
    static constexpr ByteSize KiB(std::uint64_t n) { return n << 10; }
    static constexpr ByteSize MiB(std::uint64_t n) { return n << 20; }
    static constexpr ByteSize GiB(std::uint64_t n) { return n << 30; }

    constexpr std::uint64_t as_u64() const { return m_bytes; }

    constexpr bool operator==(const ByteSize&) const = default;
    constexpr auto operator<=>(const ByteSize&) const = default;

    /// Units (case-insensitive): b, kb, kib, mb, mib, gb, gib. No unit means
    /// bytes. Fractions are truncated to whole bytes.
    static std::optional<ByteSize> parse(std::string_view text) {
        while(!text.empty() && text.front() == ' ') text.remove_prefix(1);
        while(!text.empty() && text.back() == ' ') text.remove_suffix(1);

        std::size_t num_end = 0;
        while(num_end < text.size() && ((text[num_end] >= '0' && text[num_end] <= '9') || text[num_end] == '.')) {
            num_end ++;
        }
        if(num_end == 0) return std::nullopt;

        double value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + num_end, value);
        if(ec != std::errc() || ptr != text.data() + num_end) return std::nullopt;

        std::string_view unit = text.substr(num_end);
        while(!unit.empty() && unit.front() == ' ') unit.remove_prefix(1);

        double multiplier = 0;
        if(unit.empty() || unit_is(unit, "b"))  multiplier = 1;
        else if(unit_is(unit, "kb"))  multiplier = 1e3;
        else if(unit_is(unit, "kib")) multiplier = 1024.0;
        else if(unit_is(unit, "mb"))  multiplier = 1e6;
        else if(unit_is(unit, "mib")) multiplier = 1024.0 * 1024.0;
        else if(unit_is(unit, "gb"))  multiplier = 1e9;
        else if(unit_is(unit, "gib")) multiplier = 1024.0 * 1024.0 * 1024.0;
        else return std::nullopt;

        double bytes = std::floor(value * multiplier);
        if(!(bytes < static_cast<double>(std::numeric_limits<std::uint64_t>::max()))) {
            return std::nullopt;
        }
        return ByteSize(static_cast<std::uint64_t>(bytes));
    }
};

/// Named data limits, looked up hierarchically: `file/pdf` falls back to
/// `file` when no exact entry exists.
class Limits {
    std::vector<std::pair<std::string, ByteSize>> m_limits;

public:
    static constexpr ByteSize FORM      = ByteSize::KiB(32);
    static constexpr ByteSize DATA_FORM = ByteSize::MiB(2);
    static constexpr ByteSize FILE      = ByteSize::MiB(1);
    static constexpr ByteSize STRING    = ByteSize::KiB(8);
    static constexpr ByteSize BYTES     = ByteSize::KiB(8);

    Limits() {
        m_limits = {
            {"form",      FORM},
            {"data-form", DATA_FORM},
            {"file",      FILE},
            {"string",    STRING},
            {"bytes",     BYTES},
        };
    }

    /// Sets (or replaces) the limit for `name`.
    Limits&& limit(std::string_view name, ByteSize size) && {
        set(name, size);
        return std::move(*this);
    }

    Limits& limit(std::string_view name, ByteSize size) & {
        set(name, size);
        return *this;
    }

    /// The limit for `name`, walking up `/`-separated prefixes.
    std::optional<ByteSize> get(std::string_view name) const {
        while(true) {
            for(const auto& [k, v] : m_limits) {
                if(k == name) return v;
            }
            std::size_t slash = name.rfind('/');
            if(slash == std::string_view::npos) return std::nullopt;
            name = name.substr(0, slash);
        }
    }

    /// `find({"file", "pdf"})` looks up `file/pdf`, then `file`.
    std::optional<ByteSize> find(std::initializer_list<std::string_view> layers) const {
        std::string joined;
        for(auto layer : layers) {
            if(!joined.empty()) joined.push_back('/');
            joined.append(layer);
        }
        return get(joined);
    }

    /// Parses `name=size[,name=size]*` on top of the current limits.
    bool merge(std::string_view text) {
        std::vector<std::pair<std::string, ByteSize>> parsed;
        while(!text.empty()) {
            std::size_t comma = text.find(',');
            std::string_view item = text.substr(0, comma);
            text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);

            while(!item.empty() && item.front() == ' ') item.remove_prefix(1);
            if(item.empty()) continue;
            std::size_t eq = item.find('=');
            if(eq == std::string_view::npos || eq == 0) return false;
            auto size = ByteSize::parse(item.substr(eq + 1));
            if(!size) return false;
            std::string_view name = item.substr(0, eq);
            while(!name.empty() && name.back() == ' ') name.remove_suffix(1);
            parsed.emplace_back(std::string(name), *size);
        }
        for(const auto& [k, v] : parsed) set(k, v);
        return true;
    }

    auto begin() const { return m_limits.begin(); }
    auto end() const { return m_limits.end(); }

private:
    void set(std::string_view name, ByteSize size) {
        for(auto& [k, v] : m_limits) {
            if(k == name) {
                v = size;
                return;
            }
        }
        m_limits.emplace_back(std::string(name), size);
    }
};

/// Request-level configuration visible to data field binders.
struct FormConfig {
    Limits limits;
    std::filesystem::path temp_dir = default_temp_dir();

    static std::filesystem::path default_temp_dir() {
        std::error_code ec;
        auto dir = std::filesystem::temp_directory_path(ec);
        if(ec) return "/tmp";
        return dir;
    }

    /// Defaults overridden by FORMFUSION_TEMP_DIR and FORMFUSION_LIMITS
    /// (`file=2MiB,string=16KiB`). A malformed limits string is ignored as a
    /// whole.
    static FormConfig from_env() {
        FormConfig config;
        if(const char* dir = std::getenv("FORMFUSION_TEMP_DIR"); dir && *dir) {
            config.temp_dir = dir;
        }
        if(const char* limits = std::getenv("FORMFUSION_LIMITS"); limits && *limits) {
            if(!config.limits.merge(limits)) {
                log::warn("ignoring malformed FORMFUSION_LIMITS '{}'", limits);
            }
        }
        return config;
    }
};

} // namespace FormFusion

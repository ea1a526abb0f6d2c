#pragma once

#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <FormFusion/parser.hpp>

namespace TestHelpers {

/// Hands out at most `chunk` bytes per read, the way a socket does.
class ChunkedStream {
    std::string_view m_data;
    std::size_t m_chunk;
    std::size_t m_pos = 0;
public:
    std::size_t reads = 0;

    ChunkedStream(std::string_view data, std::size_t chunk) : m_data(data), m_chunk(chunk) {}

    FormFusion::ChunkResult read_chunk(char* out, std::size_t max) {
        reads ++;
        std::size_t n = std::min({max, m_chunk, m_data.size() - m_pos});
        std::copy_n(m_data.data() + m_pos, n, out);
        m_pos += n;
        return {FormFusion::ChunkStatus::ok, n, m_pos == m_data.size()};
    }

    std::size_t consumed() const { return m_pos; }
};

/// Delivers `good` bytes, then fails.
class FailingStream {
    std::string_view m_good;
    bool m_sent = false;
public:
    explicit FailingStream(std::string_view good) : m_good(good) {}

    FormFusion::ChunkResult read_chunk(char* out, std::size_t max) {
        if(!m_sent) {
            m_sent = true;
            std::size_t n = std::min(max, m_good.size());
            std::copy_n(m_good.data(), n, out);
            return {FormFusion::ChunkStatus::ok, n, false};
        }
        return {FormFusion::ChunkStatus::error, 0, true, std::make_error_code(std::errc::connection_reset)};
    }
};

/// A fresh directory under the system temp dir, removed with its contents.
class ScopedDir {
    std::filesystem::path m_path;
public:
    explicit ScopedDir(std::string_view tag)
        : ScopedDir(tag, std::filesystem::temp_directory_path()) {}

    ScopedDir(std::string_view tag, const std::filesystem::path& base) {
        for(int i = 0; ; i ++) {
            m_path = base / (std::string("formfusion-test-") + std::string(tag) + "-" + std::to_string(i));
            if(std::filesystem::create_directory(m_path)) break;
        }
    }
    ScopedDir(const ScopedDir&) = delete;
    ScopedDir& operator=(const ScopedDir&) = delete;
    ~ScopedDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    const std::filesystem::path& path() const { return m_path; }
    std::filesystem::path operator/(std::string_view name) const { return m_path / name; }

    /// Number of regular files directly inside the directory.
    std::size_t files() const {
        std::size_t n = 0;
        for(const auto& e : std::filesystem::directory_iterator(m_path)) {
            if(e.is_regular_file()) n ++;
        }
        return n;
    }
};

inline std::string ReadFile(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void WriteFile(const std::filesystem::path& p, std::string_view content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

/// The error carrying `name`, which must exist.
inline const FormFusion::Error& ErrorAt(const FormFusion::Errors& errors, std::string_view name) {
    const FormFusion::Error* e = errors.find(name);
    assert(e != nullptr);
    return *e;
}

inline bool HasError(const FormFusion::Errors& errors, std::string_view name, FormFusion::ErrorKind kind) {
    for(const auto& e : errors) {
        if(e.name() && *e.name() == name && e.kind() == kind) return true;
    }
    return false;
}

} // namespace TestHelpers

#pragma once
#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include "static_schema.hpp"
#include "config.hpp"
#include "content_type.hpp"
#include "log.hpp"

namespace FormFusion {

/// Owns a staged file on disk and removes it on destruction unless
/// release() was called. Move-only.
class TempPath {
    std::filesystem::path m_path;
    bool m_armed = false;

public:
    TempPath() = default;
    explicit TempPath(std::filesystem::path p) : m_path(std::move(p)), m_armed(true) {}

    TempPath(const TempPath&) = delete;
    TempPath& operator=(const TempPath&) = delete;

    TempPath(TempPath&& other) noexcept
        : m_path(std::move(other.m_path)), m_armed(std::exchange(other.m_armed, false)) {}

    TempPath& operator=(TempPath&& other) noexcept {
        if(this != &other) {
            remove();
            m_path = std::move(other.m_path);
            m_armed = std::exchange(other.m_armed, false);
        }
        return *this;
    }

    ~TempPath() { remove(); }

    const std::filesystem::path& path() const { return m_path; }

    /// Stops tracking the file; it will no longer be removed.
    std::filesystem::path release() {
        m_armed = false;
        return m_path;
    }

private:
    void remove() {
        if(!m_armed) return;
        m_armed = false;
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
        if(ec) {
            log::warn("failed to remove temporary file '{}': {}", m_path.string(), ec.message());
        }
    }
};

namespace temp_file_detail {

class FdGuard {
    int m_fd;
public:
    explicit FdGuard(int fd) : m_fd(fd) {}
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    ~FdGuard() { if(m_fd >= 0) ::close(m_fd); }
    int get() const { return m_fd; }

    std::error_code close() {
        int fd = std::exchange(m_fd, -1);
        if(fd >= 0 && ::close(fd) != 0) {
            return std::error_code(errno, std::system_category());
        }
        return {};
    }
};

inline std::error_code last_error() {
    return std::error_code(errno, std::system_category());
}

/// Creates a unique file in `dir` with mkstemp.
inline std::error_code create_temp(const std::filesystem::path& dir, TempPath& out_path, int& out_fd) {
    std::string pattern = (dir / "formfusion-XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    int fd = ::mkstemp(buf.data());
    if(fd < 0) {
        return last_error();
    }
    out_path = TempPath(std::filesystem::path(buf.data()));
    out_fd = fd;
    return {};
}

/// Moves `from` to `to`, copying when they live on different devices.
inline std::error_code move_file(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if(ec != std::errc::cross_device_link) {
        return ec;
    }

    log::warn("'{}' and '{}' are on different devices, copying", from.string(), to.string());
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if(ec) {
        std::error_code ignored;
        std::filesystem::remove(to, ignored);
        return ec;
    }
    std::error_code rm_ec;
    std::filesystem::remove(from, rm_ec);
    if(rm_ec) {
        log::warn("copied '{}' but could not remove it: {}", from.string(), rm_ec.message());
    }
    return {};
}

/// Writes `content` to `to`. A partially written file is removed.
inline std::error_code write_file(const std::filesystem::path& to, std::string_view content) {
    int fd = ::open(to.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if(fd < 0) {
        return last_error();
    }
    std::error_code ec;
    {
        FdGuard guard(fd);
        while(!content.empty()) {
            ssize_t w = ::write(fd, content.data(), content.size());
            if(w < 0) {
                if(errno == EINTR) continue;
                ec = last_error();
                break;
            }
            content.remove_prefix(static_cast<std::size_t>(w));
        }
        std::error_code close_ec = guard.close();
        if(!ec) ec = close_ec;
    }
    if(ec) {
        std::error_code ignored;
        std::filesystem::remove(to, ignored);
    }
    return ec;
}

} // namespace temp_file_detail

/// An uploaded file: either a short value kept in memory, or data streamed
/// to a staging file that is deleted unless persisted.
///
/// The staging directory is shared with whatever cleans it up; a staged
/// file can disappear before persist_to() is called, which then fails with
/// the error from rename.
class TempFile {
public:
    struct Buffered {
        std::string content;
    };

    struct File {
        std::optional<std::string> file_name;
        std::optional<ContentType> content_type;
        std::variant<TempPath, std::filesystem::path> location;
        std::uint64_t len = 0;
    };

private:
    std::variant<Buffered, File> m_state;

    explicit TempFile(Buffered b) : m_state(std::move(b)) {}
    explicit TempFile(File f) : m_state(std::move(f)) {}

public:
    TempFile() = default;

    static TempFile buffered(std::string content) {
        return TempFile(Buffered{std::move(content)});
    }

    static TempFile staged(TempPath path, std::uint64_t len,
                           std::optional<std::string> file_name = std::nullopt,
                           std::optional<ContentType> content_type = std::nullopt) {
        return TempFile(File{std::move(file_name), std::move(content_type), std::move(path), len});
    }

    bool is_buffered() const { return std::holds_alternative<Buffered>(m_state); }

    /// Persisted or not, no system calls.
    std::uint64_t len() const {
        if(auto b = std::get_if<Buffered>(&m_state)) return b->content.size();
        return std::get<File>(m_state).len;
    }

    /// Where the data lives now; nullopt while buffered.
    std::optional<std::filesystem::path> path() const {
        auto f = std::get_if<File>(&m_state);
        if(!f) return std::nullopt;
        if(auto tp = std::get_if<TempPath>(&f->location)) return tp->path();
        return std::get<std::filesystem::path>(f->location);
    }

    /// The sanitized client side name, without extension.
    std::optional<std::string_view> file_name() const {
        auto f = std::get_if<File>(&m_state);
        if(!f || !f->file_name) return std::nullopt;
        return std::string_view(*f->file_name);
    }

    std::optional<ContentType> content_type() const {
        auto f = std::get_if<File>(&m_state);
        if(!f) return std::nullopt;
        return f->content_type;
    }

    /// Moves the data to `dest`. The new location is recorded before the
    /// move, so a second call moves from `dest`, never from the staging
    /// path. On failure the location is restored and the call can be
    /// retried.
    std::error_code persist_to(const std::filesystem::path& dest) {
        if(auto b = std::get_if<Buffered>(&m_state)) {
            if(std::error_code ec = temp_file_detail::write_file(dest, b->content)) {
                log::error("failed to persist buffered file to '{}': {}", dest.string(), ec.message());
                return ec;
            }
            std::uint64_t len = b->content.size();
            m_state = File{std::nullopt, std::nullopt, dest, len};
            log::info("persisted buffered file to '{}'", dest.string());
            return {};
        }

        auto& location = std::get<File>(m_state).location;
        auto previous = std::exchange(location, dest);

        std::error_code ec;
        if(auto tp = std::get_if<TempPath>(&previous)) {
            ec = temp_file_detail::move_file(tp->path(), dest);
            if(!ec) tp->release();
        } else {
            ec = temp_file_detail::move_file(std::get<std::filesystem::path>(previous), dest);
        }

        if(ec) {
            location = std::move(previous);
            log::error("failed to persist file to '{}': {}", dest.string(), ec.message());
            return ec;
        }
        log::info("persisted file to '{}'", dest.string());
        return {};
    }

    /// Streams `data` into a new staging file under `config.temp_dir`. The
    /// limit is `file/<ext>` for the declared content type, then `file`,
    /// then 1 MiB.
    template<DataStreamLike S>
    static BindResult<Capped<TempFile>> from(const FormConfig& config, S& data,
                                             std::optional<std::string_view> file_name,
                                             std::optional<ContentType> content_type) {
        std::optional<ByteSize> limit;
        if(content_type) {
            if(auto ext = content_type->extension()) {
                limit = config.limits.find({"file", *ext});
            }
        }
        if(!limit) limit = config.limits.get("file");
        const std::uint64_t cap = limit.value_or(Limits::FILE).as_u64();

        TempPath staging;
        int fd = -1;
        if(std::error_code ec = temp_file_detail::create_temp(config.temp_dir, staging, fd)) {
            log::error("failed to create temporary file in '{}': {}", config.temp_dir.string(), ec.message());
            return Error::io(ec).with_entity(Entity::DataField);
        }
        log::debug("staging upload in '{}', limit {} bytes", staging.path().string(), cap);

        temp_file_detail::FdGuard guard(fd);
        StreamOutcome out = stream_capped_to_fd(data, fd, cap);
        if(!out) {
            return Error::io(out.error).with_entity(Entity::DataField);
        }
        if(std::error_code ec = guard.close()) {
            return Error::io(ec).with_entity(Entity::DataField);
        }

        std::optional<std::string> name;
        if(file_name) name.emplace(*file_name);
        return Capped<TempFile>(staged(std::move(staging), out.n.written, std::move(name), std::move(content_type)),
                                out.n, cap);
    }
};

template<>
struct FieldParser<Capped<TempFile>> {
    static BindResult<Capped<TempFile>> from_value(const ValueField& f) {
        return Capped<TempFile>::complete(TempFile::buffered(std::string(f.value)), f.value.size());
    }

    template<DataStreamLike S>
    static BindResult<Capped<TempFile>> from_data(DataField<S> f) {
        return TempFile::from(f.request, f.data, f.file_name, f.content_type);
    }
};

/// Data cut off at the limit is an error; Capped<TempFile> accepts it.
template<>
struct FieldParser<TempFile> {
    static BindResult<TempFile> from_value(const ValueField& f) {
        return TempFile::buffered(std::string(f.value));
    }

    template<DataStreamLike S>
    static BindResult<TempFile> from_data(DataField<S> f) {
        auto capped = FieldParser<Capped<TempFile>>::from_data(std::move(f));
        if(!capped) {
            return capped.take_errors();
        }
        if(!capped.value().is_complete()) {
            return Error::truncated(*capped.value().limit());
        }
        return std::move(capped.take_value()).into_inner();
    }
};

} // namespace FormFusion

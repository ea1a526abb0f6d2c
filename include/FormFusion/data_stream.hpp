#pragma once

#include <algorithm>
#include <array>
#include <cerrno>
#include <concepts>
#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>

namespace FormFusion {

enum class ChunkStatus {
    ok,       // wrote some bytes (maybe zero), no error
    error     // the underlying source failed, see ChunkResult::error
};

struct ChunkResult {
    ChunkStatus     status;
    std::size_t     bytes_written; // how many bytes we put into `out`
    bool            done;          // true once the source is exhausted
    std::error_code error{};
};

/// DataStreamLike is the pull interface a data field exposes to its binder.
/// A stream is read at most once; it is where a cooperative transport
/// suspends while the body is still arriving.
template<typename S>
concept DataStreamLike = requires(S& stream, char* out, std::size_t max) {
    { stream.read_chunk(out, max) } -> std::same_as<ChunkResult>;
};

template<typename S>
constexpr bool is_data_stream_like_v = DataStreamLike<S>;

/// How many bytes were consumed and whether the stream ended before the
/// limit did.
struct N {
    std::uint64_t written = 0;
    bool complete = true;

    constexpr bool operator==(const N&) const = default;
};

struct StreamOutcome {
    N n;
    std::error_code error{};

    explicit operator bool() const { return !error; }
};

/// A stream over bytes that are already in memory.
class BufferDataStream {
    std::string_view m_data;
    std::size_t m_pos = 0;
public:
    explicit BufferDataStream(std::string_view data) : m_data(data) {}

    ChunkResult read_chunk(char* out, std::size_t max) {
        std::size_t n = std::min(max, m_data.size() - m_pos);
        std::copy_n(m_data.data() + m_pos, n, out);
        m_pos += n;
        return {ChunkStatus::ok, n, m_pos == m_data.size()};
    }

    std::size_t remaining() const { return m_data.size() - m_pos; }
};

/// A stream over any std::istream: a file, a socket buffer, a pipe.
class IstreamDataStream {
    std::istream& m_in;
public:
    explicit IstreamDataStream(std::istream& in) : m_in(in) {}

    ChunkResult read_chunk(char* out, std::size_t max) {
        m_in.read(out, static_cast<std::streamsize>(max));
        std::size_t n = static_cast<std::size_t>(m_in.gcount());
        if(m_in.bad()) {
            return {ChunkStatus::error, n, true, std::make_error_code(std::errc::io_error)};
        }
        return {ChunkStatus::ok, n, m_in.eof()};
    }
};

namespace data_stream_detail {

inline constexpr std::size_t ChunkSize = 4096;

/// Pulls up to `limit` bytes, handing each chunk to `sink`. After the limit
/// is reached one more byte is probed to tell "exactly at the limit" from
/// "cut off"; the probed byte is discarded.
template<DataStreamLike S, class Sink>
StreamOutcome drain(S& stream, std::uint64_t limit, Sink&& sink) {
    std::array<char, ChunkSize> buf;
    StreamOutcome out;
    bool done = false;
    while(!done && out.n.written < limit) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(buf.size(), limit - out.n.written));
        ChunkResult r = stream.read_chunk(buf.data(), want);
        if(r.status == ChunkStatus::error) {
            out.error = r.error ? r.error : std::make_error_code(std::errc::io_error);
            return out;
        }
        if(r.bytes_written > 0) {
            if(std::error_code ec = sink(std::string_view(buf.data(), r.bytes_written))) {
                out.error = ec;
                return out;
            }
            out.n.written += r.bytes_written;
        }
        done = r.done;
    }

    while(!done) {
        char probe;
        ChunkResult r = stream.read_chunk(&probe, 1);
        if(r.status == ChunkStatus::error) {
            out.error = r.error ? r.error : std::make_error_code(std::errc::io_error);
            return out;
        }
        if(r.bytes_written > 0) {
            out.n.complete = false;
            return out;
        }
        done = r.done;
    }
    return out;
}

} // namespace data_stream_detail

/// Appends at most `limit` bytes of `stream` to `out`.
template<DataStreamLike S>
StreamOutcome read_capped_into(S& stream, std::string& out, std::uint64_t limit) {
    return data_stream_detail::drain(stream, limit, [&](std::string_view chunk) {
        out.append(chunk);
        return std::error_code{};
    });
}

/// Writes at most `limit` bytes of `stream` to the open descriptor `fd`.
template<DataStreamLike S>
StreamOutcome stream_capped_to_fd(S& stream, int fd, std::uint64_t limit) {
    return data_stream_detail::drain(stream, limit, [fd](std::string_view chunk) {
        while(!chunk.empty()) {
            ssize_t w = ::write(fd, chunk.data(), chunk.size());
            if(w < 0) {
                if(errno == EINTR) continue;
                return std::error_code(errno, std::system_category());
            }
            chunk.remove_prefix(static_cast<std::size_t>(w));
        }
        return std::error_code{};
    });
}

} // namespace FormFusion

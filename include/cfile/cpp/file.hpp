/**
 * @file file.hpp
 * @date 19 Oct 2026
 *
 * @brief Owning wrapper around a LibC `std::FILE` stream.
 *
 * Using the classical C++ IO mechanisms is often too slow and too opaque,
 * so we stick to the LibC buffered streams, but wrap them into an owning
 * handle, that translates every `errno` into a returned `status_t`.
 */
#pragma once
#include <cerrno>      // `EBADF`
#include <cstdint>     // `std::uint64_t`
#include <cstdio>      // `std::FILE`
#include <string>      // `std::string`
#include <string_view> // `std::string_view`
#include <type_traits> // `std::is_void_v`
#include <utility>     // `std::exchange`

#include "cfile/cpp/config.hpp" // `open_config_t`
#include "cfile/cpp/status.hpp" // `status_t`
#include "cfile/cpp/types.hpp"  // `value_view_t`

namespace unum::cfile {

/**
 * @brief Exclusively owns one open `std::FILE*` and the path it was opened with.
 *
 * The handle is either open or closed, and once closed, stays closed.
 * Every I/O call on a closed handle reports `EBADF` without touching LibC.
 * The stream is released exactly once: by `close()`, `remove()`, or the destructor.
 * Not thread-safe, synchronize externally if shared.
 */
class file_t {
    std::FILE* handle_ = nullptr;
    std::string path_;

    file_t(std::FILE* handle, std::string&& path) noexcept : handle_(handle), path_(std::move(path)) {}

  public:
    file_t() noexcept = default;
    file_t(file_t const&) = delete;
    file_t& operator=(file_t const&) = delete;

    file_t(file_t&& other) noexcept
        : handle_(std::exchange(other.handle_, nullptr)), path_(std::move(other.path_)) {}
    /// Closes the currently owned stream, if any, before taking over the other one.
    file_t& operator=(file_t&& other) noexcept {
        if (this == &other)
            return *this;
        if (handle_)
            std::fclose(handle_);
        handle_ = std::exchange(other.handle_, nullptr);
        path_ = std::move(other.path_);
        return *this;
    }

    ~file_t() noexcept;

    /**
     * @brief Opens a file with one of the LibC mode strings, like `truncate_random_access_k`.
     * @return `bad_path_k` if the path or mode contain a NULL character,
     *         `os_k` if `std::fopen` fails.
     */
    static expected_gt<file_t> open(std::string_view path, std::string_view mode) noexcept;

    /**
     * @brief Opens a file, creating it first if asked, and configures its buffering and permissions.
     */
    static expected_gt<file_t> open(std::string_view path, open_config_t const& config) noexcept;

    /**
     * @brief Opens for reading and overwriting anywhere, creating an empty file if it doesn't exist.
     * Unlike `open(path, random_access_k)`, never fails just because the file is missing.
     */
    static expected_gt<file_t> open_random_access(std::string_view path) noexcept;

    /**
     * @brief Creates an empty file, if it doesn't exist. Doesn't modify existing ones.
     */
    static status_t create(std::string_view path) noexcept;

    /**
     * @brief Flushes and releases the stream. Closing a closed file is a no-op.
     * Even if `std::fclose` reports an error, the stream can't be used anymore.
     */
    status_t close() noexcept;

    /**
     * @brief Closes the stream and deletes the file from the filesystem.
     * The handle is closed afterwards, regardless of the outcome.
     */
    status_t remove() noexcept;

    /**
     * @brief Writes as much of `bytes` as the stream accepts.
     * @return Number of bytes written, which may be smaller than requested.
     */
    expected_gt<std::size_t> write(value_view_t bytes) noexcept;

    /**
     * @brief Writes all of `bytes` or reports `write_mismatch_k` with the partial count.
     */
    status_t write_all(value_view_t bytes) noexcept;

    /**
     * @brief Pushes the buffered output down to the filesystem.
     */
    status_t flush() noexcept;

    /**
     * @brief Reads up to `buffer.size()` bytes.
     * Reaching the end of the file isn't an error, just a smaller count.
     */
    expected_gt<std::size_t> read(value_span_t buffer) noexcept;

    /**
     * @brief Fills the entire `buffer` or fails.
     * If the end of the file is reached first, reports `end_of_file_k` with the
     * number of bytes that were read. Those bytes stay in the front of `buffer`.
     * Other failures are reported as `os_k`.
     */
    status_t read_exact(value_span_t buffer) noexcept;

    /**
     * @brief Reads everything from the current position till the end of the file,
     * into the front of `buffer`, growing it if needed, but never shrinking it.
     * @return Number of bytes read, zero if already at the end.
     */
    expected_gt<std::size_t> read_to_end(bytes_t& buffer) noexcept;

    /**
     * @brief Current offset from the beginning of the file.
     */
    expected_gt<std::uint64_t> current_pos() const noexcept;

    /**
     * @brief Moves the cursor `offset` bytes away from `origin`.
     * @return Resulting absolute offset from the beginning of the file.
     */
    expected_gt<std::uint64_t> seek(seek_origin_t origin, std::int64_t offset) noexcept;

    /**
     * @brief Size of the file in bytes. Preserves the current position.
     */
    expected_gt<std::uint64_t> size() noexcept;

    /**
     * @brief Changes the buffering mode of the stream.
     * Must be called before any other I/O on the stream.
     * @param buffer_size Zero keeps the LibC default size.
     */
    status_t set_buffering(buffering_t buffering, std::size_t buffer_size = 0) noexcept;

    bool is_open() const noexcept { return handle_ != nullptr; }
    std::string const& path() const noexcept { return path_; }

    /**
     * @brief Lends the raw `std::FILE*` to a callback, only while the file is open.
     * The callback must neither close the stream nor keep the pointer.
     * It may return `void`, or a `status_t` to be forwarded.
     */
    template <typename callback_at>
    status_t with_native(callback_at&& callback) {
        if (!handle_)
            return file_error_t::os(EBADF);
        if constexpr (std::is_void_v<decltype(callback(handle_))>) {
            callback(handle_);
            return {};
        }
        else
            return callback(handle_);
    }
};

/**
 * @brief Changes the read/write/execute permissions of a file, like `0644`.
 */
status_t chmod(std::string_view path, unsigned mode) noexcept;

} // namespace unum::cfile

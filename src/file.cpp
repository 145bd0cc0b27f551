/**
 * @file file.cpp
 * @date 19 Oct 2026
 *
 * @brief LibC-backed implementation of `file_t`.
 *
 * Every call resets `errno` before entering LibC, as some of the stream
 * functions may fail without setting it.
 */

#include <sys/stat.h> // `::chmod`
#include <sys/types.h> // `off_t`

#include <cerrno> // `errno`
#include <cstdio> // `std::fopen`

#include "cfile/cpp/file.hpp"

namespace unum::cfile {

static bool is_c_compatible(std::string_view str) noexcept { return str.find('\0') == std::string_view::npos; }

/**
 * @brief Collects the stream error and resets the indicator,
 * so that the next operation starts clean.
 */
static file_error_t take_stream_error(std::FILE* handle) noexcept {
    auto error = file_error_t::last_os();
    std::clearerr(handle);
    return error;
}

file_t::~file_t() noexcept {
    if (handle_)
        std::fclose(handle_);
}

expected_gt<file_t> file_t::open(std::string_view path, std::string_view mode) noexcept {
    return_if_error_m(is_c_compatible(path) && is_c_compatible(mode), file_error_t::bad_path());

    std::string c_path {path};
    std::string c_mode {mode};
    errno = 0;
    std::FILE* handle = std::fopen(c_path.c_str(), c_mode.c_str());
    if (!handle)
        return file_error_t::last_os();
    return file_t {handle, std::move(c_path)};
}

expected_gt<file_t> file_t::open(std::string_view path, open_config_t const& config) noexcept {
    if (config.create_if_missing) {
        auto status = create(path);
        return_on_error_m(status);
    }

    auto maybe_file = open(path, config.mode);
    if (!maybe_file)
        return maybe_file;

    if (config.buffering != buffering_t::full_k || config.buffer_size) {
        auto status = maybe_file->set_buffering(config.buffering, config.buffer_size);
        return_on_error_m(status);
    }

    if (config.permissions) {
        auto status = chmod(path, *config.permissions);
        return_on_error_m(status);
    }

    return maybe_file;
}

expected_gt<file_t> file_t::open_random_access(std::string_view path) noexcept {
    // If the file can't be created, opening it would fail anyway,
    // so we report the more descriptive error of the two.
    auto status = create(path);
    return_on_error_m(status);
    return open(path, random_access_k);
}

status_t file_t::create(std::string_view path) noexcept {
    auto maybe_file = open(path, append_read_k);
    return_on_error_m(maybe_file);
    return maybe_file->close();
}

status_t file_t::close() noexcept {
    if (!handle_)
        return {};

    errno = 0;
    if (std::fclose(std::exchange(handle_, nullptr)) != 0)
        return file_error_t::last_os();
    return {};
}

status_t file_t::remove() noexcept {
    auto closed = close();

    errno = 0;
    if (std::remove(path_.c_str()) != 0)
        return file_error_t::last_os();
    return closed;
}

expected_gt<std::size_t> file_t::write(value_view_t bytes) noexcept {
    return_if_error_m(handle_, file_error_t::os(EBADF));

    errno = 0;
    std::size_t written = std::fwrite(bytes.data(), sizeof(byte_t), bytes.size(), handle_);
    if (!std::ferror(handle_))
        return written;

    // A partial count is still reported, but the indicator is reset either way
    auto error = take_stream_error(handle_);
    if (written)
        return written;
    return error;
}

status_t file_t::write_all(value_view_t bytes) noexcept {
    return_if_error_m(handle_, file_error_t::os(EBADF));

    errno = 0;
    std::size_t written = std::fwrite(bytes.data(), sizeof(byte_t), bytes.size(), handle_);
    if (written == bytes.size())
        return {};

    int code = std::ferror(handle_) ? take_stream_error(handle_).code() : 0;
    return file_error_t::write_mismatch(written, code);
}

status_t file_t::flush() noexcept {
    return_if_error_m(handle_, file_error_t::os(EBADF));

    errno = 0;
    if (std::fflush(handle_) != 0)
        return take_stream_error(handle_);
    return {};
}

expected_gt<std::size_t> file_t::read(value_span_t buffer) noexcept {
    return_if_error_m(handle_, file_error_t::os(EBADF));

    errno = 0;
    std::size_t count = std::fread(buffer.data(), sizeof(byte_t), buffer.size(), handle_);
    if (!std::ferror(handle_))
        return count;

    auto error = take_stream_error(handle_);
    if (count)
        return count;
    return error;
}

status_t file_t::read_exact(value_span_t buffer) noexcept {
    return_if_error_m(handle_, file_error_t::os(EBADF));

    errno = 0;
    std::size_t count = std::fread(buffer.data(), sizeof(byte_t), buffer.size(), handle_);
    if (count == buffer.size())
        return {};

    // Check if we hit the end of the file
    if (std::feof(handle_) && !std::ferror(handle_))
        return file_error_t::end_of_file(count);
    return take_stream_error(handle_);
}

expected_gt<std::size_t> file_t::read_to_end(bytes_t& buffer) noexcept {
    auto maybe_pos = current_pos();
    return_on_error_m(maybe_pos);
    auto maybe_end = seek(seek_origin_t::end_k, 0);
    return_on_error_m(maybe_end);

    std::uint64_t pos = *maybe_pos;
    std::uint64_t end = *maybe_end;
    if (pos == end)
        return std::size_t(0);

    // Also covers the cursor left beyond the end of the file
    auto restored = seek(seek_origin_t::start_k, static_cast<std::int64_t>(pos));
    return_on_error_m(restored);
    if (pos > end)
        return std::size_t(0);

    // Grow exactly as much as needed, without the usual geometric over-allocation
    auto to_read = static_cast<std::size_t>(end - pos);
    if (buffer.size() < to_read) {
        buffer.reserve(to_read);
        buffer.resize(to_read, byte_t {0});
    }

    auto status = read_exact(value_span_t {buffer.data(), to_read});
    if (status)
        return to_read;

    // The file was truncated by someone else in the meantime
    if (status.error().kind() == end_of_file_k)
        return status.error().count();
    return status.release_error();
}

expected_gt<std::uint64_t> file_t::current_pos() const noexcept {
    return_if_error_m(handle_, file_error_t::os(EBADF));

    errno = 0;
    off_t pos = ::ftello(handle_);
    if (pos < 0)
        return file_error_t::last_os();
    return static_cast<std::uint64_t>(pos);
}

expected_gt<std::uint64_t> file_t::seek(seek_origin_t origin, std::int64_t offset) noexcept {
    return_if_error_m(handle_, file_error_t::os(EBADF));

    int whence = SEEK_SET;
    switch (origin) {
    case seek_origin_t::start_k:
        return_if_error_m(offset >= 0, file_error_t::os(EINVAL));
        whence = SEEK_SET;
        break;
    case seek_origin_t::end_k: whence = SEEK_END; break;
    case seek_origin_t::current_k: whence = SEEK_CUR; break;
    }

    errno = 0;
    if (::fseeko(handle_, static_cast<off_t>(offset), whence) != 0)
        return file_error_t::last_os();
    return current_pos();
}

expected_gt<std::uint64_t> file_t::size() noexcept {
    auto maybe_pos = current_pos();
    return_on_error_m(maybe_pos);
    auto maybe_end = seek(seek_origin_t::end_k, 0);
    return_on_error_m(maybe_end);
    auto restored = seek(seek_origin_t::start_k, static_cast<std::int64_t>(*maybe_pos));
    return_on_error_m(restored);
    return maybe_end;
}

status_t file_t::set_buffering(buffering_t buffering, std::size_t buffer_size) noexcept {
    return_if_error_m(handle_, file_error_t::os(EBADF));

    errno = 0;
    if (std::setvbuf(handle_, nullptr, to_native(buffering), buffer_size ? buffer_size : BUFSIZ) != 0)
        return errno ? file_error_t::last_os() : file_error_t::os(EINVAL);
    return {};
}

status_t chmod(std::string_view path, unsigned mode) noexcept {
    return_if_error_m(is_c_compatible(path), file_error_t::bad_path());

    std::string c_path {path};
    errno = 0;
    if (::chmod(c_path.c_str(), static_cast<mode_t>(mode)) != 0)
        return file_error_t::last_os();
    return {};
}

} // namespace unum::cfile

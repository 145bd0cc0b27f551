/**
 * @file status.hpp
 * @date 19 Oct 2026
 *
 * @brief Error taxonomy and the Monads carrying it out of every call.
 */

#pragma once
#include <cstddef>     // `std::size_t`
#include <cstring>     // `std::strcmp`
#include <optional>    // `std::optional`
#include <stdexcept>   // `std::runtime_error`
#include <string>      // `std::string`
#include <string_view> // `std::string_view`
#include <utility>     // `std::exchange`

#include <fmt/format.h> // `fmt::formatter`

namespace unum::cfile {

enum error_kind_t {
    success_k = 0,
    /// A LibC call failed, `code()` holds its `errno`.
    os_k,
    /// Path or mode can't be passed to LibC, as it contains a NULL character.
    bad_path_k,
    /// A fixed-size read reached the end of the file, `count()` bytes were read.
    end_of_file_k,
    /// A full write stopped after `count()` bytes, `code()` holds `errno` if it was set.
    write_mismatch_k,
    /// Open-configuration is malformed, `message()` explains.
    config_k,
};

/**
 * @brief Tagged union over everything that can go wrong with a file.
 * Carries just enough to recover the native error code, if one exists.
 */
class file_error_t {
    error_kind_t kind_ = success_k;
    int code_ = 0;
    std::size_t count_ = 0;
    char const* note_ = nullptr;

    file_error_t(error_kind_t kind, int code, std::size_t count, char const* note = nullptr) noexcept
        : kind_(kind), code_(code), count_(count), note_(note) {}

  public:
    file_error_t() noexcept = default;

    static file_error_t os(int code) noexcept { return {os_k, code, 0}; }
    static file_error_t last_os() noexcept;
    static file_error_t bad_path() noexcept { return {bad_path_k, 0, 0}; }
    static file_error_t end_of_file(std::size_t count) noexcept { return {end_of_file_k, 0, count}; }
    static file_error_t write_mismatch(std::size_t count, int code) noexcept { return {write_mismatch_k, code, count}; }
    /// @param note Must be a string literal or otherwise outlive the error.
    static file_error_t config(char const* note) noexcept { return {config_k, 0, 0, note}; }

    error_kind_t kind() const noexcept { return kind_; }
    explicit operator bool() const noexcept { return kind_ != success_k; }

    /// Native `errno`, or zero for errors that don't originate in LibC.
    int code() const noexcept { return code_; }
    /// Bytes transferred before the failure, for partial reads and writes.
    std::size_t count() const noexcept { return count_; }

    /**
     * @brief Human-readable description.
     * For native codes matches `std::strerror`, but is thread-safe.
     */
    std::string message() const;

    bool operator==(file_error_t const& other) const noexcept {
        return kind_ == other.kind_ && code_ == other.code_ && count_ == other.count_ &&
               (note_ == other.note_ || (note_ && other.note_ && std::strcmp(note_, other.note_) == 0));
    }
    bool operator!=(file_error_t const& other) const noexcept { return !operator==(other); }
};

class [[nodiscard]] status_t {
    file_error_t error_;

  public:
    status_t() noexcept = default;
    status_t(file_error_t error) noexcept : error_(error) {}
    operator bool() const noexcept { return !error_; }

    status_t(status_t const&) = default;
    status_t& operator=(status_t const&) = default;

    status_t(status_t&& other) noexcept : error_(std::exchange(other.error_, file_error_t {})) {}
    status_t& operator=(status_t&& other) noexcept {
        std::swap(error_, other.error_);
        return *this;
    }

    std::runtime_error release_exception();

    void throw_unhandled() {
        if (error_) // C++20: [[unlikely]]
            throw release_exception();
    }

    file_error_t const& error() const noexcept { return error_; }
    file_error_t release_error() noexcept { return std::exchange(error_, file_error_t {}); }
    std::string message() const { return error_.message(); }
};

/**
 * @brief Extends `std::optional` to support a status, describing empty state.
 */
template <typename object_at>
class [[nodiscard]] expected_gt {
  protected:
    status_t status_;
    object_at object_;

  public:
    expected_gt() = default;
    expected_gt(object_at&& object) : object_(std::move(object)) {}
    expected_gt(object_at const& object) : object_(object) {}
    expected_gt(status_t&& status, object_at&& default_object = object_at {})
        : status_(std::move(status)), object_(std::move(default_object)) {}
    expected_gt(file_error_t error) : status_(error), object_() {}

    expected_gt(expected_gt&& other) noexcept : status_(std::move(other.status_)), object_(std::move(other.object_)) {}

    expected_gt& operator=(expected_gt&& other) noexcept {
        std::swap(status_, other.status_);
        std::swap(object_, other.object_);
        return *this;
    }

    operator bool() const noexcept { return status_; }
    object_at operator*() && noexcept { return std::move(object_); }
    object_at& operator*() & noexcept { return object_; }
    object_at const& operator*() const& noexcept { return object_; }
    object_at* operator->() noexcept { return &object_; }
    object_at const* operator->() const noexcept { return &object_; }
    operator std::optional<object_at>() && {
        return !status_ ? std::nullopt : std::optional<object_at> {std::move(object_)};
    }

    file_error_t const& error() const noexcept { return status_.error(); }
    file_error_t release_error() noexcept { return status_.release_error(); }
    void throw_unhandled() { return status_.throw_unhandled(); }
    status_t release_status() { return std::exchange(status_, status_t {}); }
    object_at& throw_or_ref() & {
        status_.throw_unhandled();
        return object_;
    }
    object_at throw_or_release() && {
        status_.throw_unhandled();
        return std::move(object_);
    }

    template <typename hetero_at>
    bool operator==(hetero_at const& other) const noexcept {
        return status_ && object_ == other;
    }

    template <typename hetero_at>
    bool operator!=(hetero_at const& other) const noexcept {
        return !status_ || object_ != other;
    }
};

} // namespace unum::cfile

template <>
struct fmt::formatter<unum::cfile::file_error_t> : fmt::formatter<std::string_view> {
    template <typename context_at>
    auto format(unum::cfile::file_error_t const& error, context_at& ctx) const {
        using namespace unum::cfile;
        switch (error.kind()) {
        case os_k: return fmt::format_to(ctx.out(), "os error {}: {}", error.code(), error.message());
        case end_of_file_k: return fmt::format_to(ctx.out(), "end of file after {} bytes", error.count());
        case write_mismatch_k:
            return fmt::format_to(ctx.out(),
                                  "wrote only {} bytes, os error {}: {}",
                                  error.count(),
                                  error.code(),
                                  error.message());
        default: return fmt::format_to(ctx.out(), "{}", error.message());
        }
    }
};

/**
 * Early-return helpers for functions returning `status_t` or `expected_gt`.
 */
#define return_if_error_m(must_be_true, error) \
    if (!(must_be_true))                       \
        return error;

#define return_on_error_m(status)            \
    {                                        \
        if (!(status))                       \
            return (status).release_error(); \
    }

/**
 * @file types.hpp
 * @date 19 Oct 2026
 *
 * @brief Byte views, buffers and the fixed vocabulary of modes and origins.
 */

#pragma once
#include <algorithm>   // `std::equal`
#include <cstdint>     // `std::uint8_t`
#include <cstdio>      // `_IOFBF`
#include <cstring>     // `std::strlen`
#include <iterator>    // `std::begin`
#include <string>      // `std::string`
#include <string_view> // `std::string_view`
#include <vector>      // `std::vector`

namespace unum::cfile {

enum class byte_t : std::uint8_t {};

using bytes_t = std::vector<byte_t>;

/**
 * @brief Allocates a zero-filled buffer of `length` bytes.
 */
inline bytes_t make_buffer(std::size_t length) { return bytes_t(length, byte_t {0}); }

#pragma region Modes

/// Reading only. The file must exist.
constexpr char const* read_only_k = "r";
/// Writing only. Truncates an existing file or creates a new one.
constexpr char const* write_only_k = "w";
/// Writing at the end of the file only. Creates the file if missing.
constexpr char const* append_only_k = "a";
/// Reading anywhere and writing at the end. Creates the file if missing.
constexpr char const* append_read_k = "a+";
/// Reading and overwriting anywhere. The file must exist.
constexpr char const* update_k = "rb+";
/// Same as `update_k`.
constexpr char const* random_access_k = "rb+";
/// Reading and overwriting anywhere. Truncates or creates the file.
constexpr char const* truncate_random_access_k = "wb+";

constexpr char const* modes_k[] = {
    read_only_k,
    write_only_k,
    append_only_k,
    append_read_k,
    update_k,
    truncate_random_access_k,
};

inline bool is_known_mode(std::string_view mode) noexcept {
    return std::find(std::begin(modes_k), std::end(modes_k), mode) != std::end(modes_k);
}

enum class seek_origin_t {
    start_k,
    end_k,
    current_k,
};

enum class buffering_t {
    full_k,
    line_k,
    none_k,
};

inline int to_native(buffering_t buffering) noexcept {
    switch (buffering) {
    case buffering_t::line_k: return _IOLBF;
    case buffering_t::none_k: return _IONBF;
    default: return _IOFBF;
    }
}

#pragma region Views

/**
 * @brief Immutable contiguous range of bytes, passed into writes.
 * Doesn't own the memory.
 */
class value_view_t {

    byte_t const* ptr_ = nullptr;
    std::size_t length_ = 0;

  public:
    using value_type = byte_t;

    inline value_view_t() = default;
    inline value_view_t(byte_t const* ptr, std::size_t length) noexcept : ptr_(ptr), length_(length) {}
    inline value_view_t(byte_t const* begin, byte_t const* end) noexcept
        : ptr_(begin), length_(static_cast<std::size_t>(end - begin)) {}

    inline value_view_t(char const* c_str) noexcept
        : ptr_(reinterpret_cast<byte_t const*>(c_str)), length_(c_str ? std::strlen(c_str) : 0) {}

    template <typename char_at, typename traits_at>
    inline value_view_t(std::basic_string_view<char_at, traits_at> view) noexcept
        : ptr_(reinterpret_cast<byte_t const*>(view.data())), length_(view.size() * sizeof(char_at)) {}

    inline value_view_t(std::string const& str) noexcept
        : ptr_(reinterpret_cast<byte_t const*>(str.data())), length_(str.size()) {}

    inline value_view_t(bytes_t const& bytes) noexcept : ptr_(bytes.data()), length_(bytes.size()) {}

    inline std::size_t size() const noexcept { return length_; }
    inline byte_t const* data() const noexcept { return ptr_; }
    inline char const* c_str() const noexcept { return reinterpret_cast<char const*>(ptr_); }
    inline byte_t const* begin() const noexcept { return ptr_; }
    inline byte_t const* end() const noexcept { return ptr_ + length_; }
    inline bool empty() const noexcept { return !length_; }
    inline value_view_t prefix(std::size_t n) const noexcept { return {ptr_, std::min(n, length_)}; }
    operator std::string_view() const noexcept { return {c_str(), length_}; }

    bool operator==(value_view_t other) const noexcept {
        return size() == other.size() && std::equal(begin(), end(), other.begin());
    }
    bool operator!=(value_view_t other) const noexcept { return !operator==(other); }
};

/**
 * @brief Mutable contiguous range of bytes, filled by reads.
 * Doesn't own the memory.
 */
class value_span_t {

    byte_t* ptr_ = nullptr;
    std::size_t length_ = 0;

  public:
    using value_type = byte_t;

    inline value_span_t() = default;
    inline value_span_t(byte_t* ptr, std::size_t length) noexcept : ptr_(ptr), length_(length) {}
    inline value_span_t(char* ptr, std::size_t length) noexcept
        : ptr_(reinterpret_cast<byte_t*>(ptr)), length_(length) {}
    inline value_span_t(bytes_t& bytes) noexcept : ptr_(bytes.data()), length_(bytes.size()) {}
    inline value_span_t(std::string& str) noexcept
        : ptr_(reinterpret_cast<byte_t*>(str.data())), length_(str.size()) {}

    template <std::size_t length_ak>
    inline value_span_t(char (&array)[length_ak]) noexcept
        : ptr_(reinterpret_cast<byte_t*>(array)), length_(length_ak) {}

    inline std::size_t size() const noexcept { return length_; }
    inline byte_t* data() const noexcept { return ptr_; }
    inline byte_t* begin() const noexcept { return ptr_; }
    inline byte_t* end() const noexcept { return ptr_ + length_; }
    inline bool empty() const noexcept { return !length_; }
    inline value_span_t prefix(std::size_t n) const noexcept { return {ptr_, std::min(n, length_)}; }
    operator value_view_t() const noexcept { return {ptr_, length_}; }
    operator std::string_view() const noexcept { return {reinterpret_cast<char const*>(ptr_), length_}; }
};

} // namespace unum::cfile

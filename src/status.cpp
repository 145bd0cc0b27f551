/**
 * @file status.cpp
 * @date 19 Oct 2026
 *
 * @brief Rendering of errors into human-readable form.
 */

#include <cerrno>       // `errno`
#include <system_error> // `std::generic_category`

#include <fmt/format.h>

#include "cfile/cpp/status.hpp"

namespace unum::cfile {

file_error_t file_error_t::last_os() noexcept {
    // Some LibC calls fail without setting `errno` at all.
    return os(errno ? errno : EIO);
}

std::string file_error_t::message() const {
    switch (kind_) {
    case success_k: return "Success";
    case os_k: return std::generic_category().message(code_);
    case bad_path_k: return "The path supplied is invalid";
    case end_of_file_k: return "The end of the file was reached";
    case write_mismatch_k:
        return code_ ? std::generic_category().message(code_) : "Not all bytes were written to the file";
    case config_k: return note_ ? note_ : "Invalid configuration";
    }
    return "Unknown error";
}

std::runtime_error status_t::release_exception() {
    std::runtime_error result(fmt::format("{}", error_));
    error_ = file_error_t {};
    return result;
}

} // namespace unum::cfile

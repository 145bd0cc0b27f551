/**
 * @file config.hpp
 * @date 19 Oct 2026
 *
 * @brief Open-configurations, that can be stored and shipped as JSON.
 */
#pragma once

#include <cmath>             // `std::isnan`
#include <cstdint>           // `uint8_t`
#include <limits>            // `std::numeric_limit`
#include <optional>          // `std::optional`
#include <sstream>           // `std::stringstream`
#include <string>            // `std::string`
#include <nlohmann/json.hpp> // `nlohmann::json`
#include <fmt/format.h>      // `fmt::format`

#include "cfile/cpp/status.hpp" // `status_t`
#include "cfile/cpp/types.hpp"  // `buffering_t`

namespace unum::cfile {

using json_t = nlohmann::json;

/**
 * @brief How a file should be opened and buffered.
 *
 * @mode: One of the fixed LibC mode strings, like "rb+".
 * @create_if_missing: Create an empty file before opening, if none exists.
 * @buffering: Full, line or no buffering of the stream.
 * @buffer_size: Size of the stream buffer, zero keeps the LibC default.
 * @permissions: Permission bits applied after opening, like 0644.
 */
struct open_config_t {
    std::string mode = random_access_k;
    bool create_if_missing = false;
    buffering_t buffering = buffering_t::full_k;
    std::size_t buffer_size = 0;
    std::optional<unsigned> permissions;
};

/**
 * @brief Open-configurations loader
 */
class config_loader_t {
  public:
    static constexpr uint8_t current_major_version_k = 1;
    static constexpr uint8_t current_minor_version_k = 0;

  public:
    static inline status_t load_from_json(json_t const& json, open_config_t& config);
    static inline status_t load_from_json_string(std::string const& str_json,
                                                 open_config_t& config,
                                                 bool ignore_comments = false);

    static inline status_t save_to_json(open_config_t const& config, json_t& json);
    static inline status_t save_to_json_string(open_config_t const& config, std::string& str_json);

  private:
    static inline std::string current_version() noexcept;
    static inline status_t validate_config(json_t const& json);

    static inline bool parse_version(std::string const& str_version, uint8_t& major, uint8_t& minor) noexcept;
    static inline bool parse_buffering(std::string const& str, buffering_t& buffering) noexcept;
    static inline bool parse_volume(json_t const& json, std::string const& key, size_t& bytes) noexcept;
    static inline bool parse_bytes(std::string const& str, size_t& bytes) noexcept;
    static inline bool parse_permissions(json_t const& json, std::optional<unsigned>& permissions) noexcept;
    static inline char const* buffering_name(buffering_t buffering) noexcept;
};

inline status_t config_loader_t::load_from_json(json_t const& json, open_config_t& result) {

    // The caller's config stays untouched unless the whole document is valid
    open_config_t config;
    try {
        auto status = validate_config(json);
        if (!status)
            return status;

        config.mode = json.value("mode", std::string(random_access_k));
        if (!is_known_mode(config.mode))
            return file_error_t::config("Unsupported file mode");

        config.create_if_missing = json.value("create_if_missing", false);

        if (json.contains("buffering"))
            if (!parse_buffering(json["buffering"].get<std::string>(), config.buffering))
                return file_error_t::config("Unknown buffering, expected \"full\", \"line\" or \"none\"");

        if (!parse_volume(json, "buffer_size", config.buffer_size))
            return file_error_t::config("Invalid buffer size format");

        if (!parse_permissions(json, config.permissions))
            return file_error_t::config("Invalid permissions format");
    }
    catch (json_t::exception const&) {
        return file_error_t::config("Exception occurred: Invalid json config file");
    }

    result = std::move(config);
    return {};
}

inline status_t config_loader_t::load_from_json_string(std::string const& str_json,
                                                       open_config_t& config,
                                                       bool ignore_comments) {
    auto json = json_t::parse(str_json, nullptr, false, ignore_comments);
    if (json.is_discarded())
        return file_error_t::config("Config isn't a valid JSON document");
    return load_from_json(json, config);
}

inline status_t config_loader_t::save_to_json(open_config_t const& config, json_t& json) {

    json.clear();
    json["version"] = current_version();
    json["mode"] = config.mode;
    json["create_if_missing"] = config.create_if_missing;
    json["buffering"] = buffering_name(config.buffering);
    json["buffer_size"] = config.buffer_size;
    if (config.permissions)
        json["permissions"] = fmt::format("{:04o}", *config.permissions);

    return {};
}

inline status_t config_loader_t::save_to_json_string(open_config_t const& config, std::string& str_json) {
    json_t json;
    auto status = save_to_json(config, json);
    if (!status)
        return status;

    str_json = json.dump();
    return {};
}

inline std::string config_loader_t::current_version() noexcept {
    return fmt::format("{}.{}", current_major_version_k, current_minor_version_k);
}

inline status_t config_loader_t::validate_config(json_t const& json) {

    if (!json.is_object())
        return file_error_t::config("Config must be a JSON object");

    std::string version = json.value("version", std::string());
    uint8_t major_version = 0;
    uint8_t minor_version = 0;
    if (!parse_version(version.c_str(), major_version, minor_version))
        return file_error_t::config("Invalid version format");
    if (major_version != current_major_version_k || minor_version != current_minor_version_k)
        return file_error_t::config("Version not supported");
    return {};
}

inline bool config_loader_t::parse_version(std::string const& str_version, uint8_t& major, uint8_t& minor) noexcept {

    int mj = 0;
    int mn = 0;
    try {
        size_t pos = 0;
        std::string str = str_version.c_str();
        mj = std::stoul(str, &pos);
        if (pos == str.size())
            return false;
        str = str.substr(++pos);
        mn = std::stoul(str, &pos);
        if (pos < str.size())
            return false;
    }
    catch (std::exception const&) {
        return false;
    }
    if (mj < 0 || mn < 0 || mj > int(std::numeric_limits<uint8_t>::max()) ||
        mn > int(std::numeric_limits<uint8_t>::max()))
        return false;

    major = static_cast<uint8_t>(mj);
    minor = static_cast<uint8_t>(mn);
    return true;
}

inline bool config_loader_t::parse_buffering(std::string const& str, buffering_t& buffering) noexcept {
    if (str == "full")
        buffering = buffering_t::full_k;
    else if (str == "line")
        buffering = buffering_t::line_k;
    else if (str == "none")
        buffering = buffering_t::none_k;
    else
        return false;
    return true;
}

inline char const* config_loader_t::buffering_name(buffering_t buffering) noexcept {
    switch (buffering) {
    case buffering_t::line_k: return "line";
    case buffering_t::none_k: return "none";
    default: return "full";
    }
}

inline bool config_loader_t::parse_volume(json_t const& json, std::string const& key, size_t& bytes) noexcept {

    auto it = json.find(key.c_str());
    if (it == json.end())
        return true; // Skip if not exist

    switch (it->type()) {
    case json_t::value_t::number_unsigned: {
        bytes = it->get<size_t>();
        return true;
    }
    case json_t::value_t::string: {
        std::string value = it->get<std::string>();
        return parse_bytes(value, bytes);
    }
    default: break;
    }

    return false;
}

inline bool config_loader_t::parse_bytes(std::string const& str, size_t& bytes) noexcept {

    if (str.empty()) { // Just set zero if it is empty
        bytes = 0;
        return true;
    }

    // Parse number
    double number = 0.0;
    std::stringstream ss(str.c_str());
    if (str.rfind('.', 0) == 0 || (ss >> number).fail() || std::isnan(number) || number < 0)
        return false;

    // Parse unit
    std::string metric;
    if (ss >> metric) {
        if (metric == "KB")
            number *= 1024ull;
        else if (metric == "MB")
            number *= 1024 * 1024ull;
        else if (metric == "GB")
            number *= 1024 * 1024 * 1024ull;
        else if (metric != "B" || str.find('.') != std::string::npos)
            return false;
    }
    else if (str.find('.') != std::string::npos)
        return false;

    if (!ss.eof())
        return false;
    if (std::isnan(number) || number > double(std::numeric_limits<size_t>::max()))
        return false;

    bytes = static_cast<size_t>(number);
    return true;
}

inline bool config_loader_t::parse_permissions(json_t const& json, std::optional<unsigned>& permissions) noexcept {

    auto it = json.find("permissions");
    if (it == json.end() || it->is_null())
        return true;

    // Range-check before narrowing, so that huge values don't wrap into valid bits
    std::uint64_t bits = 0;
    if (it->is_number_unsigned())
        bits = it->get<std::uint64_t>();
    else if (it->is_string()) {
        std::string str = it->get<std::string>();
        if (str.empty() || str.find_first_not_of("01234567") != std::string::npos)
            return false;
        try {
            bits = std::stoull(str, nullptr, 8);
        }
        catch (std::exception const&) {
            return false;
        }
    }
    else
        return false;

    if (bits > 07777)
        return false;
    permissions = static_cast<unsigned>(bits);
    return true;
}

} // namespace unum::cfile

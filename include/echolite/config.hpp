#pragma once
/**
 * @file config.hpp
 * @brief echolite-cli defaults, loaded from a small JSON file.
 *
 * Location: `$XDG_CONFIG_HOME/echolite/config.json`, or
 * `$HOME/.config/echolite/config.json` when XDG_CONFIG_HOME is unset.
 *
 * Example:
 * @code
 * {
 *   "seoj": "0x05FF01",
 *   "deoj": 166913,
 *   "format": "json",
 *   "log_level": "debug"
 * }
 * @endcode
 *
 * All keys are optional. A missing file is not an error. Loading never
 * throws: a bad value stops the load and names the key in `err`
 * (`config_seoj`, `config_format`, ...).
 */

#include "echolite/log.hpp"
#include "echolite/requests.hpp"

#include <cstdint>
#include <string>

namespace echolite {

struct Config {
    uint32_t      seoj      = EOJ_CONTROLLER;
    uint32_t      deoj      = EOJ_SMART_METER;
    std::string   format    = "pretty";        ///< pretty | json | raw
    Logger::Level log_level = Logger::kInfo;
};

/// XDG path described above. Empty when neither variable is set.
std::string default_config_path();

/// True for "pretty", "json" and "raw".
bool is_output_format(const std::string& s);

/**
 * @brief Apply a JSON document on top of `cfg`.
 * @param err  `config_syntax`, `config_root` or `config_<key>` on failure.
 * @return false on the first bad value; `cfg` is left unchanged.
 */
bool parse_config(const std::string& text, Config& cfg, std::string& err);

/**
 * @brief Read `path` and apply it with parse_config().
 *
 * A file that does not exist leaves `cfg` alone and returns true.
 * An unreadable file sets err to `config_read`.
 */
bool load_config(const std::string& path, Config& cfg, std::string& err);

} // namespace echolite

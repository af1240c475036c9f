#pragma once
/**
 * @file cli_args.hpp
 * @brief Text-to-frame plumbing behind echolite-cli.
 *
 * cli/main.cpp only wires CLI11 options to these functions and prints what
 * they return, so the argument syntax and the JSON rendering can be tested
 * without spawning the tool.
 *
 * Argument syntax:
 *   - Codes (ESV, EOJ, EPC) are hex, with or without "0x": "62", "0x05FF01".
 *     A sign is never accepted on a code.
 *   - Numbers (TID, property values) are decimal, or hex with "0x".
 *   - Properties are "EPC" (value 0) or "EPC=VALUE": "E7", "80=0x30".
 *
 * Every failure is reported as a snake_case token for
 * `status=error reason=<token>`.
 */

#include "echolite/config.hpp"
#include "echolite/frame.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace echolite {

/// Decimal or 0x-hex unsigned number no larger than `max`.
bool parse_number(const std::string& s, uint64_t max, uint64_t& out);

/// Hex code with optional 0x prefix, no larger than `max`.
bool parse_code(const std::string& s, uint64_t max, uint64_t& out);

/// "EPC" or "EPC=VALUE". The value is checked later, by Frame::make().
bool parse_prop(const std::string& s, PropertyInput& out);

/// Raw `encode` flags as typed; empty strings mean "not given".
struct EncodeArgs {
  std::string esv, tid, seoj, deoj;
  std::vector<std::string> props;
};

/**
 * @brief Turn `encode` flags into a frame. SEOJ/DEOJ default to the config.
 * @param reason  invalid_esv / invalid_tid / invalid_seoj / invalid_deoj /
 *                invalid_prop, or a FrameStatus reason from Frame::make().
 */
bool build_frame(const EncodeArgs& a, const Config& cfg, Frame& out, std::string& reason);

/// Hex text to Frame. `reason` is invalid_hex or a FrameStatus reason.
bool decode_hex(const std::string& text, Frame& out, std::string& reason);

/// Flags that override config-file values when present.
struct CliOverrides {
  std::optional<std::string> format;
  std::optional<std::string> log_level;
};

/// Apply flags on top of a loaded config. `reason` is invalid_format / invalid_log_level.
bool apply_overrides(const CliOverrides& o, Config& cfg, std::string& reason);

/**
 * @brief `decode --format json` document.
 *
 * @code
 * {"tid":1,"seoj":"0x05ff01","deoj":"0x028801","esv":"0x62",
 *  "properties":[{"epc":"0xe7","pdc":0,"edt":"0x0","value":"0"}],
 *  "hex":"1081000105ff010288016201e700"}
 * @endcode
 *
 * `value` is a decimal string because an EDT may exceed 64 bits.
 */
nlohmann::json frame_to_json(const Frame& f);

/// Text printed by `decode` for a config format (pretty / json / raw).
std::string render_frame(const Frame& f, const std::string& format);

} // namespace echolite

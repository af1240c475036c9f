#pragma once
/**
 * @file hex.hpp
 * @brief Hex text <-> byte buffer helpers for logs, the CLI and tests.
 *
 * Not part of the wire format. Frames travel as raw bytes; hex is only how
 * humans paste them into a terminal or read them back from a log line.
 */

#include <string>
#include <vector>
#include <cstdint>

namespace echolite {

/// Value of one hex digit (either case), or -1.
int hex_nibble(char c);

/// `v` as exactly `digits` lowercase hex digits, no prefix (hex_fixed(0x62, 4) == "0062").
std::string hex_fixed(uint32_t v, int digits);

/// Lowercase hex, two digits per byte, no separators ("1081000105ff01").
std::string bytes_to_hex(const uint8_t* p, size_t n);
std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

/**
 * @brief Parse hex text into bytes.
 *
 * Accepts an optional "0x" prefix and ignores spaces, tabs, ':' and '-'
 * between digits, so "10 81 00 01", "10:81:00:01" and "0x10810001" all decode.
 *
 * @param text  Input text.
 * @param out   Cleared, then filled on success. Left empty on failure.
 * @return false on an odd number of digits or any other character.
 */
bool hex_to_bytes(const std::string& text, std::vector<uint8_t>& out);

} // namespace echolite

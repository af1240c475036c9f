/**
 * @file edt.hpp
 * @brief echolite Edt: arbitrary-precision, non-negative property value (EDT).
 *
 * An ECHONET Lite property carries its payload (EDT) as a big-endian unsigned
 * integer of PDC bytes, and PDC is a single byte. So an EDT is never wider than
 * 255 bytes, which lets us store it in a fixed-capacity ETL vector instead of
 * pulling in a general big-integer library.
 *
 * ### Representation
 * - `mag_` holds the *minimal* big-endian magnitude: no leading zero bytes.
 * - Zero is the empty vector. Its encoded byte length is still 1 (one 0x00).
 *
 * ### Creation paths
 * - `Edt(uint64_t)` for machine integers.
 * - `Edt::from_bytes()` for wire bytes (leading zeros stripped, value kept).
 * - `Edt::from_string()` for decimal or `0x` hex text of any width up to 255 bytes.
 * - `Edt::from_number()` for floating-point input; non-integral values are refused.
 *
 * ### Output paths
 * - `to_u64()` when `fits_u64()`, `to_hex()`, `to_decimal()`.
 * - `write_be(n, out)` appends exactly n bytes, left-padded with zeros.
 */

#ifndef ECHOLITE_EDT_HPP
#define ECHOLITE_EDT_HPP

#include "etl/vector.h"
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace echolite {

/// Largest EDT the 1-byte PDC field can describe.
static constexpr size_t EDT_MAX_BYTES = 255;

using EdtBytes = etl::vector<uint8_t, EDT_MAX_BYTES>;

/// Result codes for the text / number creation paths.
enum class EdtStatus : uint8_t {
  Ok = 0,
  Negative,     // leading '-' with a non-zero magnitude, or a negative number
  NonIntegral,  // number with a fractional part, NaN or infinity
  Malformed,    // empty text, bad digit, bad prefix
  TooLong,      // needs more than EDT_MAX_BYTES bytes
};

class Edt {
public:
  /// Zero.
  Edt() = default;

  explicit Edt(uint64_t v);

  /**
   * @brief Build from big-endian bytes. Leading zero bytes are dropped.
   * @return false if the significant part exceeds EDT_MAX_BYTES.
   */
  static bool from_bytes(const uint8_t* p, size_t n, Edt& out);

  /**
   * @brief Parse decimal ("1234") or hex ("0x04d2") text, optional leading '+'/'-'.
   *
   * "-0" is accepted as zero. Any other negative text returns EdtStatus::Negative.
   * `out` is only written on EdtStatus::Ok.
   */
  static EdtStatus from_string(const std::string& text, Edt& out);

  /**
   * @brief Convert a floating-point number that holds an integer value.
   *
   * Doubles above 2^64 are converted exactly from their mantissa/exponent, so
   * 1e30 becomes the integer 1000000000000000019884624838656.
   */
  static EdtStatus from_number(double v, Edt& out);

  bool   is_zero() const { return mag_.empty(); }

  /// Minimal encoded width in bytes (ceil(hex digits / 2)); 1 for zero.
  size_t byte_length() const { return mag_.empty() ? 1 : mag_.size(); }

  bool     fits_u64() const { return mag_.size() <= 8; }
  uint64_t to_u64() const;   // low 64 bits if !fits_u64()

  std::string to_hex() const;      // lowercase, no prefix, "0" for zero
  std::string to_decimal() const;

  /// Append exactly n bytes, big-endian, left-padded with zeros.
  /// High-order bytes beyond n are not written; callers size n from byte_length().
  void write_be(size_t n, std::vector<uint8_t>& out) const;

  const EdtBytes& magnitude() const { return mag_; }

  bool operator==(const Edt& o) const { return mag_ == o.mag_; }
  bool operator!=(const Edt& o) const { return !(*this == o); }

private:
  EdtBytes mag_{};

  // little-endian scratch -> minimal big-endian magnitude
  static bool assign_le(const std::vector<uint8_t>& le, Edt& out);
};

} // namespace echolite

#endif // ECHOLITE_EDT_HPP

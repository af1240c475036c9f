/**
 * @file frame.hpp
 * @brief echolite Frame: immutable ECHONET Lite frame (EHD/TID/SEOJ/DEOJ/ESV/OPC + properties).
 *
 * This is the codec. Everything else in the repository is a convenience around it.
 *
 * ### Wire layout (all integers big-endian)
 *
 * | Offset | Size | Field | Meaning                                  |
 * |--------|------|-------|------------------------------------------|
 * | 0      | 2    | EHD   | fixed header 0x10 0x81                   |
 * | 2      | 2    | TID   | transaction id, correlates req/resp      |
 * | 4      | 3    | SEOJ  | source object (class group/class/inst)   |
 * | 7      | 3    | DEOJ  | destination object                       |
 * | 10     | 1    | ESV   | service code (Get, Get_Res, INF, ...)    |
 * | 11     | 1    | OPC   | number of property records that follow   |
 * | 12     | ...  | props | OPC × [EPC:1][PDC:1][EDT:PDC]            |
 *
 * Example: `10 81 00 01 05 FF 01 02 88 01 62 01 E7 00` is a Get (0x62) from the
 * controller (0x05FF01) to a smart meter (0x028801) asking for EPC 0xE7
 * (instantaneous power), TID 1, with an empty EDT.
 *
 * ### Life of a Frame
 * - Outbound: `Frame::make(spec, f)` → `f.to_bytes()` → transport.
 * - Inbound:  transport → `Frame::parse(bytes, f)` → `f.get_edt(epc, v)` or
 *   `request.is_valid_response(f)`.
 *
 * A Frame has no setters. The only ways to get a populated one are `make()` and
 * `parse()`, so PDC always matches the EDT it describes and `to_bytes()` never
 * has to truncate.
 *
 * ### Errors
 * No exceptions. Every fallible call returns a FrameStatus and writes its output
 * parameter only on FrameStatus::Ok. `status_class()` groups codes into the
 * format / validation / lookup / range families.
 */

#ifndef ECHOLITE_FRAME_HPP
#define ECHOLITE_FRAME_HPP

#include "edt.hpp"
#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace echolite {

/// Fixed ECHONET Lite header bytes (EHD1, EHD2).
static constexpr uint8_t EHD1 = 0x10;
static constexpr uint8_t EHD2 = 0x81;

/// EHD(2) + TID(2) + SEOJ(3) + DEOJ(3) + ESV(1) + OPC(1).
static constexpr size_t FRAME_HEADER_SIZE = 12;

static constexpr size_t   FRAME_MAX_PROPERTIES = 255;  ///< OPC is one byte
static constexpr uint32_t EOJ_MAX              = 0xFFFFFF;

/// Widest EDT the fixed-width accessor returns; wider values need get_edt_big().
static constexpr size_t GET_EDT_MAX_BYTES = 6;

/// Result codes for every fallible Frame operation.
enum class FrameStatus : uint8_t {
  Ok = 0,

  // format (parse)
  InvalidHeader,           // first two bytes are not 0x10 0x81
  TooShort,                // fewer than FRAME_HEADER_SIZE bytes
  MissingPropertyHeader,   // OPC promised a record but EPC/PDC is cut off
  IncompleteEdt,           // fewer than PDC bytes left

  // validation (make)
  NegativeEdt,
  NonIntegralEdt,
  MalformedEdt,            // arbitrary-precision text that is not a number
  EdtTooLong,              // value needs more than 255 bytes
  TooManyProperties,       // more than 255 records
  ObjectOutOfRange,        // SEOJ/DEOJ wider than 24 bits

  // lookup
  PropertyNotFound,

  // range
  EdtTooWide,              // PDC > GET_EDT_MAX_BYTES for the fixed-width accessor
};

enum class StatusClass : uint8_t { None = 0, Format, Validation, Lookup, Range };

/// Family a status belongs to (None for Ok).
StatusClass status_class(FrameStatus s);

/// Stable snake_case token for `status=error reason=<token>` lines.
const char* status_reason(FrameStatus s);

/// "format", "validation", "lookup", "range" or "ok".
const char* status_class_name(StatusClass c);

/// One decoded property record.
struct Property {
  uint8_t epc = 0;   ///< property code
  uint8_t pdc = 0;   ///< EDT length in bytes
  Edt     edt{};     ///< value, big-endian, exactly pdc bytes on the wire

  bool operator==(const Property& o) const { return epc == o.epc && pdc == o.pdc && edt == o.edt; }
  bool operator!=(const Property& o) const { return !(*this == o); }
};

/**
 * @brief One property request for Frame::make().
 *
 * The value can be omitted (encodes as a single 0x00 byte), given as a
 * machine integer, a floating-point number, decimal/hex text of any width,
 * or a ready Edt. PDC is never supplied by the caller; make() computes it.
 */
struct PropertyInput {
  enum class Kind : uint8_t { None, Integer, Number, Text, Value };

  uint8_t     epc     = 0;
  Kind        kind    = Kind::None;
  int64_t     integer = 0;
  double      number  = 0.0;
  std::string text{};
  Edt         value{};

  PropertyInput() = default;

  /// EPC only; value defaults to 0.
  explicit PropertyInput(uint8_t code) : epc(code) {}

  PropertyInput(uint8_t code, int64_t v) : epc(code), kind(Kind::Integer), integer(v) {}

  PropertyInput(uint8_t code, const Edt& v) : epc(code), kind(Kind::Value), value(v) {}

  static PropertyInput from_number(uint8_t code, double v) {
    PropertyInput p(code);
    p.kind = Kind::Number;
    p.number = v;
    return p;
  }

  /// Decimal or "0x" hex text; see Edt::from_string().
  static PropertyInput from_text(uint8_t code, const std::string& digits) {
    PropertyInput p(code);
    p.kind = Kind::Text;
    p.text = digits;
    return p;
  }
};

/// Structured input for Frame::make(). A missing tid is drawn at random.
struct FrameSpec {
  std::optional<uint16_t>    tid{};
  uint32_t                   seoj = 0;
  uint32_t                   deoj = 0;
  uint8_t                    esv  = 0;
  std::vector<PropertyInput> properties{};
};

class Frame {
public:
  /// Empty frame (all fields zero, no properties). Use make() or parse() to populate.
  Frame() = default;

  /**
   * @brief Build a frame from structured input.
   *
   * - Missing tid → random_tid().
   * - Each PropertyInput is validated and turned into an Edt; PDC = byte_length().
   * - Fails with a validation status on negative / non-integral / malformed /
   *   over-long values, more than 255 properties, or SEOJ/DEOJ > 0xFFFFFF.
   */
  static FrameStatus make(const FrameSpec& spec, Frame& out);

  /**
   * @brief Decode raw bytes. All-or-nothing: `out` is untouched on failure.
   *
   * Checks run in wire order: header, minimum size, then each EPC/PDC/EDT.
   * Bytes after the last property record are ignored.
   */
  static FrameStatus parse(const uint8_t* data, size_t n, Frame& out);
  static FrameStatus parse(const std::vector<uint8_t>& bytes, Frame& out);

  // -------- Fields --------

  uint16_t tid()  const { return tid_; }
  uint32_t seoj() const { return seoj_; }
  uint32_t deoj() const { return deoj_; }
  uint8_t  esv()  const { return esv_; }
  const std::vector<Property>& properties() const { return props_; }

  // -------- Property accessors --------

  /// First property with this EPC, or nullptr.
  const Property* find(uint8_t epc) const;

  /// Fixed-width value. PropertyNotFound / EdtTooWide (PDC > 6) on failure.
  FrameStatus get_edt(uint8_t epc, uint64_t& out) const;

  /// Arbitrary-precision value. PropertyNotFound on failure.
  FrameStatus get_edt_big(uint8_t epc, Edt& out) const;

  /**
   * @brief True if `response` answers this request.
   *
   * Matches swapped objects (response.SEOJ == DEOJ, response.DEOJ == SEOJ) and
   * the same TID. ESV and properties are not compared; Get_Res and Get_SNA
   * both answer a Get.
   */
  bool is_valid_response(const Frame& response) const;

  // -------- Serialization --------

  /// Canonical wire bytes. Exact inverse of parse().
  std::vector<uint8_t> to_bytes() const;

  /// Append the wire bytes to `out`.
  void write_to(std::vector<uint8_t>& out) const;

  /**
   * @brief Diagnostic one-liner, not a wire format.
   *
   * Example:
   *   "tid=0x0001 | seoj=0x05ff01 | deoj=0x028801 | esv=0x62 |
   *    properties=[epc=0xe7, pdc=0, edt=0x0] | all=0x108100010..."
   */
  std::string to_string() const;

  bool operator==(const Frame& o) const {
    return tid_ == o.tid_ && seoj_ == o.seoj_ && deoj_ == o.deoj_ &&
           esv_ == o.esv_ && props_ == o.props_;
  }
  bool operator!=(const Frame& o) const { return !(*this == o); }

private:
  Frame(uint16_t tid, uint32_t seoj, uint32_t deoj, uint8_t esv, std::vector<Property> props)
  : tid_(tid), seoj_(seoj), deoj_(deoj), esv_(esv), props_(std::move(props)) {}

  uint16_t tid_  = 0;
  uint32_t seoj_ = 0;
  uint32_t deoj_ = 0;
  uint8_t  esv_  = 0;
  std::vector<Property> props_{};
};

/// Uniform draw in [0, 0xFFFF] from a per-thread engine. Not unique across calls.
uint16_t random_tid();

} // namespace echolite

#endif // ECHOLITE_FRAME_HPP

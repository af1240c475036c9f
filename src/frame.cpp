/**
 * @file frame.cpp
 * @brief Implementation of the echolite Frame codec.
 *
 * Refer to `frame.hpp` for the wire layout and the API contract.
 */
#include "echolite/frame.hpp"
#include "echolite/hex.hpp"

#include <random>
#include <sstream>
#include <iomanip>

namespace echolite {

// ============================================================================
// Status helpers
// ============================================================================

StatusClass status_class(FrameStatus s) {
    switch (s) {
        case FrameStatus::Ok:                    return StatusClass::None;

        case FrameStatus::InvalidHeader:
        case FrameStatus::TooShort:
        case FrameStatus::MissingPropertyHeader:
        case FrameStatus::IncompleteEdt:         return StatusClass::Format;

        case FrameStatus::NegativeEdt:
        case FrameStatus::NonIntegralEdt:
        case FrameStatus::MalformedEdt:
        case FrameStatus::EdtTooLong:
        case FrameStatus::TooManyProperties:
        case FrameStatus::ObjectOutOfRange:      return StatusClass::Validation;

        case FrameStatus::PropertyNotFound:      return StatusClass::Lookup;

        case FrameStatus::EdtTooWide:            return StatusClass::Range;
    }
    return StatusClass::None;
}

const char* status_reason(FrameStatus s) {
    switch (s) {
        case FrameStatus::Ok:                    return "ok";
        case FrameStatus::InvalidHeader:         return "invalid_header";
        case FrameStatus::TooShort:              return "frame_too_short";
        case FrameStatus::MissingPropertyHeader: return "property_header_missing";
        case FrameStatus::IncompleteEdt:         return "incomplete_property_value";
        case FrameStatus::NegativeEdt:           return "negative_value";
        case FrameStatus::NonIntegralEdt:        return "non_integral_value";
        case FrameStatus::MalformedEdt:          return "malformed_value";
        case FrameStatus::EdtTooLong:            return "edt_too_long";
        case FrameStatus::TooManyProperties:     return "too_many_properties";
        case FrameStatus::ObjectOutOfRange:      return "object_out_of_range";
        case FrameStatus::PropertyNotFound:      return "property_not_found";
        case FrameStatus::EdtTooWide:            return "value_too_wide";
    }
    return "unknown";
}

const char* status_class_name(StatusClass c) {
    switch (c) {
        case StatusClass::None:       return "ok";
        case StatusClass::Format:     return "format";
        case StatusClass::Validation: return "validation";
        case StatusClass::Lookup:     return "lookup";
        case StatusClass::Range:      return "range";
    }
    return "unknown";
}

// ============================================================================
// Low-level helpers
// ----------------------------------------------------------------------------
// Big-endian put/get for the fixed header fields. Widths are 1, 2 or 3 bytes.
// ============================================================================

static inline void put_be(std::vector<uint8_t>& b, uint32_t v, int width) {
    for (int i = width - 1; i >= 0; --i)
        b.push_back(static_cast<uint8_t>(v >> (i * 8)));
}

static inline uint32_t get_be(const uint8_t* p, int width) {
    uint32_t v = 0;
    for (int i = 0; i < width; ++i) v = (v << 8) | p[i];
    return v;
}

static FrameStatus to_frame_status(EdtStatus s) {
    switch (s) {
        case EdtStatus::Ok:          return FrameStatus::Ok;
        case EdtStatus::Negative:    return FrameStatus::NegativeEdt;
        case EdtStatus::NonIntegral: return FrameStatus::NonIntegralEdt;
        case EdtStatus::Malformed:   return FrameStatus::MalformedEdt;
        case EdtStatus::TooLong:     return FrameStatus::EdtTooLong;
    }
    return FrameStatus::MalformedEdt;
}

// Turn one PropertyInput into a Property with its minimal PDC.
static FrameStatus resolve_input(const PropertyInput& in, Property& out) {
    Edt v;
    switch (in.kind) {
        case PropertyInput::Kind::None:
            break;                                     // zero, one 0x00 byte
        case PropertyInput::Kind::Integer:
            if (in.integer < 0) return FrameStatus::NegativeEdt;
            v = Edt(static_cast<uint64_t>(in.integer));
            break;
        case PropertyInput::Kind::Number: {
            FrameStatus st = to_frame_status(Edt::from_number(in.number, v));
            if (st != FrameStatus::Ok) return st;
            break;
        }
        case PropertyInput::Kind::Text: {
            FrameStatus st = to_frame_status(Edt::from_string(in.text, v));
            if (st != FrameStatus::Ok) return st;
            break;
        }
        case PropertyInput::Kind::Value:
            v = in.value;
            break;
    }

    out.epc = in.epc;
    out.pdc = static_cast<uint8_t>(v.byte_length());   // 1..255, Edt caps the width
    out.edt = v;
    return FrameStatus::Ok;
}

// ============================================================================
// Construction
// ============================================================================

uint16_t random_tid() {
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 0xFFFF);
    return static_cast<uint16_t>(dist(engine));
}

FrameStatus Frame::make(const FrameSpec& spec, Frame& out) {
    if (spec.seoj > EOJ_MAX || spec.deoj > EOJ_MAX) return FrameStatus::ObjectOutOfRange;
    if (spec.properties.size() > FRAME_MAX_PROPERTIES) return FrameStatus::TooManyProperties;

    std::vector<Property> props;
    props.reserve(spec.properties.size());
    for (const auto& in : spec.properties) {
        Property p;
        FrameStatus st = resolve_input(in, p);
        if (st != FrameStatus::Ok) return st;
        props.push_back(p);
    }

    const uint16_t tid = spec.tid ? *spec.tid : random_tid();
    out = Frame(tid, spec.seoj, spec.deoj, spec.esv, std::move(props));
    return FrameStatus::Ok;
}

// ============================================================================
// Parsing
// ----------------------------------------------------------------------------
// Layout: [10 81][TID:2][SEOJ:3][DEOJ:3][ESV][OPC] then OPC × [EPC][PDC][EDT]
// Everything is decoded into locals first; `out` is assigned once at the end.
// ============================================================================

FrameStatus Frame::parse(const uint8_t* data, size_t n, Frame& out) {
    if (n < 2 || data[0] != EHD1 || data[1] != EHD2) return FrameStatus::InvalidHeader;
    if (n < FRAME_HEADER_SIZE) return FrameStatus::TooShort;

    const uint16_t tid  = static_cast<uint16_t>(get_be(data + 2, 2));
    const uint32_t seoj = get_be(data + 4, 3);
    const uint32_t deoj = get_be(data + 7, 3);
    const uint8_t  esv  = data[10];
    const uint8_t  opc  = data[11];

    std::vector<Property> props;
    props.reserve(opc);

    size_t off = FRAME_HEADER_SIZE;
    for (unsigned i = 0; i < opc; ++i) {
        if (off + 2 > n) return FrameStatus::MissingPropertyHeader;

        Property p;
        p.epc = data[off++];
        p.pdc = data[off++];

        if (off + p.pdc > n) return FrameStatus::IncompleteEdt;

        // PDC 0 leaves the value at zero
        if (!Edt::from_bytes(data + off, p.pdc, p.edt)) return FrameStatus::EdtTooLong;
        off += p.pdc;

        props.push_back(p);
    }

    out = Frame(tid, seoj, deoj, esv, std::move(props));
    return FrameStatus::Ok;
}

FrameStatus Frame::parse(const std::vector<uint8_t>& bytes, Frame& out) {
    return parse(bytes.data(), bytes.size(), out);
}

// ============================================================================
// Accessors
// ============================================================================

const Property* Frame::find(uint8_t epc) const {
    for (const auto& p : props_)
        if (p.epc == epc) return &p;
    return nullptr;
}

FrameStatus Frame::get_edt(uint8_t epc, uint64_t& out) const {
    const Property* p = find(epc);
    if (!p) return FrameStatus::PropertyNotFound;
    if (p->pdc > GET_EDT_MAX_BYTES) return FrameStatus::EdtTooWide;
    out = p->edt.to_u64();
    return FrameStatus::Ok;
}

FrameStatus Frame::get_edt_big(uint8_t epc, Edt& out) const {
    const Property* p = find(epc);
    if (!p) return FrameStatus::PropertyNotFound;
    out = p->edt;
    return FrameStatus::Ok;
}

bool Frame::is_valid_response(const Frame& response) const {
    return response.seoj_ == deoj_ &&
           response.deoj_ == seoj_ &&
           response.tid_  == tid_;
}

// ============================================================================
// Serialization
// ============================================================================

void Frame::write_to(std::vector<uint8_t>& b) const {
    b.push_back(EHD1);
    b.push_back(EHD2);
    put_be(b, tid_, 2);
    put_be(b, seoj_, 3);
    put_be(b, deoj_, 3);
    b.push_back(esv_);
    b.push_back(static_cast<uint8_t>(props_.size()));  // make() caps at 255

    for (const auto& p : props_) {
        b.push_back(p.epc);
        b.push_back(p.pdc);
        p.edt.write_be(p.pdc, b);
    }
}

std::vector<uint8_t> Frame::to_bytes() const {
    std::vector<uint8_t> b;
    size_t size = FRAME_HEADER_SIZE;
    for (const auto& p : props_) size += 2u + p.pdc;
    b.reserve(size);
    write_to(b);
    return b;
}

// ============================================================================
// Diagnostics
// ============================================================================

std::string Frame::to_string() const {
    std::ostringstream os;
    os << std::hex << std::setfill('0');

    os << "tid=0x"  << std::setw(4) << tid_
       << " | seoj=0x" << std::setw(6) << seoj_
       << " | deoj=0x" << std::setw(6) << deoj_
       << " | esv=0x"  << unsigned(esv_);

    os << " | properties=[";
    for (size_t i = 0; i < props_.size(); ++i) {
        const Property& p = props_[i];
        if (i) os << " | ";
        os << "epc=0x" << std::setw(2) << unsigned(p.epc)
           << ", pdc=" << std::dec << unsigned(p.pdc) << std::hex
           << ", edt=0x" << p.edt.to_hex();
    }
    os << "]";

    os << " | all=0x" << bytes_to_hex(to_bytes());
    return os.str();
}

} // namespace echolite

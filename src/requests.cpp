#include "echolite/requests.hpp"   // ESV/EOJ/EPC codes, builders, describe()
#include "echolite/hex.hpp"        // bytes_to_hex() for the fallback dump

#include <sstream>
#include <iomanip>

namespace echolite {
// ============================================================================
// Builders
// ----------------------------------------------------------------------------
// Thin wrappers over Frame::make(). The controller always talks to meter
// instance 1; callers that need other objects build a FrameSpec directly.
// ============================================================================

FrameStatus make_get_request(const std::vector<uint8_t>& epcs, Frame& out,
                             std::optional<uint16_t> tid) {
    FrameSpec spec;
    spec.tid  = tid;
    spec.seoj = EOJ_CONTROLLER;
    spec.deoj = EOJ_SMART_METER;
    spec.esv  = ESV_GET;
    for (uint8_t epc : epcs) spec.properties.emplace_back(epc);
    return Frame::make(spec, out);
}

FrameStatus make_set_request(const std::vector<PropertyInput>& props, Frame& out,
                             std::optional<uint16_t> tid) {
    FrameSpec spec;
    spec.tid        = tid;
    spec.seoj       = EOJ_CONTROLLER;
    spec.deoj       = EOJ_SMART_METER;
    spec.esv        = ESV_SETC;
    spec.properties = props;
    return Frame::make(spec, out);
}

bool is_error_response(const Frame& f) {
    return (f.esv() & 0xF0) == 0x50;
}

bool is_notification(const Frame& f) {
    return f.esv() == ESV_INF || f.esv() == ESV_INFC;
}

bool cumulative_unit_kwh(uint8_t code, double& kwh) {
    switch (code) {
        case 0x00: kwh = 1;      return true;
        case 0x01: kwh = 0.1;    return true;
        case 0x02: kwh = 0.01;   return true;
        case 0x03: kwh = 0.001;  return true;
        case 0x04: kwh = 0.0001; return true;
        case 0x0A: kwh = 10;     return true;
        case 0x0B: kwh = 100;    return true;
        case 0x0C: kwh = 1000;   return true;
        case 0x0D: kwh = 10000;  return true;
        default:                 return false;
    }
}

// ============================================================================
// describe()
// ----------------------------------------------------------------------------
// Status word from the ESV range, then one key=value per property.
// ============================================================================

static const char* status_word(uint8_t esv) {
    if ((esv & 0xF0) == 0x50)                 return "error";
    if (esv == ESV_INF || esv == ESV_INFC)    return "notify";
    if ((esv & 0xF0) == 0x60)                 return "request";
    if ((esv & 0xF0) == 0x70)                 return "ok";
    return "unknown";
}

// Raw EDT bytes, exactly PDC wide.
static std::vector<uint8_t> edt_bytes(const Property& p) {
    std::vector<uint8_t> b;
    p.edt.write_be(p.pdc, b);
    return b;
}

static inline uint32_t be_u32(const std::vector<uint8_t>& b, size_t off) {
    return (uint32_t(b[off]) << 24) | (uint32_t(b[off + 1]) << 16) |
           (uint32_t(b[off + 2]) << 8) | uint32_t(b[off + 3]);
}

static inline int16_t be_i16(const std::vector<uint8_t>& b, size_t off) {
    return static_cast<int16_t>((uint16_t(b[off]) << 8) | uint16_t(b[off + 1]));
}

static void put_epc_key(std::ostringstream& os, uint8_t epc) {
    os << " epc_" << std::hex << std::setw(2) << std::setfill('0') << unsigned(epc)
       << std::dec << std::setfill(' ');
}

// Returns false when the EPC is unknown or its PDC does not match the layout.
static bool describe_known(std::ostringstream& os, const Property& p) {
    const std::vector<uint8_t> b = edt_bytes(p);

    switch (p.epc) {
        case EPC_OPERATION_STATUS:
            if (p.pdc != 1) return false;
            if      (b[0] == 0x30) os << " operation=on";
            else if (b[0] == 0x31) os << " operation=off";
            else return false;
            return true;

        case EPC_COEFFICIENT:
            if (p.pdc != 4) return false;
            os << " coefficient=" << be_u32(b, 0);
            return true;

        case EPC_EFFECTIVE_DIGITS:
            if (p.pdc != 1) return false;
            os << " effective_digits=" << unsigned(b[0]);
            return true;

        case EPC_CUMULATIVE_NORMAL:
            if (p.pdc != 4) return false;
            os << " cumulative_normal=" << be_u32(b, 0);
            return true;

        case EPC_CUMULATIVE_REV:
            if (p.pdc != 4) return false;
            os << " cumulative_reverse=" << be_u32(b, 0);
            return true;

        case EPC_CUMULATIVE_UNIT: {
            double kwh = 0;
            if (p.pdc != 1 || !cumulative_unit_kwh(b[0], kwh)) return false;
            os << " cumulative_unit_kwh=" << kwh;
            return true;
        }

        case EPC_INSTANT_POWER:
            if (p.pdc != 4) return false;
            os << " instant_power_w=" << static_cast<int32_t>(be_u32(b, 0));
            return true;

        case EPC_INSTANT_CURRENT: {
            if (p.pdc != 4) return false;
            // 0.1 A units; T phase is 0x7FFE on single-phase meters
            const int16_t r = be_i16(b, 0);
            const int16_t t = be_i16(b, 2);
            os << std::fixed << std::setprecision(1);
            os << " current_r_a=" << (r / 10.0);
            if (t != 0x7FFE) os << " current_t_a=" << (t / 10.0);
            os.unsetf(std::ios_base::floatfield);
            os << std::setprecision(6);
            return true;
        }

        case EPC_CUMULATIVE_FIXED: {
            if (p.pdc != 11) return false;
            const unsigned year = (unsigned(b[0]) << 8) | b[1];
            os << " fixed_time=" << std::setfill('0')
               << std::setw(4) << year << '-'
               << std::setw(2) << unsigned(b[2]) << '-'
               << std::setw(2) << unsigned(b[3]) << 'T'
               << std::setw(2) << unsigned(b[4]) << ':'
               << std::setw(2) << unsigned(b[5]) << ':'
               << std::setw(2) << unsigned(b[6])
               << std::setfill(' ')
               << " cumulative_fixed=" << be_u32(b, 7);
            return true;
        }

        default:
            return false;
    }
}

std::string describe(const Frame& f) {
    std::ostringstream os;

    os << "status=" << status_word(f.esv())
       << " tid=" << f.tid()
       << " esv=0x" << std::hex << std::setw(2) << std::setfill('0') << unsigned(f.esv())
       << std::dec << std::setfill(' ');

    for (const auto& p : f.properties()) {
        if (p.pdc == 0) {
            put_epc_key(os, p.epc);
            os << "=unavailable";
            continue;
        }
        if (describe_known(os, p)) continue;

        // Unknown EPC or unexpected width: dump the raw EDT
        put_epc_key(os, p.epc);
        os << "=0x" << bytes_to_hex(edt_bytes(p));
    }

    return os.str();
}

} // namespace echolite

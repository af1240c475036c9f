#include "echolite/cli_args.hpp"
#include "echolite/edt.hpp"
#include "echolite/hex.hpp"
#include "echolite/requests.hpp"

using json = nlohmann::json;

namespace echolite {

// ---------- argument syntax ----------

bool parse_number(const std::string& s, uint64_t max, uint64_t& out) {
    Edt e;
    if (Edt::from_string(s, e) != EdtStatus::Ok) return false;
    if (!e.fits_u64() || e.to_u64() > max) return false;
    out = e.to_u64();
    return true;
}

bool parse_code(const std::string& s, uint64_t max, uint64_t& out) {
    if (s.empty() || s[0] == '+' || s[0] == '-') return false;
    const bool prefixed = s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
    return parse_number(prefixed ? s : "0x" + s, max, out);
}

bool parse_prop(const std::string& s, PropertyInput& out) {
    const size_t eq = s.find('=');
    uint64_t epc = 0;
    if (!parse_code(s.substr(0, eq), 0xFF, epc)) return false;

    if (eq == std::string::npos) {
        out = PropertyInput(static_cast<uint8_t>(epc));
    } else {
        const std::string value = s.substr(eq + 1);
        if (value.empty()) return false;
        out = PropertyInput::from_text(static_cast<uint8_t>(epc), value);
    }
    return true;
}

// ---------- encode / decode ----------

bool build_frame(const EncodeArgs& a, const Config& cfg, Frame& out, std::string& reason) {
    FrameSpec spec;
    spec.seoj = cfg.seoj;
    spec.deoj = cfg.deoj;

    uint64_t v = 0;
    if (!parse_code(a.esv, 0xFF, v)) { reason = "invalid_esv"; return false; }
    spec.esv = static_cast<uint8_t>(v);

    if (!a.tid.empty()) {
        if (!parse_number(a.tid, 0xFFFF, v)) { reason = "invalid_tid"; return false; }
        spec.tid = static_cast<uint16_t>(v);
    }
    // wider than 24 bits parses here and is refused by Frame::make()
    if (!a.seoj.empty()) {
        if (!parse_code(a.seoj, 0xFFFFFFFFu, v)) { reason = "invalid_seoj"; return false; }
        spec.seoj = static_cast<uint32_t>(v);
    }
    if (!a.deoj.empty()) {
        if (!parse_code(a.deoj, 0xFFFFFFFFu, v)) { reason = "invalid_deoj"; return false; }
        spec.deoj = static_cast<uint32_t>(v);
    }

    for (const auto& s : a.props) {
        PropertyInput in;
        if (!parse_prop(s, in)) { reason = "invalid_prop"; return false; }
        spec.properties.push_back(in);
    }

    FrameStatus st = Frame::make(spec, out);
    if (st != FrameStatus::Ok) { reason = status_reason(st); return false; }
    return true;
}

bool decode_hex(const std::string& text, Frame& out, std::string& reason) {
    std::vector<uint8_t> bytes;
    if (!hex_to_bytes(text, bytes)) { reason = "invalid_hex"; return false; }

    FrameStatus st = Frame::parse(bytes, out);
    if (st != FrameStatus::Ok) { reason = status_reason(st); return false; }
    return true;
}

bool apply_overrides(const CliOverrides& o, Config& cfg, std::string& reason) {
    Config tmp = cfg;
    if (o.format) {
        if (!is_output_format(*o.format)) { reason = "invalid_format"; return false; }
        tmp.format = *o.format;
    }
    if (o.log_level && !parse_log_level(*o.log_level, tmp.log_level)) {
        reason = "invalid_log_level";
        return false;
    }
    cfg = tmp;
    return true;
}

// ---------- output ----------

json frame_to_json(const Frame& f) {
    json j;
    j["tid"]  = f.tid();
    j["seoj"] = "0x" + hex_fixed(f.seoj(), 6);
    j["deoj"] = "0x" + hex_fixed(f.deoj(), 6);
    j["esv"]  = "0x" + hex_fixed(f.esv(), 2);

    json props = json::array();
    for (const auto& p : f.properties()) {
        json e;
        e["epc"]   = "0x" + hex_fixed(p.epc, 2);
        e["pdc"]   = p.pdc;
        e["edt"]   = "0x" + p.edt.to_hex();
        e["value"] = p.edt.to_decimal();
        props.push_back(e);
    }
    j["properties"] = props;
    j["hex"] = bytes_to_hex(f.to_bytes());
    return j;
}

std::string render_frame(const Frame& f, const std::string& format) {
    if (format == "json") return frame_to_json(f).dump(2);
    if (format == "raw")  return describe(f);
    return f.to_string();
}

} // namespace echolite

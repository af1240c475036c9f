#include "echolite/config.hpp"
#include "echolite/edt.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace echolite {

// ---------- helpers ----------

// Object code from a JSON number or a "0x.." / decimal string, <= 0xFFFFFF.
static bool read_eoj(const json& v, uint32_t& out) {
    if (v.is_number_unsigned()) {
        const uint64_t n = v.get<uint64_t>();
        if (n > EOJ_MAX) return false;
        out = static_cast<uint32_t>(n);
        return true;
    }
    if (v.is_string()) {
        Edt e;
        if (Edt::from_string(v.get<std::string>(), e) != EdtStatus::Ok) return false;
        if (!e.fits_u64() || e.to_u64() > EOJ_MAX) return false;
        out = static_cast<uint32_t>(e.to_u64());
        return true;
    }
    return false;
}

static bool file_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

// ---------- public ----------

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/echolite/config.json";
    const char* home = std::getenv("HOME");
    if (home && *home) return std::string(home) + "/.config/echolite/config.json";
    return std::string();
}

bool is_output_format(const std::string& s) {
    return s == "pretty" || s == "json" || s == "raw";
}

bool parse_config(const std::string& text, Config& cfg, std::string& err) {
    const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) { err = "config_syntax"; return false; }
    if (!j.is_object())   { err = "config_root";   return false; }

    Config tmp = cfg;

    if (j.contains("seoj") && !read_eoj(j["seoj"], tmp.seoj)) { err = "config_seoj"; return false; }
    if (j.contains("deoj") && !read_eoj(j["deoj"], tmp.deoj)) { err = "config_deoj"; return false; }

    if (j.contains("format")) {
        const json& f = j["format"];
        if (!f.is_string() || !is_output_format(f.get<std::string>())) {
            err = "config_format";
            return false;
        }
        tmp.format = f.get<std::string>();
    }

    if (j.contains("log_level")) {
        const json& l = j["log_level"];
        if (!l.is_string() || !parse_log_level(l.get<std::string>(), tmp.log_level)) {
            err = "config_log_level";
            return false;
        }
    }

    cfg = tmp;
    return true;
}

bool load_config(const std::string& path, Config& cfg, std::string& err) {
    if (path.empty() || !file_exists(path)) return true;

    std::ifstream in(path);
    if (!in) { err = "config_read"; return false; }

    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str(), cfg, err);
}

} // namespace echolite

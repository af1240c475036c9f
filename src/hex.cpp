#include "echolite/hex.hpp"

namespace echolite {

static const char HEX_DIGITS[] = "0123456789abcdef";

int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string hex_fixed(uint32_t v, int digits) {
    std::string s;
    for (int i = digits - 1; i >= 0; --i) s += HEX_DIGITS[(v >> (i * 4)) & 0xF];
    return s;
}

std::string bytes_to_hex(const uint8_t* p, size_t n) {
    std::string s;
    s.reserve(n * 2);
    for (size_t i = 0; i < n; ++i) {
        s += HEX_DIGITS[p[i] >> 4];
        s += HEX_DIGITS[p[i] & 0x0F];
    }
    return s;
}

std::string bytes_to_hex(const std::vector<uint8_t>& bytes) {
    return bytes_to_hex(bytes.data(), bytes.size());
}

bool hex_to_bytes(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();

    size_t i = 0;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) i = 2;

    std::vector<uint8_t> bytes;
    bytes.reserve(text.size() / 2);
    int hi = -1;                                   // pending high nibble
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (c == ' ' || c == '\t' || c == ':' || c == '-') continue;

        int v = hex_nibble(c);
        if (v < 0) return false;
        if (hi < 0) {
            hi = v;
        } else {
            bytes.push_back(static_cast<uint8_t>((hi << 4) | v));
            hi = -1;
        }
    }
    if (hi >= 0) return false;                     // odd digit count

    out.swap(bytes);
    return true;
}

} // namespace echolite

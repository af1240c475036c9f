/**
 * @file edt.cpp
 * @brief Implementation of echolite::Edt. See edt.hpp for the contract.
 */
#include "echolite/edt.hpp"
#include "echolite/hex.hpp"

#include <cmath>
#include <cstddef>

namespace echolite {

// ---------------------------------------------------------------------------
// Local helpers
// ---------------------------------------------------------------------------

// le = le * mul + add, little-endian, growing as needed.
static void mul_add_le(std::vector<uint8_t>& le, unsigned mul, unsigned add) {
    unsigned carry = add;
    for (auto& b : le) {
        unsigned v = b * mul + carry;
        b = static_cast<uint8_t>(v & 0xFF);
        carry = v >> 8;
    }
    while (carry) {
        le.push_back(static_cast<uint8_t>(carry & 0xFF));
        carry >>= 8;
    }
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Edt::Edt(uint64_t v) {
    int top = 7;
    while (top >= 0 && ((v >> (top * 8)) & 0xFF) == 0) --top;
    for (int i = top; i >= 0; --i)
        mag_.push_back(static_cast<uint8_t>(v >> (i * 8)));
}

bool Edt::assign_le(const std::vector<uint8_t>& le, Edt& out) {
    size_t n = le.size();
    while (n > 0 && le[n - 1] == 0) --n;        // drop high-order zeros
    if (n > EDT_MAX_BYTES) return false;

    out.mag_.clear();
    for (size_t i = n; i > 0; --i) out.mag_.push_back(le[i - 1]);
    return true;
}

bool Edt::from_bytes(const uint8_t* p, size_t n, Edt& out) {
    size_t i = 0;
    while (i < n && p[i] == 0) ++i;             // leading zeros carry no value
    if (n - i > EDT_MAX_BYTES) return false;

    out.mag_.clear();
    for (; i < n; ++i) out.mag_.push_back(p[i]);
    return true;
}

EdtStatus Edt::from_string(const std::string& text, Edt& out) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = (text[pos] == '-');
        ++pos;
    }

    bool hex = false;
    if (text.size() - pos >= 2 && text[pos] == '0' && (text[pos + 1] == 'x' || text[pos + 1] == 'X')) {
        hex = true;
        pos += 2;
    }
    if (pos >= text.size()) return EdtStatus::Malformed;

    std::vector<uint8_t> le;
    if (hex) {
        for (size_t i = pos; i < text.size(); ++i)
            if (hex_nibble(text[i]) < 0) return EdtStatus::Malformed;

        while (pos + 1 < text.size() && text[pos] == '0') ++pos;
        if (text.size() - pos > EDT_MAX_BYTES * 2) return EdtStatus::TooLong;

        // pack nibbles from the least significant end
        size_t i = text.size();
        while (i > pos) {
            int lo = hex_nibble(text[--i]);
            int hi = (i > pos) ? hex_nibble(text[--i]) : 0;
            le.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }
    } else {
        for (size_t i = pos; i < text.size(); ++i) {
            char c = text[i];
            if (c < '0' || c > '9') return EdtStatus::Malformed;
            mul_add_le(le, 10, static_cast<unsigned>(c - '0'));
            if (le.size() > EDT_MAX_BYTES) return EdtStatus::TooLong;
        }
    }

    Edt tmp;
    if (!assign_le(le, tmp)) return EdtStatus::TooLong;
    if (negative && !tmp.is_zero()) return EdtStatus::Negative;

    out = tmp;
    return EdtStatus::Ok;
}

EdtStatus Edt::from_number(double v, Edt& out) {
    if (!std::isfinite(v) || std::floor(v) != v) return EdtStatus::NonIntegral;
    if (v < 0) return EdtStatus::Negative;

    if (v < 18446744073709551616.0) {           // 2^64
        out = Edt(static_cast<uint64_t>(v));
        return EdtStatus::Ok;
    }

    // v = m * 2^e with m in [0.5, 1): take the 53-bit mantissa and shift it up.
    int e = 0;
    double m = std::frexp(v, &e);
    uint64_t mant = static_cast<uint64_t>(std::ldexp(m, 53));
    int shift = e - 53;

    std::vector<uint8_t> le(static_cast<size_t>(shift / 8), 0);
    for (int i = 0; i < 8; ++i) le.push_back(static_cast<uint8_t>(mant >> (i * 8)));

    const int bits = shift % 8;
    if (bits) {
        unsigned carry = 0;
        for (auto& b : le) {
            unsigned w = (static_cast<unsigned>(b) << bits) | carry;
            b = static_cast<uint8_t>(w & 0xFF);
            carry = w >> 8;
        }
        if (carry) le.push_back(static_cast<uint8_t>(carry));
    }

    Edt tmp;
    if (!assign_le(le, tmp)) return EdtStatus::TooLong;
    out = tmp;
    return EdtStatus::Ok;
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

uint64_t Edt::to_u64() const {
    uint64_t v = 0;
    size_t start = mag_.size() > 8 ? mag_.size() - 8 : 0;
    for (size_t i = start; i < mag_.size(); ++i) v = (v << 8) | mag_[i];
    return v;
}

std::string Edt::to_hex() const {
    if (mag_.empty()) return "0";

    std::string s = bytes_to_hex(mag_.data(), mag_.size());
    if (s[0] == '0') s.erase(0, 1);             // minimal digits
    return s;
}

std::string Edt::to_decimal() const {
    if (mag_.empty()) return "0";

    std::vector<uint8_t> be(mag_.begin(), mag_.end());
    std::string digits;
    size_t first = 0;
    while (first < be.size()) {
        unsigned rem = 0;
        for (size_t i = first; i < be.size(); ++i) {
            unsigned cur = (rem << 8) | be[i];
            be[i] = static_cast<uint8_t>(cur / 10);
            rem = cur % 10;
        }
        digits += static_cast<char>('0' + rem);
        while (first < be.size() && be[first] == 0) ++first;
    }
    return std::string(digits.rbegin(), digits.rend());
}

void Edt::write_be(size_t n, std::vector<uint8_t>& out) const {
    const size_t len = mag_.size();
    if (n >= len) {
        out.insert(out.end(), n - len, static_cast<uint8_t>(0));
        out.insert(out.end(), mag_.begin(), mag_.end());
    } else {
        out.insert(out.end(), mag_.end() - static_cast<std::ptrdiff_t>(n), mag_.end());
    }
}

} // namespace echolite

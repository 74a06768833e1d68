#pragma once
#include <cstddef>
#include <string>

namespace autopatch {

// Makes verification output safe to embed in JSON reports and the audit log.
// Well-formed UTF-8 is kept. Stray, truncated, overlong or out-of-range
// sequences and control bytes become '?'. Output beyond `max_bytes` is cut at
// a character boundary.
inline std::string scrub_report(const std::string& str, size_t max_bytes = 64 * 1024) {
    std::string out;
    out.reserve(str.size() < max_bytes ? str.size() : max_bytes);

    size_t i = 0;
    while (i < str.size()) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        size_t len = 0;
        if (c == 0x09 || c == 0x0A || c == 0x0D || (c >= 0x20 && c < 0x7F)) len = 1;
        else if (c >= 0xC2 && c <= 0xDF) len = 2;
        else if (c >= 0xE0 && c <= 0xEF) len = 3;
        else if (c >= 0xF0 && c <= 0xF4) len = 4;

        bool valid = len > 0 && i + len <= str.size();
        for (size_t k = 1; valid && k < len; ++k) {
            valid = (static_cast<unsigned char>(str[i + k]) & 0xC0) == 0x80;
        }
        if (valid && len > 2) {
            // Second-byte limits: no overlongs, no surrogates, nothing past U+10FFFF.
            unsigned char c1 = static_cast<unsigned char>(str[i + 1]);
            if (c == 0xE0) valid = c1 >= 0xA0;
            else if (c == 0xED) valid = c1 <= 0x9F;
            else if (c == 0xF0) valid = c1 >= 0x90;
            else if (c == 0xF4) valid = c1 <= 0x8F;
        }

        size_t emit = valid ? len : 1;
        if (out.size() + emit > max_bytes) {
            out += "\n...[truncated " + std::to_string(str.size() - i) + " bytes]";
            break;
        }
        if (valid) out.append(str, i, len);
        else out += '?';
        i += emit;
    }
    return out;
}

}

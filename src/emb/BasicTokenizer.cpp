#include "emb/BasicTokenizer.hpp"

namespace labelsearch {
namespace tokenize {

static constexpr uint32_t kInvalid = 0xFFFD;

uint32_t next_codepoint(const std::string& s, size_t& i) {
    const unsigned char c0 = (unsigned char)s[i];
    size_t len = 0;
    uint32_t cp = 0;

    if (c0 < 0x80) { ++i; return c0; }
    else if ((c0 & 0xE0) == 0xC0) { len = 2; cp = c0 & 0x1F; }
    else if ((c0 & 0xF0) == 0xE0) { len = 3; cp = c0 & 0x0F; }
    else if ((c0 & 0xF8) == 0xF0) { len = 4; cp = c0 & 0x07; }
    else { ++i; return kInvalid; }

    if (i + len > s.size()) { ++i; return kInvalid; }

    for (size_t k = 1; k < len; ++k) {
        const unsigned char ck = (unsigned char)s[i + k];
        if ((ck & 0xC0) != 0x80) { ++i; return kInvalid; }
        cp = (cp << 6) | (ck & 0x3F);
    }
    i += len;
    return cp;
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        const unsigned char c0 = (unsigned char)s[i];
        size_t len = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;

        if (c0 < 0x80) { ++i; continue; }
        else if ((c0 & 0xE0) == 0xC0) { len = 2; cp = c0 & 0x1F; min_cp = 0x80; }
        else if ((c0 & 0xF0) == 0xE0) { len = 3; cp = c0 & 0x0F; min_cp = 0x800; }
        else if ((c0 & 0xF8) == 0xF0) { len = 4; cp = c0 & 0x07; min_cp = 0x10000; }
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            const unsigned char ck = (unsigned char)s[i + k];
            if ((ck & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (ck & 0x3F);
        }
        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back((char)cp);
    } else if (cp < 0x800) {
        out.push_back((char)(0xC0 | (cp >> 6)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back((char)(0xE0 | (cp >> 12)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | (cp >> 18)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

static bool is_ws(uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == 0x3000 || cp == 0xA0;
}

bool is_cjk(uint32_t cp) {
    return (cp >= 0x4E00 && cp <= 0x9FFF) ||
           (cp >= 0x3400 && cp <= 0x4DBF) ||
           (cp >= 0x20000 && cp <= 0x2A6DF) ||
           (cp >= 0x2A700 && cp <= 0x2CEAF) ||
           (cp >= 0xF900 && cp <= 0xFAFF) ||
           (cp >= 0x2F800 && cp <= 0x2FA1F);
}

bool is_punct(uint32_t cp) {
    if (cp < 0x80) {
        return (cp >= 33 && cp <= 47) || (cp >= 58 && cp <= 64) ||
               (cp >= 91 && cp <= 96) || (cp >= 123 && cp <= 126);
    }
    // CJK symbols and punctuation, fullwidth ASCII punctuation, general punctuation
    return (cp >= 0x3001 && cp <= 0x303F) ||
           (cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
           (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65) ||
           (cp >= 0x2010 && cp <= 0x205E);
}

std::vector<std::string> basic_tokenize(const std::string& text, bool drop_punct) {
    std::vector<std::string> out;
    std::string cur;
    auto flush = [&](){
        if (!cur.empty()) { out.push_back(cur); cur.clear(); }
    };

    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = next_codepoint(text, i);
        if (cp == kInvalid) continue;

        if (is_ws(cp)) {
            flush();
        } else if (is_punct(cp)) {
            flush();
            if (!drop_punct) {
                std::string p;
                append_utf8(p, cp);
                out.push_back(std::move(p));
            }
        } else if (is_cjk(cp)) {
            flush();
            std::string c;
            append_utf8(c, cp);
            out.push_back(std::move(c));
        } else {
            if (cp >= 'A' && cp <= 'Z') cp = cp - 'A' + 'a';
            append_utf8(cur, cp);
        }
    }
    flush();
    return out;
}

}  // namespace tokenize
}  // namespace labelsearch

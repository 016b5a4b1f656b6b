#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace labelsearch {
namespace tokenize {

// Splits on whitespace, lowercases ASCII, emits each ASCII / CJK punctuation
// mark and each CJK ideograph as its own token. Input is UTF-8; malformed
// bytes are dropped.
std::vector<std::string> basic_tokenize(const std::string& text, bool drop_punct = false);

// Decodes one code point starting at s[i]; advances i. Returns 0xFFFD on a
// malformed sequence (and advances by one byte).
uint32_t next_codepoint(const std::string& s, size_t& i);

// Strict check: rejects truncated or overlong sequences, surrogates and code
// points above U+10FFFF.
bool is_valid_utf8(const std::string& s);

bool is_cjk(uint32_t cp);
bool is_punct(uint32_t cp);

}  // namespace tokenize
}  // namespace labelsearch

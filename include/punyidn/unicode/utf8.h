#pragma once
#include <string>
#include <string_view>

namespace punyidn::unicode {

// 0..0x10FFFF minus the surrogate block.
bool is_scalar_value(char32_t cp);

bool is_ascii(std::string_view text);
bool is_ascii(std::u32string_view text);

// Strict decoding: rejects truncated sequences, stray continuation bytes,
// overlong forms, surrogates and values above 0x10FFFF.
bool utf8_decode(std::string_view input, std::u32string& output);

bool append_utf8(char32_t cp, std::string& output);
std::string utf8_encode(std::u32string_view input);

// Lowercases A-Z only; multi-byte sequences pass through untouched.
std::string to_lower_ascii(std::string_view input);

} // namespace punyidn::unicode

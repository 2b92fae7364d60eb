#pragma once
#include <string>
#include <string_view>

// RFC 3492 Bootstring encoding with the Punycode parameters.
namespace punyidn::punycode {

enum class Status {
    Success,
    Overflow,        // a 32-bit accumulator would wrap
    BadInput,        // non-digit character, non-basic prefix byte, or non-scalar value
    InvalidEncoding, // reserved; decode() reports malformed input as BadInput
};

const char* status_name(Status status);

// Appends the encoded form of input to output. Pure ASCII input is copied
// unchanged. The ACE prefix is not added here.
Status encode(std::u32string_view input, std::string& output);

// Appends the decoded code points of input to output. Digits are accepted in
// either case; basic code points keep theirs. A trailing delimiter with no
// digits after it decodes to the basic code points alone, so "abc-" gives
// "abc". Canonical form is not checked here.
Status decode(std::string_view input, std::u32string& output);

Status encode_utf8(std::string_view utf8, std::string& output);
Status decode_to_utf8(std::string_view input, std::string& utf8_output);

} // namespace punyidn::punycode

#pragma once
#include <punyidn/punycode/punycode.h>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace punyidn::core {
class DiagnosticEmitter;
}

// IDNA2008 label framing (RFC 5890). NFC normalization of the input is the
// caller's job; decomposed and composed forms encode differently.
namespace punyidn::idna {

enum class Error {
    None,
    EmptyLabel,
    LabelTooLong,
    InvalidLabel,
    PunycodeError,
    InvalidAcePrefix,
};

const char* error_name(Error error);

// Codec failures never reach callers under their own kind.
Error error_from_punycode(punycode::Status status);

struct Options {
    // Enables the LDH, reserved-hyphen, ACE prefix and canonical A-label checks.
    bool strict = false;
    core::DiagnosticEmitter* diagnostics = nullptr;
};

struct ConversionResult {
    bool ok = false;
    Error error = Error::None;
    std::string value;
    std::size_t label_index = 0; // failing label when !ok
    std::string message;
};

ConversionResult label_to_ascii(std::string_view label, const Options& options = {});
ConversionResult label_to_unicode(std::string_view label, const Options& options = {});

// Both stop at the first failing label; there is no partial result.
ConversionResult to_ascii(std::string_view domain, const Options& options = {});
ConversionResult to_unicode(std::string_view domain, const Options& options = {});

std::optional<std::string> domain_to_ascii(std::string_view domain);
std::optional<std::string> domain_to_unicode(std::string_view domain);

} // namespace punyidn::idna

#include <punyidn/idna/idna.h>
#include <punyidn/idna/label.h>
#include <punyidn/core/config.h>
#include <punyidn/core/diagnostics.h>
#include <punyidn/unicode/utf8.h>
#include <utility>

namespace punyidn::idna {

namespace {

using core::config::kAcePrefixLength;
using core::config::kMaxDecodedLabelLength;
using core::config::kMaxEncodedLabelLength;

constexpr const char kModule[] = "idna";

using LabelConverter = ConversionResult (*)(std::string_view, const Options&);

ConversionResult failure(Error error, std::string message) {
    ConversionResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}

ConversionResult success(std::string value) {
    ConversionResult result;
    result.ok = true;
    result.value = std::move(value);
    return result;
}

bool is_ldh(char32_t c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-';
}

// RFC 5891 section 4.2.3.1: "--" in the third and fourth positions is
// reserved for tagged labels such as A-labels.
template <typename Text>
bool has_reserved_hyphens(const Text& label) {
    return label.size() >= 4 && label[2] == '-' && label[3] == '-';
}

template <typename Text>
bool check_hyphens(const Text& label, std::string& err) {
    if (label.front() == '-') {
        err = "label starts with a hyphen";
        return false;
    }
    if (label.back() == '-') {
        err = "label ends with a hyphen";
        return false;
    }
    return true;
}

// Letters, digits and hyphens only, no leading or trailing hyphen, and no
// reserved "??--" form.
bool check_nr_ldh(std::string_view label, std::string& err) {
    for (char c : label) {
        if (!is_ldh(static_cast<unsigned char>(c))) {
            err = "label contains a character outside letters, digits and hyphen";
            return false;
        }
    }
    if (!check_hyphens(label, err)) {
        return false;
    }
    if (has_reserved_hyphens(label)) {
        err = "hyphens in the third and fourth positions are reserved";
        return false;
    }
    return true;
}

// ASCII code points of a U-label follow the same LDH repertoire.
bool check_u_label(const std::u32string& code_points, std::string& err) {
    for (char32_t c : code_points) {
        if (c < 0x80 && !is_ldh(c)) {
            err = "label contains an ASCII character outside letters, digits and hyphen";
            return false;
        }
    }
    if (!check_hyphens(code_points, err)) {
        return false;
    }
    if (has_reserved_hyphens(code_points)) {
        err = "hyphens in the third and fourth positions are reserved";
        return false;
    }
    return true;
}

ConversionResult decode_a_label(std::string_view label, const Options& options) {
    const std::string lowered = unicode::to_lower_ascii(label);
    const std::string_view payload = std::string_view(lowered).substr(kAcePrefixLength);

    if (options.strict) {
        if (label.size() > kMaxEncodedLabelLength) {
            return failure(Error::LabelTooLong,
                           "A-label is " + std::to_string(label.size()) +
                           " octets, limit is " + std::to_string(kMaxEncodedLabelLength));
        }
        if (payload.empty()) {
            return failure(Error::InvalidAcePrefix, "nothing follows the ACE prefix");
        }
    }

    std::u32string code_points;
    const punycode::Status status = punycode::decode(payload, code_points);
    if (status != punycode::Status::Success) {
        return failure(error_from_punycode(status),
                       std::string("punycode decoding failed: ") + punycode::status_name(status));
    }

    if (code_points.size() > kMaxDecodedLabelLength) {
        return failure(Error::LabelTooLong,
                       "U-label is " + std::to_string(code_points.size()) +
                       " code points, limit is " + std::to_string(kMaxDecodedLabelLength));
    }

    if (options.strict) {
        std::string err;
        if (!check_u_label(code_points, err)) {
            return failure(Error::InvalidLabel, err);
        }
        std::string reencoded;
        const punycode::Status reencode_status = punycode::encode(code_points, reencoded);
        if (reencode_status != punycode::Status::Success) {
            return failure(error_from_punycode(reencode_status),
                           std::string("punycode re-encoding failed: ") +
                           punycode::status_name(reencode_status));
        }
        if (reencoded != payload) {
            return failure(Error::PunycodeError, "A-label is not in canonical form");
        }
    }

    return success(unicode::utf8_encode(code_points));
}

void report(const Options& options, core::Severity severity, const char* stage,
            std::string_view domain, std::size_t index, std::string_view label,
            const std::string& message) {
    if (options.diagnostics == nullptr) {
        return;
    }
    core::DiagnosticEvent event;
    event.severity = severity;
    event.module = kModule;
    event.stage = stage;
    event.domain = std::string(domain);
    event.label_index = index;
    event.label = std::string(label);
    event.message = message;
    options.diagnostics->emit(std::move(event));
}

ConversionResult convert_domain(std::string_view domain, const Options& options,
                                const char* stage, LabelConverter convert) {
    std::string output;
    output.reserve(domain.size());

    std::size_t index = 0;
    std::size_t start = 0;
    while (true) {
        const std::size_t end = domain.find(core::config::kLabelSeparator, start);
        const std::string_view label = domain.substr(
            start, end == std::string_view::npos ? std::string_view::npos : end - start);

        ConversionResult converted = convert(label, options);
        if (!converted.ok) {
            converted.label_index = index;
            report(options, core::Severity::Error, stage, domain, index, label,
                   std::string(error_name(converted.error)) + ": " + converted.message);
            return converted;
        }

        report(options, core::Severity::Info, stage, domain, index, label,
               std::string(label_kind_name(classify_label(label))) + " -> " + converted.value);

        if (index > 0) {
            output += core::config::kLabelSeparator;
        }
        output += converted.value;

        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
        ++index;
    }

    return success(std::move(output));
}

} // anonymous namespace

const char* error_name(Error error) {
    switch (error) {
        case Error::None:             return "none";
        case Error::EmptyLabel:       return "empty_label";
        case Error::LabelTooLong:     return "label_too_long";
        case Error::InvalidLabel:     return "invalid_label";
        case Error::PunycodeError:    return "punycode_error";
        case Error::InvalidAcePrefix: return "invalid_ace_prefix";
    }
    return "unknown";
}

Error error_from_punycode(punycode::Status status) {
    switch (status) {
        case punycode::Status::Success:         return Error::None;
        case punycode::Status::Overflow:        return Error::PunycodeError;
        case punycode::Status::BadInput:        return Error::PunycodeError;
        case punycode::Status::InvalidEncoding: return Error::PunycodeError;
    }
    return Error::PunycodeError;
}

ConversionResult label_to_ascii(std::string_view label, const Options& options) {
    if (label.empty()) {
        return failure(Error::EmptyLabel, "empty label");
    }

    if (unicode::is_ascii(label)) {
        std::string lowered = unicode::to_lower_ascii(label);
        if (lowered.size() > kMaxEncodedLabelLength) {
            return failure(Error::LabelTooLong,
                           "label is " + std::to_string(lowered.size()) +
                           " octets, limit is " + std::to_string(kMaxEncodedLabelLength));
        }
        if (options.strict) {
            if (has_ace_prefix(lowered)) {
                ConversionResult checked = decode_a_label(lowered, options);
                if (!checked.ok) {
                    return checked;
                }
            } else {
                std::string err;
                if (!check_nr_ldh(lowered, err)) {
                    return failure(Error::InvalidLabel, err);
                }
            }
        }
        return success(std::move(lowered));
    }

    std::u32string code_points;
    if (!unicode::utf8_decode(label, code_points)) {
        return failure(Error::InvalidLabel, "label is not valid UTF-8");
    }

    // A-labels are always lowercase
    for (char32_t& c : code_points) {
        if (c >= 'A' && c <= 'Z') {
            c = c - 'A' + 'a';
        }
    }

    if (options.strict) {
        std::string err;
        if (!check_u_label(code_points, err)) {
            return failure(Error::InvalidLabel, err);
        }
    }

    std::string encoded(core::config::kAcePrefix);
    const punycode::Status status = punycode::encode(code_points, encoded);
    if (status != punycode::Status::Success) {
        return failure(error_from_punycode(status),
                       std::string("punycode encoding failed: ") + punycode::status_name(status));
    }

    if (encoded.size() > kMaxEncodedLabelLength) {
        return failure(Error::LabelTooLong,
                       "encoded label is " + std::to_string(encoded.size()) +
                       " octets, limit is " + std::to_string(kMaxEncodedLabelLength));
    }

    return success(std::move(encoded));
}

ConversionResult label_to_unicode(std::string_view label, const Options& options) {
    if (label.empty()) {
        return failure(Error::EmptyLabel, "empty label");
    }

    if (is_a_label(label)) {
        return decode_a_label(label, options);
    }

    std::u32string code_points;
    if (!unicode::utf8_decode(label, code_points)) {
        return failure(Error::InvalidLabel, "label is not valid UTF-8");
    }

    if (options.strict) {
        std::string err;
        const bool valid = unicode::is_ascii(code_points)
            ? check_nr_ldh(label, err)
            : check_u_label(code_points, err);
        if (!valid) {
            return failure(Error::InvalidLabel, err);
        }
    }

    return success(unicode::to_lower_ascii(label));
}

ConversionResult to_ascii(std::string_view domain, const Options& options) {
    return convert_domain(domain, options, "to_ascii", &label_to_ascii);
}

ConversionResult to_unicode(std::string_view domain, const Options& options) {
    return convert_domain(domain, options, "to_unicode", &label_to_unicode);
}

std::optional<std::string> domain_to_ascii(std::string_view domain) {
    ConversionResult result = to_ascii(domain);
    if (!result.ok) {
        return std::nullopt;
    }
    return std::move(result.value);
}

std::optional<std::string> domain_to_unicode(std::string_view domain) {
    ConversionResult result = to_unicode(domain);
    if (!result.ok) {
        return std::nullopt;
    }
    return std::move(result.value);
}

} // namespace punyidn::idna

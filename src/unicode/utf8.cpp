#include <punyidn/unicode/utf8.h>

namespace punyidn::unicode {

namespace {

bool is_continuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

} // anonymous namespace

bool is_scalar_value(char32_t cp) {
    return cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
}

bool is_ascii(std::string_view text) {
    for (char c : text) {
        if (static_cast<unsigned char>(c) >= 0x80) return false;
    }
    return true;
}

bool is_ascii(std::u32string_view text) {
    for (char32_t c : text) {
        if (c >= 0x80) return false;
    }
    return true;
}

bool utf8_decode(std::string_view input, std::u32string& output) {
    output.reserve(output.size() + input.size());

    size_t i = 0;
    while (i < input.size()) {
        const unsigned char b0 = static_cast<unsigned char>(input[i]);

        if (b0 < 0x80) {
            output.push_back(b0);
            ++i;
            continue;
        }

        size_t len = 0;
        char32_t cp = 0;
        char32_t min = 0;
        if ((b0 & 0xE0) == 0xC0) {
            len = 2;
            cp = b0 & 0x1F;
            min = 0x80;
        } else if ((b0 & 0xF0) == 0xE0) {
            len = 3;
            cp = b0 & 0x0F;
            min = 0x800;
        } else if ((b0 & 0xF8) == 0xF0) {
            len = 4;
            cp = b0 & 0x07;
            min = 0x10000;
        } else {
            return false;
        }

        if (i + len > input.size()) return false;

        for (size_t j = 1; j < len; ++j) {
            const unsigned char b = static_cast<unsigned char>(input[i + j]);
            if (!is_continuation(b)) return false;
            cp = (cp << 6) | (b & 0x3F);
        }

        // Overlong forms and out-of-range values
        if (cp < min || !is_scalar_value(cp)) return false;

        output.push_back(cp);
        i += len;
    }

    return true;
}

bool append_utf8(char32_t cp, std::string& output) {
    if (!is_scalar_value(cp)) {
        return false;
    }
    if (cp <= 0x7F) {
        output.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        output.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        output.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        output.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        output.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        output.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        output.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return true;
}

// Non-scalar values are skipped.
std::string utf8_encode(std::u32string_view input) {
    std::string result;
    result.reserve(input.size());
    for (char32_t cp : input) {
        append_utf8(cp, result);
    }
    return result;
}

std::string to_lower_ascii(std::string_view input) {
    std::string result(input);
    for (char& c : result) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return result;
}

} // namespace punyidn::unicode

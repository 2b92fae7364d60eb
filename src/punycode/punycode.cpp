#include <punyidn/punycode/punycode.h>
#include <punyidn/unicode/utf8.h>
#include <cstdint>
#include <limits>

namespace punyidn::punycode {

namespace {

// Needs to be unsigned and at least 26 bits wide (RFC 3492 section 6.4).
using punycode_uint = std::uint32_t;

constexpr punycode_uint kBase = 36;
constexpr punycode_uint kTMin = 1;
constexpr punycode_uint kTMax = 26;
constexpr punycode_uint kSkew = 38;
constexpr punycode_uint kDamp = 700;
constexpr punycode_uint kInitialBias = 72;
constexpr punycode_uint kInitialN = 0x80;
constexpr char kDelimiter = '-';

constexpr punycode_uint kMaxInt = std::numeric_limits<punycode_uint>::max();

bool is_basic(char32_t cp) {
    return cp < 0x80;
}

// Numeric value of a digit character, or kBase if it is not one.
punycode_uint decode_digit(unsigned char c) {
    if (c >= '0' && c <= '9') return c - '0' + 26;
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a';
    return kBase;
}

// 0..25 map to a..z, 26..35 map to 0..9
char encode_digit(punycode_uint d) {
    return static_cast<char>(d < 26 ? 'a' + d : '0' + (d - 26));
}

punycode_uint threshold(punycode_uint k, punycode_uint bias) {
    if (k <= bias + kTMin) return kTMin;
    if (k >= bias + kTMax) return kTMax;
    return k - bias;
}

punycode_uint adapt(punycode_uint delta, punycode_uint num_points, bool first_time) {
    delta = first_time ? delta / kDamp : delta / 2;
    delta += delta / num_points;

    punycode_uint k = 0;
    while (delta > ((kBase - kTMin) * kTMax) / 2) {
        delta /= kBase - kTMin;
        k += kBase;
    }

    return k + ((kBase - kTMin + 1) * delta) / (delta + kSkew);
}

// Writes q as a generalized variable-length integer.
void encode_integer(punycode_uint q, punycode_uint bias, std::string& out) {
    for (punycode_uint k = kBase;; k += kBase) {
        const punycode_uint t = threshold(k, bias);
        if (q < t) break;
        out.push_back(encode_digit(t + (q - t) % (kBase - t)));
        q = (q - t) / (kBase - t);
    }
    out.push_back(encode_digit(q));
}

} // anonymous namespace

const char* status_name(Status status) {
    switch (status) {
        case Status::Success:         return "success";
        case Status::Overflow:        return "overflow";
        case Status::BadInput:        return "bad_input";
        case Status::InvalidEncoding: return "invalid_encoding";
    }
    return "unknown";
}

Status encode(std::u32string_view input, std::string& output) {
    if (input.size() >= kMaxInt) {
        return Status::Overflow;
    }

    std::string result;
    result.reserve(input.size());

    for (char32_t cp : input) {
        if (!unicode::is_scalar_value(cp)) {
            return Status::BadInput;
        }
        if (is_basic(cp)) {
            result.push_back(static_cast<char>(cp));
        }
    }

    const auto input_length = static_cast<punycode_uint>(input.size());
    const auto b = static_cast<punycode_uint>(result.size());
    if (b > 0 && b < input_length) {
        result.push_back(kDelimiter);
    }

    punycode_uint n = kInitialN;
    punycode_uint delta = 0;
    punycode_uint bias = kInitialBias;

    // h counts the code points handled so far
    for (punycode_uint h = b; h < input_length;) {
        // Every code point below n is handled; find the next larger one.
        punycode_uint m = kMaxInt;
        for (char32_t cp : input) {
            if (cp >= n && cp < m) m = cp;
        }

        if (m - n > (kMaxInt - delta) / (h + 1)) {
            return Status::Overflow;
        }
        delta += (m - n) * (h + 1);
        n = m;

        for (char32_t cp : input) {
            if (cp < n && ++delta == 0) {
                return Status::Overflow;
            }
            if (cp == n) {
                encode_integer(delta, bias, result);
                bias = adapt(delta, h + 1, h == b);
                delta = 0;
                ++h;
            }
        }

        if (++delta == 0) {
            return Status::Overflow;
        }
        ++n;
    }

    output += result;
    return Status::Success;
}

Status decode(std::string_view input, std::u32string& output) {
    if (input.size() >= kMaxInt) {
        return Status::Overflow;
    }

    std::u32string result;
    result.reserve(input.size());

    size_t pos = 0;
    const size_t delimiter = input.rfind(kDelimiter);
    if (delimiter != std::string_view::npos) {
        // Either side of the delimiter may be empty.
        for (size_t j = 0; j < delimiter; ++j) {
            const unsigned char c = static_cast<unsigned char>(input[j]);
            if (!is_basic(c)) {
                return Status::BadInput;
            }
            result.push_back(c);
        }
        pos = delimiter + 1;
    }

    punycode_uint n = kInitialN;
    punycode_uint i = 0;
    punycode_uint bias = kInitialBias;

    while (pos < input.size()) {
        const punycode_uint old_i = i;
        punycode_uint w = 1;

        for (punycode_uint k = kBase;; k += kBase) {
            if (pos >= input.size()) {
                return Status::BadInput;
            }
            const punycode_uint digit = decode_digit(static_cast<unsigned char>(input[pos++]));
            if (digit >= kBase) {
                return Status::BadInput;
            }
            if (digit > (kMaxInt - i) / w) {
                return Status::Overflow;
            }
            i += digit * w;

            const punycode_uint t = threshold(k, bias);
            if (digit < t) break;

            if (w > kMaxInt / (kBase - t)) {
                return Status::Overflow;
            }
            w *= kBase - t;
        }

        const auto length = static_cast<punycode_uint>(result.size() + 1);
        bias = adapt(i - old_i, length, old_i == 0);

        if (i / length > kMaxInt - n) {
            return Status::Overflow;
        }
        n += i / length;
        i %= length;

        if (!unicode::is_scalar_value(n)) {
            return Status::BadInput;
        }
        result.insert(result.begin() + i, static_cast<char32_t>(n));
        ++i;
    }

    output += result;
    return Status::Success;
}

Status encode_utf8(std::string_view utf8, std::string& output) {
    std::u32string code_points;
    if (!unicode::utf8_decode(utf8, code_points)) {
        return Status::BadInput;
    }
    return encode(code_points, output);
}

Status decode_to_utf8(std::string_view input, std::string& utf8_output) {
    std::u32string code_points;
    const Status status = decode(input, code_points);
    if (status != Status::Success) {
        return status;
    }
    utf8_output += unicode::utf8_encode(code_points);
    return Status::Success;
}

} // namespace punyidn::punycode

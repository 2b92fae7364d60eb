#include <gtest/gtest.h>
#include <punyidn/punycode/punycode.h>
#include <string>
#include <vector>

using namespace punyidn::punycode;

namespace {

std::string encoded(std::u32string_view input) {
    std::string out;
    EXPECT_EQ(encode(input, out), Status::Success);
    return out;
}

std::u32string decoded(std::string_view input) {
    std::u32string out;
    EXPECT_EQ(decode(input, out), Status::Success);
    return out;
}

} // namespace

// =============================================================================
// Known labels
// =============================================================================
TEST(PunycodeEncode, Munchen) {
    EXPECT_EQ(encoded(U"münchen"), "mnchen-3ya");
}

TEST(PunycodeDecode, Munchen) {
    EXPECT_EQ(decoded("mnchen-3ya"), U"münchen");
}

TEST(PunycodeEncode, NoBasicCodePointsMeansNoDelimiter) {
    EXPECT_EQ(encoded(U"日本"), "wgv71a");
    EXPECT_EQ(encoded(U"中国"), "fiqs8s");
}

TEST(PunycodeEncode, PureAsciiIsUnchanged) {
    EXPECT_EQ(encoded(U"example"), "example");
    EXPECT_EQ(encoded(U"Hello-World"), "Hello-World");
}

TEST(PunycodeEncode, EmptyInput) {
    EXPECT_EQ(encoded(U""), "");
}

TEST(PunycodeDecode, EmptyInput) {
    EXPECT_EQ(decoded(""), U"");
}

TEST(PunycodeEncode, AppendsToOutput) {
    std::string out = "xn--";
    ASSERT_EQ(encode(U"bücher", out), Status::Success);
    EXPECT_EQ(out, "xn--bcher-kva");
}

TEST(PunycodeDecode, DigitsAreCaseInsensitive) {
    // Basic code points keep their case, digits do not matter
    EXPECT_EQ(decoded("MNCHEN-3YA"), U"MüNCHEN");
    EXPECT_EQ(decoded("mnchen-3YA"), U"münchen");
}

TEST(PunycodeRoundTrip, SingleExtendedCodePoint) {
    EXPECT_EQ(decoded(encoded(U"ü")), U"ü");
}

TEST(PunycodeRoundTrip, SupplementaryPlane) {
    const std::u32string input = U"a\U0001F600b\U00010348";
    EXPECT_EQ(decoded(encoded(input)), input);
}

TEST(PunycodeRoundTrip, RepeatedCodePoints) {
    const std::u32string input = U"ééé-aéb";
    EXPECT_EQ(decoded(encoded(input)), input);
}

// =============================================================================
// RFC 3492 section 7.1 sample strings
// =============================================================================
struct SampleString {
    const char* name;
    std::u32string unicode;
    std::string punycode;
};

TEST(PunycodeRfc3492, SampleStrings) {
    const std::vector<SampleString> samples = {
        {"Arabic (Egyptian)",
         U"\u0644\u064A\u0647\u0645\u0627\u0628\u062A\u0643\u0644\u0645\u0648\u0634\u0639\u0631\u0628\u064A\u061F",
         "egbpdaj6bu4bxfgehfvwxn"},
        {"Chinese (simplified)",
         U"\u4ED6\u4EEC\u4E3A\u4EC0\u4E48\u4E0D\u8BF4\u4E2D\u6587",
         "ihqwcrb4cv8a8dqg056pqjye"},
        {"Chinese (traditional)",
         U"\u4ED6\u5011\u7232\u4EC0\u9EBD\u4E0D\u8AAA\u4E2D\u6587",
         "ihqwctvzc91f659drss3x8bo0yb"},
        {"Czech",
         U"Pro\u010Dprost\u011Bnemluv\u00ED\u010Desky",
         "Proprostnemluvesky-uyb24dma41a"},
        {"Hebrew",
         U"\u05DC\u05DE\u05D4\u05D4\u05DD\u05E4\u05E9\u05D5\u05D8\u05DC\u05D0\u05DE\u05D3\u05D1\u05E8\u05D9\u05DD\u05E2\u05D1\u05E8\u05D9\u05EA",
         "4dbcagdahymbxekheh6e0a7fei0b"},
        {"Hindi (Devanagari)",
         U"\u092F\u0939\u0932\u094B\u0917\u0939\u093F\u0928\u094D\u0926\u0940\u0915\u094D\u092F\u094B\u0902\u0928\u0939\u0940\u0902\u092C\u094B\u0932\u0938\u0915\u0924\u0947\u0939\u0948\u0902",
         "i1baa7eci9glrd9b2ae1bj0hfcgg6iyaf8o0a1dig0cd"},
        {"Japanese (kanji and hiragana)",
         U"\u306A\u305C\u307F\u3093\u306A\u65E5\u672C\u8A9E\u3092\u8A71\u3057\u3066\u304F\u308C\u306A\u3044\u306E\u304B",
         "n8jok5ay5dzabd5bym9f0cm5685rrjetr6pdxa"},
        {"Korean (Hangul syllables)",
         U"\uC138\uACC4\uC758\uBAA8\uB4E0\uC0AC\uB78C\uB4E4\uC774\uD55C\uAD6D\uC5B4\uB97C\uC774\uD574\uD55C\uB2E4\uBA74\uC5BC\uB9C8\uB098\uC88B\uC744\uAE4C",
         "989aomsvi5e83db1d2a355cv1e0vak1dwrv93d5xbh15a0dt30a5jpsd879ccm6fea98c"},
        {"Russian (Cyrillic)",
         U"\u043F\u043E\u0447\u0435\u043C\u0443\u0436\u0435\u043E\u043D\u0438\u043D\u0435\u0433\u043E\u0432\u043E\u0440\u044F\u0442\u043F\u043E\u0440\u0443\u0441\u0441\u043A\u0438",
         "b1abfaaepdrnnbgefbadotcwatmq2g4l"},
        {"Spanish",
         U"Porqu\u00E9nopuedenhablarenEspa\u00F1ol",
         "PorqunopuedenhablarenEspaol-fmd56a"},
        {"Vietnamese",
         U"T\u1EA1isaoh\u1ECDkh\u00F4ngth\u1EC3ch\u1EC9n\u00F3iti\u1EBFngVi\u1EC7t",
         "TisaohkhngthchnitingVit-kjcr8268qyxafd2f1b9g"},
        {"Japanese (3 characters)",
         U"3\u5E74B\u7D44\u91D1\u516B\u5148\u751F",
         "3B-ww4c5e180e575a65lsy2b"},
        {"Japanese (symbols and hiragana)",
         U"\u5B89\u5BA4\u5948\u7F8E\u6075-with-SUPER-MONKEYS",
         "-with-SUPER-MONKEYS-pc58ag80a8qai00g7n9n"},
        {"Japanese (Hello Another Way)",
         U"Hello-Another-Way-\u305D\u308C\u305E\u308C\u306E\u5834\u6240",
         "Hello-Another-Way--fc4qua05auwb3674vfr0b"},
        {"Japanese (Hiragana Maji)",
         U"\u3072\u3068\u3064\u5C4B\u6839\u306E\u4E0B2",
         "2-u9tlzr9756bt3uc0v"},
        {"Japanese (Maji)",
         U"Maji\u3067Koi\u3059\u308B5\u79D2\u524D",
         "MajiKoi5-783gue6qz075azm5e"},
        {"Japanese (Pafikaria)",
         U"\u30D1\u30D5\u30A3\u30FCde\u30EB\u30F3\u30D0",
         "de-jg4avhby1noc0d"},
        {"Japanese (Sono Speed)",
         U"\u305D\u306E\u30B9\u30D4\u30FC\u30C9\u3067",
         "d9juau41awczczp"},
    };

    for (const auto& sample : samples) {
        SCOPED_TRACE(sample.name);
        EXPECT_EQ(encoded(sample.unicode), sample.punycode);
        EXPECT_EQ(decoded(sample.punycode), sample.unicode);
    }
}

// =============================================================================
// Failures
// =============================================================================
TEST(PunycodeDecode, NonDigitCharacterIsBadInput) {
    std::u32string out;
    EXPECT_EQ(decode("invalid!!!", out), Status::BadInput);
    EXPECT_EQ(decode("abc_d", out), Status::BadInput);
}

TEST(PunycodeDecode, NonAsciiDigitIsBadInput) {
    std::u32string out;
    EXPECT_EQ(decode("a\xC3\xBC", out), Status::BadInput);
}

TEST(PunycodeDecode, NonAsciiBasicPrefixIsBadInput) {
    std::u32string out;
    EXPECT_EQ(decode("m\xC3\xBCnchen-3ya", out), Status::BadInput);
}

TEST(PunycodeDecode, TruncatedIntegerIsBadInput) {
    // 'z' never terminates a digit group at the first positions
    std::u32string out;
    EXPECT_EQ(decode("z", out), Status::BadInput);
}

TEST(PunycodeDecode, CodePointAboveUnicodeRangeIsBadInput) {
    // Encodes a delta that lands past U+10FFFF
    std::u32string out;
    EXPECT_EQ(decode("99999a", out), Status::BadInput);
}

TEST(PunycodeDecode, LongDigitRunOverflows) {
    std::u32string out;
    EXPECT_EQ(decode("999999999999", out), Status::Overflow);
}

TEST(PunycodeDecode, LeadingDelimiterMeansEmptyBasicPrefix) {
    std::u32string with_delimiter;
    ASSERT_EQ(decode("-3ya", with_delimiter), Status::Success);
    EXPECT_EQ(with_delimiter, U"\u03E5");

    std::u32string without;
    ASSERT_EQ(decode("3ya", without), Status::Success);
    EXPECT_EQ(with_delimiter, without);
}

TEST(PunycodeDecode, TrailingDelimiterLeavesBasicCodePoints) {
    std::u32string out;
    ASSERT_EQ(decode("abc-", out), Status::Success);
    EXPECT_EQ(out, U"abc");

    std::u32string hyphens;
    ASSERT_EQ(decode("a-b-", hyphens), Status::Success);
    EXPECT_EQ(hyphens, U"a-b");
}

TEST(PunycodeDecode, LoneDelimiterIsEmpty) {
    std::u32string out;
    ASSERT_EQ(decode("-", out), Status::Success);
    EXPECT_TRUE(out.empty());
}

TEST(PunycodeDecode, FailureLeavesOutputUntouched) {
    std::u32string out = U"keep";
    EXPECT_EQ(decode("mnchen-3y!", out), Status::BadInput);
    EXPECT_EQ(out, U"keep");
}

TEST(PunycodeEncode, DeltaOverflowIsReported) {
    // (0x10FFFF - 0x80) * 4001 does not fit in 32 bits
    std::u32string input(4000, U'a');
    input.push_back(U'\U0010FFFF');
    std::string out;
    EXPECT_EQ(encode(input, out), Status::Overflow);
    EXPECT_TRUE(out.empty());
}

TEST(PunycodeEncode, LargeDeltaBelowLimitEncodes) {
    // (0x10FFFF - 0x80) * 2001 still fits in 32 bits
    std::u32string input(2000, U'a');
    input.push_back(U'\U0010FFFF');
    std::string out;
    ASSERT_EQ(encode(input, out), Status::Success);

    std::u32string decoded;
    ASSERT_EQ(decode(out, decoded), Status::Success);
    EXPECT_EQ(decoded, input);
}

TEST(PunycodeEncode, SurrogateIsBadInput) {
    std::u32string input = U"a";
    input.push_back(static_cast<char32_t>(0xD800));
    std::string out;
    EXPECT_EQ(encode(input, out), Status::BadInput);
}

// =============================================================================
// UTF-8 entry points and names
// =============================================================================
TEST(PunycodeUtf8, EncodeFromUtf8) {
    std::string out;
    ASSERT_EQ(encode_utf8("m\xC3\xBCnchen", out), Status::Success);
    EXPECT_EQ(out, "mnchen-3ya");
}

TEST(PunycodeUtf8, EncodeRejectsInvalidUtf8) {
    std::string out;
    EXPECT_EQ(encode_utf8("m\xC3", out), Status::BadInput);
}

TEST(PunycodeUtf8, DecodeToUtf8) {
    std::string out;
    ASSERT_EQ(decode_to_utf8("wgv71a", out), Status::Success);
    EXPECT_EQ(out, "\xE6\x97\xA5\xE6\x9C\xAC");
}

TEST(PunycodeStatus, Names) {
    EXPECT_STREQ(status_name(Status::Success), "success");
    EXPECT_STREQ(status_name(Status::Overflow), "overflow");
    EXPECT_STREQ(status_name(Status::BadInput), "bad_input");
    EXPECT_STREQ(status_name(Status::InvalidEncoding), "invalid_encoding");
}

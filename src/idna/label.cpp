#include <punyidn/idna/label.h>
#include <punyidn/core/config.h>
#include <punyidn/unicode/utf8.h>

namespace punyidn::idna {

namespace {

char lower_ascii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // anonymous namespace

const char* label_kind_name(LabelKind kind) {
    switch (kind) {
        case LabelKind::ALabel:     return "a-label";
        case LabelKind::ULabel:     return "u-label";
        case LabelKind::NrLdhLabel: return "nr-ldh-label";
        case LabelKind::Empty:      return "empty";
    }
    return "unknown";
}

bool has_ace_prefix(std::string_view label) {
    constexpr std::size_t prefix_length = core::config::kAcePrefixLength;
    if (label.size() < prefix_length) {
        return false;
    }
    for (std::size_t i = 0; i < prefix_length; ++i) {
        if (lower_ascii(label[i]) != core::config::kAcePrefix[i]) {
            return false;
        }
    }
    return true;
}

LabelKind classify_label(std::string_view label) {
    if (label.empty()) {
        return LabelKind::Empty;
    }
    if (has_ace_prefix(label)) {
        return LabelKind::ALabel;
    }
    return unicode::is_ascii(label) ? LabelKind::NrLdhLabel : LabelKind::ULabel;
}

bool is_a_label(std::string_view label) {
    return classify_label(label) == LabelKind::ALabel;
}

bool is_u_label(std::string_view label) {
    return classify_label(label) == LabelKind::ULabel;
}

bool is_nr_ldh_label(std::string_view label) {
    return classify_label(label) == LabelKind::NrLdhLabel;
}

} // namespace punyidn::idna

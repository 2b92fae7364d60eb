#pragma once
#include <string_view>

namespace punyidn::idna {

// Every non-empty label falls in exactly one of the first three kinds.
enum class LabelKind {
    ALabel,     // starts with the ACE prefix (any case)
    ULabel,     // contains a non-ASCII code point, no ACE prefix
    NrLdhLabel, // ASCII without the ACE prefix
    Empty,
};

const char* label_kind_name(LabelKind kind);

LabelKind classify_label(std::string_view label);

bool is_a_label(std::string_view label);
bool is_u_label(std::string_view label);
bool is_nr_ldh_label(std::string_view label);

// True when the label starts with the ACE prefix, compared case-insensitively.
bool has_ace_prefix(std::string_view label);

} // namespace punyidn::idna

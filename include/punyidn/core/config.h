#ifndef PUNYIDN_CORE_CONFIG_H
#define PUNYIDN_CORE_CONFIG_H

#include <cstddef>

namespace punyidn::core::config {

// ACE prefix marking an A-label (RFC 5890 section 2.3.2.5).
inline constexpr const char kAcePrefix[] = "xn--";
inline constexpr std::size_t kAcePrefixLength = sizeof(kAcePrefix) - 1;

// Maximum label length in octets (RFC 1035).
inline constexpr std::size_t kMaxEncodedLabelLength = 63;

// Maximum U-label length in code points.
inline constexpr std::size_t kMaxDecodedLabelLength = 252;

inline constexpr char kLabelSeparator = '.';

}  // namespace punyidn::core::config

#endif  // PUNYIDN_CORE_CONFIG_H

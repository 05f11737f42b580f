#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tmax::engine {

// Length of a v1 info-hash rendered as hex.
constexpr std::size_t kFingerprintLength = 40;

inline int hex_digit_value(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

// Lower-cases a 40 character hex fingerprint; anything else is rejected.
inline std::optional<std::string> canonical_fingerprint(std::string_view value) {
  if (value.size() != kFingerprintLength) {
    return std::nullopt;
  }
  constexpr char kHexDigits[] = "0123456789abcdef";
  std::string result;
  result.reserve(kFingerprintLength);
  for (char ch : value) {
    int digit = hex_digit_value(ch);
    if (digit < 0) {
      return std::nullopt;
    }
    result.push_back(kHexDigits[digit]);
  }
  return result;
}

inline std::string fingerprint_from_bytes(std::uint8_t const *bytes,
                                          std::size_t size) {
  constexpr char kHexDigits[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHexDigits[bytes[i] >> 4]);
    result.push_back(kHexDigits[bytes[i] & 0x0F]);
  }
  return result;
}

inline bool is_magnet_uri(std::string_view value) {
  constexpr std::string_view kPrefix = "magnet:";
  if (value.size() < kPrefix.size()) {
    return false;
  }
  for (std::size_t i = 0; i < kPrefix.size(); ++i) {
    char ch = value[i];
    if (ch >= 'A' && ch <= 'Z') {
      ch = static_cast<char>(ch - 'A' + 'a');
    }
    if (ch != kPrefix[i]) {
      return false;
    }
  }
  return true;
}

inline std::string percent_encode(std::string_view value) {
  constexpr char kHexDigits[] = "0123456789ABCDEF";
  std::string result;
  result.reserve(value.size());
  for (unsigned char ch : value) {
    bool unreserved = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
                      (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' ||
                      ch == '.' || ch == '~';
    if (unreserved) {
      result.push_back(static_cast<char>(ch));
      continue;
    }
    result.push_back('%');
    result.push_back(kHexDigits[ch >> 4]);
    result.push_back(kHexDigits[ch & 0x0F]);
  }
  return result;
}

// Rebuilds a magnet link for a torrent restored from the saved list.
inline std::string build_magnet_uri(std::string const &fingerprint,
                                    std::string const &name,
                                    std::vector<std::string> const &trackers) {
  std::string uri = "magnet:?xt=urn:btih:";
  uri.append(fingerprint);
  if (!name.empty()) {
    uri.append("&dn=");
    uri.append(percent_encode(name));
  }
  for (auto const &tracker : trackers) {
    if (tracker.empty()) {
      continue;
    }
    uri.append("&tr=");
    uri.append(percent_encode(tracker));
  }
  return uri;
}

} // namespace tmax::engine

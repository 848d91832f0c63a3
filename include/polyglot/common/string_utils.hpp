#pragma once

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace polyglot::common {

// Escape ECMAScript regex metacharacters so text matches literally.
inline auto EscapeRegex(std::string_view s) -> std::string {
  std::string result;
  result.reserve(s.size() + (s.size() / 4));
  for (char c : s) {
    switch (c) {
      case '\\':
      case '^':
      case '$':
      case '.':
      case '|':
      case '?':
      case '*':
      case '+':
      case '(':
      case ')':
      case '[':
      case ']':
      case '{':
      case '}':
        result += '\\';
        result += c;
        break;
      default:
        result += c;
        break;
    }
  }
  return result;
}

// Map arbitrary scenario/environment names to a safe path component.
inline auto SanitizeFileName(std::string_view s) -> std::string {
  std::string result;
  result.reserve(s.size());
  for (char c : s) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) != 0 || c == '-' || c == '_' || c == '.') {
      result += c;
    } else {
      result += '_';
    }
  }
  if (result.empty() || result == "." || result == "..") {
    result = "_";
  }
  return result;
}

// Length of the well-formed UTF-8 sequence at the front of `s`, or 0 when
// the leading byte does not start one. Overlong forms, surrogates and code
// points above U+10FFFF are rejected.
inline auto Utf8SequenceLength(std::string_view s) -> size_t {
  auto byte = [&](size_t i) { return static_cast<unsigned char>(s[i]); };
  unsigned char lead = byte(0);
  if (lead < 0x80) {
    return 1;
  }
  size_t length = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) {
      lo = 0xA0;
    } else if (lead == 0xED) {
      hi = 0x9F;
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) {
      lo = 0x90;
    } else if (lead == 0xF4) {
      hi = 0x8F;
    }
  } else {
    return 0;
  }
  if (s.size() < length || byte(1) < lo || byte(1) > hi) {
    return 0;
  }
  for (size_t i = 2; i < length; ++i) {
    if (byte(i) < 0x80 || byte(i) > 0xBF) {
      return 0;
    }
  }
  return length;
}

// Escape text for XML attribute values and character data. Bytes that are
// not well-formed UTF-8 and characters XML 1.0 forbids become U+FFFD.
inline auto EscapeXml(std::string_view s) -> std::string {
  constexpr std::string_view kReplacement = "\xEF\xBF\xBD";
  std::string result;
  result.reserve(s.size() + (s.size() / 10));
  size_t i = 0;
  while (i < s.size()) {
    char c = s[i];
    auto uc = static_cast<unsigned char>(c);
    if (uc >= 0x80) {
      size_t length = Utf8SequenceLength(s.substr(i));
      if (length == 0) {
        result += kReplacement;
        ++i;
        continue;
      }
      std::string_view sequence = s.substr(i, length);
      // U+FFFE and U+FFFF are not XML characters
      if (sequence == "\xEF\xBF\xBE" || sequence == "\xEF\xBF\xBF") {
        result += kReplacement;
      } else {
        result += sequence;
      }
      i += length;
      continue;
    }
    switch (c) {
      case '&':
        result += "&amp;";
        break;
      case '<':
        result += "&lt;";
        break;
      case '>':
        result += "&gt;";
        break;
      case '"':
        result += "&quot;";
        break;
      case '\'':
        result += "&apos;";
        break;
      default:
        // XML 1.0 forbids most control characters even when escaped
        if (uc < 0x20 && c != '\n' && c != '\t' && c != '\r') {
          result += kReplacement;
        } else {
          result += c;
        }
        break;
    }
    ++i;
  }
  return result;
}

// Keep the head and tail of long captured output.
inline auto TruncateForDisplay(const std::string& str, size_t max_size)
    -> std::string {
  if (str.size() <= max_size) {
    return str;
  }
  size_t half = max_size / 2;
  return str.substr(0, half) + "\n... [" +
         std::to_string(str.size() - (2 * half)) + " bytes truncated] ...\n" +
         str.substr(str.size() - half);
}

}  // namespace polyglot::common

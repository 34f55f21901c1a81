// verdict failure-message renderer.
// Copyright (c) 2026 The verdict authors
// For license information refer to accompanying LICENSE file.
#include "vd/string_utils.h"

#include <optional>

#include "vd/third_party_imports.h"

VD_BEGIN_THIRD_PARTY_INCLUDES
#include <fmt/format.h>
VD_END_THIRD_PARTY_INCLUDES

namespace vd {

// Two character escape for `c`, if it has one.
static std::optional<std::string_view> short_escape(const char c) noexcept {
  switch (c) {
    case '\0':
      return "\\0";
    case '\a':
      return "\\a";
    case '\b':
      return "\\b";
    case '\f':
      return "\\f";
    case '\n':
      return "\\n";
    case '\r':
      return "\\r";
    case '\t':
      return "\\t";
    case '\v':
      return "\\v";
    default:
      return std::nullopt;
  }
}

std::string escape_null_characters(const std::string_view text) {
  std::string output;
  output.reserve(text.size());
  for (const char c : text) {
    if (c == '\0') {
      output.append("\\0");
    } else {
      output.push_back(c);
    }
  }
  return output;
}

std::string escape_control_chars(const std::string_view text) {
  std::string output;
  output.reserve(text.size());
  for (const char c : text) {
    const auto byte = static_cast<unsigned char>(c);
    if (const std::optional<std::string_view> escape = short_escape(c); escape.has_value()) {
      output.append(*escape);
    } else if (byte < 0x20 || byte == 0x7F) {
      fmt::format_to(std::back_inserter(output), "\\x{:02X}", byte);
    } else {
      output.push_back(c);
    }
  }
  return output;
}

// Number of bytes in the sequence introduced by `lead`, or 1 if `lead` cannot begin one.
static std::size_t utf8_sequence_length(const unsigned char lead) noexcept {
  if (lead >= 0xC2 && lead <= 0xDF) {
    return 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    return 3;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    return 4;
  }
  return 1;
}

constexpr bool is_continuation_byte(const unsigned char byte) noexcept {
  return (byte & 0xC0) == 0x80;
}

// True if `sequence` is one complete UTF-8 character: continuation bytes after the lead, with no
// overlong forms, surrogates, or code points above U+10FFFF.
static bool is_well_formed_sequence(const std::string_view sequence) noexcept {
  for (std::size_t i = 1; i < sequence.size(); ++i) {
    if (!is_continuation_byte(static_cast<unsigned char>(sequence[i]))) {
      return false;
    }
  }
  if (sequence.size() < 3) {
    return true;
  }
  const auto lead = static_cast<unsigned char>(sequence[0]);
  const auto second = static_cast<unsigned char>(sequence[1]);
  if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second >= 0xA0)) {
    return false;
  }
  return !((lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F));
}

std::vector<std::size_t> utf8_character_offsets(const std::string_view text) {
  std::vector<std::size_t> offsets{};
  offsets.reserve(text.size() + 1);
  std::size_t pos = 0;
  while (pos < text.size()) {
    offsets.push_back(pos);
    const std::size_t length = utf8_sequence_length(static_cast<unsigned char>(text[pos]));
    if (length > 1 && pos + length <= text.size() &&
        is_well_formed_sequence(text.substr(pos, length))) {
      pos += length;
    } else {
      pos += 1;
    }
  }
  offsets.push_back(text.size());
  return offsets;
}

char32_t decode_utf8_character(const std::string_view character) noexcept {
  if (character.empty()) {
    return 0;
  }
  const auto lead = static_cast<unsigned char>(character[0]);
  if (character.size() == 1) {
    return lead;
  }
  // Payload bits of the lead byte for 2, 3 and 4 byte sequences.
  const unsigned char lead_mask =
      character.size() == 2 ? 0x1F : (character.size() == 3 ? 0x0F : 0x07);
  char32_t code_point = lead & lead_mask;
  for (std::size_t i = 1; i < character.size(); ++i) {
    code_point = (code_point << 6) | (static_cast<unsigned char>(character[i]) & 0x3F);
  }
  return code_point;
}

char32_t fold_case(const char32_t c) noexcept {
  if (c >= U'A' && c <= U'Z') {
    return c + 0x20;
  } else if (c >= 0xC0 && c <= 0xDE && c != 0xD7) {
    // Latin-1 capitals, skipping the multiplication sign.
    return c + 0x20;
  } else if (c >= 0x100 && c <= 0x177) {
    // Latin Extended-A pairs. The run shifts parity at U+0138 (kra) and ends at U+0149.
    if (c >= 0x139 && c <= 0x148) {
      return c % 2 == 1 ? c + 1 : c;
    } else if (c != 0x138 && c != 0x149) {
      return c % 2 == 0 ? c + 1 : c;
    }
  } else if (c == 0x178) {
    return 0xFF;
  } else if (c >= 0x179 && c <= 0x17E) {
    return c % 2 == 1 ? c + 1 : c;
  } else if (c >= 0x391 && c <= 0x3AB && c != 0x3A2) {
    return c + 0x20;
  } else if (c >= 0x410 && c <= 0x42F) {
    return c + 0x20;
  } else if (c >= 0x400 && c <= 0x40F) {
    return c + 0x50;
  }
  return c;
}

}  // namespace vd

#include "text_decoding.hpp"

namespace docsync::loader {

namespace {

bool IsContinuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

// Length of the well-formed sequence starting at `pos`, or 0.
size_t SequenceLength(std::string_view bytes, size_t pos) {
  const auto lead      = static_cast<unsigned char>(bytes[pos]);
  const auto remaining = bytes.size() - pos;

  if (lead < 0x80) {
    return 1;
  }

  size_t        length = 0;
  unsigned char lower  = 0x80;
  unsigned char upper  = 0xBF;

  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) lower = 0xA0;
    if (lead == 0xED) upper = 0x9F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) lower = 0x90;
    if (lead == 0xF4) upper = 0x8F;
  } else {
    return 0;
  }

  if (remaining < length) {
    return 0;
  }

  const auto second = static_cast<unsigned char>(bytes[pos + 1]);
  if (second < lower || second > upper) {
    return 0;
  }
  for (size_t i = 2; i < length; ++i) {
    if (!IsContinuation(static_cast<unsigned char>(bytes[pos + i]))) {
      return 0;
    }
  }
  return length;
}

char32_t DecodeCodePoint(std::string_view bytes, size_t pos, size_t length) {
  static constexpr unsigned char kLeadMask[] = {0, 0x7F, 0x1F, 0x0F, 0x07};

  char32_t code_point = static_cast<unsigned char>(bytes[pos]) & kLeadMask[length];
  for (size_t i = 1; i < length; ++i) {
    code_point = (code_point << 6) | (static_cast<unsigned char>(bytes[pos + i]) & 0x3F);
  }
  return code_point;
}

// White_Space code points plus the ASCII information separators.
bool IsWhitespace(char32_t c) {
  switch (c) {
    case U'\t':
    case U'\n':
    case U'\v':
    case U'\f':
    case U'\r':
    case U' ':
    case 0x1C:
    case 0x1D:
    case 0x1E:
    case 0x1F:
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return c >= 0x2000 && c <= 0x200A;
  }
}

} // namespace

std::string SanitizeUtf8(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());

  size_t pos = 0;
  while (pos < bytes.size()) {
    const auto length = SequenceLength(bytes, pos);
    if (length == 0) {
      ++pos;
      continue;
    }
    out.append(bytes.substr(pos, length));
    pos += length;
  }
  return out;
}

bool IsBlank(std::string_view text) {
  size_t pos = 0;
  while (pos < text.size()) {
    const auto length = SequenceLength(text, pos);
    if (length == 0 || !IsWhitespace(DecodeCodePoint(text, pos, length))) {
      return false;
    }
    pos += length;
  }
  return true;
}

} // namespace docsync::loader

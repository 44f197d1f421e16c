#include "codec/utf8.hpp"

#include <cstddef>

namespace nglog::codec {

namespace {

bool IsContinuation(const std::uint8_t byte) {
  return (byte & 0xC0U) == 0x80U;
}

// Sequence width announced by a lead byte, or 0 when the byte can never start
// a well-formed sequence (continuation bytes, C0/C1 overlong leads, F5..FF).
std::size_t SequenceWidth(const std::uint8_t lead) {
  if (lead < 0x80U) {
    return 1;
  }
  if (lead >= 0xC2U && lead <= 0xDFU) {
    return 2;
  }
  if (lead >= 0xE0U && lead <= 0xEFU) {
    return 3;
  }
  if (lead >= 0xF0U && lead <= 0xF4U) {
    return 4;
  }
  return 0;
}

// The second byte of 3- and 4-byte sequences carries the overlong, surrogate
// and upper-bound restrictions; every other trailing byte is a plain
// continuation byte.
bool IsValidSecondByte(const std::uint8_t lead, const std::uint8_t second) {
  switch (lead) {
  case 0xE0U:
    return second >= 0xA0U && second <= 0xBFU;
  case 0xEDU:
    return second >= 0x80U && second <= 0x9FU;
  case 0xF0U:
    return second >= 0x90U && second <= 0xBFU;
  case 0xF4U:
    return second >= 0x80U && second <= 0x8FU;
  default:
    return IsContinuation(second);
  }
}

std::string InvalidSequence(const std::size_t length, const std::size_t index) {
  return "invalid utf-8 sequence of " + std::to_string(length) + " bytes from index " +
         std::to_string(index);
}

std::string IncompleteSequence(const std::size_t index) {
  return "incomplete utf-8 byte sequence from index " + std::to_string(index);
}

} // namespace

bool ValidateUtf8(std::span<const std::uint8_t> bytes, std::string& error) {
  std::size_t index = 0;
  while (index < bytes.size()) {
    const std::uint8_t lead = bytes[index];
    const std::size_t width = SequenceWidth(lead);
    if (width == 1U) {
      ++index;
      continue;
    }
    if (width == 0U) {
      error = InvalidSequence(1, index);
      return false;
    }

    // `consumed` counts the bytes of this sequence accepted so far; a bad
    // byte reports that valid prefix as the invalid sequence length.
    for (std::size_t consumed = 1; consumed < width; ++consumed) {
      const std::size_t position = index + consumed;
      if (position >= bytes.size()) {
        error = IncompleteSequence(index);
        return false;
      }
      const bool ok = consumed == 1U ? IsValidSecondByte(lead, bytes[position])
                                     : IsContinuation(bytes[position]);
      if (!ok) {
        error = InvalidSequence(consumed, index);
        return false;
      }
    }
    index += width;
  }

  return true;
}

bool Utf8BytesToString(std::span<const std::uint8_t> bytes, std::string& text, std::string& error) {
  if (!ValidateUtf8(bytes, error)) {
    return false;
  }
  text.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  return true;
}

} // namespace nglog::codec

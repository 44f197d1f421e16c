#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace nglog::codec {

// Strict UTF-8 well-formedness check (no overlongs, no surrogates, nothing
// above U+10FFFF).
//
// On failure `error` describes the first offending sequence:
// - "invalid utf-8 sequence of <n> bytes from index <i>"
// - "incomplete utf-8 byte sequence from index <i>" when the buffer ends
//   inside an otherwise valid multi-byte sequence
bool ValidateUtf8(std::span<const std::uint8_t> bytes, std::string& error);

// Validates and copies `bytes` into `text` in one step. `text` is untouched on
// failure.
bool Utf8BytesToString(std::span<const std::uint8_t> bytes, std::string& text, std::string& error);

} // namespace nglog::codec

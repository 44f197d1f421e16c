#pragma once

#include "core/errors/parse_error.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace nglog::codec {

// Reverses the byte-pair obfuscation applied to "world" ngLog copies.
//
// Each original byte is stored as two bytes `(b0, b1)` with `b0 ^ b1` equal to
// the original. This is the scheme Unreal Tournament (1999) writes; other
// titles are not known to use it and no variants are attempted.
//
// Contract:
// - odd-length input fails with kMalformedInput before anything is decoded
// - on success `decoded` holds exactly `encoded.size() / 2` bytes
// - `decoded` is untouched on failure
bool DecodeWorldBytes(std::span<const std::uint8_t> encoded, std::vector<std::uint8_t>& decoded,
                      core::errors::ParseError& error);

} // namespace nglog::codec

#include "codec/world_decoder.hpp"

#include <cstddef>
#include <optional>
#include <utility>

namespace nglog::codec {

bool DecodeWorldBytes(std::span<const std::uint8_t> encoded, std::vector<std::uint8_t>& decoded,
                      core::errors::ParseError& error) {
  if (encoded.size() % 2U != 0U) {
    error = {.code = core::errors::ParseErrorCode::kMalformedInput,
             .message = "non-even log length",
             .line = std::nullopt};
    return false;
  }

  std::vector<std::uint8_t> output;
  output.reserve(encoded.size() / 2U);
  for (std::size_t i = 0; i < encoded.size(); i += 2U) {
    output.push_back(static_cast<std::uint8_t>(encoded[i] ^ encoded[i + 1U]));
  }

  decoded = std::move(output);
  return true;
}

} // namespace nglog::codec

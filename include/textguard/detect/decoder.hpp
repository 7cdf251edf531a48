#pragma once

#include "textguard/detect/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textguard::detect {

enum class Codec { Base64, Hex, Rot13 };

[[nodiscard]] FindingKind payload_kind(Codec codec);

/// Byte range of a substring that may hold an encoded payload.
struct Candidate {
  std::size_t begin = 0;
  std::size_t end = 0;
};

/// Base64 runs, hex runs (raw, 0x.., \x.., %..) and Latin word runs, ordered by start offset.
[[nodiscard]] std::vector<Candidate> find_candidates(std::string_view text,
                                                     const DetectOptions &options);

/// Standard alphabet, padded or unpadded. Fails on bad characters, bad padding or
/// output that does not read as text.
[[nodiscard]] std::optional<std::string> decode_base64(std::string_view candidate);

/// Hex digit pairs, optionally prefixed (0x, \x, %) and separated by spaces or commas.
/// Unprefixed digit runs must decode to text holding a word of three distinct letters.
[[nodiscard]] std::optional<std::string> decode_hex(std::string_view candidate);

[[nodiscard]] std::string rot13(std::string_view text);

/// Succeeds only when the rotated text reads as more suspicious than the input.
[[nodiscard]] std::optional<std::string> decode_rot13(std::string_view candidate);

/// Mostly printable, non-empty text.
[[nodiscard]] bool looks_like_text(std::string_view decoded);

/// Decodes embedded payloads layer by layer up to `options.max_decode_depth`, scanning
/// each decoded payload with the character, homoglyph and pattern detectors. Emits one
/// payload finding per successful decode; spans cover the encoded form of the top-level
/// payloads only.
[[nodiscard]] Detection decode_payloads(std::string_view text, const DetectOptions &options);

} // namespace textguard::detect

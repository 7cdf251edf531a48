#include "textguard/detect/pipeline.hpp"

#include "textguard/detect/characters.hpp"
#include "textguard/detect/decoder.hpp"
#include "textguard/detect/homoglyphs.hpp"
#include "textguard/detect/patterns.hpp"

namespace textguard::detect {

Detection run_detectors(const std::string_view text, const DetectOptions &options) {
  Detection detection = classify_characters(text);
  detection.append(detect_homoglyphs(text));
  detection.append(match_patterns(text, options.max_matches));
  detection.append(decode_payloads(text, options));
  return detection;
}

} // namespace textguard::detect

#include "textguard/detect/catalog.hpp"

#include <stdexcept>

namespace textguard::detect {

namespace {

const CodepointRange *find_in(const std::vector<CodepointRange> &ranges, const std::uint32_t cp) {
  for (const auto &range : ranges) {
    if (cp >= range.first && cp <= range.last) {
      return &range;
    }
  }
  return nullptr;
}

} // namespace

const std::vector<CodepointRange> &zero_width_catalog() {
  static const std::vector<CodepointRange> catalog = {
      {0x200BU, 0x200BU, "Zero-width space (ZWSP)"},
      {0x200CU, 0x200CU, "Zero-width non-joiner (ZWNJ)"},
      {0x200DU, 0x200DU, "Zero-width joiner (ZWJ)"},
      {0x2060U, 0x2060U, "Word joiner"},
      {0xFEFFU, 0xFEFFU, "Zero-width no-break space / byte order mark"},
      {0x180EU, 0x180EU, "Mongolian vowel separator"},
      {0x00ADU, 0x00ADU, "Soft hyphen"},
      {0x034FU, 0x034FU, "Combining grapheme joiner"},
      {0x061CU, 0x061CU, "Arabic letter mark"},
      {0x115FU, 0x115FU, "Hangul choseong filler"},
      {0x1160U, 0x1160U, "Hangul jungseong filler"},
      {0x17B4U, 0x17B4U, "Khmer vowel inherent aq"},
      {0x17B5U, 0x17B5U, "Khmer vowel inherent aa"},
      {0x3164U, 0x3164U, "Hangul filler"},
      {0xFFA0U, 0xFFA0U, "Halfwidth hangul filler"},
  };
  return catalog;
}

const std::vector<CodepointRange> &bidi_catalog() {
  static const std::vector<CodepointRange> catalog = {
      {0x202AU, 0x202AU, "Left-to-right embedding (LRE)"},
      {0x202BU, 0x202BU, "Right-to-left embedding (RLE)"},
      {0x202CU, 0x202CU, "Pop directional formatting (PDF)"},
      {0x202DU, 0x202DU, "Left-to-right override (LRO)"},
      {0x202EU, 0x202EU, "Right-to-left override (RLO)"},
      {0x2066U, 0x2066U, "Left-to-right isolate (LRI)"},
      {0x2067U, 0x2067U, "Right-to-left isolate (RLI)"},
      {0x2068U, 0x2068U, "First strong isolate (FSI)"},
      {0x2069U, 0x2069U, "Pop directional isolate (PDI)"},
  };
  return catalog;
}

const std::vector<Confusable> &confusable_catalog() {
  static const std::vector<Confusable> catalog = {
      // Cyrillic
      {0x0430U, 0x0430U, 'a', "Cyrillic small letter a"},
      {0x0435U, 0x0435U, 'e', "Cyrillic small letter ie"},
      {0x0456U, 0x0456U, 'i', "Cyrillic small letter byelorussian-ukrainian i"},
      {0x0458U, 0x0458U, 'j', "Cyrillic small letter je"},
      {0x0455U, 0x0455U, 's', "Cyrillic small letter dze"},
      {0x043EU, 0x043EU, 'o', "Cyrillic small letter o"},
      {0x0440U, 0x0440U, 'p', "Cyrillic small letter er"},
      {0x0441U, 0x0441U, 'c', "Cyrillic small letter es"},
      {0x0443U, 0x0443U, 'y', "Cyrillic small letter u"},
      {0x0445U, 0x0445U, 'x', "Cyrillic small letter ha"},
      {0x04BBU, 0x04BBU, 'h', "Cyrillic small letter shha"},
      {0x0501U, 0x0501U, 'd', "Cyrillic small letter komi de"},
      {0x0405U, 0x0405U, 'S', "Cyrillic capital letter dze"},
      {0x0406U, 0x0406U, 'I', "Cyrillic capital letter byelorussian-ukrainian i"},
      {0x0408U, 0x0408U, 'J', "Cyrillic capital letter je"},
      {0x0410U, 0x0410U, 'A', "Cyrillic capital letter a"},
      {0x0412U, 0x0412U, 'B', "Cyrillic capital letter ve"},
      {0x0415U, 0x0415U, 'E', "Cyrillic capital letter ie"},
      {0x041AU, 0x041AU, 'K', "Cyrillic capital letter ka"},
      {0x041CU, 0x041CU, 'M', "Cyrillic capital letter em"},
      {0x041DU, 0x041DU, 'H', "Cyrillic capital letter en"},
      {0x041EU, 0x041EU, 'O', "Cyrillic capital letter o"},
      {0x0420U, 0x0420U, 'P', "Cyrillic capital letter er"},
      {0x0421U, 0x0421U, 'C', "Cyrillic capital letter es"},
      {0x0422U, 0x0422U, 'T', "Cyrillic capital letter te"},
      {0x0425U, 0x0425U, 'X', "Cyrillic capital letter ha"},
      // Greek
      {0x0391U, 0x0391U, 'A', "Greek capital letter alpha"},
      {0x0392U, 0x0392U, 'B', "Greek capital letter beta"},
      {0x0395U, 0x0395U, 'E', "Greek capital letter epsilon"},
      {0x0396U, 0x0396U, 'Z', "Greek capital letter zeta"},
      {0x0397U, 0x0397U, 'H', "Greek capital letter eta"},
      {0x0399U, 0x0399U, 'I', "Greek capital letter iota"},
      {0x039AU, 0x039AU, 'K', "Greek capital letter kappa"},
      {0x039CU, 0x039CU, 'M', "Greek capital letter mu"},
      {0x039DU, 0x039DU, 'N', "Greek capital letter nu"},
      {0x039FU, 0x039FU, 'O', "Greek capital letter omicron"},
      {0x03A1U, 0x03A1U, 'P', "Greek capital letter rho"},
      {0x03A4U, 0x03A4U, 'T', "Greek capital letter tau"},
      {0x03A5U, 0x03A5U, 'Y', "Greek capital letter upsilon"},
      {0x03A7U, 0x03A7U, 'X', "Greek capital letter chi"},
      {0x03B1U, 0x03B1U, 'a', "Greek small letter alpha"},
      {0x03BFU, 0x03BFU, 'o', "Greek small letter omicron"},
      {0x03C1U, 0x03C1U, 'p', "Greek small letter rho"},
      {0x03C5U, 0x03C5U, 'u', "Greek small letter upsilon"},
      {0x03C7U, 0x03C7U, 'x', "Greek small letter chi"},
      // Fullwidth forms
      {0xFF10U, 0xFF19U, '0', "Fullwidth digit"},
      {0xFF21U, 0xFF3AU, 'A', "Fullwidth Latin capital letter"},
      {0xFF41U, 0xFF5AU, 'a', "Fullwidth Latin small letter"},
  };
  return catalog;
}

const std::vector<PatternFamily> &pattern_catalog() {
  static const std::vector<PatternFamily> catalog = {
      {FindingKind::InstructionInjection, "instruction override",
       R"(ignore\s+(?:all\s+)?(?:(?:of\s+)?(?:the|your|my|any)\s+)?(?:previous|prior|above|earlier|preceding)\s+(?:instructions?|prompts?|rules?|guidelines?|directions?|messages?)|ignore\s+(?:all|your|any)\s+(?:the\s+)?(?:instructions?|rules?|guidelines?))"},
      {FindingKind::InstructionInjection, "disregard prior context",
       R"(disregard\s+(?:all\s+)?(?:of\s+)?(?:the\s+|your\s+)?(?:previous|prior|above|earlier|preceding)(?:\s+(?:instructions?|prompts?|rules?|messages?|text))?)"},
      {FindingKind::InstructionInjection, "memory manipulation",
       R"(forget\s+(?:everything|all|what)\s+(?:you\s+(?:were\s+)?(?:said|told|know|learned)|i\s+(?:said|told\s+you|mentioned))|forget\s+(?:all\s+)?(?:your|previous|prior)\s+(?:instructions?|rules?|guidelines?))"},
      {FindingKind::InstructionInjection, "new instructions",
       R"(new\s+instructions?\s*:|new\s+system\s+prompt|new\s+prompt\s*:)"},
      {FindingKind::InstructionInjection, "role hijack", R"(you\s+are\s+now\b)"},
      {FindingKind::InstructionInjection, "role manipulation",
       R"(pretend\s+(?:that\s+)?(?:you\s+are|to\s+be)\b|act\s+as\s+(?:if\s+you|an?\s+(?:unrestricted|unfiltered|different))\b)"},
      {FindingKind::InstructionInjection, "safety bypass",
       R"((?:override|bypass|disable)\s+(?:your|all|any|the)\s+(?:instructions?|rules?|restrictions?|filters?|safety|safeguards?|guidelines?))"},
      {FindingKind::InstructionInjection, "jailbreak",
       R"(\bjailbreak(?:ing|s)?\b|\bdan\s*mode\b|\bdeveloper\s+mode\b|\bdo\s+anything\s+now\b)"},
      {FindingKind::InstructionInjection, "prompt leak",
       R"(\b(?:reveal|show|print|repeat|leak)\s+(?:me\s+)?(?:your|the)\s+(?:system\s+)?(?:prompt|instructions)\b)"},
      {FindingKind::InstructionInjection, "system prompt",
       R"(system\s+prompt|system\s*:?\s*(?:override|command))"},

      {FindingKind::DelimiterInjection, "instruction marker", R"(\[/?INST\])"},
      {FindingKind::DelimiterInjection, "system block", R"(<</?SYS>>)"},
      {FindingKind::DelimiterInjection, "special token", R"(<\|[^|<>\s]{1,40}\|>)"},
      {FindingKind::DelimiterInjection, "role fence",
       R"(```[ \t]*(?:system|assistant|user|human|instructions?)\b)"},
      {FindingKind::DelimiterInjection, "role header",
       R"(#{2,16}\s*(?:system|instructions?|prompt|human|assistant)\b)"},
      {FindingKind::DelimiterInjection, "role separator",
       R"(-{3,16}\s*(?:system|instructions?|prompt)\b)"},
      {FindingKind::DelimiterInjection, "role marker", R"(\b(?:human|assistant)\s*:)"},
      {FindingKind::DelimiterInjection, "system tag",
       R"(\[\s*/?\s*system\s*\]|<\s*/?\s*system\s*>|\|\s*system\s*\|)"},
  };
  return catalog;
}

const std::vector<TechniqueInfo> &technique_catalog() {
  static const std::vector<TechniqueInfo> catalog = {
      {FindingKind::ZeroWidth, "Zero-Width Characters",
       "Invisible zero-width characters that can hide or split payloads inside normal text",
       Severity::High, {"U+200B (ZWSP)", "U+200C (ZWNJ)", "U+200D (ZWJ)", "U+FEFF (BOM)"}},
      {FindingKind::BidiOverride, "Bidirectional Overrides",
       "Directional override characters that can visually reorder and disguise text",
       Severity::High, {"U+202E (RLO)", "U+202D (LRO)", "U+2066-U+2069 (isolates)"}},
      {FindingKind::ControlCharacter, "Control Characters",
       "C0/C1 control characters that can disrupt downstream processing", Severity::Medium,
       {"NULL (U+0000)", "Escape (U+001B)", "Delete (U+007F)"}},
      {FindingKind::AsciiSmuggling, "ASCII Smuggling (Tag Characters)",
       "Unicode tag characters (U+E0000-U+E007F) encoding a hidden ASCII message",
       Severity::Critical, {"Tag characters spelling out an entire hidden prompt"}},
      {FindingKind::Homoglyph, "Homoglyphs",
       "Characters from other scripts that render like Latin letters", Severity::Medium,
       {"Cyrillic 'a' (U+0430) vs Latin 'a'", "Greek 'o' (U+03BF) vs Latin 'o'"}},
      {FindingKind::InstructionInjection, "Instruction Injection",
       "Phrases attempting to override the model's prior instructions", Severity::High,
       {"'Ignore previous instructions'", "'New instructions:'", "'You are now...'"}},
      {FindingKind::DelimiterInjection, "Delimiter Injection",
       "Structural prompt markers used to escape the surrounding prompt", Severity::Medium,
       {"[INST] markers", "<<SYS>> blocks", "<|im_start|> tokens"}},
      {FindingKind::Base64Payload, "Base64 Payloads",
       "Base64-encoded hidden content, decoded and re-scanned up to five layers deep",
       Severity::High, {"Base64-encoded override commands", "Nested Base64 layers"}},
      {FindingKind::HexPayload, "Hex Payloads", "Hexadecimal-encoded hidden content",
       Severity::High, {"69676e6f7265...", "\\x69\\x67...", "0x69 0x67 ..."}},
      {FindingKind::Rot13Payload, "ROT13 Payloads",
       "ROT13-rotated text that decodes into suspicious instructions", Severity::High,
       {"'vtaber cerivbhf vafgehpgvbaf'"}},
  };
  return catalog;
}

const std::vector<std::string_view> &suspicious_words() {
  static const std::vector<std::string_view> words = {
      "ignore",   "disregard", "forget",    "previous", "prior",    "instruction",
      "instructions", "system", "prompt",   "override", "bypass",   "jailbreak",
      "pretend",  "reveal",    "password",  "secret",   "admin",    "execute",
      "unrestricted", "rules",
  };
  return words;
}

const TechniqueInfo &technique_info(const FindingKind kind) {
  for (const auto &info : technique_catalog()) {
    if (info.kind == kind) {
      return info;
    }
  }
  throw std::logic_error("technique catalog is missing kind " + std::string(kind_name(kind)));
}

const CodepointRange *find_zero_width(const std::uint32_t cp) {
  return find_in(zero_width_catalog(), cp);
}

const CodepointRange *find_bidi(const std::uint32_t cp) { return find_in(bidi_catalog(), cp); }

const Confusable *find_confusable(const std::uint32_t cp) {
  if (cp < 0x80U) {
    return nullptr;
  }
  for (const auto &entry : confusable_catalog()) {
    if (cp >= entry.first && cp <= entry.last) {
      return &entry;
    }
  }
  return nullptr;
}

std::optional<char> latin_equivalent(const std::uint32_t cp) {
  const auto *entry = find_confusable(cp);
  if (entry == nullptr) {
    return std::nullopt;
  }
  return static_cast<char>(entry->latin + static_cast<char>(cp - entry->first));
}

bool is_control_codepoint(const std::uint32_t cp) {
  if (cp == '\t' || cp == '\n' || cp == '\r') {
    return false;
  }
  return cp < 0x20U || cp == 0x7FU || (cp >= 0x80U && cp <= 0x9FU);
}

bool is_tag_codepoint(const std::uint32_t cp) {
  return cp >= TAG_CHARACTER_BASE && cp <= TAG_CHARACTER_LAST;
}

} // namespace textguard::detect

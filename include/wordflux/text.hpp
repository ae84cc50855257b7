#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace wordflux {

enum class SplitMode {
  kSpace = 0,   // trim, then split on ' ' only
  kWhitespace,  // split on any ASCII whitespace
};

// Strips characters <= ' ' from both ends.
[[nodiscard]] std::string_view Trim(std::string_view text);

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix);

// Empty fragments produced by consecutive separators are dropped.
[[nodiscard]] std::vector<std::string> SplitWords(std::string_view text, SplitMode mode = SplitMode::kSpace);

[[nodiscard]] std::vector<std::string> SplitCsv(std::string_view text);

// Splits UTF-8 into code points. A malformed lead or continuation byte is
// returned as a single-byte code point of its own.
[[nodiscard]] std::vector<std::string> SplitCodepoints(std::string_view text);

[[nodiscard]] bool ParseSplitMode(std::string_view text, SplitMode& mode);
[[nodiscard]] std::string_view SplitModeName(SplitMode mode);

}  // namespace wordflux

#include "wordflux/text.hpp"

#include <cctype>

namespace wordflux {

namespace {
bool IsTrimmable(char c) {
  return static_cast<unsigned char>(c) <= ' ';
}

std::size_t Utf8SequenceLength(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead >> 5) == 0x6) return 2;
  if ((lead >> 4) == 0xE) return 3;
  if ((lead >> 3) == 0x1E) return 4;
  return 1;
}

std::string ToLowerAscii(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}
}  // namespace

std::string_view Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && IsTrimmable(text[begin])) ++begin;
  while (end > begin && IsTrimmable(text[end - 1])) --end;
  return text.substr(begin, end - begin);
}

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> SplitWords(std::string_view text, SplitMode mode) {
  std::vector<std::string> out;
  std::string cur;
  auto is_separator = [mode](char c) {
    if (mode == SplitMode::kSpace) return c == ' ';
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  for (char c : Trim(text)) {
    if (is_separator(c)) {
      if (!cur.empty()) {
        out.push_back(cur);
        cur.clear();
      }
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) {
    out.push_back(cur);
  }
  return out;
}

std::vector<std::string> SplitCsv(std::string_view text) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    auto comma = text.find(',', pos);
    if (comma == std::string_view::npos) comma = text.size();
    auto field = Trim(text.substr(pos, comma - pos));
    if (!field.empty()) out.emplace_back(field);
    pos = comma + 1;
  }
  return out;
}

std::vector<std::string> SplitCodepoints(std::string_view text) {
  std::vector<std::string> out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    std::size_t len = Utf8SequenceLength(static_cast<unsigned char>(text[i]));
    if (i + len > text.size()) {
      len = 1;
    }
    for (std::size_t k = 1; k < len; ++k) {
      if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
        len = 1;
        break;
      }
    }
    out.emplace_back(text.substr(i, len));
    i += len;
  }
  return out;
}

bool ParseSplitMode(std::string_view text, SplitMode& mode) {
  auto v = ToLowerAscii(text);
  if (v == "space" || v == "single_space") {
    mode = SplitMode::kSpace;
    return true;
  }
  if (v == "whitespace" || v == "ws") {
    mode = SplitMode::kWhitespace;
    return true;
  }
  return false;
}

std::string_view SplitModeName(SplitMode mode) {
  switch (mode) {
    case SplitMode::kSpace:
      return "space";
    case SplitMode::kWhitespace:
      return "whitespace";
  }
  return "space";
}

}  // namespace wordflux

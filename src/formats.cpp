#include "wordflux/formats.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>
#include <zlib.h>

#include "wordflux/text.hpp"

namespace wordflux {

namespace {
bool IsGzipPath(const std::string& path) {
  return std::filesystem::path(path).extension() == ".gz";
}
}  // namespace

bool ReadGzipFile(const std::string& path, std::string& payload) {
  gzFile gz = gzopen(path.c_str(), "rb");
  if (!gz) {
    return false;
  }
  payload.clear();
  char buf[1 << 15];
  int read_n = 0;
  while ((read_n = gzread(gz, buf, sizeof(buf))) > 0) {
    payload.append(buf, static_cast<std::size_t>(read_n));
  }
  gzclose(gz);
  return read_n == 0;
}

std::vector<std::string> ReadLines(std::istream& in, bool trim) {
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (trim) {
      auto trimmed = Trim(line);
      if (trimmed.empty()) continue;
      lines.emplace_back(trimmed);
    } else {
      lines.push_back(line);
    }
  }
  return lines;
}

std::vector<std::string> ReadLines(const std::string& path, bool trim) {
  if (!std::filesystem::exists(path)) {
    return {};
  }
  if (IsGzipPath(path)) {
    std::string payload;
    if (!ReadGzipFile(path, payload)) {
      throw std::runtime_error("failed to decompress " + path);
    }
    std::istringstream iss(std::move(payload));
    return ReadLines(iss, trim);
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open " + path);
  }
  return ReadLines(in, trim);
}

Vocabulary LoadVocabularyText(const std::string& path, VocabularyOptions options) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("vocabulary file not found: " + path);
  }
  VocabularyBuilder builder(std::move(options));
  builder.AddFromTextFile(path);
  return builder.Build();
}

Vocabulary LoadHFTokenizerJson(const std::string& path, VocabularyOptions options) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open tokenizer json " + path);
  }

  std::vector<std::pair<std::int64_t, std::string>> id_token;
  try {
    nlohmann::json j;
    in >> j;
    const auto& model = j.at("model");
    const auto& vocab_obj = model.at("vocab");
    if (!vocab_obj.is_object()) {
      throw std::runtime_error("model.vocab is not an object in " + path);
    }
    id_token.reserve(vocab_obj.size());
    for (auto it = vocab_obj.begin(); it != vocab_obj.end(); ++it) {
      id_token.emplace_back(it.value().get<std::int64_t>(), it.key());
    }
    if (!options.unknown_token && model.contains("unk_token") && model["unk_token"].is_string()) {
      options.unknown_token = model["unk_token"].get<std::string>();
    }
    if (j.contains("added_tokens") && j["added_tokens"].is_array()) {
      for (const auto& added : j["added_tokens"]) {
        if (added.value("special", false) && added.contains("content")) {
          options.reserved_tokens.push_back(added["content"].get<std::string>());
        }
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("malformed tokenizer json " + path + ": " + e.what());
  }

  std::sort(id_token.begin(), id_token.end());
  std::vector<std::string> tokens;
  tokens.reserve(id_token.size());
  for (auto& entry : id_token) {
    // Ids must be exactly 0..n-1, otherwise re-adding would shift them.
    if (entry.first != static_cast<std::int64_t>(tokens.size())) {
      throw std::runtime_error("model.vocab ids are not dense in " + path + ": expected id " +
                               std::to_string(tokens.size()) + " but found " + std::to_string(entry.first) +
                               " for '" + entry.second + "'");
    }
    tokens.push_back(std::move(entry.second));
  }

  VocabularyBuilder builder(std::move(options));
  builder.Add(std::move(tokens));
  return builder.Build();
}

void SaveVocabularyText(const Vocabulary& vocab, const std::string& path) {
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("failed to create vocabulary file " + path);
  }
  for (const auto& token : vocab.Tokens()) {
    out << token << '\n';
  }
}

void SaveAsHFTokenizerJson(const Vocabulary& vocab,
                           const WordpieceOptions& options,
                           const std::string& tokenizer_json_path) {
  nlohmann::json j;
  j["version"] = "1.0";
  j["truncation"] = nullptr;
  j["padding"] = nullptr;
  j["normalizer"] = nullptr;
  j["post_processor"] = nullptr;
  j["pre_tokenizer"] = {
      {"type", options.split_mode == SplitMode::kWhitespace ? "WhitespaceSplit" : "Split"}};
  if (options.split_mode == SplitMode::kSpace) {
    j["pre_tokenizer"]["pattern"] = {{"String", " "}};
    j["pre_tokenizer"]["behavior"] = "Removed";
    j["pre_tokenizer"]["invert"] = false;
  }
  j["decoder"] = {{"type", "WordPiece"}, {"prefix", options.continuing_prefix}, {"cleanup", true}};

  nlohmann::json added = nlohmann::json::array();
  nlohmann::json vocab_json = nlohmann::json::object();
  const auto& tokens = vocab.Tokens();
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    vocab_json[tokens[i]] = i;
    if (vocab.IsReserved(tokens[i])) {
      added.push_back({{"id", i},
                       {"content", tokens[i]},
                       {"single_word", false},
                       {"lstrip", false},
                       {"rstrip", false},
                       {"normalized", false},
                       {"special", true}});
    }
  }
  j["added_tokens"] = std::move(added);

  j["model"] = {
      {"type", "WordPiece"},
      {"unk_token", options.unknown_token},
      {"continuing_subword_prefix", options.continuing_prefix},
      {"max_input_chars_per_word", options.max_input_chars},
      {"vocab", std::move(vocab_json)},
  };

  std::ofstream out(tokenizer_json_path);
  if (!out) {
    throw std::runtime_error("failed to create tokenizer json " + tokenizer_json_path);
  }
  out << j.dump(2);
}

}  // namespace wordflux

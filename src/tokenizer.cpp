#include "wordflux/tokenizer.hpp"

#include <iterator>
#include <utility>

#include "wordflux/errors.hpp"

namespace wordflux {

WordpieceTokenizer::WordpieceTokenizer(std::shared_ptr<const Vocabulary> vocabulary, WordpieceOptions options)
    : vocabulary_(std::move(vocabulary)), options_(std::move(options)) {
  if (!vocabulary_) {
    throw InvalidConfigurationError("wordpiece tokenizer requires a vocabulary");
  }
}

WordpieceTokenizer::WordpieceTokenizer(std::shared_ptr<const Vocabulary> vocabulary, std::string unknown_token,
                                       std::size_t max_input_chars)
    : WordpieceTokenizer(std::move(vocabulary), WordpieceOptions{std::move(unknown_token), max_input_chars}) {}

std::vector<std::string> WordpieceTokenizer::Tokenize(std::string_view text) const {
  std::vector<std::string> out;
  for (const auto& word : SplitWords(text, options_.split_mode)) {
    TokenizeWord(word, out);
  }
  return out;
}

void WordpieceTokenizer::TokenizeWord(const std::string& word, std::vector<std::string>& out) const {
  const auto cps = SplitCodepoints(word);
  if (cps.size() > options_.max_input_chars) {
    out.push_back(options_.unknown_token);
    return;
  }

  std::vector<std::string> pieces;
  std::string cand;
  std::size_t start = 0;
  while (start < cps.size()) {
    bool found = false;
    std::size_t end = cps.size();
    for (; end > start; --end) {
      cand.clear();
      if (start > 0) {
        cand = options_.continuing_prefix;
      }
      for (std::size_t k = start; k < end; ++k) {
        cand += cps[k];
      }
      if (vocabulary_->Contains(cand)) {
        found = true;
        break;
      }
    }
    if (!found) {
      out.push_back(options_.unknown_token);
      return;
    }
    pieces.push_back(cand);
    if (pieces.size() > options_.max_input_chars) {
      throw InvariantViolationError("too many pieces for word '" + word + "'");
    }
    start = end;
  }
  out.insert(out.end(), std::make_move_iterator(pieces.begin()), std::make_move_iterator(pieces.end()));
}

std::vector<TokenId> WordpieceTokenizer::TokenToIds(std::span<const std::string> tokens) const {
  std::vector<TokenId> ids;
  ids.reserve(tokens.size());
  for (const auto& token : tokens) {
    ids.push_back(vocabulary_->GetIndex(token));
  }
  return ids;
}

std::vector<TokenId> WordpieceTokenizer::Encode(std::string_view text) const {
  return TokenToIds(Tokenize(text));
}

std::string WordpieceTokenizer::Decode(std::span<const TokenId> ids) const {
  std::string out;
  const auto& prefix = options_.continuing_prefix;
  for (TokenId id : ids) {
    auto token = vocabulary_->GetToken(id);
    if (!token) {
      continue;
    }
    if (!prefix.empty() && StartsWith(*token, prefix) && !out.empty()) {
      out += token->substr(prefix.size());
      continue;
    }
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += *token;
  }
  return out;
}

}  // namespace wordflux

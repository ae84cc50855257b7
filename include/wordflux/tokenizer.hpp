#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "wordflux/text.hpp"
#include "wordflux/vocabulary.hpp"

namespace wordflux {

class Tokenizer {
 public:
  virtual ~Tokenizer() = default;

  [[nodiscard]] virtual std::vector<std::string> Tokenize(std::string_view text) const = 0;
  [[nodiscard]] virtual std::vector<TokenId> Encode(std::string_view text) const = 0;
  [[nodiscard]] virtual std::string Decode(std::span<const TokenId> ids) const = 0;

  [[nodiscard]] virtual std::size_t VocabSize() const = 0;
};

struct WordpieceOptions {
  // Emitted in place of a word that is too long or cannot be split. Need not
  // be the vocabulary's own unknown token.
  std::string unknown_token = "[UNK]";
  std::size_t max_input_chars = 200;
  std::string continuing_prefix = "##";
  SplitMode split_mode = SplitMode::kSpace;
};

class WordpieceTokenizer final : public Tokenizer {
 public:
  WordpieceTokenizer(std::shared_ptr<const Vocabulary> vocabulary, WordpieceOptions options = {});
  WordpieceTokenizer(std::shared_ptr<const Vocabulary> vocabulary, std::string unknown_token,
                     std::size_t max_input_chars);

  // Greedy longest-match-first segmentation of every word of `text`.
  [[nodiscard]] std::vector<std::string> Tokenize(std::string_view text) const override;

  // Same length and order as `tokens`. Throws UndefinedTokenError when a token
  // is missing and the vocabulary has no unknown token.
  [[nodiscard]] std::vector<TokenId> TokenToIds(std::span<const std::string> tokens) const;

  [[nodiscard]] std::vector<TokenId> Encode(std::string_view text) const override;

  // Continuation pieces are glued to the preceding token; ids that resolve to
  // nothing are skipped.
  [[nodiscard]] std::string Decode(std::span<const TokenId> ids) const override;

  [[nodiscard]] std::size_t VocabSize() const override { return vocabulary_->Size(); }
  [[nodiscard]] const Vocabulary& GetVocabulary() const { return *vocabulary_; }
  [[nodiscard]] const WordpieceOptions& Options() const { return options_; }

 private:
  // Appends the pieces of `word`, or the unknown token when it cannot be split.
  void TokenizeWord(const std::string& word, std::vector<std::string>& out) const;

  std::shared_ptr<const Vocabulary> vocabulary_;
  WordpieceOptions options_;
};

}  // namespace wordflux

#pragma once

#include <istream>
#include <string>
#include <vector>

#include "wordflux/tokenizer.hpp"
#include "wordflux/vocabulary.hpp"

namespace wordflux {

// Decompresses a whole gzip file into `payload`. False when it cannot be
// opened or the stream is corrupt.
[[nodiscard]] bool ReadGzipFile(const std::string& path, std::string& payload);

// Splits on "\n" and "\r\n". With `trim`, lines are trimmed and blank ones dropped.
[[nodiscard]] std::vector<std::string> ReadLines(std::istream& in, bool trim = false);

// A missing file yields no lines. Paths ending in ".gz" are decompressed.
[[nodiscard]] std::vector<std::string> ReadLines(const std::string& path, bool trim = false);

// vocab.txt: one token per line, line order is index order.
[[nodiscard]] Vocabulary LoadVocabularyText(const std::string& path, VocabularyOptions options = {});

// HuggingFace tokenizer.json. Tokens of model.vocab are added in id order and
// model.unk_token is used when `options` names no unknown token. Throws
// std::runtime_error when model.vocab ids are not exactly 0..n-1.
[[nodiscard]] Vocabulary LoadHFTokenizerJson(const std::string& path, VocabularyOptions options = {});

void SaveVocabularyText(const Vocabulary& vocab, const std::string& path);

void SaveAsHFTokenizerJson(const Vocabulary& vocab,
                           const WordpieceOptions& options,
                           const std::string& tokenizer_json_path);

}  // namespace wordflux

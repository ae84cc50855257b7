#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "wordflux/tokenizer.hpp"

namespace wordflux {

// Encodes many lines at once. Workers share the tokenizer, which must outlive
// the encoder.
class BatchEncoder {
 public:
  explicit BatchEncoder(const Tokenizer& tokenizer, std::size_t threads = 0);

  // One id list per line, in input order. The first worker failure is rethrown.
  [[nodiscard]] std::vector<std::vector<TokenId>> EncodeLines(const std::vector<std::string>& lines) const;

  [[nodiscard]] std::size_t Threads() const { return threads_; }

 private:
  const Tokenizer& tokenizer_;
  std::size_t threads_;
};

}  // namespace wordflux

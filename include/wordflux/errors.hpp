#pragma once

#include <stdexcept>

namespace wordflux {

// Vocabulary or tokenizer options that cannot be satisfied together.
class InvalidConfigurationError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// A token has no index and the vocabulary has no unknown token to fall back on.
class UndefinedTokenError : public std::out_of_range {
 public:
  using std::out_of_range::out_of_range;
};

class InvariantViolationError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

}  // namespace wordflux

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace wordflux {

// Signed so that callers may probe with any index; inference engines also
// take int64 input ids.
using TokenId = std::int64_t;

struct CountedFrequency {
  std::uint64_t count = 0;
};

// Frequency of a reserved token. Outranks every count and is never pruned.
struct PinnedFrequency {};

using Frequency = std::variant<CountedFrequency, PinnedFrequency>;

[[nodiscard]] bool IsPinned(const Frequency& f);
[[nodiscard]] bool IsBelow(const Frequency& f, std::uint64_t threshold);
[[nodiscard]] bool MoreFrequent(const Frequency& lhs, const Frequency& rhs);

struct VocabularyOptions {
  // Tokens seen fewer times are pruned. Disabled when < 2.
  std::int64_t min_frequency = -1;
  // Keep only the most frequent tokens, reserved ones included. Disabled when <= 0.
  std::int64_t max_tokens = -1;
  // Fallback for GetIndex misses and out-of-range GetToken. Implicitly reserved.
  std::optional<std::string> unknown_token;
  std::vector<std::string> reserved_tokens;
};

class Vocabulary {
 public:
  // Builds with every token of `tokens` in order and no pruning.
  static Vocabulary FromTokens(const std::vector<std::string>& tokens,
                               std::optional<std::string> unknown_token = std::nullopt);

  [[nodiscard]] bool Contains(std::string_view token) const;

  // Out-of-range indices resolve to the unknown token, or to nullopt when the
  // vocabulary has none. This never throws.
  [[nodiscard]] std::optional<std::string_view> GetToken(TokenId index) const;

  // Throws UndefinedTokenError when `token` is absent and no unknown token is set.
  [[nodiscard]] TokenId GetIndex(std::string_view token) const;

  [[nodiscard]] std::size_t Size() const { return index_to_token_.size(); }

  [[nodiscard]] std::optional<Frequency> GetFrequency(std::string_view token) const;
  [[nodiscard]] bool IsReserved(std::string_view token) const;
  [[nodiscard]] const std::optional<std::string>& UnknownToken() const { return unknown_token_; }

  // Tokens in index order.
  [[nodiscard]] const std::vector<std::string>& Tokens() const { return index_to_token_; }

 private:
  friend class VocabularyBuilder;

  struct TokenInfo {
    Frequency frequency;
    TokenId index = -1;
  };

  Vocabulary() = default;

  std::unordered_map<std::string, TokenInfo> tokens_;
  std::vector<std::string> index_to_token_;
  std::unordered_set<std::string> reserved_tokens_;
  std::optional<std::string> unknown_token_;
};

using VocabularyLoader = std::function<std::vector<std::string>(const std::string&)>;

// Accumulates sentences, then builds an immutable Vocabulary. Counting state
// lives only inside Build(), so one builder may build repeatedly.
class VocabularyBuilder {
 public:
  explicit VocabularyBuilder(VocabularyOptions options = {});

  void Add(std::vector<std::string> sentence);
  void AddAll(std::vector<std::vector<std::string>> sentences);

  // One token per line, trimmed, blank lines skipped. A missing file adds an
  // empty sentence.
  void AddFromTextFile(const std::string& path);
  void AddFromCustomizedFile(const std::string& path, const VocabularyLoader& loader);

  // Throws InvalidConfigurationError when max_tokens cannot hold every
  // reserved token.
  [[nodiscard]] Vocabulary Build() const;
  [[nodiscard]] std::shared_ptr<const Vocabulary> BuildShared() const;

  [[nodiscard]] const VocabularyOptions& Options() const { return options_; }
  [[nodiscard]] std::size_t SentenceCount() const { return sentences_.size(); }

 private:
  [[nodiscard]] std::vector<std::string> ReservedInOrder() const;

  VocabularyOptions options_;
  std::vector<std::vector<std::string>> sentences_;
};

}  // namespace wordflux

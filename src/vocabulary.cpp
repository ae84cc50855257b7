#include "wordflux/vocabulary.hpp"

#include <algorithm>
#include <utility>

#include "wordflux/errors.hpp"
#include "wordflux/formats.hpp"

namespace wordflux {

bool IsPinned(const Frequency& f) {
  return std::holds_alternative<PinnedFrequency>(f);
}

bool IsBelow(const Frequency& f, std::uint64_t threshold) {
  const auto* counted = std::get_if<CountedFrequency>(&f);
  return counted != nullptr && counted->count < threshold;
}

bool MoreFrequent(const Frequency& lhs, const Frequency& rhs) {
  if (IsPinned(lhs)) {
    return !IsPinned(rhs);
  }
  if (IsPinned(rhs)) {
    return false;
  }
  return std::get<CountedFrequency>(lhs).count > std::get<CountedFrequency>(rhs).count;
}

Vocabulary Vocabulary::FromTokens(const std::vector<std::string>& tokens,
                                  std::optional<std::string> unknown_token) {
  VocabularyOptions options;
  options.unknown_token = std::move(unknown_token);
  VocabularyBuilder builder(std::move(options));
  builder.Add(tokens);
  return builder.Build();
}

bool Vocabulary::Contains(std::string_view token) const {
  return tokens_.find(std::string(token)) != tokens_.end();
}

std::optional<std::string_view> Vocabulary::GetToken(TokenId index) const {
  if (index < 0 || static_cast<std::size_t>(index) >= index_to_token_.size()) {
    if (unknown_token_) {
      return std::string_view(*unknown_token_);
    }
    return std::nullopt;
  }
  return std::string_view(index_to_token_[static_cast<std::size_t>(index)]);
}

TokenId Vocabulary::GetIndex(std::string_view token) const {
  auto it = tokens_.find(std::string(token));
  if (it != tokens_.end()) {
    return it->second.index;
  }
  if (unknown_token_) {
    return tokens_.at(*unknown_token_).index;
  }
  throw UndefinedTokenError("undefined token '" + std::string(token) +
                            "': define an unknown token for the vocabulary to enable unknown token support");
}

std::optional<Frequency> Vocabulary::GetFrequency(std::string_view token) const {
  auto it = tokens_.find(std::string(token));
  if (it == tokens_.end()) {
    return std::nullopt;
  }
  return it->second.frequency;
}

bool Vocabulary::IsReserved(std::string_view token) const {
  return reserved_tokens_.count(std::string(token)) > 0;
}

VocabularyBuilder::VocabularyBuilder(VocabularyOptions options) : options_(std::move(options)) {}

void VocabularyBuilder::Add(std::vector<std::string> sentence) {
  sentences_.push_back(std::move(sentence));
}

void VocabularyBuilder::AddAll(std::vector<std::vector<std::string>> sentences) {
  for (auto& sentence : sentences) {
    sentences_.push_back(std::move(sentence));
  }
}

void VocabularyBuilder::AddFromTextFile(const std::string& path) {
  Add(ReadLines(path, true));
}

void VocabularyBuilder::AddFromCustomizedFile(const std::string& path, const VocabularyLoader& loader) {
  Add(loader(path));
}

std::vector<std::string> VocabularyBuilder::ReservedInOrder() const {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto& token : options_.reserved_tokens) {
    if (seen.insert(token).second) out.push_back(token);
  }
  if (options_.unknown_token && seen.insert(*options_.unknown_token).second) {
    out.push_back(*options_.unknown_token);
  }
  return out;
}

Vocabulary VocabularyBuilder::Build() const {
  const auto reserved = ReservedInOrder();
  if (options_.max_tokens > 0 && static_cast<std::size_t>(options_.max_tokens) < reserved.size()) {
    throw InvalidConfigurationError("max_tokens (" + std::to_string(options_.max_tokens) +
                                    ") is smaller than the number of reserved tokens (" +
                                    std::to_string(reserved.size()) + ")");
  }

  Vocabulary vocab;
  vocab.unknown_token_ = options_.unknown_token;
  vocab.reserved_tokens_.insert(reserved.begin(), reserved.end());

  std::unordered_map<std::string, Vocabulary::TokenInfo> counts;
  auto add_token = [&](const std::string& token) {
    auto [it, inserted] = counts.try_emplace(token);
    if (inserted) {
      it->second.index = static_cast<TokenId>(counts.size() - 1);
    }
    if (vocab.reserved_tokens_.count(token) > 0) {
      it->second.frequency = PinnedFrequency{};
    } else {
      ++std::get<CountedFrequency>(it->second.frequency).count;
    }
  };

  for (const auto& sentence : sentences_) {
    for (const auto& token : sentence) {
      add_token(token);
    }
  }
  // Reserved tokens go after the sentence tokens so file order is preserved.
  for (const auto& token : reserved) {
    add_token(token);
  }

  bool pruned = false;
  if (options_.min_frequency > 1) {
    const auto threshold = static_cast<std::uint64_t>(options_.min_frequency);
    std::erase_if(counts, [threshold](const auto& kv) { return IsBelow(kv.second.frequency, threshold); });
    pruned = true;
  }

  if (options_.max_tokens > 0 && counts.size() > static_cast<std::size_t>(options_.max_tokens)) {
    std::vector<const std::pair<const std::string, Vocabulary::TokenInfo>*> ranked;
    ranked.reserve(counts.size());
    for (const auto& kv : counts) {
      ranked.push_back(&kv);
    }
    // Most frequent first; equal frequencies keep first-seen order.
    std::sort(ranked.begin(), ranked.end(), [](const auto* l, const auto* r) {
      if (MoreFrequent(l->second.frequency, r->second.frequency)) return true;
      if (MoreFrequent(r->second.frequency, l->second.frequency)) return false;
      return l->second.index < r->second.index;
    });
    std::vector<std::string> evicted;
    for (std::size_t i = static_cast<std::size_t>(options_.max_tokens); i < ranked.size(); ++i) {
      evicted.push_back(ranked[i]->first);
    }
    for (const auto& token : evicted) {
      counts.erase(token);
    }
    pruned = true;
  }

  if (pruned) {
    // Close the gaps left by pruning without changing relative order.
    std::vector<std::pair<TokenId, std::string>> by_index;
    by_index.reserve(counts.size());
    for (const auto& [token, info] : counts) {
      by_index.emplace_back(info.index, token);
    }
    std::sort(by_index.begin(), by_index.end());
    vocab.index_to_token_.reserve(by_index.size());
    for (auto& entry : by_index) {
      counts[entry.second].index = static_cast<TokenId>(vocab.index_to_token_.size());
      vocab.index_to_token_.push_back(std::move(entry.second));
    }
  } else {
    vocab.index_to_token_.resize(counts.size());
    for (const auto& [token, info] : counts) {
      vocab.index_to_token_[static_cast<std::size_t>(info.index)] = token;
    }
  }

  vocab.tokens_ = std::move(counts);
  return vocab;
}

std::shared_ptr<const Vocabulary> VocabularyBuilder::BuildShared() const {
  return std::make_shared<const Vocabulary>(Build());
}

}  // namespace wordflux

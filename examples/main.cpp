#include <iostream>
#include <memory>
#include <vector>

#include "wordflux/tokenizer.hpp"
#include "wordflux/vocabulary.hpp"

int main() {
  using namespace wordflux;

  VocabularyOptions vopts;
  vopts.unknown_token = "[UNK]";
  vopts.reserved_tokens = {"[PAD]", "[CLS]", "[SEP]"};
  VocabularyBuilder builder(vopts);
  builder.Add({"i", "want", "to", "make", "a", "transfer", "israel", "##s", "##er"});
  auto vocab = builder.BuildShared();

  WordpieceTokenizer tokenizer(vocab, "[UNK]", 200);
  auto tokens = tokenizer.Tokenize("i want to make a transfer to israel transfers");
  auto ids = tokenizer.TokenToIds(tokens);

  std::cout << "Tokens:";
  for (const auto& token : tokens) {
    std::cout << ' ' << token;
  }
  std::cout << "\nIDs:";
  for (auto id : ids) {
    std::cout << ' ' << id;
  }
  std::cout << "\nDecoded: " << tokenizer.Decode(ids) << '\n';
  return 0;
}

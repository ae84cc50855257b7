#include "test_helpers.hpp"

#include <memory>
#include <string>
#include <vector>

#include "wordflux/errors.hpp"
#include "wordflux/tokenizer.hpp"
#include "wordflux/vocabulary.hpp"

using namespace wordflux;
using wordflux::testing::Throws;

namespace {

using Tokens = std::vector<std::string>;

std::shared_ptr<const Vocabulary> MakeVocab(const Tokens& tokens, const std::string& unk = "[UNK]") {
  VocabularyOptions options;
  if (!unk.empty()) {
    options.unknown_token = unk;
  }
  VocabularyBuilder builder(options);
  builder.Add(tokens);
  return builder.BuildShared();
}

void TestWholeWordsSentence() {
  auto vocab = MakeVocab({"i", "want", "to", "make", "a", "transfer", "israel", "[UNK]"});
  WordpieceTokenizer tokenizer(vocab, "[UNK]", 200);
  auto tokens = tokenizer.Tokenize("i want to make a transfer to israel");
  assert(tokens == (Tokens{"i", "want", "to", "make", "a", "transfer", "to", "israel"}));

  auto ids = tokenizer.TokenToIds(tokens);
  assert(ids == (std::vector<TokenId>{0, 1, 2, 3, 4, 5, 2, 6}));
}

void TestCaseIsNotFolded() {
  auto vocab = MakeVocab({"i", "want"});
  WordpieceTokenizer tokenizer(vocab, "[UNK]", 200);
  assert(tokenizer.Tokenize("I want") == (Tokens{"[UNK]", "want"}));
}

void TestContinuationMatchSucceeds() {
  auto vocab = MakeVocab({"make", "##r"});
  WordpieceTokenizer tokenizer(vocab, "[UNK]", 200);
  assert(tokenizer.Tokenize("maker") == (Tokens{"make", "##r"}));
}

void TestUnmatchableSuffixDiscardsWord() {
  auto vocab = MakeVocab({"make", "##e", "go"});
  WordpieceTokenizer tokenizer(vocab, "[UNK]", 200);
  assert(tokenizer.Tokenize("maker") == (Tokens{"[UNK]"}));
  assert(tokenizer.Tokenize("go maker go") == (Tokens{"go", "[UNK]", "go"}));
}

void TestContinuationPrefixOnlyOnLaterPieces() {
  auto vocab = MakeVocab({"un", "##aff", "##able", "aff", "able"});
  WordpieceTokenizer tokenizer(vocab, "[UNK]", 200);
  auto tokens = tokenizer.Tokenize("unaffable");
  assert(tokens == (Tokens{"un", "##aff", "##able"}));
  assert(tokens[0].rfind("##", 0) != 0);
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    assert(tokens[i].rfind("##", 0) == 0);
  }
}

void TestLongestMatchFirst() {
  auto vocab = MakeVocab({"a", "ab", "abc", "##d", "##cd", "##b", "##c"});
  WordpieceTokenizer tokenizer(vocab, "[UNK]", 200);
  assert(tokenizer.Tokenize("abcd") == (Tokens{"abc", "##d"}));
  assert(tokenizer.Tokenize("abd") == (Tokens{"ab", "##d"}));
}

void TestOversizedWordBecomesSinglePlaceholder() {
  auto vocab = MakeVocab({"abcdefgh", "abcde", "a", "##b", "##c", "##d", "##e", "##f", "##g", "##h"});
  WordpieceTokenizer tokenizer(vocab, "[UNK]", 5);
  assert(tokenizer.Tokenize("abcdefgh") == (Tokens{"[UNK]"}));
  assert(tokenizer.Tokenize("abcdef a") == (Tokens{"[UNK]", "a"}));
  assert(tokenizer.Tokenize("abcde") == (Tokens{"abcde"}));
  assert(tokenizer.Tokenize("abcd") == (Tokens{"a", "##b", "##c", "##d"}));
}

void TestZeroMaxCharsRejectsEveryWord() {
  auto vocab = MakeVocab({"a"});
  WordpieceTokenizer tokenizer(vocab, "[UNK]", 0);
  assert(tokenizer.Tokenize("a a") == (Tokens{"[UNK]", "[UNK]"}));
}

void TestLengthCountsCodepoints() {
  auto vocab = MakeVocab({"caf", "##\xC3\xA9"});
  WordpieceTokenizer tokenizer(vocab, "[UNK]", 4);
  // "café" is five bytes but four code points.
  assert(tokenizer.Tokenize("caf\xC3\xA9") == (Tokens{"caf", "##\xC3\xA9"}));
}

void TestSpaceSplitting() {
  auto vocab = MakeVocab({"i", "want"});
  WordpieceTokenizer tokenizer(vocab, "[UNK]", 200);
  assert(tokenizer.Tokenize("   i    want  ") == (Tokens{"i", "want"}));
  assert(tokenizer.Tokenize("").empty());
  assert(tokenizer.Tokenize(" \t\n ").empty());
  // Only spaces separate words in the default mode.
  assert(tokenizer.Tokenize("i\twant") == (Tokens{"[UNK]"}));

  WordpieceOptions options;
  options.split_mode = SplitMode::kWhitespace;
  WordpieceTokenizer ws_tokenizer(vocab, options);
  assert(ws_tokenizer.Tokenize("i\twant\ni") == (Tokens{"i", "want", "i"}));
}

void TestCustomContinuationPrefix() {
  auto vocab = MakeVocab({"play", "@@ing"});
  WordpieceOptions options;
  options.continuing_prefix = "@@";
  WordpieceTokenizer tokenizer(vocab, options);
  assert(tokenizer.Tokenize("playing") == (Tokens{"play", "@@ing"}));
}

void TestIdsMatchTokenCount() {
  auto vocab = MakeVocab({"un", "##aff", "##able", "i"});
  WordpieceTokenizer tokenizer(vocab, "[UNK]", 10);
  for (const std::string text : {"", "i", "unaffable i", "i zzz unaffable", "averyveryverylongword i"}) {
    auto tokens = tokenizer.Tokenize(text);
    auto ids = tokenizer.TokenToIds(tokens);
    assert(ids.size() == tokens.size());
    assert(tokenizer.Encode(text) == ids);
  }
}

void TestPlaceholderMayDifferFromVocabularyUnknown() {
  auto vocab = MakeVocab({"i", "[UNK]"});
  WordpieceTokenizer tokenizer(vocab, "<oov>", 200);
  auto tokens = tokenizer.Tokenize("i xyz");
  assert(tokens == (Tokens{"i", "<oov>"}));
  assert(tokenizer.TokenToIds(tokens) == (std::vector<TokenId>{0, 1}));
}

void TestMissingTokenWithoutUnknownThrows() {
  auto vocab = MakeVocab({"i", "want"}, "");
  WordpieceTokenizer tokenizer(vocab, "[UNK]", 200);
  auto tokens = tokenizer.Tokenize("i need");
  assert(tokens == (Tokens{"i", "[UNK]"}));
  assert(Throws<UndefinedTokenError>([&] { (void)tokenizer.TokenToIds(tokens); }));
  assert(Throws<UndefinedTokenError>([&] { (void)tokenizer.Encode("need"); }));
}

void TestDecodeGluesContinuationPieces() {
  auto vocab = MakeVocab({"un", "##aff", "##able", "i"});
  WordpieceTokenizer tokenizer(vocab, "[UNK]", 200);
  auto ids = tokenizer.Encode("i unaffable i");
  assert(tokenizer.Decode(ids) == "i unaffable i");

  auto plain = MakeVocab({"i"}, "");
  WordpieceTokenizer plain_tokenizer(plain, "[UNK]", 200);
  std::vector<TokenId> with_bad_ids = {0, 42, -1, 0};
  assert(plain_tokenizer.Decode(with_bad_ids) == "i i");
}

void TestNullVocabularyIsRejected() {
  assert(Throws<InvalidConfigurationError>([] { WordpieceTokenizer tokenizer(nullptr); }));
}

void TestSharedVocabulary() {
  auto vocab = MakeVocab({"i", "want"});
  WordpieceTokenizer first(vocab, "[UNK]", 200);
  WordpieceTokenizer second(vocab, "<unk>", 1);
  assert(&first.GetVocabulary() == &second.GetVocabulary());
  assert(first.Tokenize("want") == (Tokens{"want"}));
  assert(second.Tokenize("want") == (Tokens{"<unk>"}));
  assert(first.VocabSize() == 3);
}

}  // namespace

int main() {
  TestWholeWordsSentence();
  TestCaseIsNotFolded();
  TestContinuationMatchSucceeds();
  TestUnmatchableSuffixDiscardsWord();
  TestContinuationPrefixOnlyOnLaterPieces();
  TestLongestMatchFirst();
  TestOversizedWordBecomesSinglePlaceholder();
  TestZeroMaxCharsRejectsEveryWord();
  TestLengthCountsCodepoints();
  TestSpaceSplitting();
  TestCustomContinuationPrefix();
  TestIdsMatchTokenCount();
  TestPlaceholderMayDifferFromVocabularyUnknown();
  TestMissingTokenWithoutUnknownThrows();
  TestDecodeGluesContinuationPieces();
  TestNullVocabularyIsRejected();
  TestSharedVocabulary();
  return 0;
}

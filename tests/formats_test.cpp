#include "test_helpers.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <zlib.h>

#include "wordflux/corpus_reader.hpp"
#include "wordflux/formats.hpp"
#include "wordflux/tokenizer.hpp"

using namespace wordflux;
using wordflux::testing::ScratchDir;
using wordflux::testing::Throws;
using wordflux::testing::WriteFile;

namespace {

using Lines = std::vector<std::string>;

void WriteGzip(const std::filesystem::path& path, const std::string& content) {
  gzFile gz = gzopen(path.string().c_str(), "wb");
  assert(gz != nullptr);
  assert(gzwrite(gz, content.data(), static_cast<unsigned>(content.size())) == static_cast<int>(content.size()));
  assert(gzclose(gz) == Z_OK);
}

void TestReadLinesTrimmed() {
  std::istringstream in("  hello \r\n\r\nworld\n\t\n##s");
  assert(ReadLines(in, true) == (Lines{"hello", "world", "##s"}));

  std::istringstream raw("a \r\n\nb");
  assert(ReadLines(raw) == (Lines{"a ", "", "b"}));
}

void TestMissingFileYieldsNoLines(const std::filesystem::path& dir) {
  assert(ReadLines((dir / "absent.txt").string(), true).empty());
  assert(Throws<std::runtime_error>([&] { (void)LoadVocabularyText((dir / "absent.txt").string()); }));

  VocabularyBuilder builder;
  builder.AddFromTextFile((dir / "absent.txt").string());
  assert(builder.Build().Size() == 0);
}

void TestLoadVocabularyText(const std::filesystem::path& dir) {
  auto path = dir / "vocab.txt";
  WriteFile(path, "[PAD]\n  hello \n\nworld\r\n##s\n[UNK]\n");

  VocabularyOptions options;
  options.unknown_token = "[UNK]";
  auto vocab = LoadVocabularyText(path.string(), options);
  assert(vocab.Tokens() == (Lines{"[PAD]", "hello", "world", "##s", "[UNK]"}));
  assert(vocab.GetIndex("nope") == 4);

  WordpieceTokenizer tokenizer(std::make_shared<const Vocabulary>(vocab), "[UNK]", 100);
  assert(tokenizer.Tokenize("worlds hello") == (Lines{"world", "##s", "hello"}));
}

void TestGzipVocabulary(const std::filesystem::path& dir) {
  auto path = dir / "vocab.txt.gz";
  WriteGzip(path, "alpha\n\n beta\ngamma\n");
  assert(ReadLines(path.string(), true) == (Lines{"alpha", "beta", "gamma"}));
  assert(LoadVocabularyText(path.string()).GetIndex("gamma") == 2);
}

void TestTextRoundTrip(const std::filesystem::path& dir) {
  VocabularyOptions options;
  options.max_tokens = 3;
  options.unknown_token = "[UNK]";
  VocabularyBuilder builder(options);
  builder.Add({"b", "a", "a", "c", "a", "b"});
  auto vocab = builder.Build();

  auto path = dir / "pruned.txt";
  SaveVocabularyText(vocab, path.string());
  auto reloaded = LoadVocabularyText(path.string(), VocabularyOptions{-1, -1, std::string("[UNK]"), {}});
  assert(reloaded.Tokens() == vocab.Tokens());
  assert(reloaded.Tokens() == (Lines{"b", "a", "[UNK]"}));
}

void TestCustomizedLoader(const std::filesystem::path& dir) {
  auto path = dir / "custom.tsv";
  WriteFile(path, "hello\t10\nworld\t3\n");
  VocabularyBuilder builder;
  builder.AddFromCustomizedFile(path.string(), [](const std::string& p) {
    Lines tokens;
    for (const auto& line : ReadLines(p, true)) {
      tokens.push_back(line.substr(0, line.find('\t')));
    }
    return tokens;
  });
  auto vocab = builder.Build();
  assert(vocab.Tokens() == (Lines{"hello", "world"}));
}

void TestLoadHFTokenizerJson(const std::filesystem::path& dir) {
  auto path = dir / "tokenizer.json";
  WriteFile(path, R"({
    "added_tokens": [
      {"id": 0, "content": "[PAD]", "special": true},
      {"id": 1, "content": "[UNK]", "special": true}
    ],
    "model": {
      "type": "WordPiece",
      "unk_token": "[UNK]",
      "continuing_subword_prefix": "##",
      "vocab": {"hello": 2, "[UNK]": 1, "##s": 3, "[PAD]": 0}
    }
  })");

  auto vocab = LoadHFTokenizerJson(path.string());
  assert(vocab.Tokens() == (Lines{"[PAD]", "[UNK]", "hello", "##s"}));
  assert(vocab.UnknownToken() == std::string("[UNK]"));
  assert(vocab.IsReserved("[PAD]"));
  assert(vocab.GetIndex("missing") == 1);

  VocabularyOptions override_unk;
  override_unk.unknown_token = "[PAD]";
  assert(LoadHFTokenizerJson(path.string(), override_unk).GetIndex("missing") == 0);
}

void TestHFTokenizerJsonRoundTrip(const std::filesystem::path& dir) {
  VocabularyOptions options;
  options.unknown_token = "[UNK]";
  options.reserved_tokens = {"[CLS]"};
  VocabularyBuilder builder(options);
  builder.Add({"play", "##ing", "##ed"});
  auto vocab = builder.Build();

  auto path = dir / "saved.json";
  SaveAsHFTokenizerJson(vocab, WordpieceOptions{}, path.string());
  auto reloaded = LoadHFTokenizerJson(path.string());
  assert(reloaded.Tokens() == vocab.Tokens());
  assert(reloaded.UnknownToken() == std::string("[UNK]"));
  assert(reloaded.IsReserved("[CLS]"));
}

void TestMalformedJsonThrows(const std::filesystem::path& dir) {
  auto broken = dir / "broken.json";
  WriteFile(broken, "{\"model\": ");
  assert(Throws<std::runtime_error>([&] { (void)LoadHFTokenizerJson(broken.string()); }));

  auto no_vocab = dir / "no_vocab.json";
  WriteFile(no_vocab, R"({"model": {"type": "WordPiece"}})");
  assert(Throws<std::runtime_error>([&] { (void)LoadHFTokenizerJson(no_vocab.string()); }));

  assert(Throws<std::runtime_error>([&] { (void)LoadHFTokenizerJson((dir / "absent.json").string()); }));
}

void TestSparseJsonIdsThrow(const std::filesystem::path& dir) {
  auto gap = dir / "gap.json";
  WriteFile(gap, R"({"model": {"unk_token": "[UNK]", "vocab": {"[UNK]": 0, "a": 1, "b": 3}}})");
  assert(Throws<std::runtime_error>([&] { (void)LoadHFTokenizerJson(gap.string()); }));

  auto offset = dir / "offset.json";
  WriteFile(offset, R"({"model": {"vocab": {"a": 1, "b": 2}}})");
  assert(Throws<std::runtime_error>([&] { (void)LoadHFTokenizerJson(offset.string()); }));

  auto shared_id = dir / "shared_id.json";
  WriteFile(shared_id, R"({"model": {"vocab": {"a": 0, "b": 0}}})");
  assert(Throws<std::runtime_error>([&] { (void)LoadHFTokenizerJson(shared_id.string()); }));
}

void TestReadGzipFile(const std::filesystem::path& dir) {
  WriteGzip(dir / "payload.gz", "one\ntwo\n");
  std::string payload = "stale";
  assert(ReadGzipFile((dir / "payload.gz").string(), payload));
  assert(payload == "one\ntwo\n");
  assert(!ReadGzipFile((dir / "absent.gz").string(), payload));
}

void TestCorpusReader(const std::filesystem::path& dir) {
  CorpusReader reader;
  Lines records;
  auto collect = [&](const std::string& rec) { records.push_back(rec); };

  WriteFile(dir / "corpus.txt", "first line\n\nsecond line\r\n");
  assert(reader.for_each_record((dir / "corpus.txt").string(), collect));
  assert(records == (Lines{"first line", "second line"}));

  records.clear();
  WriteFile(dir / "corpus.jsonl", "{\"text\": \"a b\"}\nnot json\n{\"content\": \"c\"}\n{\"other\": 1}\n");
  assert(reader.for_each_record((dir / "corpus.jsonl").string(), collect));
  assert(records == (Lines{"a b", "c"}));

  records.clear();
  WriteFile(dir / "corpus.json", "[{\"text\": \"x\"}, {\"text\": \"y\"}]");
  assert(reader.for_each_record((dir / "corpus.json").string(), collect));
  assert(records == (Lines{"x", "y"}));

  records.clear();
  WriteGzip(dir / "corpus.jsonl.gz", "{\"text\": \"zipped\"}\n");
  assert(reader.for_each_record((dir / "corpus.jsonl.gz").string(), collect));
  assert(records == (Lines{"zipped"}));

  records.clear();
  WriteGzip(dir / "plain.txt.gz", "alpha\n\nbeta\n");
  assert(reader.for_each_record((dir / "plain.txt.gz").string(), collect));
  assert(records == (Lines{"alpha", "beta"}));
  assert(!reader.for_each_record((dir / "absent.txt.gz").string(), collect));

  records.clear();
  CorpusReader body_reader(CorpusReadOptions{{"body"}});
  WriteFile(dir / "body.jsonl", "{\"text\": \"skip\", \"body\": \"keep\"}\n");
  assert(body_reader.for_each_record((dir / "body.jsonl").string(), collect));
  assert(records == (Lines{"keep"}));

  assert(!reader.for_each_record((dir / "absent.txt").string(), collect));
}

}  // namespace

int main() {
  auto dir = ScratchDir("wordflux_formats_test");
  TestReadLinesTrimmed();
  TestMissingFileYieldsNoLines(dir);
  TestLoadVocabularyText(dir);
  TestGzipVocabulary(dir);
  TestTextRoundTrip(dir);
  TestCustomizedLoader(dir);
  TestLoadHFTokenizerJson(dir);
  TestHFTokenizerJsonRoundTrip(dir);
  TestMalformedJsonThrows(dir);
  TestSparseJsonIdsThrow(dir);
  TestReadGzipFile(dir);
  TestCorpusReader(dir);
  std::filesystem::remove_all(dir);
  return 0;
}

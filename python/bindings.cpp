#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "wordflux/batch.hpp"
#include "wordflux/errors.hpp"
#include "wordflux/formats.hpp"
#include "wordflux/tokenizer.hpp"
#include "wordflux/vocabulary.hpp"

namespace py = pybind11;
using namespace wordflux;

PYBIND11_MODULE(pywordflux, m) {
  py::register_exception<InvalidConfigurationError>(m, "InvalidConfigurationError", PyExc_ValueError);
  py::register_exception<UndefinedTokenError>(m, "UndefinedTokenError", PyExc_KeyError);
  py::register_exception<InvariantViolationError>(m, "InvariantViolationError", PyExc_RuntimeError);

  py::enum_<SplitMode>(m, "SplitMode")
      .value("SPACE", SplitMode::kSpace)
      .value("WHITESPACE", SplitMode::kWhitespace);

  py::class_<CountedFrequency>(m, "CountedFrequency").def_readonly("count", &CountedFrequency::count);
  py::class_<PinnedFrequency>(m, "PinnedFrequency");

  py::class_<VocabularyOptions>(m, "VocabularyOptions")
      .def(py::init<>())
      .def_readwrite("min_frequency", &VocabularyOptions::min_frequency)
      .def_readwrite("max_tokens", &VocabularyOptions::max_tokens)
      .def_readwrite("unknown_token", &VocabularyOptions::unknown_token)
      .def_readwrite("reserved_tokens", &VocabularyOptions::reserved_tokens);

  py::class_<Vocabulary, std::shared_ptr<Vocabulary>>(m, "Vocabulary")
      .def_static("from_tokens", [](const std::vector<std::string>& tokens, std::optional<std::string> unk) {
             return std::make_shared<Vocabulary>(Vocabulary::FromTokens(tokens, std::move(unk)));
           }, py::arg("tokens"), py::arg("unknown_token") = py::none())
      .def("contains", &Vocabulary::Contains)
      .def("get_token", [](const Vocabulary& self, TokenId index) -> std::optional<std::string> {
        auto token = self.GetToken(index);
        if (!token) return std::nullopt;
        return std::string(*token);
      })
      .def("get_index", &Vocabulary::GetIndex)
      .def("get_frequency", &Vocabulary::GetFrequency)
      .def("is_reserved", &Vocabulary::IsReserved)
      .def_property_readonly("unknown_token", &Vocabulary::UnknownToken)
      .def_property_readonly("tokens", &Vocabulary::Tokens)
      .def("__len__", &Vocabulary::Size)
      .def("__contains__", &Vocabulary::Contains);

  py::class_<VocabularyBuilder>(m, "VocabularyBuilder")
      .def(py::init<VocabularyOptions>(), py::arg("options") = VocabularyOptions{})
      .def("add", &VocabularyBuilder::Add)
      .def("add_all", &VocabularyBuilder::AddAll)
      .def("add_from_text_file", &VocabularyBuilder::AddFromTextFile)
      .def("build", [](const VocabularyBuilder& self) { return std::make_shared<Vocabulary>(self.Build()); });

  py::class_<WordpieceOptions>(m, "WordpieceOptions")
      .def(py::init<>())
      .def_readwrite("unknown_token", &WordpieceOptions::unknown_token)
      .def_readwrite("max_input_chars", &WordpieceOptions::max_input_chars)
      .def_readwrite("continuing_prefix", &WordpieceOptions::continuing_prefix)
      .def_readwrite("split_mode", &WordpieceOptions::split_mode);

  py::class_<WordpieceTokenizer>(m, "WordpieceTokenizer")
      .def(py::init([](std::shared_ptr<Vocabulary> vocab, WordpieceOptions opts) {
             return WordpieceTokenizer(std::move(vocab), std::move(opts));
           }),
           py::arg("vocabulary"), py::arg("options") = WordpieceOptions{})
      .def("tokenize", &WordpieceTokenizer::Tokenize)
      .def("token_to_ids", [](const WordpieceTokenizer& self, const std::vector<std::string>& tokens) {
        return self.TokenToIds(tokens);
      })
      .def("encode", &WordpieceTokenizer::Encode)
      .def("decode", [](const WordpieceTokenizer& self, const std::vector<TokenId>& ids) { return self.Decode(ids); })
      .def("vocab_size", &WordpieceTokenizer::VocabSize);

  py::class_<BatchEncoder>(m, "BatchEncoder")
      .def(py::init([](const WordpieceTokenizer& tk, std::size_t threads) { return BatchEncoder(tk, threads); }),
           py::keep_alive<1, 2>(), py::arg("tokenizer"), py::arg("threads") = 0)
      .def("encode_lines", &BatchEncoder::EncodeLines, py::call_guard<py::gil_scoped_release>());

  m.def("load_vocabulary_text", [](const std::string& path, VocabularyOptions opts) {
    return std::make_shared<Vocabulary>(LoadVocabularyText(path, std::move(opts)));
  }, py::arg("path"), py::arg("options") = VocabularyOptions{});
  m.def("load_hf_tokenizer_json", [](const std::string& path, VocabularyOptions opts) {
    return std::make_shared<Vocabulary>(LoadHFTokenizerJson(path, std::move(opts)));
  }, py::arg("path"), py::arg("options") = VocabularyOptions{});
  m.def("save_vocabulary_text", &SaveVocabularyText);
  m.def("save_as_hf_tokenizer_json", &SaveAsHFTokenizerJson, py::arg("vocabulary"), py::arg("options"),
        py::arg("tokenizer_json_path"));
}

#include "cli_config.h"

#include "wordflux/batch.hpp"
#include "wordflux/corpus_reader.hpp"
#include "wordflux/errors.hpp"
#include "wordflux/formats.hpp"
#include "wordflux/tokenizer.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <utility>

using namespace wordflux;

namespace
{
std::shared_ptr<const Vocabulary> load_vocabulary(const cli::Config &cfg)
{
    auto options = cli::to_load_options(cfg, cfg.vocab_path);
    if (cli::is_json_path(cfg.vocab_path))
    {
        return std::make_shared<const Vocabulary>(LoadHFTokenizerJson(cfg.vocab_path, std::move(options)));
    }
    return std::make_shared<const Vocabulary>(LoadVocabularyText(cfg.vocab_path, std::move(options)));
}

void write_ids(std::ostream &out, const std::vector<TokenId> &ids)
{
    for (std::size_t i = 0; i < ids.size(); ++i)
    {
        if (i > 0)
        {
            out << ' ';
        }
        out << ids[i];
    }
    out << '\n';
}

int run_tokenize(const cli::Config &cfg, const WordpieceTokenizer &tokenizer)
{
    std::string text;
    for (const auto &part : cfg.inputs)
    {
        if (!text.empty())
        {
            text.push_back(' ');
        }
        text += part;
    }
    auto tokens = tokenizer.Tokenize(text);
    auto ids = tokenizer.TokenToIds(tokens);
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        std::cout << (i > 0 ? " " : "") << tokens[i];
    }
    std::cout << '\n';
    write_ids(std::cout, ids);
    return 0;
}

int run_encode(const cli::Config &cfg, const WordpieceTokenizer &tokenizer)
{
    CorpusReadOptions ropts;
    ropts.json_text_fields = {cfg.text_field};
    CorpusReader reader(std::move(ropts));

    std::vector<std::string> records;
    for (const auto &file : cfg.inputs)
    {
        if (!reader.for_each_record(file, [&](const std::string &rec) { records.push_back(rec); }))
        {
            std::cerr << "failed to read " << file << "\n";
            return 3;
        }
    }

    BatchEncoder encoder(tokenizer, cfg.threads);
    auto encoded = encoder.EncodeLines(records);

    std::ofstream file_out;
    if (!cfg.output_path.empty())
    {
        file_out.open(cfg.output_path);
        if (!file_out)
        {
            std::cerr << "failed to create " << cfg.output_path << "\n";
            return 3;
        }
    }
    std::ostream &out = cfg.output_path.empty() ? std::cout : file_out;
    std::size_t total_ids = 0;
    for (const auto &ids : encoded)
    {
        write_ids(out, ids);
        total_ids += ids.size();
    }
    std::cerr << "encoded records=" << encoded.size() << " ids=" << total_ids << " threads=" << encoder.Threads()
              << "\n";
    return 0;
}

int run_build_vocab(const cli::Config &cfg)
{
    CorpusReadOptions ropts;
    ropts.json_text_fields = {cfg.text_field};
    CorpusReader reader(std::move(ropts));

    VocabularyBuilder builder(cli::to_vocabulary_options(cfg));
    for (const auto &file : cfg.inputs)
    {
        bool ok = reader.for_each_record(file, [&](const std::string &rec) {
            auto words = SplitWords(rec, cfg.split_mode);
            if (!words.empty())
            {
                builder.Add(std::move(words));
            }
        });
        if (!ok)
        {
            std::cerr << "failed to read " << file << "\n";
            return 3;
        }
    }

    auto vocab = builder.Build();
    if (cli::is_json_path(cfg.output_path))
    {
        SaveAsHFTokenizerJson(vocab, cli::to_wordpiece_options(cfg, vocab), cfg.output_path);
    }
    else
    {
        SaveVocabularyText(vocab, cfg.output_path);
    }
    std::cerr << "records=" << builder.SentenceCount() << " vocab=" << vocab.Size() << " -> " << cfg.output_path
              << "\n";
    return 0;
}
} // namespace

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);

    cli::Config cfg;
    cfg.env_path = cli::detect_env_path_arg(argc, argv, cfg.env_path);
    cli::apply_env_overrides(cfg, cli::read_env_file(cfg.env_path));

    std::string parse_err;
    bool show_help = false;
    if (!cli::parse_args(argc, argv, cfg, parse_err, show_help))
    {
        if (show_help)
        {
            cli::print_usage();
            return 0;
        }
        std::cerr << parse_err << "\n";
        cli::print_usage();
        return 1;
    }

    try
    {
        if (cfg.command == cli::Command::build_vocab)
        {
            return run_build_vocab(cfg);
        }
    }
    catch (const InvalidConfigurationError &e)
    {
        std::cerr << "invalid configuration: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "build-vocab failed: " << e.what() << "\n";
        return 3;
    }

    std::shared_ptr<const Vocabulary> vocab;
    try
    {
        vocab = load_vocabulary(cfg);
    }
    catch (const std::exception &e)
    {
        std::cerr << "failed to load vocabulary: " << e.what() << "\n";
        return 2;
    }
    auto wopts = cli::to_wordpiece_options(cfg, *vocab);
    std::cerr << "loaded vocabulary " << cfg.vocab_path << " size=" << vocab->Size() << " unk=" << wopts.unknown_token
              << " split=" << SplitModeName(wopts.split_mode) << "\n";

    try
    {
        WordpieceTokenizer tokenizer(vocab, std::move(wopts));
        if (cfg.command == cli::Command::tokenize)
        {
            return run_tokenize(cfg, tokenizer);
        }
        return run_encode(cfg, tokenizer);
    }
    catch (const std::exception &e)
    {
        std::cerr << "tokenization failed: " << e.what() << "\n";
        return 3;
    }
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "wordflux/text.hpp"
#include "wordflux/tokenizer.hpp"
#include "wordflux/vocabulary.hpp"

namespace wordflux::cli
{

enum class Command
{
    none = 0,
    tokenize,
    encode,
    build_vocab
};

struct Config
{
    std::string env_path = ".env";
    Command command = Command::none;
    std::vector<std::string> inputs;

    std::string vocab_path = "vocab.txt";
    std::string output_path;
    std::string text_field = "text";

    std::optional<std::string> unk_token; // unset -> file's own, else [UNK]
    std::vector<std::string> reserved_tokens;
    std::int64_t min_frequency = -1; // < 2 -> disabled
    std::int64_t max_tokens = -1;    // <= 0 -> disabled

    std::size_t max_input_chars = 200;
    std::string continuing_prefix = "##";
    SplitMode split_mode = SplitMode::kSpace;
    std::size_t threads = 0; // 0 -> auto
};

std::unordered_map<std::string, std::string> read_env_file(const std::string &path);
void apply_env_overrides(Config &cfg, const std::unordered_map<std::string, std::string> &env);

std::string detect_env_path_arg(int argc, char **argv, const std::string &default_path = ".env");
bool parse_command(const std::string &text, Command &command);
void print_usage();
bool parse_args(int argc, char **argv, Config &cfg, std::string &err, bool &show_help);

inline const std::string kDefaultUnkToken = "[UNK]";

bool is_json_path(const std::string &path);

// Options for build-vocab: pruning applies and the unknown token defaults to [UNK].
VocabularyOptions to_vocabulary_options(const Config &cfg);
// Options for loading an existing vocabulary at `vocab_path`. Pruning never applies.
// A tokenizer.json keeps its own model.unk_token unless one was configured.
VocabularyOptions to_load_options(const Config &cfg, const std::string &vocab_path);
WordpieceOptions to_wordpiece_options(const Config &cfg, const Vocabulary &vocab);

} // namespace wordflux::cli

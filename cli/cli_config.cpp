#include "cli_config.h"

#include "wordflux/formats.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <system_error>

namespace wordflux::cli
{

namespace
{
template <typename T> bool parse_number(std::string_view s, T &out)
{
    s = Trim(s);
    if (s.empty())
    {
        return false;
    }
    T v{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size())
    {
        return false;
    }
    out = v;
    return true;
}

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

// KEY=VALUE, with optional matching single or double quotes around VALUE.
bool split_env_line(std::string_view line, std::string &key, std::string &val)
{
    if (line.empty() || line.front() == '#')
    {
        return false;
    }
    auto eq = line.find('=');
    if (eq == std::string_view::npos)
    {
        return false;
    }
    key = Trim(line.substr(0, eq));
    auto raw = Trim(line.substr(eq + 1));
    if (raw.size() >= 2 && (raw.front() == '"' || raw.front() == '\'') && raw.back() == raw.front())
    {
        raw = raw.substr(1, raw.size() - 2);
    }
    val = raw;
    return !key.empty();
}
} // namespace

std::unordered_map<std::string, std::string> read_env_file(const std::string &path)
{
    std::unordered_map<std::string, std::string> env;
    auto lines = ReadLines(path, true);
    if (!lines.empty() && StartsWith(lines.front(), kUtf8Bom))
    {
        lines.front() = std::string(Trim(std::string_view(lines.front()).substr(kUtf8Bom.size())));
    }
    std::string key;
    std::string val;
    for (const auto &line : lines)
    {
        if (split_env_line(line, key, val))
        {
            env[key] = val;
        }
    }
    return env;
}

void apply_env_overrides(Config &cfg, const std::unordered_map<std::string, std::string> &env)
{
    auto get = [&](const std::string &key) -> const std::string * {
        auto it = env.find(key);
        if (it == env.end())
        {
            return nullptr;
        }
        return &it->second;
    };
    if (auto v = get("VOCAB_PATH"))
        cfg.vocab_path = *v;
    if (auto v = get("OUTPUT"))
        cfg.output_path = *v;
    if (auto v = get("TEXT_FIELD"))
        cfg.text_field = *v;
    if (auto v = get("UNK_TOKEN"))
        cfg.unk_token = *v;
    if (auto v = get("RESERVED_TOKENS"))
        cfg.reserved_tokens = SplitCsv(*v);
    if (auto v = get("MIN_FREQ"))
        (void)parse_number(*v, cfg.min_frequency);
    if (auto v = get("MAX_TOKENS"))
        (void)parse_number(*v, cfg.max_tokens);
    if (auto v = get("MAX_INPUT_CHARS"))
        (void)parse_number(*v, cfg.max_input_chars);
    if (auto v = get("WORDPIECE_PREFIX"))
        cfg.continuing_prefix = *v;
    if (auto v = get("SPLIT_MODE"))
        (void)ParseSplitMode(*v, cfg.split_mode);
    if (auto v = get("THREADS"))
        (void)parse_number(*v, cfg.threads);
}

std::string detect_env_path_arg(int argc, char **argv, const std::string &default_path)
{
    std::string path = default_path;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--env" && i + 1 < argc)
        {
            path = argv[i + 1];
            ++i;
        }
    }
    return path;
}

bool parse_command(const std::string &text, Command &command)
{
    if (text == "tokenize")
    {
        command = Command::tokenize;
        return true;
    }
    if (text == "encode")
    {
        command = Command::encode;
        return true;
    }
    if (text == "build-vocab" || text == "build_vocab")
    {
        command = Command::build_vocab;
        return true;
    }
    return false;
}

void print_usage()
{
    std::cerr << "WordPiece tokenizer tool\n"
              << "Usage:\n"
              << "  wordflux_cli tokenize [options] <text...>\n"
              << "  wordflux_cli encode [options] <corpus files...>\n"
              << "  wordflux_cli build-vocab [options] <corpus files...>\n\n"
              << "Options:\n"
              << "  --env <path>                Path to .env (default: .env)\n"
              << "  --vocab <path>              vocab.txt or tokenizer.json (default: vocab.txt)\n"
              << "  --output <path>             Output file (default: stdout / required for build-vocab)\n"
              << "  --text-field <name>         JSON field holding the text (default: text)\n"
              << "  --unk-token <tok>           Unknown token (default: tokenizer.json unk_token, else [UNK])\n"
              << "  --reserved-tokens <csv>     Tokens that are never pruned\n"
              << "  --min-freq <n>              Prune tokens seen fewer than n times (default: off)\n"
              << "  --max-tokens <n>            Keep only the n most frequent tokens (default: off)\n"
              << "  --max-input-chars <n>       Longer words become the unknown token (default: 200)\n"
              << "  --wordpiece-prefix <s>      Continuation prefix (default: ##)\n"
              << "  --split <mode>              space | whitespace (default: space)\n"
              << "  --threads <n>               Worker threads for encode (0=auto)\n"
              << "  --help                      Show this help\n";
}

bool parse_args(int argc, char **argv, Config &cfg, std::string &err, bool &show_help)
{
    show_help = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto require_value = [&](const std::string &name) -> const char * {
            if (i + 1 >= argc)
            {
                err = "missing value for " + name;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h")
        {
            show_help = true;
            return false;
        }
        if (arg == "--env")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.env_path = v;
            continue;
        }
        if (arg == "--vocab")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.vocab_path = v;
            continue;
        }
        if (arg == "--output")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.output_path = v;
            continue;
        }
        if (arg == "--text-field")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.text_field = v;
            continue;
        }
        if (arg == "--unk-token")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.unk_token = v;
            continue;
        }
        if (arg == "--reserved-tokens")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.reserved_tokens = SplitCsv(v);
            continue;
        }
        if (arg == "--min-freq")
        {
            const char *v = require_value(arg);
            if (!v || !parse_number(v, cfg.min_frequency))
            {
                err = "invalid --min-freq";
                return false;
            }
            continue;
        }
        if (arg == "--max-tokens")
        {
            const char *v = require_value(arg);
            if (!v || !parse_number(v, cfg.max_tokens))
            {
                err = "invalid --max-tokens";
                return false;
            }
            continue;
        }
        if (arg == "--max-input-chars")
        {
            const char *v = require_value(arg);
            if (!v || !parse_number(v, cfg.max_input_chars))
            {
                err = "invalid --max-input-chars";
                return false;
            }
            continue;
        }
        if (arg == "--wordpiece-prefix")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.continuing_prefix = v;
            continue;
        }
        if (arg == "--split")
        {
            const char *v = require_value(arg);
            if (!v || !ParseSplitMode(v, cfg.split_mode))
            {
                err = "invalid --split";
                return false;
            }
            continue;
        }
        if (arg == "--threads")
        {
            const char *v = require_value(arg);
            if (!v || !parse_number(v, cfg.threads))
            {
                err = "invalid --threads";
                return false;
            }
            continue;
        }
        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0)
        {
            err = "unknown argument: " + arg;
            return false;
        }

        if (cfg.command == Command::none)
        {
            if (!parse_command(arg, cfg.command))
            {
                err = "unknown command: " + arg;
                return false;
            }
            continue;
        }
        cfg.inputs.push_back(arg);
    }

    if (cfg.command == Command::none)
    {
        err = "missing command";
        return false;
    }
    if (cfg.inputs.empty())
    {
        err = "missing inputs";
        return false;
    }
    if (cfg.command == Command::build_vocab && cfg.output_path.empty())
    {
        err = "build-vocab requires --output";
        return false;
    }
    if (cfg.continuing_prefix.empty())
    {
        cfg.continuing_prefix = "##";
    }
    return true;
}

bool is_json_path(const std::string &path)
{
    return std::filesystem::path(path).extension() == ".json";
}

VocabularyOptions to_vocabulary_options(const Config &cfg)
{
    VocabularyOptions options;
    options.min_frequency = cfg.min_frequency;
    options.max_tokens = cfg.max_tokens;
    options.unknown_token = cfg.unk_token.value_or(kDefaultUnkToken);
    options.reserved_tokens = cfg.reserved_tokens;
    return options;
}

VocabularyOptions to_load_options(const Config &cfg, const std::string &vocab_path)
{
    VocabularyOptions options;
    options.reserved_tokens = cfg.reserved_tokens;
    if (cfg.unk_token)
    {
        options.unknown_token = cfg.unk_token;
    }
    else if (!is_json_path(vocab_path))
    {
        options.unknown_token = kDefaultUnkToken;
    }
    return options;
}

WordpieceOptions to_wordpiece_options(const Config &cfg, const Vocabulary &vocab)
{
    WordpieceOptions options;
    if (cfg.unk_token)
    {
        options.unknown_token = *cfg.unk_token;
    }
    else
    {
        options.unknown_token = vocab.UnknownToken().value_or(kDefaultUnkToken);
    }
    options.max_input_chars = cfg.max_input_chars;
    options.continuing_prefix = cfg.continuing_prefix;
    options.split_mode = cfg.split_mode;
    return options;
}

} // namespace wordflux::cli

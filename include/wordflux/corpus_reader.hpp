#pragma once

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace wordflux {

struct CorpusReadOptions {
    std::vector<std::string> json_text_fields = {"text", "content"};
};

// Streams text records out of .txt, .jsonl, .json and gzip-compressed corpora.
class CorpusReader {
public:
    using RecordFn = std::function<void(const std::string&)>;

    explicit CorpusReader(CorpusReadOptions options = {});

    // False when `path` cannot be opened or decompressed.
    bool for_each_record(const std::string& path, const RecordFn& fn) const;

private:
    bool read_text_like(const std::string& path, const RecordFn& fn) const;
    bool read_jsonl(const std::string& path, const RecordFn& fn) const;
    bool read_json(const std::string& path, const RecordFn& fn) const;
    bool read_gz(const std::string& path, const RecordFn& fn) const;

    void emit_lines(std::istream& in, const RecordFn& fn) const;
    void emit_json_lines(std::istream& in, const RecordFn& fn) const;
    bool emit_fields(const std::string& json_text, const RecordFn& fn) const;

    CorpusReadOptions options_;
};

} // namespace wordflux

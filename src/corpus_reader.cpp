#include "wordflux/corpus_reader.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>

#include "wordflux/formats.hpp"

namespace wordflux {

namespace {
template <typename Fn>
void emit_first_field(const nlohmann::json& j, const std::vector<std::string>& fields, const Fn& fn) {
    if (!j.is_object()) return;
    for (const auto& field : fields) {
        if (j.contains(field) && j[field].is_string()) {
            fn(j[field].get<std::string>());
            break;
        }
    }
}
} // namespace

CorpusReader::CorpusReader(CorpusReadOptions options) : options_(std::move(options)) {}

bool CorpusReader::for_each_record(const std::string& path, const RecordFn& fn) const {
    auto ext = std::filesystem::path(path).extension().string();
    if (ext == ".jsonl") return read_jsonl(path, fn);
    if (ext == ".json") return read_json(path, fn);
    if (ext == ".gz") return read_gz(path, fn);
    return read_text_like(path, fn);
}

bool CorpusReader::read_text_like(const std::string& path, const RecordFn& fn) const {
    std::ifstream in(path);
    if (!in) return false;
    emit_lines(in, fn);
    return true;
}

bool CorpusReader::read_jsonl(const std::string& path, const RecordFn& fn) const {
    std::ifstream in(path);
    if (!in) return false;
    emit_json_lines(in, fn);
    return true;
}

bool CorpusReader::read_json(const std::string& path, const RecordFn& fn) const {
    std::ifstream in(path);
    if (!in) return false;
    std::stringstream buf;
    buf << in.rdbuf();
    return emit_fields(buf.str(), fn);
}

bool CorpusReader::read_gz(const std::string& path, const RecordFn& fn) const {
    std::string payload;
    if (!ReadGzipFile(path, payload)) return false;

    auto inner = std::filesystem::path(path).stem().extension().string();
    std::istringstream iss(payload);
    if (inner == ".jsonl") {
        emit_json_lines(iss, fn);
        return true;
    }
    if (inner == ".json") {
        return emit_fields(payload, fn);
    }
    emit_lines(iss, fn);
    return true;
}

void CorpusReader::emit_lines(std::istream& in, const RecordFn& fn) const {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) fn(line);
    }
}

void CorpusReader::emit_json_lines(std::istream& in, const RecordFn& fn) const {
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded()) continue;
        emit_first_field(j, options_.json_text_fields, fn);
    }
}

bool CorpusReader::emit_fields(const std::string& json_text, const RecordFn& fn) const {
    auto j = nlohmann::json::parse(json_text, nullptr, false);
    if (j.is_discarded()) return false;
    if (j.is_array()) {
        for (const auto& item : j) emit_first_field(item, options_.json_text_fields, fn);
    } else {
        emit_first_field(j, options_.json_text_fields, fn);
    }
    return true;
}

} // namespace wordflux

#include "wordflux/batch.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <thread>

namespace wordflux {

namespace {
std::size_t EffectiveThreads(std::size_t configured) {
  if (configured > 0) {
    return configured;
  }
  const auto hw = std::thread::hardware_concurrency();
  return hw == 0 ? 4 : hw;
}
}  // namespace

BatchEncoder::BatchEncoder(const Tokenizer& tokenizer, std::size_t threads)
    : tokenizer_(tokenizer), threads_(EffectiveThreads(threads)) {}

std::vector<std::vector<TokenId>> BatchEncoder::EncodeLines(const std::vector<std::string>& lines) const {
  std::vector<std::vector<TokenId>> out(lines.size());
  if (lines.empty()) {
    return out;
  }
  const std::size_t workers = std::min(threads_, lines.size());
  if (workers == 1) {
    for (std::size_t i = 0; i < lines.size(); ++i) {
      out[i] = tokenizer_.Encode(lines[i]);
    }
    return out;
  }

  std::atomic<std::size_t> next{0};
  std::atomic<bool> failed{false};
  std::vector<std::future<void>> jobs;
  jobs.reserve(workers);
  for (std::size_t t = 0; t < workers; ++t) {
    jobs.emplace_back(std::async(std::launch::async, [&]() {
      while (!failed.load()) {
        auto idx = next.fetch_add(1);
        if (idx >= lines.size()) break;
        try {
          out[idx] = tokenizer_.Encode(lines[idx]);
        } catch (...) {
          failed.store(true);
          throw;
        }
      }
    }));
  }

  // Wait for every worker before rethrowing so none outlives `out`.
  std::exception_ptr first_error;
  for (auto& job : jobs) {
    try {
      job.get();
    } catch (...) {
      if (!first_error) first_error = std::current_exception();
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return out;
}

}  // namespace wordflux

#include "fstpiece/encode_pipeline.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace fstpiece {

namespace {

std::size_t effective_threads(std::size_t configured, std::size_t jobs) {
  std::size_t threads = configured;
  if (threads == 0) {
    const auto hw = std::thread::hardware_concurrency();
    threads = hw == 0 ? 4 : hw;
  }
  return std::max<std::size_t>(1, std::min(threads, jobs));
}

}  // namespace

EncodeStats& EncodeStats::operator+=(const EncodeStats& other) {
  files += other.files;
  records += other.records;
  tokens += other.tokens;
  unk_tokens += other.unk_tokens;
  return *this;
}

EncodePipeline::EncodePipeline(std::shared_ptr<const WordPieceTokenizer> tokenizer, CorpusReadOptions ropts)
    : tokenizer_(std::move(tokenizer)), reader_(std::move(ropts)) {
  if (!tokenizer_) {
    throw std::invalid_argument("EncodePipeline requires a tokenizer");
  }
}

std::string EncodePipeline::IdsPath(const std::string& output_dir, std::size_t index) {
  return (std::filesystem::path(output_dir) / ("shard_" + std::to_string(index) + ".ids")).string();
}

std::string EncodePipeline::IndexPath(const std::string& output_dir, std::size_t index) {
  return (std::filesystem::path(output_dir) / ("shard_" + std::to_string(index) + ".idx")).string();
}

template <typename T>
EncodeStats EncodePipeline::EncodeFile(const std::string& file, std::size_t index,
                                       const EncodeOptions& options) const {
  const std::string ids_path = IdsPath(options.output_dir, index);
  const std::string idx_path = IndexPath(options.output_dir, index);
  std::ofstream ids_out(ids_path, std::ios::binary | std::ios::trunc);
  std::ofstream idx_out(idx_path, std::ios::binary | std::ios::trunc);
  // A failed file leaves no shard behind.
  auto fail = [&](const std::string& message) {
    ids_out.close();
    idx_out.close();
    std::error_code ec;
    std::filesystem::remove(ids_path, ec);
    std::filesystem::remove(idx_path, ec);
    throw std::runtime_error(message + file);
  };
  if (!ids_out || !idx_out) {
    fail("failed to create shard files for: ");
  }

  const WordPieceTokenizer& tokenizer = *tokenizer_;
  const T unk = TokenIdTraits<T>::FromCanonical(tokenizer.UnkId());
  const std::size_t skip_front = (!options.add_special_tokens && tokenizer.PrefixId()) ? 1 : 0;
  const std::size_t skip_back = (!options.add_special_tokens && tokenizer.SuffixId()) ? 1 : 0;

  EncodeStats stats;
  stats.files = 1;
  std::vector<T> ids;
  std::vector<Range> ranges;
  std::uint64_t cursor = 0;

  bool ok = reader_.ForEachRecord(file, [&](std::string_view record) {
    tokenizer.TokensInto(record, ids, ranges);
    const std::size_t count = ids.size() - skip_front - skip_back;
    const T* data = ids.data() + skip_front;
    ShardIndexRecord rec{cursor, static_cast<std::uint32_t>(count)};
    ids_out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(count * sizeof(T)));
    idx_out.write(reinterpret_cast<const char*>(&rec), static_cast<std::streamsize>(sizeof(rec)));
    cursor += count * sizeof(T);
    ++stats.records;
    stats.tokens += count;
    stats.unk_tokens += static_cast<std::uint64_t>(std::count(data, data + count, unk));
  });
  if (!ok) {
    fail("failed to read input file: ");
  }
  ids_out.flush();
  idx_out.flush();
  if (!ids_out || !idx_out) {
    fail("failed to write shard files for: ");
  }
  return stats;
}

EncodeStats EncodePipeline::Run(const std::vector<std::string>& files, const EncodeOptions& options) const {
  std::filesystem::create_directories(options.output_dir);
  const std::size_t threads = effective_threads(options.threads, files.size());

  std::atomic<std::size_t> file_idx{0};
  std::mutex log_mu;
  auto worker = [&]() {
    EncodeStats local;
    while (true) {
      const auto idx = file_idx.fetch_add(1);
      if (idx >= files.size()) break;
      EncodeStats file_stats;
      switch (options.id_type) {
        case IdType::kU64:
          file_stats = EncodeFile<std::uint64_t>(files[idx], idx, options);
          break;
        case IdType::kI64:
          file_stats = EncodeFile<std::int64_t>(files[idx], idx, options);
          break;
        case IdType::kI32:
          file_stats = EncodeFile<std::int32_t>(files[idx], idx, options);
          break;
        case IdType::kF64:
          file_stats = EncodeFile<double>(files[idx], idx, options);
          break;
      }
      if (options.verbose) {
        std::lock_guard<std::mutex> lock(log_mu);
        std::cerr << "Encoded " << files[idx] << ": records=" << file_stats.records
                  << " tokens=" << file_stats.tokens << "\n";
      }
      local += file_stats;
    }
    return local;
  };

  std::vector<std::future<EncodeStats>> jobs;
  jobs.reserve(threads);
  for (std::size_t t = 0; t < threads; ++t) {
    jobs.emplace_back(std::async(std::launch::async, worker));
  }

  // Join every worker before rethrowing the first failure.
  EncodeStats total;
  std::exception_ptr first_error;
  for (auto& job : jobs) {
    try {
      total += job.get();
    } catch (const std::exception&) {
      if (!first_error) first_error = std::current_exception();
    }
  }
  if (first_error) std::rethrow_exception(first_error);
  return total;
}

}  // namespace fstpiece

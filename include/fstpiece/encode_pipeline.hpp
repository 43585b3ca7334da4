#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "fstpiece/corpus_reader.hpp"
#include "fstpiece/token_id.hpp"
#include "fstpiece/tokenizer.hpp"

namespace fstpiece {

struct EncodeOptions {
  std::size_t threads = 0;  // 0 -> hardware concurrency
  std::string output_dir = "./tokens";
  IdType id_type = IdType::kI64;
  bool add_special_tokens = true;
  bool verbose = false;
};

// Per record in shard_<n>.idx: byte offset into shard_<n>.ids and token count.
struct ShardIndexRecord {
  std::uint64_t offset;
  std::uint32_t length;
};

struct EncodeStats {
  std::uint64_t files = 0;
  std::uint64_t records = 0;
  std::uint64_t tokens = 0;
  std::uint64_t unk_tokens = 0;

  EncodeStats& operator+=(const EncodeStats& other);
};

// Encodes whole files into id shards, one shard per input file. Workers share
// the tokenizer and own their buffers.
class EncodePipeline {
 public:
  explicit EncodePipeline(std::shared_ptr<const WordPieceTokenizer> tokenizer,
                          CorpusReadOptions ropts = {});

  // Throws std::runtime_error when an input or output file fails.
  EncodeStats Run(const std::vector<std::string>& files, const EncodeOptions& options) const;

  static std::string IdsPath(const std::string& output_dir, std::size_t index);
  static std::string IndexPath(const std::string& output_dir, std::size_t index);

 private:
  template <typename T>
  EncodeStats EncodeFile(const std::string& file, std::size_t index, const EncodeOptions& options) const;

  std::shared_ptr<const WordPieceTokenizer> tokenizer_;
  CorpusReader reader_;
};

}  // namespace fstpiece

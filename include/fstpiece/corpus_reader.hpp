#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace fstpiece {

struct CorpusReadOptions {
  std::vector<std::string> json_text_fields = {"text", "content"};
};

// Streams text records out of .txt / .jsonl / .json files and their .gz
// variants. Plain .txt and .jsonl are read line by line; .json and .gz inputs
// are loaded whole. Returns false when the file cannot be opened or read.
class CorpusReader {
 public:
  using RecordFn = std::function<void(std::string_view)>;

  explicit CorpusReader(CorpusReadOptions options = {});

  bool ForEachRecord(const std::string& path, const RecordFn& fn) const;

 private:
  enum class Layout { kText, kJsonLines, kJson };

  static Layout LayoutOf(const std::string& path);
  void EmitLine(std::string_view line, Layout layout, const RecordFn& fn) const;
  void EmitLines(std::string_view payload, Layout layout, const RecordFn& fn) const;
  void EmitJson(std::string_view payload, const RecordFn& fn) const;
  bool ReadGzip(const std::string& path, std::string& payload) const;

  CorpusReadOptions options_;
};

}  // namespace fstpiece

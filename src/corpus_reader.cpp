#include "fstpiece/corpus_reader.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

#include <nlohmann/json.hpp>
#include <zlib.h>

namespace fstpiece {

namespace {

void emit_text_field(const nlohmann::json& item, const std::vector<std::string>& fields,
                     const CorpusReader::RecordFn& fn) {
  if (!item.is_object()) return;
  for (const auto& field : fields) {
    auto it = item.find(field);
    if (it != item.end() && it->is_string()) {
      fn(it->get_ref<const std::string&>());
      return;
    }
  }
}

}  // namespace

CorpusReader::CorpusReader(CorpusReadOptions options) : options_(std::move(options)) {}

CorpusReader::Layout CorpusReader::LayoutOf(const std::string& path) {
  std::filesystem::path p(path);
  if (p.extension() == ".gz") p = p.stem();
  const auto ext = p.extension().string();
  if (ext == ".jsonl") return Layout::kJsonLines;
  if (ext == ".json") return Layout::kJson;
  return Layout::kText;
}

bool CorpusReader::ForEachRecord(const std::string& path, const RecordFn& fn) const {
  const Layout layout = LayoutOf(path);
  if (std::filesystem::path(path).extension() == ".gz") {
    std::string payload;
    if (!ReadGzip(path, payload)) return false;
    if (layout == Layout::kJson) {
      EmitJson(payload, fn);
    } else {
      EmitLines(payload, layout, fn);
    }
    return true;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  if (layout == Layout::kJson) {
    const std::string payload((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EmitJson(payload, fn);
    return true;
  }
  std::string line;
  while (std::getline(in, line)) {
    EmitLine(line, layout, fn);
  }
  return !in.bad();
}

void CorpusReader::EmitLine(std::string_view line, Layout layout, const RecordFn& fn) const {
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  if (line.empty()) return;
  if (layout == Layout::kText) {
    fn(line);
    return;
  }
  auto j = nlohmann::json::parse(line, nullptr, false);
  if (j.is_discarded()) return;
  emit_text_field(j, options_.json_text_fields, fn);
}

void CorpusReader::EmitLines(std::string_view payload, Layout layout, const RecordFn& fn) const {
  std::size_t pos = 0;
  while (pos < payload.size()) {
    std::size_t nl = payload.find('\n', pos);
    if (nl == std::string_view::npos) nl = payload.size();
    EmitLine(payload.substr(pos, nl - pos), layout, fn);
    pos = nl + 1;
  }
}

void CorpusReader::EmitJson(std::string_view payload, const RecordFn& fn) const {
  auto j = nlohmann::json::parse(payload, nullptr, false);
  if (j.is_discarded()) {
    // Some dumps name jsonl files .json.
    EmitLines(payload, Layout::kJsonLines, fn);
    return;
  }
  if (j.is_array()) {
    for (const auto& item : j) emit_text_field(item, options_.json_text_fields, fn);
  } else {
    emit_text_field(j, options_.json_text_fields, fn);
  }
}

bool CorpusReader::ReadGzip(const std::string& path, std::string& payload) const {
  gzFile gz = gzopen(path.c_str(), "rb");
  if (!gz) return false;
  char buf[1 << 15];
  int read_n = 0;
  while ((read_n = gzread(gz, buf, sizeof(buf))) > 0) {
    payload.append(buf, static_cast<std::size_t>(read_n));
  }
  const bool ok = read_n == 0;
  gzclose(gz);
  return ok;
}

}  // namespace fstpiece

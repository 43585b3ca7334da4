#include "fstpiece/vocab.hpp"

#include <fstream>

namespace fstpiece {

bool IsBracketed(std::string_view token) {
  return token.size() >= 2 && token.front() == '[' && token.back() == ']';
}

EntryKind ClassifyEntry(std::string_view token) {
  if (token.starts_with(kUnusedPrefix)) return EntryKind::kUnused;
  if (token.starts_with(kContinuationPrefix)) return EntryKind::kFollower;
  return EntryKind::kStarter;
}

Vocab ReadVocabLines(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw LoadError("failed to open vocabulary file: " + path);
  }
  Vocab tokens;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    tokens.push_back(std::move(line));
  }
  if (in.bad()) {
    throw LoadError("failed to read vocabulary file: " + path);
  }
  return tokens;
}

void WriteVocabLines(const Vocab& tokens, const std::string& path) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw SaveError("failed to create vocabulary file: " + path);
  }
  for (const auto& token : tokens) {
    out << token << '\n';
  }
  out.flush();
  if (!out) {
    throw SaveError("failed to write vocabulary file: " + path);
  }
}

}  // namespace fstpiece

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fstpiece {

class LoadError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class SaveError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

using Vocab = std::vector<std::string>;

inline constexpr std::string_view kUnkToken = "[UNK]";
inline constexpr std::string_view kClsToken = "[CLS]";
inline constexpr std::string_view kSepToken = "[SEP]";
inline constexpr std::string_view kPadToken = "[PAD]";
inline constexpr std::string_view kUnusedPrefix = "[unused";
inline constexpr std::string_view kContinuationPrefix = "##";

// How a single vocabulary line participates in matching.
enum class EntryKind {
  kStarter = 0,
  kFollower,
  kUnused,
};

[[nodiscard]] EntryKind ClassifyEntry(std::string_view token);
[[nodiscard]] bool IsBracketed(std::string_view token);

// One token per line, line index = id. A trailing '\r' is dropped and a final
// newline does not produce an extra entry. Throws LoadError.
[[nodiscard]] Vocab ReadVocabLines(const std::string& path);

// Throws SaveError.
void WriteVocabLines(const Vocab& tokens, const std::string& path);

}  // namespace fstpiece

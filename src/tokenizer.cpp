#include "fstpiece/tokenizer.hpp"

#include <iostream>
#include <utility>

namespace fstpiece {

namespace detail {

std::size_t WhitespaceLength(std::string_view text, std::size_t pos) {
  const auto at = [&](std::size_t i) { return static_cast<unsigned char>(text[i]); };
  const unsigned char b0 = at(pos);
  if (b0 < 0x80) {
    return (b0 == 0x20 || (b0 >= 0x09 && b0 <= 0x0D)) ? 1 : 0;
  }
  const std::size_t left = text.size() - pos;
  if (b0 == 0xC2) {
    // U+0085, U+00A0
    return (left >= 2 && (at(pos + 1) == 0x85 || at(pos + 1) == 0xA0)) ? 2 : 0;
  }
  if (left < 3) return 0;
  const unsigned char b1 = at(pos + 1);
  const unsigned char b2 = at(pos + 2);
  switch (b0) {
    case 0xE1:  // U+1680
      return (b1 == 0x9A && b2 == 0x80) ? 3 : 0;
    case 0xE2:
      if (b1 == 0x80) {
        // U+2000..U+200A, U+2028, U+2029, U+202F
        if ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF) return 3;
        return 0;
      }
      return (b1 == 0x81 && b2 == 0x9F) ? 3 : 0;  // U+205F
    case 0xE3:  // U+3000
      return (b1 == 0x80 && b2 == 0x80) ? 3 : 0;
    default:
      return 0;
  }
}

std::size_t WordEnd(std::string_view text, std::size_t pos) {
  while (pos < text.size() && WhitespaceLength(text, pos) == 0) ++pos;
  return pos;
}

}  // namespace detail

namespace {

using Entries = std::vector<PrefixAutomaton::Entry>;

// Sorts by key and keeps the last id of every repeated key.
void sort_and_dedup(Entries& entries) {
  std::stable_sort(entries.begin(), entries.end(),
                   [](const auto& a, const auto& b) { return a.first < b.first; });
  std::size_t out = 0;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (out > 0 && entries[out - 1].first == entries[i].first) {
      entries[out - 1].second = entries[i].second;
      continue;
    }
    if (out != i) entries[out] = std::move(entries[i]);
    ++out;
  }
  entries.resize(out);
}

}  // namespace

WordPieceTokenizer WordPieceTokenizer::FromVocab(const std::string& path, LoadOptions opts) {
  auto tokens = ReadVocabLines(path);
  if (opts.verbose) {
    std::cerr << "Vocab file: " << path << "\n";
  }
  return FromTokens(std::move(tokens), opts);
}

WordPieceTokenizer WordPieceTokenizer::FromTokens(Vocab tokens, LoadOptions opts) {
  Entries starters;
  Entries followers;
  std::vector<CanonicalId> special_ids;
  std::optional<CanonicalId> unk_id;
  std::optional<CanonicalId> prefix_id;
  std::optional<CanonicalId> suffix_id;

  for (std::size_t i = 0; i < tokens.size(); ++i) {
    const std::string& token = tokens[i];
    const auto id = static_cast<CanonicalId>(i);
    const EntryKind kind = ClassifyEntry(token);
    if (kind == EntryKind::kUnused) continue;

    if (IsBracketed(token)) {
      if (token == kUnkToken) {
        unk_id = id;
      } else if (token == kClsToken) {
        prefix_id = id;
      } else if (token == kSepToken) {
        suffix_id = id;
      }
      special_ids.push_back(id);
    }

    if (kind == EntryKind::kFollower) {
      followers.emplace_back(token.substr(kContinuationPrefix.size()), id);
    } else {
      starters.emplace_back(token, id);
    }
  }

  if (!unk_id) {
    throw LoadError("vocabulary has no " + std::string(kUnkToken) + " entry");
  }

  sort_and_dedup(starters);
  sort_and_dedup(followers);

  WordPieceTokenizer tokenizer;
  try {
    tokenizer.starters_ = PrefixAutomaton::Build(starters);
    tokenizer.followers_ = PrefixAutomaton::Build(followers);
  } catch (const AutomatonError& e) {
    throw LoadError(std::string("failed to build vocabulary automaton: ") + e.what());
  }
  tokenizer.tokens_ = std::move(tokens);
  tokenizer.special_ids_ = std::move(special_ids);
  tokenizer.unk_id_ = *unk_id;
  tokenizer.prefix_id_ = prefix_id;
  tokenizer.suffix_id_ = suffix_id;

  if (opts.verbose) {
    std::cerr << "Vocab size: " << tokenizer.tokens_.size() << "\n"
              << "Starters: " << tokenizer.starters_.Size() << " keys, "
              << tokenizer.starters_.StateCount() << " states\n"
              << "Followers: " << tokenizer.followers_.Size() << " keys, "
              << tokenizer.followers_.StateCount() << " states\n"
              << "Special tokens: " << tokenizer.special_ids_.size() << "\n";
  }
  return tokenizer;
}

std::optional<CanonicalId> WordPieceTokenizer::TokenToId(std::string_view token) const {
  if (token.starts_with(kContinuationPrefix)) {
    return followers_.Get(token.substr(kContinuationPrefix.size()));
  }
  return starters_.Get(token);
}

std::string WordPieceTokenizer::SaveVocab(const std::string& path) const {
  WriteVocabLines(tokens_, path);
  return path;
}

}  // namespace fstpiece

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "fstpiece/automaton.hpp"
#include "fstpiece/token_id.hpp"
#include "fstpiece/vocab.hpp"

namespace fstpiece {

// Half-open [begin, end). Byte offsets into the input text for token ranges,
// indices into the id buffer for word ranges.
struct Range {
  std::size_t begin = 0;
  std::size_t end = 0;

  [[nodiscard]] std::size_t size() const { return end - begin; }
  [[nodiscard]] bool empty() const { return begin == end; }
  bool operator==(const Range&) const = default;
};

template <typename T>
struct Encoding {
  std::vector<T> ids;
  std::vector<Range> ranges;
  std::vector<Range> words;
};

struct LoadOptions {
  bool verbose = false;
};

namespace detail {

// Byte length of the Unicode White_Space code point starting at `pos`, or 0.
[[nodiscard]] std::size_t WhitespaceLength(std::string_view text, std::size_t pos);

// End of the whitespace-free run that starts at `pos`.
[[nodiscard]] std::size_t WordEnd(std::string_view text, std::size_t pos);

}  // namespace detail

class WordPieceTokenizer {
 public:
  // Throws LoadError.
  static WordPieceTokenizer FromVocab(const std::string& path, LoadOptions opts = {});
  static WordPieceTokenizer FromTokens(Vocab tokens, LoadOptions opts = {});

  // Clears the output buffers, then fills them with one id and one byte range
  // per token. When `words` is given it receives, per whitespace-delimited
  // word, the range of indices into `ids` holding that word's tokens.
  template <typename T>
  void TokensInto(std::string_view text, std::vector<T>& ids, std::vector<Range>& ranges,
                  std::vector<Range>* words = nullptr) const {
    static_assert(kIsTokenId<T>, "unsupported token id type");
    ids.clear();
    ranges.clear();
    if (words != nullptr) words->clear();

    AddPrefix(ids, ranges);
    std::size_t pos = 0;
    while (pos < text.size()) {
      if (const std::size_t ws = detail::WhitespaceLength(text, pos); ws > 0) {
        pos += ws;
        continue;
      }
      const std::size_t end = detail::WordEnd(text, pos);
      const std::size_t first_token = ids.size();
      TokenizeWord(text, Range{pos, end}, ids, ranges);
      if (words != nullptr) words->push_back(Range{first_token, ids.size()});
      pos = end;
    }
    AddSuffix(ids, ranges);
  }

  template <typename T = CanonicalId>
  [[nodiscard]] Encoding<T> Encode(std::string_view text) const {
    Encoding<T> out;
    TokensInto(text, out.ids, out.ranges, &out.words);
    return out;
  }

  // Appends the tokens of a single whitespace-free word. A word that cannot
  // be covered completely becomes one unk token over `word`.
  template <typename T>
  void TokenizeWord(std::string_view text, Range word, std::vector<T>& ids,
                    std::vector<Range>& ranges) const {
    using Traits = TokenIdTraits<T>;
    const std::size_t mark = ids.size();
    std::size_t cursor = word.begin;
    if (auto first = starters_.LongestPrefix(text.substr(word.begin, word.size()))) {
      ids.push_back(Traits::FromCanonical(first->value));
      ranges.push_back(Range{cursor, cursor + first->length});
      cursor += first->length;
      while (cursor < word.end) {
        auto next = followers_.LongestPrefix(text.substr(cursor, word.end - cursor));
        if (!next) break;
        ids.push_back(Traits::FromCanonical(next->value));
        ranges.push_back(Range{cursor, cursor + next->length});
        cursor += next->length;
      }
    }
    if (cursor < word.end) {
      ids.resize(mark);
      ranges.resize(mark);
      ids.push_back(Traits::FromCanonical(unk_id_));
      ranges.push_back(word);
    }
  }

  template <typename T>
  [[nodiscard]] std::string_view TextOf(T id) const {
    return tokens_.at(static_cast<std::size_t>(TokenIdTraits<T>::ToCanonical(id)));
  }

  template <typename T>
  [[nodiscard]] std::vector<std::string_view> TextsOf(std::span<const T> ids) const {
    std::vector<std::string_view> out;
    out.reserve(ids.size());
    for (const T& id : ids) out.push_back(TextOf(id));
    return out;
  }

  template <typename T>
  [[nodiscard]] bool IsSpecial(T id) const {
    return std::binary_search(special_ids_.begin(), special_ids_.end(),
                              TokenIdTraits<T>::ToCanonical(id));
  }

  // Zero for a zero (padding) id, one for anything else.
  template <typename T, typename U = T>
  [[nodiscard]] static U Attention(T id) {
    return id == TokenIdTraits<T>::Zero() ? TokenIdTraits<U>::Zero()
                                          : TokenIdTraits<U>::FromCanonical(1);
  }

  template <typename T, typename U = T>
  static void AttentionsInto(std::span<const T> ids, std::vector<U>& out) {
    out.clear();
    out.reserve(ids.size());
    for (const T& id : ids) out.push_back(Attention<T, U>(id));
  }

  // "##x" resolves against the continuation entries, anything else against
  // the word-initial ones.
  [[nodiscard]] std::optional<CanonicalId> TokenToId(std::string_view token) const;

  // Writes the table one token per line and returns `path`. Throws SaveError.
  std::string SaveVocab(const std::string& path) const;

  [[nodiscard]] std::size_t VocabSize() const { return tokens_.size(); }
  [[nodiscard]] const Vocab& Tokens() const { return tokens_; }
  [[nodiscard]] const std::vector<CanonicalId>& SpecialIds() const { return special_ids_; }
  [[nodiscard]] CanonicalId UnkId() const { return unk_id_; }
  [[nodiscard]] std::optional<CanonicalId> PrefixId() const { return prefix_id_; }
  [[nodiscard]] std::optional<CanonicalId> SuffixId() const { return suffix_id_; }
  [[nodiscard]] const PrefixAutomaton& Starters() const { return starters_; }
  [[nodiscard]] const PrefixAutomaton& Followers() const { return followers_; }

 private:
  WordPieceTokenizer() = default;

  template <typename T>
  void AddPrefix(std::vector<T>& ids, std::vector<Range>& ranges) const {
    if (!prefix_id_) return;
    ids.push_back(TokenIdTraits<T>::FromCanonical(*prefix_id_));
    ranges.push_back(Range{0, 0});
  }

  template <typename T>
  void AddSuffix(std::vector<T>& ids, std::vector<Range>& ranges) const {
    if (!suffix_id_) return;
    const std::size_t pos = ranges.empty() ? 0 : ranges.back().end;
    ids.push_back(TokenIdTraits<T>::FromCanonical(*suffix_id_));
    ranges.push_back(Range{pos, pos});
  }

  Vocab tokens_;
  PrefixAutomaton starters_;
  PrefixAutomaton followers_;
  std::vector<CanonicalId> special_ids_;
  CanonicalId unk_id_ = 0;
  std::optional<CanonicalId> prefix_id_;
  std::optional<CanonicalId> suffix_id_;
};

}  // namespace fstpiece

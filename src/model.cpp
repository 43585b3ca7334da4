#include "fstpiece/model.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>

namespace fstpiece {

WordPieceModel::WordPieceModel(std::shared_ptr<const WordPieceTokenizer> tokenizer)
    : tokenizer_(std::move(tokenizer)) {
  if (!tokenizer_) {
    throw std::invalid_argument("WordPieceModel requires a tokenizer");
  }
}

WordPieceModel WordPieceModel::FromVocab(const std::string& path) {
  return WordPieceModel(std::make_shared<const WordPieceTokenizer>(WordPieceTokenizer::FromVocab(path)));
}

std::vector<Token> WordPieceModel::Tokenize(std::span<const PreToken> words) const {
  std::vector<Token> result;
  result.reserve(words.size());
  std::vector<CanonicalId> ids;
  std::vector<Range> ranges;
  for (std::size_t w = 0; w < words.size(); ++w) {
    const PreToken& word = words[w];
    ids.clear();
    ranges.clear();
    tokenizer_->TokenizeWord(word.text, Range{0, word.text.size()}, ids, ranges);
    for (std::size_t i = 0; i < ids.size(); ++i) {
      Token token;
      token.id = static_cast<std::uint32_t>(ids[i]);
      // Table text is the matched text, with "##" kept for continuations.
      token.value = std::string(tokenizer_->TextOf(ids[i]));
      if (ids[i] == tokenizer_->UnkId() && ranges[i] == Range{0, word.text.size()}) {
        token.offsets = word.offsets;
      } else {
        token.offsets = Range{word.offsets.begin + ranges[i].begin, word.offsets.begin + ranges[i].end};
      }
      token.word = static_cast<std::uint32_t>(w);
      result.push_back(std::move(token));
    }
  }
  return result;
}

std::optional<std::uint32_t> WordPieceModel::TokenToId(std::string_view token) const {
  auto id = tokenizer_->TokenToId(token);
  if (!id) return std::nullopt;
  return static_cast<std::uint32_t>(*id);
}

std::optional<std::string> WordPieceModel::IdToToken(std::uint32_t id) const {
  if (id >= tokenizer_->VocabSize()) return std::nullopt;
  return tokenizer_->Tokens()[id];
}

std::vector<std::string> WordPieceModel::Save(const std::string& folder,
                                              std::optional<std::string_view> name) const {
  const std::string file = name ? std::string(*name) + "-vocab.txt" : std::string("vocab.txt");
  const auto path = (std::filesystem::path(folder) / file).string();
  return {tokenizer_->SaveVocab(path)};
}

}  // namespace fstpiece

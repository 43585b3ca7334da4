#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "fstpiece/tokenizer.hpp"

namespace fstpiece {

// A word produced by a host's own pre-tokenizer, with its offsets in the
// host's original input.
struct PreToken {
  std::string text;
  Range offsets;
};

struct Token {
  std::uint32_t id = 0;
  std::string value;
  Range offsets;
  std::uint32_t word = 0;
};

// Plugin surface for tokenization hosts that split text themselves and only
// need a subword model.
class Model {
 public:
  virtual ~Model() = default;

  [[nodiscard]] virtual std::vector<Token> Tokenize(std::span<const PreToken> words) const = 0;
  [[nodiscard]] virtual std::optional<std::uint32_t> TokenToId(std::string_view token) const = 0;
  [[nodiscard]] virtual std::optional<std::string> IdToToken(std::uint32_t id) const = 0;
  [[nodiscard]] virtual std::size_t VocabSize() const = 0;

  // Returns the files written into `folder`. Throws SaveError.
  virtual std::vector<std::string> Save(const std::string& folder,
                                        std::optional<std::string_view> name) const = 0;
};

class WordPieceModel final : public Model {
 public:
  explicit WordPieceModel(std::shared_ptr<const WordPieceTokenizer> tokenizer);

  static WordPieceModel FromVocab(const std::string& path);

  [[nodiscard]] std::vector<Token> Tokenize(std::span<const PreToken> words) const override;
  [[nodiscard]] std::optional<std::uint32_t> TokenToId(std::string_view token) const override;
  [[nodiscard]] std::optional<std::string> IdToToken(std::uint32_t id) const override;
  [[nodiscard]] std::size_t VocabSize() const override { return tokenizer_->VocabSize(); }
  std::vector<std::string> Save(const std::string& folder,
                                std::optional<std::string_view> name) const override;

  [[nodiscard]] const WordPieceTokenizer& GetTokenizer() const { return *tokenizer_; }

 private:
  std::shared_ptr<const WordPieceTokenizer> tokenizer_;
};

}  // namespace fstpiece

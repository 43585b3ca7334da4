#pragma once

#include <string>

#include "fstpiece/vocab.hpp"

namespace fstpiece {

// Reads the vocabulary of a WordPiece model from a HuggingFace tokenizer.json.
// Ids must be dense. Throws LoadError.
[[nodiscard]] Vocab LoadTokenizerJson(const std::string& tokenizer_json_path);

// Writes `tokens` as a WordPiece tokenizer.json. Throws SaveError.
void SaveAsTokenizerJson(const Vocab& tokens, const std::string& tokenizer_json_path);

}  // namespace fstpiece

#include "fstpiece/formats.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace fstpiece {

Vocab LoadTokenizerJson(const std::string& tokenizer_json_path) {
  std::ifstream in(tokenizer_json_path);
  if (!in) {
    throw LoadError("failed to open tokenizer json: " + tokenizer_json_path);
  }
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    throw LoadError("invalid json in " + tokenizer_json_path);
  }
  if (!j.contains("model") || !j["model"].is_object()) {
    throw LoadError("tokenizer json has no model: " + tokenizer_json_path);
  }
  const auto& model = j["model"];
  if (model.contains("type") && model["type"] != "WordPiece") {
    throw LoadError("unsupported model type " + model["type"].dump() + " in " + tokenizer_json_path);
  }
  if (!model.contains("vocab") || !model["vocab"].is_object()) {
    throw LoadError("tokenizer json has no model.vocab object: " + tokenizer_json_path);
  }

  std::vector<std::pair<std::uint64_t, std::string>> id_token;
  id_token.reserve(model["vocab"].size());
  for (auto it = model["vocab"].begin(); it != model["vocab"].end(); ++it) {
    if (!it.value().is_number_unsigned()) {
      throw LoadError("non-integer id for token " + it.key());
    }
    id_token.emplace_back(it.value().get<std::uint64_t>(), it.key());
  }
  std::sort(id_token.begin(), id_token.end());

  Vocab tokens;
  tokens.reserve(id_token.size());
  for (auto& [id, token] : id_token) {
    if (id != tokens.size()) {
      throw LoadError("vocabulary ids are not dense at id " + std::to_string(id));
    }
    tokens.push_back(std::move(token));
  }
  return tokens;
}

void SaveAsTokenizerJson(const Vocab& tokens, const std::string& tokenizer_json_path) {
  nlohmann::json j;
  j["version"] = "1.0";
  j["truncation"] = nullptr;
  j["padding"] = nullptr;
  j["added_tokens"] = nlohmann::json::array();
  j["normalizer"] = nullptr;
  j["pre_tokenizer"] = {{"type", "WhitespaceSplit"}};
  j["post_processor"] = nullptr;
  j["decoder"] = {{"type", "WordPiece"}, {"prefix", "##"}, {"cleanup", true}};

  // A json object holds one id per token, so a repeated line cannot be kept.
  nlohmann::json vocab_json = nlohmann::json::object();
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (vocab_json.contains(tokens[i])) {
      throw SaveError("token " + tokens[i] + " repeats at id " + std::to_string(i) +
                      ", tokenizer json cannot hold it: " + tokenizer_json_path);
    }
    vocab_json[tokens[i]] = i;
  }

  j["model"] = {
      {"type", "WordPiece"},
      {"unk_token", std::string(kUnkToken)},
      {"continuing_subword_prefix", std::string(kContinuationPrefix)},
      {"max_input_chars_per_word", 100},
      {"vocab", std::move(vocab_json)},
  };

  std::ofstream out(tokenizer_json_path);
  if (!out) {
    throw SaveError("failed to create tokenizer json: " + tokenizer_json_path);
  }
  try {
    out << j.dump(2);
  } catch (const nlohmann::json::exception& e) {
    throw SaveError("failed to serialize tokenizer json: " + std::string(e.what()));
  }
  if (!out) {
    throw SaveError("failed to write tokenizer json: " + tokenizer_json_path);
  }
}

}  // namespace fstpiece

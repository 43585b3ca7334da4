#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "fstpiece/token_id.hpp"

namespace fstpiece {

// Settings of the command line tool. Defaults < .env < flags.
struct Config {
  std::string env_path = ".env";
  std::string vocab_path = "vocab.txt";
  std::string tokenizer_json;  // when set, the vocabulary comes from here
  std::string data_glob;
  std::vector<std::string> inputs;
  std::string out_dir = "data/tokens";
  IdType id_type = IdType::kI64;
  std::size_t threads = 0;  // 0 -> auto
  std::vector<std::string> text_fields = {"text", "content"};
  bool add_special_tokens = true;
  bool verbose = false;
};

using EnvMap = std::unordered_map<std::string, std::string>;

// KEY=VALUE lines; '#' comments, surrounding quotes and a UTF-8 BOM are
// stripped. A missing file yields an empty map.
[[nodiscard]] EnvMap ReadEnvFile(const std::string& path);

// Recognized keys: VOCAB_PATH, TOKENIZER_JSON, DATA_PATH, OUT_DIR, ID_TYPE,
// THREADS, TEXT_FIELD, ADD_SPECIAL_TOKENS, VERBOSE.
bool ApplyEnv(const EnvMap& env, Config& cfg, std::string& err);

// Value of --env-file if present, so the .env can be read before the other
// flags are applied on top of it.
[[nodiscard]] std::string DetectEnvPath(const std::vector<std::string>& args, const std::string& fallback);

// Flags override; remaining positional arguments are appended to inputs.
bool ParseArgs(const std::vector<std::string>& args, Config& cfg, std::string& err, bool& show_help);

void PrintUsage();

[[nodiscard]] bool WildcardMatch(const std::string& pattern, const std::string& str);

// Sorted regular files matching `pattern` ('*' and '?' wildcards). A pattern
// without wildcards yields itself when it exists.
[[nodiscard]] std::vector<std::string> ExpandDataGlob(const std::string& pattern);

}  // namespace fstpiece

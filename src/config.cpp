#include "fstpiece/config.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <system_error>

namespace fstpiece {

namespace {

std::string_view trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t\r\n\f\v");
  if (first == std::string_view::npos) return {};
  return s.substr(first, s.find_last_not_of(" \t\r\n\f\v") - first + 1);
}

std::string_view unquote(std::string_view v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
    return v.substr(1, v.size() - 2);
  }
  return v;
}

std::string normalize_path(const std::string& path) {
  std::string out = path;
  std::replace(out.begin(), out.end(), '\\', '/');
  return out;
}

bool parse_size(const std::string& s, std::size_t& out) {
  if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return false;
  }
  try {
    const unsigned long long v = std::stoull(s);
    if (v > std::numeric_limits<std::size_t>::max()) return false;
    out = static_cast<std::size_t>(v);
    return true;
  } catch (const std::out_of_range&) {
    return false;
  }
}

std::optional<bool> parse_bool(const std::string& s) {
  std::string v;
  v.reserve(s.size());
  for (char c : s) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
  if (v == "0" || v == "false" || v == "no" || v == "off") return false;
  return std::nullopt;
}

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos <= s.size()) {
    std::size_t comma = s.find(',', pos);
    if (comma == std::string::npos) comma = s.size();
    const auto item = trim(std::string_view(s).substr(pos, comma - pos));
    if (!item.empty()) out.emplace_back(item);
    pos = comma + 1;
  }
  return out;
}

bool set_id_type(const std::string& value, Config& cfg, std::string& err) {
  auto type = ParseIdType(value);
  if (!type) {
    err = "Invalid id type: " + value + " (expected u64, i64, i32 or f64)";
    return false;
  }
  cfg.id_type = *type;
  return true;
}

bool set_threads(const std::string& value, Config& cfg, std::string& err) {
  if (!parse_size(value, cfg.threads)) {
    err = "Invalid thread count: " + value;
    return false;
  }
  return true;
}

}  // namespace

EnvMap ReadEnvFile(const std::string& path) {
  EnvMap env;
  std::ifstream in(path, std::ios::binary);
  if (!in) return env;
  const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  std::string_view rest = content;
  if (rest.starts_with("\xEF\xBB\xBF")) rest.remove_prefix(3);
  while (!rest.empty()) {
    const auto nl = rest.find('\n');
    const auto line = trim(rest.substr(0, nl));
    rest = nl == std::string_view::npos ? std::string_view{} : rest.substr(nl + 1);
    const auto eq = line.find('=');
    if (line.empty() || line.front() == '#' || eq == std::string_view::npos) continue;
    env[std::string(trim(line.substr(0, eq)))] = std::string(unquote(trim(line.substr(eq + 1))));
  }
  return env;
}

bool ApplyEnv(const EnvMap& env, Config& cfg, std::string& err) {
  auto get = [&](const char* key) -> const std::string* {
    auto it = env.find(key);
    return it == env.end() || it->second.empty() ? nullptr : &it->second;
  };
  if (auto v = get("VOCAB_PATH")) cfg.vocab_path = *v;
  if (auto v = get("TOKENIZER_JSON")) cfg.tokenizer_json = *v;
  if (auto v = get("DATA_PATH")) cfg.data_glob = *v;
  if (auto v = get("OUT_DIR")) cfg.out_dir = *v;
  if (auto v = get("TEXT_FIELD")) cfg.text_fields = split_csv(*v);
  if (auto v = get("ID_TYPE"); v && !set_id_type(*v, cfg, err)) return false;
  if (auto v = get("THREADS"); v && !set_threads(*v, cfg, err)) return false;
  if (auto v = get("ADD_SPECIAL_TOKENS")) {
    auto b = parse_bool(*v);
    if (!b) {
      err = "Invalid ADD_SPECIAL_TOKENS: " + *v;
      return false;
    }
    cfg.add_special_tokens = *b;
  }
  if (auto v = get("VERBOSE")) cfg.verbose = parse_bool(*v).value_or(false);
  return true;
}

std::string DetectEnvPath(const std::vector<std::string>& args, const std::string& fallback) {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == "--env-file") return args[i + 1];
  }
  return fallback;
}

bool ParseArgs(const std::vector<std::string>& args, Config& cfg, std::string& err, bool& show_help) {
  show_help = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    auto need_value = [&](std::string& out) {
      if (i + 1 >= args.size()) {
        err = "Missing value for " + arg;
        return false;
      }
      out = args[++i];
      return true;
    };

    std::string value;
    if (arg == "--help" || arg == "-h") {
      show_help = true;
      return false;
    }
    if (arg == "--") continue;
    if (arg == "--env-file") {
      if (!need_value(cfg.env_path)) return false;
    } else if (arg == "--vocab") {
      if (!need_value(cfg.vocab_path)) return false;
    } else if (arg == "--tokenizer-json") {
      if (!need_value(cfg.tokenizer_json)) return false;
    } else if (arg == "--data") {
      if (!need_value(cfg.data_glob)) return false;
    } else if (arg == "--out-dir") {
      if (!need_value(cfg.out_dir)) return false;
    } else if (arg == "--id-type") {
      if (!need_value(value) || !set_id_type(value, cfg, err)) return false;
    } else if (arg == "--threads") {
      if (!need_value(value) || !set_threads(value, cfg, err)) return false;
    } else if (arg == "--text-field") {
      if (!need_value(value)) return false;
      cfg.text_fields = split_csv(value);
    } else if (arg == "--no-special") {
      cfg.add_special_tokens = false;
    } else if (arg == "--verbose" || arg == "-v") {
      cfg.verbose = true;
    } else if (arg.starts_with("--")) {
      err = "Unknown option: " + arg;
      return false;
    } else {
      cfg.inputs.push_back(arg);
    }
  }
  return true;
}

void PrintUsage() {
  std::cerr << "fstpiece_cli: word-piece tokenization over prefix automata\n"
            << "Usage:\n"
            << "  fstpiece_cli encode [options] [files...]   Encode corpora into id shards\n"
            << "  fstpiece_cli show [options] <text...>      Print tokens of a text\n"
            << "  fstpiece_cli convert <tokenizer.json> <vocab.txt>\n"
            << "  fstpiece_cli export <vocab.txt> <tokenizer.json>\n\n"
            << "Options:\n"
            << "  --env-file <path>        Path to .env (default: .env)\n"
            << "  --vocab <path>           vocab.txt path (default: vocab.txt, env VOCAB_PATH)\n"
            << "  --tokenizer-json <path>  Read the vocabulary from a WordPiece tokenizer.json\n"
            << "  --data <glob>            Input files (env DATA_PATH)\n"
            << "  --out-dir <path>         Shard directory (default: data/tokens, env OUT_DIR)\n"
            << "  --id-type <t>            u64 | i64 | i32 | f64 (default: i64, env ID_TYPE)\n"
            << "  --threads <n>            Worker threads, 0 = auto (env THREADS)\n"
            << "  --text-field <a,b>       JSON fields holding text (default: text,content)\n"
            << "  --no-special             Leave out [CLS]/[SEP] in shards\n"
            << "  --verbose, -v            Log progress to stderr\n"
            << "  --help, -h               Show this help\n";
}

bool WildcardMatch(const std::string& pattern, const std::string& str) {
  // matched[j]: the first j pattern chars match the text consumed so far.
  std::vector<char> matched(pattern.size() + 1, 0);
  std::vector<char> next(pattern.size() + 1, 0);
  matched[0] = 1;
  for (std::size_t j = 1; j <= pattern.size(); ++j) matched[j] = matched[j - 1] && pattern[j - 1] == '*';
  for (char c : str) {
    next[0] = 0;
    for (std::size_t j = 1; j <= pattern.size(); ++j) {
      const char p = pattern[j - 1];
      next[j] = p == '*' ? (next[j - 1] || matched[j]) : (matched[j - 1] && (p == '?' || p == c));
    }
    matched.swap(next);
  }
  return matched[pattern.size()] != 0;
}

std::vector<std::string> ExpandDataGlob(const std::string& pattern) {
  namespace fs = std::filesystem;
  std::vector<std::string> out;
  std::error_code ec;
  const std::string norm = normalize_path(pattern);
  if (norm.find_first_of("*?") == std::string::npos) {
    if (fs::is_regular_file(pattern, ec)) out.push_back(pattern);
    return out;
  }

  // Walk from the directory components that precede the first wildcard.
  fs::path root;
  for (const auto& part : fs::path(norm)) {
    if (part.string().find_first_of("*?") != std::string::npos) break;
    root /= part;
  }
  const bool relative_root = root.empty();
  if (relative_root) root = ".";
  if (!fs::is_directory(root, ec)) return out;

  const auto opts = fs::directory_options::skip_permission_denied;
  for (fs::recursive_directory_iterator it(root, opts, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    const fs::path& found = it->path();
    const std::string cand = relative_root ? found.lexically_relative(root).generic_string() : found.generic_string();
    if (WildcardMatch(norm, cand)) out.push_back(found.string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace fstpiece

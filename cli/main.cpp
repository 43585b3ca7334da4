#include "fstpiece/config.hpp"
#include "fstpiece/encode_pipeline.hpp"
#include "fstpiece/formats.hpp"
#include "fstpiece/tokenizer.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace fstpiece;

namespace {

std::shared_ptr<const WordPieceTokenizer> load_tokenizer(const Config& cfg) {
  LoadOptions opts;
  opts.verbose = cfg.verbose;
  if (!cfg.tokenizer_json.empty()) {
    return std::make_shared<const WordPieceTokenizer>(
        WordPieceTokenizer::FromTokens(LoadTokenizerJson(cfg.tokenizer_json), opts));
  }
  return std::make_shared<const WordPieceTokenizer>(WordPieceTokenizer::FromVocab(cfg.vocab_path, opts));
}

int run_encode(const Config& cfg) {
  std::vector<std::string> files = cfg.inputs;
  if (!cfg.data_glob.empty()) {
    auto matched = ExpandDataGlob(cfg.data_glob);
    if (matched.empty()) {
      std::cerr << "No files matched: " << cfg.data_glob << "\n";
      return 1;
    }
    files.insert(files.end(), matched.begin(), matched.end());
  }
  if (files.empty()) {
    std::cerr << "DATA_PATH not set in .env and no input files given.\n";
    return 1;
  }

  auto tokenizer = load_tokenizer(cfg);
  CorpusReadOptions ropts;
  ropts.json_text_fields = cfg.text_fields;
  EncodePipeline pipeline(tokenizer, ropts);

  EncodeOptions opts;
  opts.threads = cfg.threads;
  opts.output_dir = cfg.out_dir;
  opts.id_type = cfg.id_type;
  opts.add_special_tokens = cfg.add_special_tokens;
  opts.verbose = cfg.verbose;

  std::cerr << "Files: " << files.size() << "\n"
            << "Id type: " << IdTypeName(cfg.id_type) << "\n"
            << "Out dir: " << cfg.out_dir << "\n";
  auto stats = pipeline.Run(files, opts);
  std::cerr << "Records: " << stats.records << "\n"
            << "Tokens: " << stats.tokens << "\n"
            << "Unknown tokens: " << stats.unk_tokens << "\n";
  return 0;
}

int run_show(const Config& cfg) {
  if (cfg.inputs.empty()) {
    std::cerr << "show: no text given\n";
    return 1;
  }
  std::string text;
  for (const auto& part : cfg.inputs) {
    if (!text.empty()) text.push_back(' ');
    text += part;
  }
  auto tokenizer = load_tokenizer(cfg);
  std::vector<CanonicalId> ids;
  std::vector<Range> ranges;
  tokenizer->TokensInto(text, ids, ranges);
  for (std::size_t i = 0; i < ids.size(); ++i) {
    std::cout << ids[i] << '\t' << ranges[i].begin << ".." << ranges[i].end << '\t' << tokenizer->TextOf(ids[i])
              << (tokenizer->IsSpecial(ids[i]) ? "\t(special)" : "") << '\n';
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);

  if (argc < 2) {
    PrintUsage();
    return 1;
  }
  const std::string cmd = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  try {
    if (cmd == "convert" || cmd == "export") {
      if (args.size() != 2) {
        PrintUsage();
        return 1;
      }
      if (cmd == "convert") {
        WriteVocabLines(LoadTokenizerJson(args[0]), args[1]);
      } else {
        // Load first so an unusable vocabulary is rejected before export.
        auto tokenizer = WordPieceTokenizer::FromVocab(args[0]);
        SaveAsTokenizerJson(tokenizer.Tokens(), args[1]);
      }
      std::cerr << "Saved: " << args[1] << "\n";
      return 0;
    }

    if (cmd != "encode" && cmd != "show") {
      std::cerr << "Unknown command: " << cmd << "\n";
      PrintUsage();
      return 1;
    }

    Config cfg;
    cfg.env_path = DetectEnvPath(args, cfg.env_path);
    std::string err;
    if (!ApplyEnv(ReadEnvFile(cfg.env_path), cfg, err)) {
      std::cerr << err << "\n";
      return 1;
    }
    bool show_help = false;
    if (!ParseArgs(args, cfg, err, show_help)) {
      if (show_help) {
        PrintUsage();
        return 0;
      }
      std::cerr << err << "\n";
      PrintUsage();
      return 1;
    }
    return cmd == "encode" ? run_encode(cfg) : run_show(cfg);
  } catch (const LoadError& e) {
    std::cerr << "load failed: " << e.what() << "\n";
    return 2;
  } catch (const SaveError& e) {
    std::cerr << "save failed: " << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 4;
  }
}

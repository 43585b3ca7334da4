#include <chrono>
#include <cstdint>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "fstpiece/tokenizer.hpp"

// Encodes a fixed set of sentences many times with reused buffers and
// reports throughput. Pass a vocab.txt to use a real vocabulary; otherwise a
// character-level one is derived from the sentences.
int main(int argc, char** argv) {
  using namespace fstpiece;

  const std::vector<std::string> sentences = {
      "Ich esse Steak.",
      "Der Hund spielt im Garten.",
      "Ein Junge im Kindergarten spielt mit dem Ball.",
      "Wie definiert die Bundesregierung Clans und Clankriminalität?",
      "Welche Vereinbarungen auf Landesebene bestehen mit Drittstaaten?",
      "Wie viele Menschen starben durch die Folgen der Borreliose-Erkrankung?",
      "Gibt es genügend Impfstoff gegen FSME angesichts der steigenden Infektionszahlen?",
      "Liegen der Bundesregierung statistische Daten zu Todesfällen in Folge von Borreliose vor und wenn ja, wie lauten diese?",
  };

  auto make_tokenizer = [&]() {
    if (argc > 1) {
      LoadOptions opts;
      opts.verbose = true;
      return WordPieceTokenizer::FromVocab(argv[1], opts);
    }
    std::set<std::string> pieces;
    for (const auto& s : sentences) {
      for (unsigned char c : s) {
        if (c != ' ' && c < 0x80) {
          pieces.insert(std::string(1, static_cast<char>(c)));
          pieces.insert("##" + std::string(1, static_cast<char>(c)));
        }
      }
    }
    Vocab vocab = {"[PAD]", "[UNK]", "[CLS]", "[SEP]", "Bundes", "##regierung", "Borr", "##eliose"};
    vocab.insert(vocab.end(), pieces.begin(), pieces.end());
    return WordPieceTokenizer::FromTokens(std::move(vocab));
  };
  const auto tokenizer = make_tokenizer();

  constexpr int kRounds = 20000;
  std::vector<std::int64_t> ids;
  std::vector<Range> ranges;
  std::size_t tokens = 0;
  std::size_t bytes = 0;
  const auto start = std::chrono::steady_clock::now();
  for (int round = 0; round < kRounds; ++round) {
    for (const auto& s : sentences) {
      tokenizer.TokensInto(s, ids, ranges);
      tokens += ids.size();
      bytes += s.size();
    }
  }
  const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

  tokenizer.TokensInto(sentences[4], ids, ranges);
  std::cout << "Sample:";
  for (auto id : ids) std::cout << ' ' << tokenizer.TextOf(id);
  std::cout << "\nTokens: " << tokens << "\nSeconds: " << elapsed
            << "\nMB/s: " << (elapsed > 0 ? static_cast<double>(bytes) / elapsed / 1e6 : 0.0) << '\n';
  return 0;
}

#include "test_util.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fstpiece/tokenizer.hpp"

using namespace fstpiece;
using fstpiece::testing::TempDir;
using fstpiece::testing::WriteFile;
using fstpiece::testing::WriteLines;

namespace {

// [PAD]=0 [UNK]=1 [CLS]=2 [SEP]=3 [MASK]=4 [unused0]=5 un=6 ##aff=7 ##able=8
// aff=9 ##a=10 play=11 ##ing=12 ##s=13 é=14
Vocab SmallVocab() {
  return {"[PAD]", "[UNK]", "[CLS]", "[SEP]", "[MASK]", "[unused0]", "un", "##aff",
          "##able", "aff", "##a", "play", "##ing", "##s", "\xC3\xA9"};
}

template <typename T>
void CheckEndToEnd(const WordPieceTokenizer& tokenizer) {
  std::vector<T> ids;
  std::vector<Range> ranges;
  std::vector<Range> words;
  tokenizer.TokensInto("Ein interessantes Beispiel", ids, ranges, &words);
  const std::vector<T> expected = {T(3), T(198), T(19168), T(26889), T(4)};
  assert(ids == expected);
  const std::vector<Range> expected_ranges = {{0, 0}, {0, 3}, {4, 17}, {18, 26}, {26, 26}};
  assert(ranges == expected_ranges);
  const std::vector<Range> expected_words = {{1, 2}, {2, 3}, {3, 4}};
  assert(words == expected_words);
}

void TestEndToEnd() {
  Vocab vocab(26890);
  for (std::size_t i = 0; i < vocab.size(); ++i) vocab[i] = "[unused" + std::to_string(i) + "]";
  vocab[0] = "[PAD]";
  vocab[1] = "[UNK]";
  vocab[2] = "[MASK]";
  vocab[3] = "[CLS]";
  vocab[4] = "[SEP]";
  vocab[198] = "Ein";
  vocab[19168] = "interessantes";
  vocab[26889] = "Beispiel";

  TempDir dir("e2e");
  const auto path = dir.File("vocab.txt");
  WriteLines(path, vocab);
  const auto tokenizer = WordPieceTokenizer::FromVocab(path);
  assert(tokenizer.VocabSize() == vocab.size());
  assert(tokenizer.UnkId() == 1);
  assert(tokenizer.PrefixId() == 3u);
  assert(tokenizer.SuffixId() == 4u);

  CheckEndToEnd<std::uint64_t>(tokenizer);
  CheckEndToEnd<std::int64_t>(tokenizer);
  CheckEndToEnd<std::int32_t>(tokenizer);
  CheckEndToEnd<double>(tokenizer);

  assert(tokenizer.TextOf(std::int32_t{0}) == "[PAD]");
  const std::vector<std::int64_t> some = {3, 198, 4};
  const auto texts = tokenizer.TextsOf<std::int64_t>(some);
  assert(texts.size() == 3 && texts[0] == "[CLS]" && texts[1] == "Ein" && texts[2] == "[SEP]");
}

void TestSubwords() {
  const auto tokenizer = WordPieceTokenizer::FromTokens(SmallVocab());
  std::vector<std::int64_t> ids;
  std::vector<Range> ranges;

  tokenizer.TokensInto("unaffable", ids, ranges);
  assert((ids == std::vector<std::int64_t>{2, 6, 7, 8, 3}));
  assert((ranges == std::vector<Range>{{0, 0}, {0, 2}, {2, 5}, {5, 9}, {9, 9}}));

  // Followers are matched longest first: "##aff" wins over "##a".
  tokenizer.TokensInto("unaff playings", ids, ranges);
  assert((ids == std::vector<std::int64_t>{2, 6, 7, 11, 12, 13, 3}));
  assert((ranges == std::vector<Range>{{0, 0}, {0, 2}, {2, 5}, {6, 10}, {10, 13}, {13, 14}, {14, 14}}));

  // A word that starts with a continuation-only piece is unknown.
  tokenizer.TokensInto("able", ids, ranges);
  assert((ids == std::vector<std::int64_t>{2, 1, 3}));
  assert((ranges == std::vector<Range>{{0, 0}, {0, 4}, {4, 4}}));

  // Multi-byte starter.
  tokenizer.TokensInto("\xC3\xA9", ids, ranges);
  assert((ids == std::vector<std::int64_t>{2, 14, 3}));
  assert((ranges == std::vector<Range>{{0, 0}, {0, 2}, {2, 2}}));
}

void TestUnkAtomicity() {
  const auto tokenizer = WordPieceTokenizer::FromTokens(SmallVocab());
  std::vector<std::uint64_t> ids;
  std::vector<Range> ranges;
  std::vector<Range> words;

  // "un" + "##aff" + "##able" matches, then "x" does not: the whole word is unk.
  tokenizer.TokensInto("play unaffablex un", ids, ranges, &words);
  assert((ids == std::vector<std::uint64_t>{2, 11, 1, 6, 3}));
  assert((ranges == std::vector<Range>{{0, 0}, {0, 4}, {5, 15}, {16, 18}, {18, 18}}));
  assert((words == std::vector<Range>{{1, 2}, {2, 3}, {3, 4}}));

  tokenizer.TokensInto("xyz", ids, ranges, &words);
  assert((ids == std::vector<std::uint64_t>{2, 1, 3}));
  assert((ranges == std::vector<Range>{{0, 0}, {0, 3}, {3, 3}}));
}

void TestSpecialTokensInText() {
  const auto tokenizer = WordPieceTokenizer::FromTokens(SmallVocab());
  std::vector<std::uint64_t> ids;
  std::vector<Range> ranges;
  tokenizer.TokensInto("[MASK] [unused0]", ids, ranges);
  // Bracketed entries match their literal text; unused slots never match.
  assert((ids == std::vector<std::uint64_t>{2, 4, 1, 3}));
  assert((ranges == std::vector<Range>{{0, 0}, {0, 6}, {7, 16}, {16, 16}}));
}

void TestEmptyAndWhitespaceInput() {
  const auto with_roles = WordPieceTokenizer::FromTokens(SmallVocab());
  std::vector<std::int32_t> ids;
  std::vector<Range> ranges;
  std::vector<Range> words;
  for (const std::string text : {"", "   ", " \t\n\r ", "\xC2\xA0\xE3\x80\x80"}) {
    with_roles.TokensInto(text, ids, ranges, &words);
    assert((ids == std::vector<std::int32_t>{2, 3}));
    assert((ranges == std::vector<Range>{{0, 0}, {0, 0}}));
    assert(words.empty());
  }

  const auto bare = WordPieceTokenizer::FromTokens({"[PAD]", "[UNK]", "a", "##b"});
  assert(!bare.PrefixId() && !bare.SuffixId());
  bare.TokensInto("", ids, ranges, &words);
  assert(ids.empty() && ranges.empty() && words.empty());
  bare.TokensInto("  \n ", ids, ranges, &words);
  assert(ids.empty() && ranges.empty() && words.empty());
  bare.TokensInto(" ab  a ", ids, ranges, &words);
  assert((ids == std::vector<std::int32_t>{2, 3, 2}));
  assert((ranges == std::vector<Range>{{1, 2}, {2, 3}, {5, 6}}));
  assert((words == std::vector<Range>{{0, 2}, {2, 3}}));
}

void TestUnicodeWhitespace() {
  const auto tokenizer = WordPieceTokenizer::FromTokens(SmallVocab());
  std::vector<std::uint64_t> ids;
  std::vector<Range> ranges;
  // NO-BREAK SPACE, IDEOGRAPHIC SPACE and EM SPACE all separate words.
  tokenizer.TokensInto("un\xC2\xA0" "aff\xE3\x80\x80play\xE2\x80\x83un", ids, ranges);
  assert((ids == std::vector<std::uint64_t>{2, 6, 9, 11, 6, 3}));
  assert((ranges == std::vector<Range>{{0, 0}, {0, 2}, {4, 7}, {10, 14}, {17, 19}, {19, 19}}));
}

void TestStructureAndReuse() {
  const auto tokenizer = WordPieceTokenizer::FromTokens(SmallVocab());
  std::vector<std::int64_t> ids;
  std::vector<Range> ranges;
  std::vector<Range> words;

  const std::vector<std::string> texts = {
      "unaffable plays playing xyz un aff", "  play\t\tun  ", "[MASK]unaff", "a", "\xC3\xA9\xC3\xA9 x"};
  for (const auto& text : texts) {
    tokenizer.TokensInto(text, ids, ranges, &words);
    assert(ids.size() == ranges.size());
    assert(ranges.front().empty() && ranges.back().empty());
    for (std::size_t i = 1; i + 1 < ranges.size(); ++i) {
      assert(!ranges[i].empty());
      assert(ranges[i].end <= text.size());
      assert(ranges[i - 1].end <= ranges[i].begin);
    }
    std::size_t covered = 1;
    for (const auto& w : words) {
      assert(w.begin == covered && w.end > w.begin);
      covered = w.end;
    }
    assert(covered == ids.size() - 1);

    // Same input, same output.
    auto again = tokenizer.Encode<std::int64_t>(text);
    assert(again.ids == ids && again.ranges == ranges && again.words == words);
  }

  // A shorter second call leaves nothing of the first behind.
  tokenizer.TokensInto("unaffable plays playing xyz un aff", ids, ranges, &words);
  const auto capacity = ids.capacity();
  tokenizer.TokensInto("play", ids, ranges, &words);
  assert((ids == std::vector<std::int64_t>{2, 11, 3}));
  assert((ranges == std::vector<Range>{{0, 0}, {0, 4}, {4, 4}}));
  assert((words == std::vector<Range>{{1, 2}}));
  assert(ids.capacity() == capacity);
}

void TestIsSpecial() {
  const auto tokenizer = WordPieceTokenizer::FromTokens(SmallVocab());
  for (std::uint64_t id : {0u, 1u, 2u, 3u, 4u}) assert(tokenizer.IsSpecial(id));
  for (std::uint64_t id = 5; id < SmallVocab().size(); ++id) assert(!tokenizer.IsSpecial(id));
  assert(tokenizer.IsSpecial(std::int32_t{4}));
  assert(tokenizer.IsSpecial(2.0));
  assert((tokenizer.SpecialIds() == std::vector<CanonicalId>{0, 1, 2, 3, 4}));
}

void TestAttention() {
  std::vector<std::int32_t> attns;
  const std::vector<std::uint64_t> ids = {3, 4285, 4, 0, 0};
  WordPieceTokenizer::AttentionsInto<std::uint64_t>(ids, attns);
  assert((attns == std::vector<std::int32_t>{1, 1, 1, 0, 0}));

  // Output is cleared first.
  const std::vector<std::uint64_t> single = {0};
  WordPieceTokenizer::AttentionsInto<std::uint64_t>(single, attns);
  assert((attns == std::vector<std::int32_t>{0}));

  assert((WordPieceTokenizer::Attention<std::uint64_t, std::int64_t>(0) == 0));
  assert((WordPieceTokenizer::Attention<std::int32_t, double>(99) == 1.0));
  assert((WordPieceTokenizer::Attention<double, double>(0.0) == 0.0));
  assert(WordPieceTokenizer::Attention(std::int64_t{7}) == 1);
}

void TestLookups() {
  const auto tokenizer = WordPieceTokenizer::FromTokens(SmallVocab());
  assert(tokenizer.TokenToId("un") == 6u);
  assert(tokenizer.TokenToId("##aff") == 7u);
  assert(tokenizer.TokenToId("aff") == 9u);
  assert(tokenizer.TokenToId("[CLS]") == 2u);
  assert(!tokenizer.TokenToId("[unused0]"));
  assert(!tokenizer.TokenToId("##zz"));
  assert(!tokenizer.TokenToId("able"));

  assert(tokenizer.TextOf(std::uint64_t{7}) == "##aff");
  bool threw = false;
  try {
    (void)tokenizer.TextOf(std::uint64_t{999});
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);
}

template <typename T>
bool TextOfThrows(const WordPieceTokenizer& tokenizer, T id) {
  try {
    (void)tokenizer.TextOf(id);
  } catch (const std::out_of_range&) {
    return true;
  }
  return false;
}

void TestNegativeAndNanIds() {
  const auto tokenizer = WordPieceTokenizer::FromTokens(SmallVocab());
  assert(TokenIdTraits<std::int32_t>::ToCanonical(-1) == kInvalidId);
  assert(TokenIdTraits<std::int64_t>::ToCanonical(-1) == kInvalidId);
  assert(TokenIdTraits<double>::ToCanonical(-1.0) == kInvalidId);
  assert(TokenIdTraits<double>::ToCanonical(std::numeric_limits<double>::quiet_NaN()) == kInvalidId);
  assert(TokenIdTraits<double>::ToCanonical(1e30) == kInvalidId);
  assert(TokenIdTraits<double>::ToCanonical(7.0) == 7u);

  assert(TextOfThrows(tokenizer, -1.0));
  assert(TextOfThrows(tokenizer, std::numeric_limits<double>::quiet_NaN()));
  assert(TextOfThrows(tokenizer, std::int32_t{-1}));
  assert(!tokenizer.IsSpecial(-1.0));
  assert(!tokenizer.IsSpecial(std::int32_t{-3}));
}

void TestDuplicateEntries() {
  // The later line owns the key; both lines keep their ids in the table.
  const auto tokenizer = WordPieceTokenizer::FromTokens({"[PAD]", "[UNK]", "ab", "##c", "ab", "##c"});
  assert(tokenizer.VocabSize() == 6);
  assert(tokenizer.TokenToId("ab") == 4u);
  assert(tokenizer.TokenToId("##c") == 5u);
  std::vector<std::uint64_t> ids;
  std::vector<Range> ranges;
  tokenizer.TokensInto("abc", ids, ranges);
  assert((ids == std::vector<std::uint64_t>{4, 5}));
}

void TestSaveAndReload() {
  TempDir dir("save");
  const auto tokenizer = WordPieceTokenizer::FromTokens(SmallVocab());
  const auto path = dir.File("saved.txt");
  assert(tokenizer.SaveVocab(path) == path);

  const auto reloaded = WordPieceTokenizer::FromVocab(path);
  assert(reloaded.Tokens() == tokenizer.Tokens());
  auto a = tokenizer.Encode("unaffable playing xyz");
  auto b = reloaded.Encode("unaffable playing xyz");
  assert(a.ids == b.ids && a.ranges == b.ranges);

  bool threw = false;
  try {
    tokenizer.SaveVocab(dir.File("missing/dir/vocab.txt"));
  } catch (const SaveError&) {
    threw = true;
  }
  assert(threw);
}

void TestLoadFailures() {
  TempDir dir("load");
  bool threw = false;
  try {
    (void)WordPieceTokenizer::FromVocab(dir.File("does_not_exist.txt"));
  } catch (const LoadError&) {
    threw = true;
  }
  assert(threw);

  const auto no_unk = dir.File("no_unk.txt");
  WriteLines(no_unk, {"[PAD]", "[CLS]", "[SEP]", "a", "##b"});
  threw = false;
  try {
    (void)WordPieceTokenizer::FromVocab(no_unk);
  } catch (const LoadError&) {
    threw = true;
  }
  assert(threw);

  // Unused slots are skipped entirely, so they cannot stand in for the unk entry.
  threw = false;
  try {
    (void)WordPieceTokenizer::FromTokens({"[PAD]", "[unused UNK]"});
  } catch (const LoadError&) {
    threw = true;
  }
  assert(threw);
}

void TestCrlfVocab() {
  TempDir dir("crlf");
  const auto path = dir.File("vocab.txt");
  WriteFile(path, "[PAD]\r\n[UNK]\r\n[CLS]\r\nhello\r\n##s\r\n\r\nlast");
  const auto tokenizer = WordPieceTokenizer::FromVocab(path);
  assert(tokenizer.VocabSize() == 7);
  assert(tokenizer.Tokens()[3] == "hello");
  assert(tokenizer.Tokens()[5].empty());
  assert(tokenizer.Tokens()[6] == "last");
  std::vector<std::uint64_t> ids;
  std::vector<Range> ranges;
  tokenizer.TokensInto("hellos last", ids, ranges);
  assert((ids == std::vector<std::uint64_t>{2, 3, 4, 6}));
}

void TestSharedAcrossThreads() {
  const auto tokenizer = WordPieceTokenizer::FromTokens(SmallVocab());
  const std::vector<std::string> texts = {"unaffable plays", "xyz playing", "un aff able", "[MASK] \xC3\xA9"};
  std::vector<Encoding<std::int64_t>> expected;
  for (const auto& t : texts) expected.push_back(tokenizer.Encode<std::int64_t>(t));

  std::vector<std::thread> workers;
  std::vector<int> failures(4, 0);
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([&, w]() {
      std::vector<std::int64_t> ids;
      std::vector<Range> ranges;
      for (int round = 0; round < 2000; ++round) {
        const std::size_t k = static_cast<std::size_t>(round + w) % texts.size();
        tokenizer.TokensInto(texts[k], ids, ranges);
        if (ids != expected[k].ids || ranges != expected[k].ranges) ++failures[w];
      }
    });
  }
  for (auto& t : workers) t.join();
  for (int f : failures) assert(f == 0);
}

}  // namespace

int main() {
  TestEndToEnd();
  TestSubwords();
  TestUnkAtomicity();
  TestSpecialTokensInText();
  TestEmptyAndWhitespaceInput();
  TestUnicodeWhitespace();
  TestStructureAndReuse();
  TestIsSpecial();
  TestAttention();
  TestLookups();
  TestNegativeAndNanIds();
  TestDuplicateEntries();
  TestSaveAndReload();
  TestLoadFailures();
  TestCrlfVocab();
  TestSharedAcrossThreads();
  return 0;
}

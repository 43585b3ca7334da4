#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "fstpiece/formats.hpp"
#include "fstpiece/tokenizer.hpp"

namespace py = pybind11;
using namespace fstpiece;

namespace {

using RangePairs = std::vector<std::pair<std::size_t, std::size_t>>;

RangePairs to_pairs(const std::vector<Range>& ranges) {
  RangePairs out;
  out.reserve(ranges.size());
  for (const auto& r : ranges) out.emplace_back(r.begin, r.end);
  return out;
}

template <typename T>
py::tuple tokens_tuple(const WordPieceTokenizer& self, const std::string& text) {
  std::vector<T> ids;
  std::vector<Range> ranges;
  std::vector<Range> words;
  {
    py::gil_scoped_release release;
    self.TokensInto(text, ids, ranges, &words);
  }
  return py::make_tuple(ids, to_pairs(ranges), to_pairs(words));
}

IdType require_id_type(const std::string& dtype) {
  auto type = ParseIdType(dtype);
  if (!type) throw std::invalid_argument("unsupported dtype: " + dtype);
  return *type;
}

}  // namespace

PYBIND11_MODULE(pyfstpiece, m) {
  py::register_exception<LoadError>(m, "LoadError", PyExc_IOError);
  py::register_exception<SaveError>(m, "SaveError", PyExc_IOError);

  py::class_<WordPieceTokenizer>(m, "WordPieceTokenizer")
      .def_static("from_vocab", [](const std::string& path) { return WordPieceTokenizer::FromVocab(path); },
                  py::arg("path"))
      .def_static("from_tokens", [](Vocab tokens) { return WordPieceTokenizer::FromTokens(std::move(tokens)); },
                  py::arg("tokens"))
      .def_static("from_tokenizer_json",
                  [](const std::string& path) { return WordPieceTokenizer::FromTokens(LoadTokenizerJson(path)); },
                  py::arg("path"))
      .def(
          "tokens_into",
          [](const WordPieceTokenizer& self, const std::string& text, const std::string& dtype) -> py::tuple {
            switch (require_id_type(dtype)) {
              case IdType::kU64:
                return tokens_tuple<std::uint64_t>(self, text);
              case IdType::kI64:
                return tokens_tuple<std::int64_t>(self, text);
              case IdType::kI32:
                return tokens_tuple<std::int32_t>(self, text);
              case IdType::kF64:
                return tokens_tuple<double>(self, text);
            }
            throw std::invalid_argument("unsupported dtype: " + dtype);
          },
          py::arg("text"), py::arg("dtype") = "i64")
      .def("text_of", [](const WordPieceTokenizer& self, std::uint64_t id) { return std::string(self.TextOf(id)); })
      .def("texts_of",
           [](const WordPieceTokenizer& self, const std::vector<std::uint64_t>& ids) {
             std::vector<std::string> out;
             out.reserve(ids.size());
             for (auto id : ids) out.emplace_back(self.TextOf(id));
             return out;
           })
      .def("is_special", [](const WordPieceTokenizer& self, std::uint64_t id) { return self.IsSpecial(id); })
      .def("token_to_id", &WordPieceTokenizer::TokenToId)
      .def("vocab_size", &WordPieceTokenizer::VocabSize)
      .def("save_vocab", &WordPieceTokenizer::SaveVocab)
      .def_property_readonly("unk_id", &WordPieceTokenizer::UnkId)
      .def_property_readonly("prefix_id", &WordPieceTokenizer::PrefixId)
      .def_property_readonly("suffix_id", &WordPieceTokenizer::SuffixId);

  m.def(
      "attentions",
      [](const std::vector<std::int64_t>& ids) {
        std::vector<std::int64_t> out;
        WordPieceTokenizer::AttentionsInto<std::int64_t>(ids, out);
        return out;
      },
      py::arg("ids"));
}

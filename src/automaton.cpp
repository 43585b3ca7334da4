#include "fstpiece/automaton.hpp"

#include <algorithm>
#include <unordered_map>

namespace fstpiece {

namespace {

struct PendingState {
  std::vector<std::pair<unsigned char, std::uint32_t>> edges;
  bool is_final = false;
  std::uint64_t value = 0;
};

std::size_t common_prefix_length(std::string_view a, std::string_view b) {
  const std::size_t n = std::min(a.size(), b.size());
  std::size_t i = 0;
  while (i < n && a[i] == b[i]) ++i;
  return i;
}

bool bytes_less(std::string_view a, std::string_view b) {
  return std::lexicographical_compare(
      a.begin(), a.end(), b.begin(), b.end(),
      [](char x, char y) { return static_cast<unsigned char>(x) < static_cast<unsigned char>(y); });
}

}  // namespace

// Incremental construction over sorted input: only the path of the previous
// key is mutable, everything left of it is frozen and deduplicated through a
// register of already emitted states.
class PrefixAutomaton::Builder {
 public:
  explicit Builder(PrefixAutomaton& out) : out_(out) { path_.emplace_back(); }

  void Add(std::string_view key, std::uint64_t value) {
    std::size_t prefix = 0;
    if (has_previous_) {
      if (!bytes_less(previous_, key)) {
        throw AutomatonError(previous_ == key ? "duplicate automaton key: " + std::string(key)
                                              : "automaton keys out of order at: " + std::string(key));
      }
      prefix = common_prefix_length(previous_, key);
    }
    FreezeDownTo(prefix);
    for (std::size_t i = prefix; i < key.size(); ++i) {
      path_.back().edges.emplace_back(static_cast<unsigned char>(key[i]), kNoState);
      path_.emplace_back();
    }
    path_.back().is_final = true;
    path_.back().value = value;
    previous_.assign(key);
    has_previous_ = true;
    ++out_.num_keys_;
  }

  void Finish() {
    FreezeDownTo(0);
    out_.root_ = Emit(path_.front());
    path_.clear();
  }

 private:
  void FreezeDownTo(std::size_t depth) {
    while (path_.size() > depth + 1) {
      std::uint32_t id = Emit(path_.back());
      path_.pop_back();
      path_.back().edges.back().second = id;
    }
  }

  std::uint32_t Emit(const PendingState& state) {
    std::string signature;
    signature.reserve(10 + state.edges.size() * 5);
    signature.push_back(state.is_final ? '\1' : '\0');
    if (state.is_final) AppendRaw(signature, state.value);
    for (const auto& [label, target] : state.edges) {
      signature.push_back(static_cast<char>(label));
      AppendRaw(signature, target);
    }

    auto it = register_.find(signature);
    if (it != register_.end()) return it->second;

    State compiled;
    compiled.first_transition = static_cast<std::uint32_t>(out_.transitions_.size());
    compiled.num_transitions = static_cast<std::uint16_t>(state.edges.size());
    compiled.is_final = state.is_final;
    compiled.value = state.value;
    for (const auto& [label, target] : state.edges) {
      out_.transitions_.push_back(Transition{label, target});
    }
    const auto id = static_cast<std::uint32_t>(out_.states_.size());
    out_.states_.push_back(compiled);
    register_.emplace(std::move(signature), id);
    return id;
  }

  template <typename T>
  static void AppendRaw(std::string& out, T v) {
    out.append(reinterpret_cast<const char*>(&v), sizeof(v));
  }

  PrefixAutomaton& out_;
  std::vector<PendingState> path_;
  std::unordered_map<std::string, std::uint32_t> register_;
  std::string previous_;
  bool has_previous_ = false;
};

PrefixAutomaton::PrefixAutomaton() { states_.emplace_back(); }

PrefixAutomaton PrefixAutomaton::Build(std::span<const Entry> entries) {
  PrefixAutomaton automaton;
  automaton.states_.clear();
  Builder builder(automaton);
  for (const auto& [key, value] : entries) {
    builder.Add(key, value);
  }
  builder.Finish();
  automaton.states_.shrink_to_fit();
  automaton.transitions_.shrink_to_fit();
  return automaton;
}

std::uint32_t PrefixAutomaton::Step(std::uint32_t state, unsigned char byte) const {
  const State& s = states_[state];
  const Transition* begin = transitions_.data() + s.first_transition;
  const Transition* end = begin + s.num_transitions;
  const Transition* it = std::lower_bound(
      begin, end, byte, [](const Transition& t, unsigned char b) { return t.label < b; });
  if (it == end || it->label != byte) return kNoState;
  return it->target;
}

std::optional<std::uint64_t> PrefixAutomaton::Get(std::string_view key) const {
  std::uint32_t state = root_;
  for (char c : key) {
    state = Step(state, static_cast<unsigned char>(c));
    if (state == kNoState) return std::nullopt;
  }
  if (!states_[state].is_final) return std::nullopt;
  return states_[state].value;
}

std::optional<PrefixMatch> PrefixAutomaton::LongestPrefix(std::string_view input) const {
  std::optional<PrefixMatch> best;
  std::uint32_t state = root_;
  for (std::size_t i = 0; i < input.size(); ++i) {
    state = Step(state, static_cast<unsigned char>(input[i]));
    if (state == kNoState) break;
    if (states_[state].is_final) {
      best = PrefixMatch{i + 1, states_[state].value};
    }
  }
  return best;
}

std::vector<PrefixAutomaton::Entry> PrefixAutomaton::Entries() const {
  std::vector<Entry> out;
  out.reserve(num_keys_);
  std::string key;
  CollectEntries(root_, key, out);
  return out;
}

void PrefixAutomaton::CollectEntries(std::uint32_t state, std::string& key, std::vector<Entry>& out) const {
  const State& s = states_[state];
  if (s.is_final) out.emplace_back(key, s.value);
  for (std::uint32_t t = s.first_transition; t < s.first_transition + s.num_transitions; ++t) {
    key.push_back(static_cast<char>(transitions_[t].label));
    CollectEntries(transitions_[t].target, key, out);
    key.pop_back();
  }
}

}  // namespace fstpiece

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fstpiece {

class AutomatonError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

struct PrefixMatch {
  std::size_t length = 0;
  std::uint64_t value = 0;
};

// Minimal deterministic acyclic automaton mapping byte strings to 64-bit
// payloads. Immutable once built; all queries are const and allocation free.
class PrefixAutomaton {
 public:
  using Entry = std::pair<std::string, std::uint64_t>;

  PrefixAutomaton();

  // Entries must be strictly increasing by key, compared as unsigned bytes.
  // Throws AutomatonError on out-of-order or duplicate keys.
  static PrefixAutomaton Build(std::span<const Entry> entries);

  [[nodiscard]] std::optional<std::uint64_t> Get(std::string_view key) const;

  // Longest prefix of `input` that is a complete key. The empty key never
  // matches here, even when it was inserted.
  [[nodiscard]] std::optional<PrefixMatch> LongestPrefix(std::string_view input) const;

  [[nodiscard]] std::size_t Size() const { return num_keys_; }
  [[nodiscard]] std::size_t StateCount() const { return states_.size(); }
  [[nodiscard]] std::size_t TransitionCount() const { return transitions_.size(); }

  // All keys with their payloads, in key order.
  [[nodiscard]] std::vector<Entry> Entries() const;

 private:
  static constexpr std::uint32_t kNoState = 0xFFFFFFFFu;

  struct State {
    std::uint32_t first_transition = 0;
    std::uint16_t num_transitions = 0;
    bool is_final = false;
    std::uint64_t value = 0;
  };

  struct Transition {
    unsigned char label = 0;
    std::uint32_t target = 0;
  };

  class Builder;

  [[nodiscard]] std::uint32_t Step(std::uint32_t state, unsigned char byte) const;
  void CollectEntries(std::uint32_t state, std::string& key, std::vector<Entry>& out) const;

  std::vector<State> states_;
  std::vector<Transition> transitions_;
  std::uint32_t root_ = 0;
  std::size_t num_keys_ = 0;
};

}  // namespace fstpiece

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

namespace fstpiece {

// Canonical id representation. Every other representation converts through it.
// Valid ids are non-negative. Negative signed ids sign-extend and negative or
// NaN floating ids map to kInvalidId, so table lookups on them fail.
using CanonicalId = std::uint64_t;

inline constexpr CanonicalId kInvalidId = ~CanonicalId{0};

template <typename T>
struct TokenIdTraits;

template <>
struct TokenIdTraits<std::uint64_t> {
  static constexpr std::uint64_t Zero() { return 0; }
  static constexpr std::uint64_t FromCanonical(CanonicalId id) { return id; }
  static constexpr CanonicalId ToCanonical(std::uint64_t id) { return id; }
};

// Signed and floating representations feed numeric tensors downstream.
template <>
struct TokenIdTraits<std::int64_t> {
  static constexpr std::int64_t Zero() { return 0; }
  static constexpr std::int64_t FromCanonical(CanonicalId id) {
    return static_cast<std::int64_t>(id);
  }
  static constexpr CanonicalId ToCanonical(std::int64_t id) {
    return static_cast<CanonicalId>(id);
  }
};

template <>
struct TokenIdTraits<std::int32_t> {
  static constexpr std::int32_t Zero() { return 0; }
  static constexpr std::int32_t FromCanonical(CanonicalId id) {
    return static_cast<std::int32_t>(id);
  }
  static constexpr CanonicalId ToCanonical(std::int32_t id) { return static_cast<CanonicalId>(id); }
};

template <>
struct TokenIdTraits<double> {
  static constexpr double Zero() { return 0.0; }
  static constexpr double FromCanonical(CanonicalId id) { return static_cast<double>(id); }
  static constexpr CanonicalId ToCanonical(double id) {
    // 2^64; NaN fails both comparisons.
    return id >= 0.0 && id < 18446744073709551616.0 ? static_cast<CanonicalId>(id) : kInvalidId;
  }
};

template <typename T, typename = void>
struct IsTokenId : std::false_type {};

template <typename T>
struct IsTokenId<T, std::void_t<decltype(TokenIdTraits<T>::Zero())>> : std::true_type {};

template <typename T>
inline constexpr bool kIsTokenId = IsTokenId<T>::value;

// Run-time name of a representation, used where the type is picked by
// configuration (pipeline, CLI, bindings).
enum class IdType {
  kU64 = 0,
  kI64,
  kI32,
  kF64,
};

[[nodiscard]] std::optional<IdType> ParseIdType(std::string_view name);
[[nodiscard]] std::string_view IdTypeName(IdType type);
[[nodiscard]] std::size_t IdTypeSize(IdType type);

}  // namespace fstpiece

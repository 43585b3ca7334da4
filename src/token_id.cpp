#include "fstpiece/token_id.hpp"

namespace fstpiece {

std::optional<IdType> ParseIdType(std::string_view name) {
  if (name == "u64" || name == "uint64") return IdType::kU64;
  if (name == "i64" || name == "int64") return IdType::kI64;
  if (name == "i32" || name == "int32") return IdType::kI32;
  if (name == "f64" || name == "float64" || name == "double") return IdType::kF64;
  return std::nullopt;
}

std::string_view IdTypeName(IdType type) {
  switch (type) {
    case IdType::kU64:
      return "u64";
    case IdType::kI64:
      return "i64";
    case IdType::kI32:
      return "i32";
    case IdType::kF64:
      return "f64";
  }
  return "u64";
}

std::size_t IdTypeSize(IdType type) {
  switch (type) {
    case IdType::kU64:
      return sizeof(std::uint64_t);
    case IdType::kI64:
      return sizeof(std::int64_t);
    case IdType::kI32:
      return sizeof(std::int32_t);
    case IdType::kF64:
      return sizeof(double);
  }
  return sizeof(std::uint64_t);
}

}  // namespace fstpiece

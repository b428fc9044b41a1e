#pragma once
#include <cstdint>

namespace animkit::core {

enum class Status : std::uint8_t {
  Success = 0,
  Failure = 1,
  InvalidParameter = 2,
  TypeMismatch = 3
};

inline constexpr bool ok(Status s) { return s == Status::Success; }

const char* statusToString(Status s);

}  // namespace animkit::core

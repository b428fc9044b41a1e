#include "animkit/core/common/status.hpp"

namespace animkit::core {

const char* statusToString(Status s) {
  switch (s) {
    case Status::Success: return "Success";
    case Status::Failure: return "Failure";
    case Status::InvalidParameter: return "InvalidParameter";
    case Status::TypeMismatch: return "TypeMismatch";
  }
  return "Unknown";
}

}  // namespace animkit::core

#include "snapseek/common/result.hpp"

namespace snapseek::common {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "ok";
  case ErrorKind::Validation:
    return "validation_error";
  case ErrorKind::InvalidImage:
    return "invalid_image";
  case ErrorKind::ModelFailure:
    return "model_failure";
  case ErrorKind::CorruptVector:
    return "corrupt_vector";
  case ErrorKind::Storage:
    return "storage_failure";
  case ErrorKind::Configuration:
    return "configuration_error";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::Internal:
    return "internal_error";
  }
  return "internal_error";
}

} // namespace snapseek::common

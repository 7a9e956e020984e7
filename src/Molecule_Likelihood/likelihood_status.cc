#include "Molecule_Likelihood/likelihood_status.h"

namespace molll {

absl::Status
InvalidInputError(absl::string_view message) {
  return absl::InvalidArgumentError(message);
}

absl::Status
CorruptFormatError(absl::string_view message) {
  return absl::DataLossError(message);
}

absl::Status
IOError(absl::string_view message) {
  return absl::UnavailableError(message);
}

bool
IsInvalidInput(const absl::Status& status) {
  return status.code() == absl::StatusCode::kInvalidArgument;
}

bool
IsCorruptFormat(const absl::Status& status) {
  return status.code() == absl::StatusCode::kDataLoss;
}

bool
IsIOError(const absl::Status& status) {
  return status.code() == absl::StatusCode::kUnavailable;
}

}  // namespace molll

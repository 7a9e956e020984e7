#ifndef MOLECULE_LIKELIHOOD_LIKELIHOOD_STATUS_H_
#define MOLECULE_LIKELIHOOD_LIKELIHOOD_STATUS_H_

// The kinds of failure reported by the likelihood models, and the
// absl::StatusCode each is carried in.
//   InvalidInput   kInvalidArgument  a molecule or a parameter cannot be used.
//   CorruptFormat  kDataLoss         a persisted model is unusable.
//   IOError        kUnavailable      a file cannot be opened, read or written.

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace molll {

absl::Status InvalidInputError(absl::string_view message);
absl::Status CorruptFormatError(absl::string_view message);
absl::Status IOError(absl::string_view message);

bool IsInvalidInput(const absl::Status& status);
bool IsCorruptFormat(const absl::Status& status);
bool IsIOError(const absl::Status& status);

}  // namespace molll

#endif  // MOLECULE_LIKELIHOOD_LIKELIHOOD_STATUS_H_

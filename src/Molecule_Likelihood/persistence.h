#ifndef MOLECULE_LIKELIHOOD_PERSISTENCE_H_
#define MOLECULE_LIKELIHOOD_PERSISTENCE_H_

// The persisted form of every likelihood model is a LikelihoodModelData
// proto, written as TextFormat, or as JSON if the file name ends in .json.

#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

#include "Molecule_Likelihood/likelihood.pb.h"

namespace molll {

// The only format version currently written or read.
inline constexpr uint32_t kFormatVersion = 1;

// "AtomLL", "MolLL", "PropLL".
absl::string_view ModelKindName(ModelKind kind);

// Checks `format_version` and `model_kind`, the fields every document
// must have, whatever the model.
absl::Status CheckEnvelope(const LikelihoodModelData& proto);

// Read `fname` into `proto` and check the envelope.
// An unreadable file is an IOError, anything else a CorruptFormatError.
absl::Status ReadModelData(const std::string& fname, LikelihoodModelData& proto);

absl::Status WriteModelData(const LikelihoodModelData& proto, const std::string& fname);

}  // namespace molll

#endif  // MOLECULE_LIKELIHOOD_PERSISTENCE_H_

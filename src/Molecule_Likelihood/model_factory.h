#ifndef MOLECULE_LIKELIHOOD_MODEL_FACTORY_H_
#define MOLECULE_LIKELIHOOD_MODEL_FACTORY_H_

// Creating models from persisted documents.

#include <cstdint>
#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

#include "Molecule_Likelihood/fingerprint_ll.h"
#include "Molecule_Likelihood/key_extractor.h"
#include "Molecule_Likelihood/likelihood.pb.h"
#include "Molecule_Likelihood/likelihood_model.h"
#include "Molecule_Likelihood/property_extractor.h"

namespace molll {

// Read `fname` and return a new model of whatever kind the document
// holds. Fingerprint models need `key_extractor`, property models
// `property_extractor`; the one not needed may be null. A document
// needing an extractor that was not supplied is an InvalidInputError.
absl::StatusOr<std::unique_ptr<LikelihoodModel>>
ReadModel(const std::string& fname, const KeyExtractor* key_extractor,
          const PropertyExtractor* property_extractor);

inline constexpr char kLibInvent[] = "libinvent";

// Name of the file holding the precomputed `kind` model for `dataset`
// fingerprints of `radius`. `kind` must be ATOM_LL or MOL_LL.
std::string PrecomputedModelFileName(ModelKind kind, absl::string_view dataset, uint32_t radius);

// A new model, loaded from PrecomputedModelFileName in `directory`.
// The radius in the file must be `radius`.
// Every call returns an independent object.
absl::StatusOr<std::unique_ptr<FingerprintLL>>
NewPrecomputedFingerprintLL(const std::string& directory, ModelKind kind, absl::string_view dataset,
                            uint32_t radius, const KeyExtractor& key_extractor);

// Models trained on the LibInvent dataset, radius 1, 2 or 3.
absl::StatusOr<std::unique_ptr<FingerprintLL>>
LibInventAtomLL(const std::string& directory, uint32_t radius, const KeyExtractor& key_extractor);
absl::StatusOr<std::unique_ptr<FingerprintLL>>
LibInventMolLL(const std::string& directory, uint32_t radius, const KeyExtractor& key_extractor);

}  // namespace molll

#endif  // MOLECULE_LIKELIHOOD_MODEL_FACTORY_H_

#ifndef MOLECULE_LIKELIHOOD_LIKELIHOOD_MODEL_H_
#define MOLECULE_LIKELIHOOD_LIKELIHOOD_MODEL_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"

#include "Molecule_Likelihood/key_extractor.h"
#include "Molecule_Likelihood/likelihood.pb.h"

namespace molll {

// Returned by AnalyzeDataset. Molecules that could not be processed
// are skipped, they do not stop the rest of the dataset being processed.
struct AnalysisSummary {
  int molecules_processed = 0;
  int molecules_skipped = 0;
  // Identifiers of the skipped molecules.
  std::vector<std::string> failed_ids;
};

// Common interface of the fingerprint (AtomLL, MolLL) and property
// (PropLL) models. Higher scores mean more like the training set.
// Scoring is const and never changes the model. Not thread safe for
// concurrent AnalyzeDataset calls.
class LikelihoodModel {
  public:
    virtual ~LikelihoodModel() = default;

    virtual ModelKind kind() const = 0;

    // Accumulate statistics from `molecules`. Adds to whatever has been
    // gathered before, it does not reset.
    virtual AnalysisSummary AnalyzeDataset(const std::vector<MoleculeRecord>& molecules) = 0;

    // Returns nullopt if `m` cannot be processed.
    virtual std::optional<double> CalculateLL(const MoleculeRecord& m) const = 0;

    // One value per molecule, in order. Molecules that cannot be
    // processed get NaN.
    std::vector<double> CalculateLLs(const std::vector<MoleculeRecord>& molecules) const;

    // The complete persisted state, envelope included.
    virtual void ToProto(LikelihoodModelData& proto) const = 0;

    // Replace the state of the model with what is in `proto`. Either all
    // of `proto` is used, or nothing changes and a CorruptFormatError is
    // returned.
    virtual absl::Status BuildFromProto(const LikelihoodModelData& proto) = 0;

    absl::Status Save(const std::string& fname) const;

    // Replaces, does not add to, existing state.
    absl::Status Load(const std::string& fname);
};

}  // namespace molll

#endif  // MOLECULE_LIKELIHOOD_LIKELIHOOD_MODEL_H_

#ifndef MOLECULE_LIKELIHOOD_FINGERPRINT_LL_H_
#define MOLECULE_LIKELIHOOD_FINGERPRINT_LL_H_

#include <cstdint>
#include <optional>
#include <vector>

#include "absl/status/status.h"

#include "Molecule_Likelihood/frequency_table.h"
#include "Molecule_Likelihood/key_extractor.h"
#include "Molecule_Likelihood/likelihood.pb.h"
#include "Molecule_Likelihood/likelihood_model.h"
#include "Molecule_Likelihood/smoother.h"

namespace molll {

enum class KeyGranularity {
  // Every atom environment is a key. A feature found at 3 atoms
  // contributes its bit 3 times.
  kAtom,
  // Every feature contributes one key made from its bit and the number
  // of atoms it occurs at, and the molecule contributes one key for its
  // total number of atom environments.
  kMolecule
};

// Feature counts above this are treated as equal when forming
// per molecule keys.
inline constexpr uint32_t kMaxMultiplicity = (1u << 24) - 1;

// The key for `bit` occurring `count` times in a molecule.
key_type MoleculeKey(bit_type bit, uint32_t count);

// The key for a molecule with `nfeatures` atom environments. Never
// the same as a MoleculeKey.
key_type MoleculeSizeKey(uint64_t nfeatures);

// Log likelihood of a molecule given the frequencies of fingerprint keys
// in a training set.
//   score = sum(log p(key)) / n^alpha
// where n is the number of keys in the molecule and p is from the Smoother.
// alpha == 1 gives the per key average, alpha == 0 the raw sum.
// A molecule with no keys scores 0.
class FingerprintLL : public LikelihoodModel {
  private:
    const KeyGranularity _granularity;

    // Not owned, must outlive this object.
    const KeyExtractor* _key_extractor;

    FrequencyTable _table;

    Smoother _smoother;

    double _alpha;

    // The fingerprint radius used by the extractor. Recorded, not used.
    uint32_t _radius;

    int _verbose;

  // private functions

    // An extractor that throws is treated as failing on `m`.
    std::optional<SparseFingerprint> _Extract(const MoleculeRecord& m) const;

  public:
    static constexpr double kDefaultAlpha = 1.0;
    static constexpr uint32_t kDefaultRadius = 1;

    FingerprintLL(KeyGranularity granularity, const KeyExtractor& key_extractor);
    FingerprintLL(KeyGranularity granularity, KeyExtractor&& key_extractor) = delete;

    // Fields not set in `config` take default values. Returns
    // kInvalidArgument, with nothing changed, for invalid parameters.
    absl::Status Initialise(const FingerprintLLConfig& config);

    void set_verbose(int s) {
      _verbose = s;
    }

    KeyGranularity granularity() const {
      return _granularity;
    }

    double alpha() const {
      return _alpha;
    }

    uint32_t radius() const {
      return _radius;
    }

    const FrequencyTable& frequency_table() const {
      return _table;
    }

    const Smoother& smoother() const {
      return _smoother;
    }

    ModelKind kind() const override;

    // The keys `fp` contributes, in the order they are scored.
    std::vector<key_type> Keys(const SparseFingerprint& fp) const;

    // Add the keys from an already extracted fingerprint.
    void Accumulate(const SparseFingerprint& fp);

    // Score an already extracted fingerprint.
    double Score(const SparseFingerprint& fp) const;

    AnalysisSummary AnalyzeDataset(const std::vector<MoleculeRecord>& molecules) override;

    std::optional<double> CalculateLL(const MoleculeRecord& m) const override;

    void ToProto(LikelihoodModelData& proto) const override;

    absl::Status BuildFromProto(const LikelihoodModelData& proto) override;
};

class AtomLL : public FingerprintLL {
  public:
    explicit AtomLL(const KeyExtractor& key_extractor) :
        FingerprintLL(KeyGranularity::kAtom, key_extractor) {
    }
    explicit AtomLL(KeyExtractor&& key_extractor) = delete;
};

class MolLL : public FingerprintLL {
  public:
    explicit MolLL(const KeyExtractor& key_extractor) :
        FingerprintLL(KeyGranularity::kMolecule, key_extractor) {
    }
    explicit MolLL(KeyExtractor&& key_extractor) = delete;
};

}  // namespace molll

#endif  // MOLECULE_LIKELIHOOD_FINGERPRINT_LL_H_

#ifndef MOLECULE_LIKELIHOOD_KEY_EXTRACTOR_H_
#define MOLECULE_LIKELIHOOD_KEY_EXTRACTOR_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace molll {

// Fingerprint bit numbers, as produced by the fingerprint generators.
using bit_type = uint32_t;

// A feature present in a molecule, and the number of atoms at which it occurs.
struct FeatureCount {
  bit_type bit;
  uint32_t count;

  bool operator==(const FeatureCount& rhs) const {
    return bit == rhs.bit && count == rhs.count;
  }
};

// Counted sparse fingerprint. Once canonicalised, sorted by bit, with
// unique bits and positive counts.
using SparseFingerprint = std::vector<FeatureCount>;

// Sort by bit, sum the counts of repeated bits and remove zero counts.
// Returns 0 if a summed count does not fit in 32 bits.
int Canonicalise(SparseFingerprint& fp);

// The number of atom environments in `fp` - the sum of the counts.
uint64_t NumberFeatures(const SparseFingerprint& fp);

// A molecule as it reaches the estimators. Nothing but a KeyExtractor
// (or PropertyExtractor) looks inside `text`.
struct MoleculeRecord {
  std::string id;
  std::string text;
};

// The first whitespace separated token of `line` is the identifier,
// the rest of the line is the text. Empty lines return nullopt.
std::optional<MoleculeRecord> ParseMoleculeRecord(absl::string_view line);

// Converts a molecule to its counted fingerprint. Implementations
// return nullopt for a molecule that cannot be processed. An empty
// fingerprint is a valid result.
class KeyExtractor {
  public:
    virtual ~KeyExtractor() = default;

    virtual std::optional<SparseFingerprint> Extract(const MoleculeRecord& m) const = 0;
};

// Interprets the text of a MoleculeRecord as a precomputed fingerprint in
// svml form, space separated `bit:count` tokens, as written by the
// fingerprint generators in svml mode.
class SvmlKeyExtractor : public KeyExtractor {
  private:
    // By convention the first column of an svml file is the response. If
    // set, a leading token without a ':' is ignored.
    bool _skip_response;

    int _verbose;

  public:
    SvmlKeyExtractor();

    void set_skip_response(bool s) {
      _skip_response = s;
    }
    void set_verbose(int s) {
      _verbose = s;
    }

    std::optional<SparseFingerprint> Extract(const MoleculeRecord& m) const override;
};

}  // namespace molll

#endif  // MOLECULE_LIKELIHOOD_KEY_EXTRACTOR_H_

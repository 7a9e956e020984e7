#ifndef MOLECULE_LIKELIHOOD_PROPERTY_EXTRACTOR_H_
#define MOLECULE_LIKELIHOOD_PROPERTY_EXTRACTOR_H_

#include <optional>
#include <vector>

#include "Molecule_Likelihood/key_extractor.h"

namespace molll {

// Computes a vector of continuous properties (molecular weight, logP...)
// for a molecule. The order of the values must match the descriptor
// names given to the PropertyLL.
class PropertyExtractor {
  public:
    virtual ~PropertyExtractor() = default;

    // nullopt if the properties cannot be computed.
    virtual std::optional<std::vector<double>> Properties(const MoleculeRecord& m) const = 0;
};

// The text of the record is whitespace separated numbers, one per
// descriptor, as written by a descriptor calculator.
class ColumnPropertyExtractor : public PropertyExtractor {
  private:
    int _verbose;

  public:
    ColumnPropertyExtractor();

    void set_verbose(int s) {
      _verbose = s;
    }

    std::optional<std::vector<double>> Properties(const MoleculeRecord& m) const override;
};

}  // namespace molll

#endif  // MOLECULE_LIKELIHOOD_PROPERTY_EXTRACTOR_H_

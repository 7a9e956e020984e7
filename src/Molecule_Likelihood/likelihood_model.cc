#include <limits>

#include "Molecule_Likelihood/likelihood_model.h"
#include "Molecule_Likelihood/persistence.h"

namespace molll {

std::vector<double>
LikelihoodModel::CalculateLLs(const std::vector<MoleculeRecord>& molecules) const {
  std::vector<double> result;
  result.reserve(molecules.size());

  for (const MoleculeRecord& m : molecules) {
    const std::optional<double> ll = CalculateLL(m);
    if (ll) {
      result.push_back(*ll);
    } else {
      result.push_back(std::numeric_limits<double>::quiet_NaN());
    }
  }

  return result;
}

absl::Status
LikelihoodModel::Save(const std::string& fname) const {
  LikelihoodModelData proto;
  ToProto(proto);

  return WriteModelData(proto, fname);
}

absl::Status
LikelihoodModel::Load(const std::string& fname) {
  LikelihoodModelData proto;
  absl::Status status = ReadModelData(fname, proto);
  if (! status.ok()) {
    return status;
  }

  return BuildFromProto(proto);
}

}  // namespace molll

#include <iostream>

#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"

#include "Molecule_Likelihood/property_extractor.h"

namespace molll {

using std::cerr;

ColumnPropertyExtractor::ColumnPropertyExtractor() {
  _verbose = 0;
}

std::optional<std::vector<double>>
ColumnPropertyExtractor::Properties(const MoleculeRecord& m) const {
  std::vector<double> result;

  for (absl::string_view token : absl::StrSplit(m.text, absl::ByAnyChar(" \t"), absl::SkipEmpty())) {
    double value;
    if (! absl::SimpleAtod(token, &value)) {
      if (_verbose) {
        cerr << "ColumnPropertyExtractor::Properties:invalid value '" << token << "' in " << m.id << '\n';
      }
      return std::nullopt;
    }

    result.push_back(value);
  }

  return result;
}

}  // namespace molll

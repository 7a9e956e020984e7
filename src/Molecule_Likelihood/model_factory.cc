#include <utility>

#include "absl/strings/str_cat.h"

#include "Molecule_Likelihood/likelihood_status.h"
#include "Molecule_Likelihood/model_factory.h"
#include "Molecule_Likelihood/persistence.h"
#include "Molecule_Likelihood/property_ll.h"

namespace molll {

namespace {

absl::StatusOr<std::unique_ptr<FingerprintLL>>
NewFingerprintLL(ModelKind kind, const KeyExtractor& key_extractor) {
  switch (kind) {
    case ATOM_LL:
      return std::make_unique<AtomLL>(key_extractor);
    case MOL_LL:
      return std::make_unique<MolLL>(key_extractor);
    default:
      return InvalidInputError(absl::StrCat("NewFingerprintLL:not a fingerprint model ",
                               ModelKindName(kind)));
  }
}

absl::StatusOr<std::unique_ptr<FingerprintLL>>
LibInvent(const std::string& directory, ModelKind kind, uint32_t radius,
          const KeyExtractor& key_extractor) {
  if (radius < 1 || radius > 3) {
    return InvalidInputError(absl::StrCat("LibInvent:no ", ModelKindName(kind), " model for radius ", radius));
  }

  return NewPrecomputedFingerprintLL(directory, kind, kLibInvent, radius, key_extractor);
}

}  // namespace

absl::StatusOr<std::unique_ptr<LikelihoodModel>>
ReadModel(const std::string& fname, const KeyExtractor* key_extractor,
          const PropertyExtractor* property_extractor) {
  LikelihoodModelData proto;
  if (absl::Status status = ReadModelData(fname, proto); ! status.ok()) {
    return status;
  }

  std::unique_ptr<LikelihoodModel> result;
  if (proto.model_kind() == PROP_LL) {
    if (property_extractor == nullptr) {
      return InvalidInputError(absl::StrCat("ReadModel:'", fname, "' needs a property extractor"));
    }
    result = std::make_unique<PropertyLL>(*property_extractor);
  } else {
    if (key_extractor == nullptr) {
      return InvalidInputError(absl::StrCat("ReadModel:'", fname, "' needs a key extractor"));
    }
    absl::StatusOr<std::unique_ptr<FingerprintLL>> fp = NewFingerprintLL(proto.model_kind(), *key_extractor);
    if (! fp.ok()) {
      return fp.status();
    }
    result = std::move(fp).value();
  }

  if (absl::Status status = result->BuildFromProto(proto); ! status.ok()) {
    return status;
  }

  return result;
}

std::string
PrecomputedModelFileName(ModelKind kind, absl::string_view dataset, uint32_t radius) {
  return absl::StrCat(ModelKindName(kind), "_", dataset, "_radius_", radius, ".textproto");
}

absl::StatusOr<std::unique_ptr<FingerprintLL>>
NewPrecomputedFingerprintLL(const std::string& directory, ModelKind kind, absl::string_view dataset,
                            uint32_t radius, const KeyExtractor& key_extractor) {
  absl::StatusOr<std::unique_ptr<FingerprintLL>> result = NewFingerprintLL(kind, key_extractor);
  if (! result.ok()) {
    return result;
  }

  const std::string fname = absl::StrCat(directory, "/", PrecomputedModelFileName(kind, dataset, radius));
  if (absl::Status status = (*result)->Load(fname); ! status.ok()) {
    return status;
  }

  if ((*result)->radius() != radius) {
    return CorruptFormatError(absl::StrCat("NewPrecomputedFingerprintLL:'", fname, "' has radius ",
                              (*result)->radius(), " expected ", radius));
  }

  return result;
}

absl::StatusOr<std::unique_ptr<FingerprintLL>>
LibInventAtomLL(const std::string& directory, uint32_t radius, const KeyExtractor& key_extractor) {
  return LibInvent(directory, ATOM_LL, radius, key_extractor);
}

absl::StatusOr<std::unique_ptr<FingerprintLL>>
LibInventMolLL(const std::string& directory, uint32_t radius, const KeyExtractor& key_extractor) {
  return LibInvent(directory, MOL_LL, radius, key_extractor);
}

}  // namespace molll

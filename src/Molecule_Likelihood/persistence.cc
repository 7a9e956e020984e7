#include "absl/strings/str_cat.h"

#include "Foundational/proto_io/proto_io.h"

#include "Molecule_Likelihood/likelihood_status.h"
#include "Molecule_Likelihood/persistence.h"

namespace molll {

absl::string_view
ModelKindName(ModelKind kind) {
  switch (kind) {
    case ATOM_LL:
      return "AtomLL";
    case MOL_LL:
      return "MolLL";
    case PROP_LL:
      return "PropLL";
    default:
      return "unknown";
  }
}

absl::Status
CheckEnvelope(const LikelihoodModelData& proto) {
  if (! proto.has_format_version()) {
    return CorruptFormatError("CheckEnvelope:no format_version");
  }
  if (proto.format_version() != kFormatVersion) {
    return CorruptFormatError(absl::StrCat("CheckEnvelope:unsupported format_version ",
                              proto.format_version()));
  }

  if (! proto.has_model_kind()) {
    return CorruptFormatError("CheckEnvelope:no model_kind");
  }

  switch (proto.model_kind()) {
    case ATOM_LL:
    case MOL_LL:
    case PROP_LL:
      return absl::OkStatus();
    default:
      return CorruptFormatError(absl::StrCat("CheckEnvelope:unrecognised model_kind ",
                                static_cast<int>(proto.model_kind())));
  }
}

absl::Status
ReadModelData(const std::string& fname, LikelihoodModelData& proto) {
  absl::Status status = proto_io::ReadProtoInto(fname, proto);
  if (IsIOError(status) || IsCorruptFormat(status)) {
    return status;
  }
  if (! status.ok()) {
    return CorruptFormatError(status.message());
  }

  return CheckEnvelope(proto);
}

absl::Status
WriteModelData(const LikelihoodModelData& proto, const std::string& fname) {
  absl::Status status = proto_io::WriteProto(proto, fname);
  if (status.ok() || IsIOError(status)) {
    return status;
  }

  return IOError(status.message());
}

}  // namespace molll

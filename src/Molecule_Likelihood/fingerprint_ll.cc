#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <utility>

#include "absl/strings/str_cat.h"

#include "Foundational/accumulator/compensated_sum.h"

#include "Molecule_Likelihood/fingerprint_ll.h"
#include "Molecule_Likelihood/likelihood_status.h"
#include "Molecule_Likelihood/persistence.h"

namespace molll {

using std::cerr;

namespace {

constexpr key_type kMoleculeSizeFlag = 1ull << 63;

absl::Status
CheckAlpha(double alpha) {
  if (! std::isfinite(alpha) || alpha < 0.0 || alpha > 1.0) {
    return InvalidInputError(absl::StrCat("FingerprintLL:alpha must be in [0,1], got ", alpha));
  }

  return absl::OkStatus();
}

}  // namespace

key_type
MoleculeKey(bit_type bit, uint32_t count) {
  return (static_cast<key_type>(bit) << 24) | std::min(count, kMaxMultiplicity);
}

key_type
MoleculeSizeKey(uint64_t nfeatures) {
  return kMoleculeSizeFlag | std::min<uint64_t>(nfeatures, kMoleculeSizeFlag - 1);
}

FingerprintLL::FingerprintLL(KeyGranularity granularity, const KeyExtractor& key_extractor) :
    _granularity(granularity),
    _key_extractor(&key_extractor) {
  _alpha = kDefaultAlpha;
  _radius = kDefaultRadius;
  _verbose = 0;
}

absl::Status
FingerprintLL::Initialise(const FingerprintLLConfig& config) {
  Smoother smoother;
  if (absl::Status status = smoother.Initialise(config.smoother()); ! status.ok()) {
    return status;
  }

  double alpha = kDefaultAlpha;
  if (config.has_alpha()) {
    alpha = config.alpha();
  }
  if (absl::Status status = CheckAlpha(alpha); ! status.ok()) {
    return status;
  }

  _smoother = smoother;
  _alpha = alpha;
  if (config.has_radius()) {
    _radius = config.radius();
  } else {
    _radius = kDefaultRadius;
  }

  return absl::OkStatus();
}

ModelKind
FingerprintLL::kind() const {
  if (_granularity == KeyGranularity::kAtom) {
    return ATOM_LL;
  }

  return MOL_LL;
}

std::vector<key_type>
FingerprintLL::Keys(const SparseFingerprint& fp) const {
  std::vector<key_type> result;
  if (fp.empty()) {
    return result;
  }

  if (_granularity == KeyGranularity::kAtom) {
    result.reserve(NumberFeatures(fp));
    for (const FeatureCount& f : fp) {
      result.insert(result.end(), f.count, f.bit);
    }
    return result;
  }

  result.reserve(fp.size() + 1);
  for (const FeatureCount& f : fp) {
    result.push_back(MoleculeKey(f.bit, f.count));
  }
  result.push_back(MoleculeSizeKey(NumberFeatures(fp)));

  return result;
}

void
FingerprintLL::Accumulate(const SparseFingerprint& fp) {
  if (_granularity == KeyGranularity::kAtom) {
    for (const FeatureCount& f : fp) {
      _table.Accumulate(f.bit, f.count);
    }
    return;
  }

  _table.Accumulate(Keys(fp));
}

double
FingerprintLL::Score(const SparseFingerprint& fp) const {
  accumulator::CompensatedSum ll;

  if (_granularity == KeyGranularity::kAtom) {
    // Each atom environment scores the same as every other with that bit.
    for (const FeatureCount& f : fp) {
      ll.Add(_smoother.LogProbability(f.bit, _table), f.count);
    }
  } else {
    for (key_type key : Keys(fp)) {
      ll += _smoother.LogProbability(key, _table);
    }
  }

  if (ll.empty()) {
    return 0.0;
  }

  return ll.sum() / std::pow(static_cast<double>(ll.n()), _alpha);
}

std::optional<SparseFingerprint>
FingerprintLL::_Extract(const MoleculeRecord& m) const {
  try {
    return _key_extractor->Extract(m);
  } catch (const std::exception& e) {
    if (_verbose) {
      cerr << "FingerprintLL::_Extract:extractor failed on '" << m.id << "' " << e.what() << '\n';
    }
    return std::nullopt;
  }
}

AnalysisSummary
FingerprintLL::AnalyzeDataset(const std::vector<MoleculeRecord>& molecules) {
  AnalysisSummary result;

  for (const MoleculeRecord& m : molecules) {
    std::optional<SparseFingerprint> fp = _Extract(m);
    if (! fp) {
      if (_verbose) {
        cerr << "FingerprintLL::AnalyzeDataset:cannot extract keys from '" << m.id << "', skipped\n";
      }
      ++result.molecules_skipped;
      result.failed_ids.push_back(m.id);
      continue;
    }

    Accumulate(*fp);
    ++result.molecules_processed;
  }

  if (_verbose) {
    cerr << ModelKindName(kind()) << " processed " << result.molecules_processed << " molecules, skipped "
         << result.molecules_skipped << ". " << _table.vocabulary_size() << " keys, total "
         << _table.total() << '\n';
  }

  return result;
}

std::optional<double>
FingerprintLL::CalculateLL(const MoleculeRecord& m) const {
  std::optional<SparseFingerprint> fp = _Extract(m);
  if (! fp) {
    if (_verbose) {
      cerr << "FingerprintLL::CalculateLL:cannot extract keys from '" << m.id << "'\n";
    }
    return std::nullopt;
  }

  return Score(*fp);
}

void
FingerprintLL::ToProto(LikelihoodModelData& proto) const {
  proto.Clear();
  proto.set_format_version(kFormatVersion);
  proto.set_model_kind(kind());
  if (_granularity == KeyGranularity::kAtom) {
    proto.set_granularity(PER_ATOM);
  } else {
    proto.set_granularity(PER_MOLECULE);
  }
  _smoother.ToProto(*proto.mutable_smoother());
  proto.set_alpha(_alpha);
  proto.set_radius(_radius);
  _table.ToProto(*proto.mutable_frequency_table());
}

absl::Status
FingerprintLL::BuildFromProto(const LikelihoodModelData& proto) {
  if (absl::Status status = CheckEnvelope(proto); ! status.ok()) {
    return status;
  }

  if (proto.model_kind() != kind()) {
    return CorruptFormatError(absl::StrCat("FingerprintLL::BuildFromProto:data is ",
                ModelKindName(proto.model_kind()), " model is ", ModelKindName(kind())));
  }

  const Granularity expected = (_granularity == KeyGranularity::kAtom) ? PER_ATOM : PER_MOLECULE;
  if (! proto.has_granularity() || proto.granularity() != expected) {
    return CorruptFormatError("FingerprintLL::BuildFromProto:missing or inconsistent granularity");
  }

  if (! proto.has_smoother() || ! proto.smoother().has_policy() ||
      ! proto.smoother().has_pseudo_count() || ! proto.smoother().has_estimated_keyspace()) {
    return CorruptFormatError("FingerprintLL::BuildFromProto:missing or incomplete smoother");
  }

  Smoother smoother;
  if (absl::Status status = smoother.Initialise(proto.smoother()); ! status.ok()) {
    return CorruptFormatError(status.message());
  }

  if (! proto.has_alpha()) {
    return CorruptFormatError("FingerprintLL::BuildFromProto:missing alpha");
  }
  if (absl::Status status = CheckAlpha(proto.alpha()); ! status.ok()) {
    return CorruptFormatError(status.message());
  }

  if (! proto.has_radius()) {
    return CorruptFormatError("FingerprintLL::BuildFromProto:missing radius");
  }

  if (! proto.has_frequency_table()) {
    return CorruptFormatError("FingerprintLL::BuildFromProto:missing frequency_table");
  }

  FrequencyTable table;
  if (absl::Status status = table.BuildFromProto(proto.frequency_table()); ! status.ok()) {
    return CorruptFormatError(status.message());
  }

  _table = std::move(table);
  _smoother = smoother;
  _alpha = proto.alpha();
  _radius = proto.radius();

  return absl::OkStatus();
}

}  // namespace molll

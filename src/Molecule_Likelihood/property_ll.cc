#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <numbers>
#include <utility>

#include "absl/strings/str_cat.h"

#include "Foundational/accumulator/compensated_sum.h"

#include "Molecule_Likelihood/likelihood_status.h"
#include "Molecule_Likelihood/persistence.h"
#include "Molecule_Likelihood/property_ll.h"

namespace molll {

using std::cerr;

double
Percentile(const std::vector<double>& sorted, double p) {
  const double position = p / 100.0 * static_cast<double>(sorted.size() - 1);
  const size_t lower = static_cast<size_t>(std::floor(position));
  const size_t upper = std::min(lower + 1, sorted.size() - 1);
  const double fraction = position - static_cast<double>(lower);

  return sorted[lower] + fraction * (sorted[upper] - sorted[lower]);
}

void
RobustScaler::Fit(const std::vector<std::vector<double>>& samples) {
  _centre.clear();
  _scale.clear();
  if (samples.empty()) {
    return;
  }

  const size_t dimension = samples.front().size();
  _centre.reserve(dimension);
  _scale.reserve(dimension);

  std::vector<double> column(samples.size());
  for (size_t d = 0; d < dimension; ++d) {
    for (size_t i = 0; i < samples.size(); ++i) {
      column[i] = samples[i][d];
    }
    std::sort(column.begin(), column.end());

    _centre.push_back(Percentile(column, 50.0));
    const double iqr = Percentile(column, 75.0) - Percentile(column, 25.0);
    if (iqr == 0.0) {
      _scale.push_back(1.0);
    } else {
      _scale.push_back(iqr);
    }
  }
}

std::vector<double>
RobustScaler::Transform(const std::vector<double>& x) const {
  std::vector<double> result(x.size());
  for (size_t i = 0; i < x.size(); ++i) {
    result[i] = (x[i] - _centre[i]) / _scale[i];
  }

  return result;
}

PropertyLL::PropertyLL(const PropertyExtractor& property_extractor) :
    _property_extractor(&property_extractor) {
  _descriptor.push_back(kDefaultDescriptor);
  _bandwidth = kDefaultBandwidth;
  _verbose = 0;
}

absl::Status
PropertyLL::Initialise(const PropertyLLConfig& config) {
  std::vector<std::string> descriptor;
  if (config.descriptor_name_size() == 0) {
    descriptor.push_back(kDefaultDescriptor);
  } else {
    descriptor.assign(config.descriptor_name().begin(), config.descriptor_name().end());
  }

  if (! _sample.empty() && descriptor.size() != _descriptor.size()) {
    return InvalidInputError(absl::StrCat("PropertyLL::Initialise:have ", _sample.size(),
                " samples of dimension ", _descriptor.size(), " cannot change to ", descriptor.size()));
  }

  double bandwidth = kDefaultBandwidth;
  if (config.has_bandwidth()) {
    bandwidth = config.bandwidth();
  }
  if (! std::isfinite(bandwidth) || bandwidth <= 0.0) {
    return InvalidInputError(absl::StrCat("PropertyLL::Initialise:invalid bandwidth ", bandwidth));
  }

  _descriptor = std::move(descriptor);
  _bandwidth = bandwidth;

  return absl::OkStatus();
}

int
PropertyLL::_Valid(const std::vector<double>& x) const {
  if (x.size() != _descriptor.size()) {
    return 0;
  }

  return std::all_of(x.begin(), x.end(), [](double v) {
    return std::isfinite(v);
  });
}

std::optional<std::vector<double>>
PropertyLL::_Properties(const MoleculeRecord& m) const {
  try {
    return _property_extractor->Properties(m);
  } catch (const std::exception& e) {
    if (_verbose) {
      cerr << "PropertyLL::_Properties:extractor failed on '" << m.id << "' " << e.what() << '\n';
    }
    return std::nullopt;
  }
}

void
PropertyLL::_UpdateDensity() {
  _scaler.Fit(_sample);

  _scaled.clear();
  _scaled.reserve(_sample.size());
  for (const std::vector<double>& x : _sample) {
    _scaled.push_back(_scaler.Transform(x));
  }
}

AnalysisSummary
PropertyLL::AnalyzeDataset(const std::vector<MoleculeRecord>& molecules) {
  AnalysisSummary result;

  for (const MoleculeRecord& m : molecules) {
    std::optional<std::vector<double>> x = _Properties(m);
    if (! x || ! _Valid(*x)) {
      if (_verbose) {
        cerr << "PropertyLL::AnalyzeDataset:invalid properties for '" << m.id << "', skipped\n";
      }
      ++result.molecules_skipped;
      result.failed_ids.push_back(m.id);
      continue;
    }

    _sample.push_back(std::move(*x));
    ++result.molecules_processed;
  }

  _UpdateDensity();

  if (_verbose) {
    cerr << "PropertyLL processed " << result.molecules_processed << " molecules, skipped "
         << result.molecules_skipped << ". " << _sample.size() << " samples\n";
  }

  return result;
}

std::optional<double>
PropertyLL::LogDensity(const std::vector<double>& x) const {
  if (_scaled.empty() || ! _Valid(x)) {
    return std::nullopt;
  }

  const std::vector<double> scaled = _scaler.Transform(x);
  const double h2 = _bandwidth * _bandwidth;

  std::vector<double> log_kernel;
  log_kernel.reserve(_scaled.size());
  for (const std::vector<double>& s : _scaled) {
    double d2 = 0.0;
    for (size_t i = 0; i < s.size(); ++i) {
      const double diff = scaled[i] - s[i];
      d2 += diff * diff;
    }
    log_kernel.push_back(-0.5 * d2 / h2);
  }

  // Log sum exp, shifted by the largest term.
  const double largest = *std::max_element(log_kernel.begin(), log_kernel.end());
  accumulator::CompensatedSum sum;
  for (double k : log_kernel) {
    sum += std::exp(k - largest);
  }

  const double d = static_cast<double>(scaled.size());
  return largest + std::log(sum.sum()) - std::log(static_cast<double>(_scaled.size())) -
         d * std::log(_bandwidth) - 0.5 * d * std::log(2.0 * std::numbers::pi);
}

std::optional<double>
PropertyLL::CalculateLL(const MoleculeRecord& m) const {
  if (_scaled.empty()) {
    if (_verbose) {
      cerr << "PropertyLL::CalculateLL:no samples\n";
    }
    return std::nullopt;
  }

  std::optional<std::vector<double>> x = _Properties(m);
  if (! x) {
    if (_verbose) {
      cerr << "PropertyLL::CalculateLL:cannot compute properties of '" << m.id << "'\n";
    }
    return std::nullopt;
  }

  return LogDensity(*x);
}

void
PropertyLL::ToProto(LikelihoodModelData& proto) const {
  proto.Clear();
  proto.set_format_version(kFormatVersion);
  proto.set_model_kind(PROP_LL);

  PropertyModelData* model = proto.mutable_property_model();
  for (const std::string& d : _descriptor) {
    model->add_descriptor_name(d);
  }
  model->set_bandwidth(_bandwidth);
  for (const std::vector<double>& x : _sample) {
    PropertyVector* v = model->add_sample();
    for (double value : x) {
      v->add_value(value);
    }
  }
}

absl::Status
PropertyLL::BuildFromProto(const LikelihoodModelData& proto) {
  if (absl::Status status = CheckEnvelope(proto); ! status.ok()) {
    return status;
  }

  if (proto.model_kind() != PROP_LL) {
    return CorruptFormatError(absl::StrCat("PropertyLL::BuildFromProto:data is ",
                ModelKindName(proto.model_kind()), " model is PropLL"));
  }

  if (! proto.has_property_model()) {
    return CorruptFormatError("PropertyLL::BuildFromProto:missing property_model");
  }

  const PropertyModelData& model = proto.property_model();
  if (model.descriptor_name_size() == 0) {
    return CorruptFormatError("PropertyLL::BuildFromProto:no descriptors");
  }
  if (! model.has_bandwidth() || ! std::isfinite(model.bandwidth()) || model.bandwidth() <= 0.0) {
    return CorruptFormatError("PropertyLL::BuildFromProto:missing or invalid bandwidth");
  }

  std::vector<std::string> descriptor(model.descriptor_name().begin(), model.descriptor_name().end());

  std::vector<std::vector<double>> sample;
  sample.reserve(model.sample_size());
  for (const PropertyVector& v : model.sample()) {
    if (static_cast<size_t>(v.value_size()) != descriptor.size()) {
      return CorruptFormatError(absl::StrCat("PropertyLL::BuildFromProto:sample dimension ",
                  v.value_size(), " expected ", descriptor.size()));
    }
    sample.emplace_back(v.value().begin(), v.value().end());
    if (! std::all_of(sample.back().begin(), sample.back().end(), [](double x) {
          return std::isfinite(x);
        })) {
      return CorruptFormatError("PropertyLL::BuildFromProto:non finite sample");
    }
  }

  _descriptor = std::move(descriptor);
  _bandwidth = model.bandwidth();
  _sample = std::move(sample);
  _UpdateDensity();

  return absl::OkStatus();
}

}  // namespace molll

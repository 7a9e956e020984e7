#include <algorithm>
#include <cmath>

#include "absl/strings/str_cat.h"

#include "Molecule_Likelihood/smoother.h"

namespace molll {

Smoother::Smoother() {
  _pseudo_count = kDefaultPseudoCount;
  _estimated_keyspace = kDefaultEstimatedKeyspace;
}

absl::Status
Smoother::Initialise(const SmootherConfig& config) {
  if (config.has_policy() && config.policy() != kAdditive) {
    return absl::InvalidArgumentError(absl::StrCat("Smoother::Initialise:unrecognised policy '",
                                      config.policy(), "'"));
  }

  double pseudo_count = kDefaultPseudoCount;
  if (config.has_pseudo_count()) {
    pseudo_count = config.pseudo_count();
  }

  uint64_t estimated_keyspace = kDefaultEstimatedKeyspace;
  if (config.has_estimated_keyspace()) {
    estimated_keyspace = config.estimated_keyspace();
  }

  // The pseudo count term of the denominator must also be finite.
  if (! std::isfinite(pseudo_count) || ! (pseudo_count >= kMinPseudoCount) ||
      ! std::isfinite(pseudo_count * static_cast<double>(std::max<uint64_t>(estimated_keyspace, 1)))) {
    return absl::InvalidArgumentError(absl::StrCat("Smoother::Initialise:invalid pseudo count ",
                                      pseudo_count));
  }

  _pseudo_count = pseudo_count;
  _estimated_keyspace = estimated_keyspace;

  return absl::OkStatus();
}

double
Smoother::_Denominator(const FrequencyTable& table) const {
  uint64_t keyspace = _estimated_keyspace;
  if (keyspace == 0) {
    keyspace = std::max<uint64_t>(table.vocabulary_size(), 1);
  }

  return static_cast<double>(table.total()) + _pseudo_count * static_cast<double>(keyspace);
}

double
Smoother::Probability(key_type key, const FrequencyTable& table) const {
  return (static_cast<double>(table.CountOf(key)) + _pseudo_count) / _Denominator(table);
}

double
Smoother::LogProbability(key_type key, const FrequencyTable& table) const {
  return LogProbabilityOfCount(table.CountOf(key), table);
}

double
Smoother::LogProbabilityOfCount(count_type count, const FrequencyTable& table) const {
  return std::log(static_cast<double>(count) + _pseudo_count) - std::log(_Denominator(table));
}

void
Smoother::ToProto(SmootherConfig& proto) const {
  proto.Clear();
  proto.set_policy(kAdditive);
  proto.set_pseudo_count(_pseudo_count);
  proto.set_estimated_keyspace(_estimated_keyspace);
}

}  // namespace molll

#ifndef MOLECULE_LIKELIHOOD_SMOOTHER_H_
#define MOLECULE_LIKELIHOOD_SMOOTHER_H_

#include <cstdint>

#include "absl/status/status.h"

#include "Molecule_Likelihood/frequency_table.h"
#include "Molecule_Likelihood/likelihood.pb.h"

namespace molll {

// Additive (Laplace) smoothing of the counts in a FrequencyTable.
//   p(key) = (count(key) + pseudo_count) / (total + pseudo_count * V)
// V is the estimated keyspace if that is positive, otherwise the observed
// vocabulary size, but never less than 1.
// p(key) > 0 for every key, seen or unseen, including with an empty table.
class Smoother {
  private:
    double _pseudo_count;

    // Zero means use the observed vocabulary size.
    uint64_t _estimated_keyspace;

  // private functions

    double _Denominator(const FrequencyTable& table) const;

  public:
    static constexpr char kAdditive[] = "additive";
    static constexpr double kDefaultPseudoCount = 0.1;
    static constexpr uint64_t kDefaultEstimatedKeyspace = 2000000;
    // Smallest pseudo count accepted. Even against a table holding 2^64
    // keys, the probability of an unseen key stays a normal double.
    static constexpr double kMinPseudoCount = 1.0e-200;

    Smoother();

    // Fields not set in `config` take default values. Returns kInvalidArgument,
    // leaving the object unchanged, for an unrecognised policy or a
    // pseudo count that is not a finite number >= kMinPseudoCount.
    absl::Status Initialise(const SmootherConfig& config);

    double pseudo_count() const {
      return _pseudo_count;
    }
    uint64_t estimated_keyspace() const {
      return _estimated_keyspace;
    }

    bool uses_observed_vocabulary() const {
      return _estimated_keyspace == 0;
    }

    double Probability(key_type key, const FrequencyTable& table) const;

    // Always finite.
    double LogProbability(key_type key, const FrequencyTable& table) const;

    // The log probability of a key that has been seen `count` times.
    double LogProbabilityOfCount(count_type count, const FrequencyTable& table) const;

    void ToProto(SmootherConfig& proto) const;
};

}  // namespace molll

#endif  // MOLECULE_LIKELIHOOD_SMOOTHER_H_

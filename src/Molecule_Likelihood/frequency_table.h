#ifndef MOLECULE_LIKELIHOOD_FREQUENCY_TABLE_H_
#define MOLECULE_LIKELIHOOD_FREQUENCY_TABLE_H_

#include <cstdint>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"

#include "Molecule_Likelihood/likelihood.pb.h"

namespace molll {

using key_type = uint64_t;
using count_type = uint64_t;

// An immutable copy of a FrequencyTable, entries sorted by key.
struct FrequencySnapshot {
  count_type total = 0;
  uint64_t vocabulary_size = 0;
  std::vector<std::pair<key_type, count_type>> counts;
};

// Number of times each key has been seen.
// Counts only ever increase. `total` is always the sum of the counts and
// `vocabulary_size` the number of distinct keys.
class FrequencyTable {
  private:
    absl::flat_hash_map<key_type, count_type> _counts;

    count_type _total;

  public:
    FrequencyTable();

    // Each key in `keys` is counted once per appearance.
    void Accumulate(const std::vector<key_type>& keys);

    // Count `key` `n` times.
    void Accumulate(key_type key, count_type n);

    count_type CountOf(key_type key) const;

    count_type total() const {
      return _total;
    }

    uint64_t vocabulary_size() const {
      return _counts.size();
    }

    bool empty() const {
      return _counts.empty();
    }

    FrequencySnapshot Snapshot() const;

    void ToProto(FrequencyTableData& proto) const;

    // Replace the contents with what is in `proto`. If `proto` is
    // inconsistent a kDataLoss status is returned and nothing changes.
    absl::Status BuildFromProto(const FrequencyTableData& proto);
};

}  // namespace molll

#endif  // MOLECULE_LIKELIHOOD_FREQUENCY_TABLE_H_

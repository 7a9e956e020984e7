#include <algorithm>
#include <limits>

#include "absl/strings/str_cat.h"

#include "Molecule_Likelihood/frequency_table.h"

namespace molll {

FrequencyTable::FrequencyTable() {
  _total = 0;
}

void
FrequencyTable::Accumulate(const std::vector<key_type>& keys) {
  for (key_type key : keys) {
    ++_counts[key];
  }

  _total += keys.size();
}

void
FrequencyTable::Accumulate(key_type key, count_type n) {
  if (n == 0) {
    return;
  }

  _counts[key] += n;
  _total += n;
}

count_type
FrequencyTable::CountOf(key_type key) const {
  const auto iter = _counts.find(key);
  if (iter == _counts.end()) {
    return 0;
  }

  return iter->second;
}

FrequencySnapshot
FrequencyTable::Snapshot() const {
  FrequencySnapshot result;
  result.total = _total;
  result.vocabulary_size = _counts.size();

  result.counts.reserve(_counts.size());
  for (const auto& [key, count] : _counts) {
    result.counts.emplace_back(key, count);
  }

  std::sort(result.counts.begin(), result.counts.end());

  return result;
}

void
FrequencyTable::ToProto(FrequencyTableData& proto) const {
  const FrequencySnapshot snapshot = Snapshot();

  proto.Clear();
  proto.set_total(snapshot.total);
  proto.set_vocabulary_size(snapshot.vocabulary_size);
  proto.mutable_counts()->Reserve(static_cast<int>(snapshot.counts.size()));
  for (const auto& [key, count] : snapshot.counts) {
    KeyCount* kc = proto.add_counts();
    kc->set_key(key);
    kc->set_count(count);
  }
}

absl::Status
FrequencyTable::BuildFromProto(const FrequencyTableData& proto) {
  if (! proto.has_total() || ! proto.has_vocabulary_size()) {
    return absl::DataLossError("FrequencyTable::BuildFromProto:missing total or vocabulary_size");
  }

  absl::flat_hash_map<key_type, count_type> counts;
  counts.reserve(proto.counts_size());

  count_type total = 0;
  for (const KeyCount& kc : proto.counts()) {
    if (kc.count() == 0) {
      return absl::DataLossError(absl::StrCat("FrequencyTable::BuildFromProto:zero count for key ", kc.key()));
    }
    if (! counts.emplace(kc.key(), kc.count()).second) {
      return absl::DataLossError(absl::StrCat("FrequencyTable::BuildFromProto:duplicate key ", kc.key()));
    }
    if (kc.count() > std::numeric_limits<count_type>::max() - total) {
      return absl::DataLossError("FrequencyTable::BuildFromProto:total overflow");
    }
    total += kc.count();
  }

  if (total != proto.total()) {
    return absl::DataLossError(absl::StrCat("FrequencyTable::BuildFromProto:total ", proto.total(),
                               " but counts sum to ", total));
  }
  if (counts.size() != proto.vocabulary_size()) {
    return absl::DataLossError(absl::StrCat("FrequencyTable::BuildFromProto:vocabulary_size ",
                               proto.vocabulary_size(), " but ", counts.size(), " keys"));
  }

  _counts = std::move(counts);
  _total = total;

  return absl::OkStatus();
}

}  // namespace molll

// Tests for FrequencyTable

#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "google/protobuf/text_format.h"

#include "Molecule_Likelihood/frequency_table.h"

namespace molll {
namespace {

using testing::ElementsAre;
using testing::Pair;

TEST(TestFrequencyTable, Empty) {
  FrequencyTable table;
  EXPECT_TRUE(table.empty());
  EXPECT_EQ(table.total(), 0u);
  EXPECT_EQ(table.vocabulary_size(), 0u);
  EXPECT_EQ(table.CountOf(3), 0u);
}

TEST(TestFrequencyTable, RepeatsCounted) {
  FrequencyTable table;
  table.Accumulate(std::vector<key_type>{5, 1, 5, 5});
  EXPECT_EQ(table.CountOf(5), 3u);
  EXPECT_EQ(table.CountOf(1), 1u);
  EXPECT_EQ(table.CountOf(2), 0u);
  EXPECT_EQ(table.total(), 4u);
  EXPECT_EQ(table.vocabulary_size(), 2u);
}

TEST(TestFrequencyTable, AccumulateMultiple) {
  FrequencyTable table;
  table.Accumulate(8, 3);
  table.Accumulate(9, 0);
  EXPECT_EQ(table.CountOf(8), 3u);
  EXPECT_EQ(table.CountOf(9), 0u);
  EXPECT_EQ(table.total(), 3u);
  EXPECT_EQ(table.vocabulary_size(), 1u);
}

TEST(TestFrequencyTable, Additive) {
  const std::vector<key_type> keys{1, 2, 2, 3};
  FrequencyTable once;
  once.Accumulate(keys);

  FrequencyTable twice;
  twice.Accumulate(keys);
  twice.Accumulate(keys);

  for (key_type k : keys) {
    EXPECT_EQ(twice.CountOf(k), 2 * once.CountOf(k));
  }
  EXPECT_EQ(twice.total(), 2 * once.total());
  EXPECT_EQ(twice.vocabulary_size(), once.vocabulary_size());
}

TEST(TestFrequencyTable, SnapshotSorted) {
  FrequencyTable table;
  table.Accumulate(std::vector<key_type>{100, 7, 42, 7});

  const FrequencySnapshot snapshot = table.Snapshot();
  EXPECT_EQ(snapshot.total, 4u);
  EXPECT_EQ(snapshot.vocabulary_size, 3u);
  EXPECT_THAT(snapshot.counts, ElementsAre(Pair(7, 2), Pair(42, 1), Pair(100, 1)));
}

TEST(TestFrequencyTable, ProtoRoundTrip) {
  FrequencyTable table;
  table.Accumulate(std::vector<key_type>{3, 1, 3});

  FrequencyTableData proto;
  table.ToProto(proto);
  EXPECT_EQ(proto.total(), 3u);
  EXPECT_EQ(proto.vocabulary_size(), 2u);
  ASSERT_EQ(proto.counts_size(), 2);
  EXPECT_EQ(proto.counts(0).key(), 1u);
  EXPECT_EQ(proto.counts(1).key(), 3u);

  FrequencyTable restored;
  ASSERT_TRUE(restored.BuildFromProto(proto).ok());
  EXPECT_EQ(restored.CountOf(3), 2u);
  EXPECT_EQ(restored.CountOf(1), 1u);
  EXPECT_EQ(restored.total(), 3u);
  EXPECT_EQ(restored.vocabulary_size(), 2u);
}

TEST(TestFrequencyTable, EmptyProto) {
  FrequencyTable table;
  FrequencyTableData proto;
  table.ToProto(proto);
  EXPECT_TRUE(proto.has_total());

  FrequencyTable restored;
  restored.Accumulate(1, 1);
  ASSERT_TRUE(restored.BuildFromProto(proto).ok());
  EXPECT_TRUE(restored.empty());
  EXPECT_EQ(restored.total(), 0u);
}

struct BadTable {
  std::string text;
};

class TestBadTable : public testing::TestWithParam<BadTable> {
};

TEST_P(TestBadTable, Rejected) {
  const auto& params = GetParam();
  FrequencyTableData proto;
  ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(params.text, &proto));

  FrequencyTable table;
  table.Accumulate(std::vector<key_type>{11, 11});

  const absl::Status status = table.BuildFromProto(proto);
  EXPECT_EQ(status.code(), absl::StatusCode::kDataLoss) << params.text;

  // Unchanged.
  EXPECT_EQ(table.CountOf(11), 2u);
  EXPECT_EQ(table.total(), 2u);
  EXPECT_EQ(table.vocabulary_size(), 1u);
}
INSTANTIATE_TEST_SUITE_P(TestBadTable, TestBadTable, testing::Values(
  BadTable{"vocabulary_size: 0"},
  BadTable{"total: 0"},
  BadTable{"total: 3 vocabulary_size: 1 counts { key: 1 count: 2 }"},
  BadTable{"total: 2 vocabulary_size: 2 counts { key: 1 count: 2 }"},
  BadTable{"total: 2 vocabulary_size: 2 counts { key: 1 count: 2 } counts { key: 2 count: 0 }"},
  BadTable{"total: 2 vocabulary_size: 1 counts { key: 1 count: 1 } counts { key: 1 count: 1 }"},
  BadTable{"total: 1 vocabulary_size: 2 counts { key: 1 count: 18446744073709551615 } counts { key: 2 count: 2 }"}
));

}  // namespace
}  // namespace molll

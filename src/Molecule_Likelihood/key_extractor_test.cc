// Tests for fingerprint parsing and molecule records.

#include <optional>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "Molecule_Likelihood/key_extractor.h"

namespace molll {
namespace {

using testing::ElementsAre;
using testing::IsEmpty;

TEST(TestCanonicalise, SortsAndMerges) {
  SparseFingerprint fp{{7, 1}, {3, 2}, {7, 4}, {5, 0}};
  ASSERT_TRUE(Canonicalise(fp));
  EXPECT_THAT(fp, ElementsAre(FeatureCount{3, 2}, FeatureCount{7, 5}));
  EXPECT_EQ(NumberFeatures(fp), 7u);
}

TEST(TestCanonicalise, Overflow) {
  SparseFingerprint fp{{1, 4000000000u}, {1, 4000000000u}};
  EXPECT_FALSE(Canonicalise(fp));
}

TEST(TestParseMoleculeRecord, IdAndText) {
  std::optional<MoleculeRecord> m = ParseMoleculeRecord("  mol1   12:1 13:2 \n");
  ASSERT_NE(m, std::nullopt);
  EXPECT_EQ(m->id, "mol1");
  EXPECT_EQ(m->text, "12:1 13:2");
}

TEST(TestParseMoleculeRecord, IdOnly) {
  std::optional<MoleculeRecord> m = ParseMoleculeRecord("mol1");
  ASSERT_NE(m, std::nullopt);
  EXPECT_EQ(m->id, "mol1");
  EXPECT_THAT(m->text, IsEmpty());
}

TEST(TestParseMoleculeRecord, Empty) {
  EXPECT_EQ(ParseMoleculeRecord("   "), std::nullopt);
}

class TestSvmlKeyExtractor : public testing::Test {
  protected:
    SvmlKeyExtractor _extractor;
};

TEST_F(TestSvmlKeyExtractor, Valid) {
  MoleculeRecord m{"id", "9:1 2:3\t9:2"};
  std::optional<SparseFingerprint> fp = _extractor.Extract(m);
  ASSERT_NE(fp, std::nullopt);
  EXPECT_THAT(*fp, ElementsAre(FeatureCount{2, 3}, FeatureCount{9, 3}));
}

TEST_F(TestSvmlKeyExtractor, EmptyIsValid) {
  MoleculeRecord m{"id", ""};
  std::optional<SparseFingerprint> fp = _extractor.Extract(m);
  ASSERT_NE(fp, std::nullopt);
  EXPECT_THAT(*fp, IsEmpty());
}

TEST_F(TestSvmlKeyExtractor, LargestBit) {
  MoleculeRecord m{"id", "4294967295:1"};
  std::optional<SparseFingerprint> fp = _extractor.Extract(m);
  ASSERT_NE(fp, std::nullopt);
  EXPECT_THAT(*fp, ElementsAre(FeatureCount{4294967295u, 1}));
}

TEST_F(TestSvmlKeyExtractor, Malformed) {
  EXPECT_EQ(_extractor.Extract(MoleculeRecord{"id", "12"}), std::nullopt);
  EXPECT_EQ(_extractor.Extract(MoleculeRecord{"id", "12:"}), std::nullopt);
  EXPECT_EQ(_extractor.Extract(MoleculeRecord{"id", "a:1"}), std::nullopt);
  EXPECT_EQ(_extractor.Extract(MoleculeRecord{"id", "1:0"}), std::nullopt);
  EXPECT_EQ(_extractor.Extract(MoleculeRecord{"id", "-1:1"}), std::nullopt);
  EXPECT_EQ(_extractor.Extract(MoleculeRecord{"id", "4294967296:1"}), std::nullopt);
}

TEST_F(TestSvmlKeyExtractor, Response) {
  MoleculeRecord m{"id", "1 5:2"};
  EXPECT_EQ(_extractor.Extract(m), std::nullopt);

  _extractor.set_skip_response(true);
  std::optional<SparseFingerprint> fp = _extractor.Extract(m);
  ASSERT_NE(fp, std::nullopt);
  EXPECT_THAT(*fp, ElementsAre(FeatureCount{5, 2}));

  // Only the first token can be a response.
  EXPECT_EQ(_extractor.Extract(MoleculeRecord{"id", "5:2 1"}), std::nullopt);
}

}  // namespace
}  // namespace molll

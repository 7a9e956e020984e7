// Tests for PropertyLL

#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "Molecule_Likelihood/likelihood_status.h"
#include "Molecule_Likelihood/property_ll.h"

namespace molll {
namespace {

using testing::DoubleEq;
using testing::ElementsAre;

std::string
TempFile(const std::string& name) {
  return testing::TempDir() + "/property_ll_test_" + name;
}

// Throws for molecules with text "throw".
class ThrowingPropertyExtractor : public PropertyExtractor {
  private:
    ColumnPropertyExtractor _columns;

  public:
    std::optional<std::vector<double>> Properties(const MoleculeRecord& m) const override {
      if (m.text == "throw") {
        throw std::runtime_error("cannot process " + m.id);
      }
      return _columns.Properties(m);
    }
};

static_assert(! std::is_constructible_v<PropertyLL, ColumnPropertyExtractor>);

const double kLogRoot2Pi = 0.5 * std::log(2.0 * std::numbers::pi);

TEST(TestPercentile, Linear) {
  const std::vector<double> v{0.0, 1.0, 2.0, 3.0, 4.0};
  EXPECT_DOUBLE_EQ(Percentile(v, 50.0), 2.0);
  EXPECT_DOUBLE_EQ(Percentile(v, 25.0), 1.0);
  EXPECT_DOUBLE_EQ(Percentile(v, 100.0), 4.0);

  const std::vector<double> two{0.0, 4.0};
  EXPECT_DOUBLE_EQ(Percentile(two, 25.0), 1.0);
  EXPECT_DOUBLE_EQ(Percentile(two, 75.0), 3.0);

  EXPECT_DOUBLE_EQ(Percentile({7.0}, 75.0), 7.0);
}

TEST(TestRobustScaler, MedianAndIqr) {
  RobustScaler scaler;
  scaler.Fit({{0.0, 5.0}, {4.0, 5.0}});
  EXPECT_THAT(scaler.centre(), ElementsAre(DoubleEq(2.0), DoubleEq(5.0)));
  // No spread in the second column.
  EXPECT_THAT(scaler.scale(), ElementsAre(DoubleEq(2.0), DoubleEq(1.0)));
  EXPECT_THAT(scaler.Transform({3.0, 7.0}), ElementsAre(DoubleEq(0.5), DoubleEq(2.0)));
}

TEST(TestColumnPropertyExtractor, Parse) {
  ColumnPropertyExtractor extractor;
  std::optional<std::vector<double>> x = extractor.Properties({"m", "1.5 -2 3e2"});
  ASSERT_NE(x, std::nullopt);
  EXPECT_THAT(*x, ElementsAre(1.5, -2.0, 300.0));

  EXPECT_EQ(extractor.Properties({"m", "1.5 abc"}), std::nullopt);
}

class TestPropertyLL : public testing::Test {
  protected:
    ColumnPropertyExtractor _extractor;
    PropertyLLConfig _config;
};

TEST_F(TestPropertyLL, Defaults) {
  PropertyLL ll(_extractor);
  EXPECT_EQ(ll.kind(), PROP_LL);
  EXPECT_THAT(ll.descriptor(), ElementsAre("MolWt"));
  EXPECT_DOUBLE_EQ(ll.bandwidth(), 0.1);
}

TEST_F(TestPropertyLL, NoSamples) {
  PropertyLL ll(_extractor);
  EXPECT_EQ(ll.CalculateLL({"m", "300"}), std::nullopt);
  EXPECT_TRUE(std::isnan(ll.CalculateLLs({{"m", "300"}})[0]));
}

TEST_F(TestPropertyLL, SingleSample) {
  PropertyLL ll(_extractor);
  ll.AnalyzeDataset({{"a", "300"}});

  const double at_sample = -std::log(0.1) - kLogRoot2Pi;
  EXPECT_NEAR(*ll.CalculateLL({"q", "300"}), at_sample, 1.0e-10);
  // One bandwidth away, scale is 1.
  EXPECT_NEAR(*ll.CalculateLL({"q", "300.1"}), at_sample - 0.5, 1.0e-10);
}

TEST_F(TestPropertyLL, TwoSamples) {
  PropertyLL ll(_extractor);
  ll.AnalyzeDataset({{"a", "0"}, {"b", "4"}});

  // Scaled samples are -1 and 1, the query is at 0.
  const double expected = -50.0 - std::log(0.1) - kLogRoot2Pi;
  EXPECT_NEAR(*ll.CalculateLL({"q", "2"}), expected, 1.0e-10);
  EXPECT_GT(*ll.CalculateLL({"q", "0"}), *ll.CalculateLL({"q", "2"}));
}

TEST_F(TestPropertyLL, Additive) {
  PropertyLL together(_extractor);
  together.AnalyzeDataset({{"a", "1"}, {"b", "2"}, {"c", "5"}});

  PropertyLL separate(_extractor);
  separate.AnalyzeDataset({{"a", "1"}});
  separate.AnalyzeDataset({{"b", "2"}, {"c", "5"}});

  EXPECT_EQ(together.number_samples(), 3u);
  EXPECT_EQ(*together.CalculateLL({"q", "3"}), *separate.CalculateLL({"q", "3"}));
}

TEST_F(TestPropertyLL, InvalidMolecules) {
  _config.add_descriptor_name("MolWt");
  _config.add_descriptor_name("TPSA");
  PropertyLL ll(_extractor);
  ASSERT_TRUE(ll.Initialise(_config).ok());

  const AnalysisSummary summary = ll.AnalyzeDataset({{"ok", "300 40"}, {"short", "300"}, {"bad", "x 1"},
                                                     {"inf", "inf 2"}});
  EXPECT_EQ(summary.molecules_processed, 1);
  EXPECT_EQ(summary.molecules_skipped, 3);
  EXPECT_THAT(summary.failed_ids, ElementsAre("short", "bad", "inf"));

  EXPECT_EQ(ll.CalculateLL({"short", "300"}), std::nullopt);
  EXPECT_NE(ll.CalculateLL({"ok", "301 41"}), std::nullopt);
}

TEST_F(TestPropertyLL, DescriptorNamesStored) {
  _config.add_descriptor_name("MolWt");
  _config.add_descriptor_name("TPSA");
  PropertyLL ll(_extractor);
  ASSERT_TRUE(ll.Initialise(_config).ok());
  ll.AnalyzeDataset({{"a", "300 40"}});

  LikelihoodModelData proto;
  ll.ToProto(proto);
  EXPECT_THAT(proto.property_model().descriptor_name(), ElementsAre("MolWt", "TPSA"));
  ASSERT_EQ(proto.property_model().sample_size(), 1);
  EXPECT_THAT(proto.property_model().sample(0).value(), ElementsAre(300.0, 40.0));

  PropertyLL restored(_extractor);
  ASSERT_TRUE(restored.BuildFromProto(proto).ok());
  EXPECT_THAT(restored.descriptor(), ElementsAre("MolWt", "TPSA"));
}

TEST(TestPropertyLLExtractorFailure, ThrowingExtractorSkipped) {
  ThrowingPropertyExtractor extractor;
  PropertyLL ll(extractor);

  const AnalysisSummary summary = ll.AnalyzeDataset({{"a", "300"}, {"b", "throw"}, {"c", "250"}});
  EXPECT_EQ(summary.molecules_processed, 2);
  EXPECT_EQ(summary.molecules_skipped, 1);
  EXPECT_THAT(summary.failed_ids, ElementsAre("b"));
  EXPECT_EQ(ll.number_samples(), 2u);

  const std::vector<double> result = ll.CalculateLLs({{"a", "300"}, {"b", "throw"}});
  ASSERT_EQ(result.size(), 2u);
  EXPECT_TRUE(std::isfinite(result[0]));
  EXPECT_TRUE(std::isnan(result[1]));
}

TEST_F(TestPropertyLL, InvalidConfig) {
  PropertyLL ll(_extractor);
  _config.set_bandwidth(0.0);
  EXPECT_TRUE(IsInvalidInput(ll.Initialise(_config)));
  EXPECT_DOUBLE_EQ(ll.bandwidth(), 0.1);

  _config.set_bandwidth(0.5);
  ll.AnalyzeDataset({{"a", "1"}});
  _config.add_descriptor_name("MolWt");
  _config.add_descriptor_name("TPSA");
  EXPECT_TRUE(IsInvalidInput(ll.Initialise(_config)));
  EXPECT_THAT(ll.descriptor(), ElementsAre("MolWt"));
}

TEST_F(TestPropertyLL, KindMismatch) {
  PropertyLL ll(_extractor);
  ll.AnalyzeDataset({{"a", "1"}});

  LikelihoodModelData proto;
  ll.ToProto(proto);
  proto.set_model_kind(ATOM_LL);
  PropertyLL other(_extractor);
  EXPECT_TRUE(IsCorruptFormat(other.BuildFromProto(proto)));
  EXPECT_EQ(other.number_samples(), 0u);
}

TEST_F(TestPropertyLL, BadSample) {
  PropertyLL ll(_extractor);
  ll.AnalyzeDataset({{"a", "1"}, {"b", "2"}});

  LikelihoodModelData proto;
  ll.ToProto(proto);
  proto.mutable_property_model()->mutable_sample(1)->add_value(3.0);

  PropertyLL other(_extractor);
  other.AnalyzeDataset({{"c", "7"}});
  EXPECT_TRUE(IsCorruptFormat(other.BuildFromProto(proto)));
  EXPECT_EQ(other.number_samples(), 1u);
}

class TestPropertyLLPersistence : public testing::TestWithParam<std::string> {
  protected:
    ColumnPropertyExtractor _extractor;
};

TEST_P(TestPropertyLLPersistence, RoundTrip) {
  const std::string fname = TempFile("round_trip" + GetParam());

  PropertyLLConfig config;
  config.add_descriptor_name("MolWt");
  config.add_descriptor_name("TPSA");
  config.set_bandwidth(0.3);

  PropertyLL ll(_extractor);
  ASSERT_TRUE(ll.Initialise(config).ok());
  ll.AnalyzeDataset({{"a", "301.25 40.5"}, {"b", "180.16 63.6"}, {"c", "46.07 20.23"}});
  absl::Status status = ll.Save(fname);
  ASSERT_TRUE(status.ok()) << status;

  PropertyLL restored(_extractor);
  status = restored.Load(fname);
  ASSERT_TRUE(status.ok()) << status;

  EXPECT_THAT(restored.descriptor(), ElementsAre("MolWt", "TPSA"));
  EXPECT_EQ(restored.bandwidth(), 0.3);
  EXPECT_EQ(restored.number_samples(), 3u);

  const std::vector<MoleculeRecord> query = {{"q1", "200 50"}, {"q2", "300 40"}, {"q3", "bad"}};
  const std::vector<double> expected = ll.CalculateLLs(query);
  const std::vector<double> actual = restored.CalculateLLs(query);
  ASSERT_EQ(actual.size(), 3u);
  EXPECT_EQ(actual[0], expected[0]);
  EXPECT_EQ(actual[1], expected[1]);
  EXPECT_TRUE(std::isnan(actual[2]));
}

INSTANTIATE_TEST_SUITE_P(TestPropertyLLPersistence, TestPropertyLLPersistence,
  testing::Values(".textproto", ".json"));

}  // namespace
}  // namespace molll

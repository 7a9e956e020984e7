#ifndef MOLECULE_LIKELIHOOD_PROPERTY_LL_H_
#define MOLECULE_LIKELIHOOD_PROPERTY_LL_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"

#include "Molecule_Likelihood/likelihood.pb.h"
#include "Molecule_Likelihood/likelihood_model.h"
#include "Molecule_Likelihood/property_extractor.h"

namespace molll {

// Per descriptor centre and scale from the median and inter quartile
// range of a set of samples. Descriptors with no spread get scale 1.
class RobustScaler {
  private:
    std::vector<double> _centre;
    std::vector<double> _scale;

  public:
    // `samples` must all have the same, non zero, dimension.
    void Fit(const std::vector<std::vector<double>>& samples);

    const std::vector<double>& centre() const {
      return _centre;
    }
    const std::vector<double>& scale() const {
      return _scale;
    }

    std::vector<double> Transform(const std::vector<double>& x) const;
};

// Linearly interpolated percentile, 0 <= p <= 100, of a non empty
// sorted vector.
double Percentile(const std::vector<double>& sorted, double p);

// Log likelihood of a molecule from a Gaussian kernel density estimate
// over robust scaled molecular properties of a training set.
class PropertyLL : public LikelihoodModel {
  private:
    // Not owned, must outlive this object.
    const PropertyExtractor* _property_extractor;

    std::vector<std::string> _descriptor;

    double _bandwidth;

    // Unscaled property vectors of every molecule analyzed.
    std::vector<std::vector<double>> _sample;

    // Derived from _sample.
    RobustScaler _scaler;
    std::vector<std::vector<double>> _scaled;

    int _verbose;

  // private functions

    int _Valid(const std::vector<double>& x) const;
    // An extractor that throws is treated as failing on `m`.
    std::optional<std::vector<double>> _Properties(const MoleculeRecord& m) const;
    void _UpdateDensity();

  public:
    static constexpr double kDefaultBandwidth = 0.1;
    static constexpr char kDefaultDescriptor[] = "MolWt";

    explicit PropertyLL(const PropertyExtractor& property_extractor);
    explicit PropertyLL(PropertyExtractor&& property_extractor) = delete;

    // Fields not set in `config` take default values. The number of
    // descriptors cannot change once samples have been accumulated.
    // Returns kInvalidArgument, with nothing changed, on failure.
    absl::Status Initialise(const PropertyLLConfig& config);

    void set_verbose(int s) {
      _verbose = s;
    }

    const std::vector<std::string>& descriptor() const {
      return _descriptor;
    }
    double bandwidth() const {
      return _bandwidth;
    }
    size_t number_samples() const {
      return _sample.size();
    }
    const RobustScaler& scaler() const {
      return _scaler;
    }

    ModelKind kind() const override {
      return PROP_LL;
    }

    AnalysisSummary AnalyzeDataset(const std::vector<MoleculeRecord>& molecules) override;

    // Log density at the unscaled property vector `x`. nullopt if there
    // are no samples, or `x` has the wrong dimension or non finite values.
    std::optional<double> LogDensity(const std::vector<double>& x) const;

    std::optional<double> CalculateLL(const MoleculeRecord& m) const override;

    void ToProto(LikelihoodModelData& proto) const override;

    absl::Status BuildFromProto(const LikelihoodModelData& proto) override;
};

}  // namespace molll

#endif  // MOLECULE_LIKELIHOOD_PROPERTY_LL_H_

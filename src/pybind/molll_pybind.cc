// Python bindings for the likelihood models.
// Molecules are passed as strings, typically smiles. The fingerprint
// or property calculation is done by a Python callable supplied by the
// caller.

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "pybind11/pybind11.h"
// to convert C++ STL containers to python list
#include "pybind11/stl.h"

namespace py = pybind11;

#include "Molecule_Likelihood/fingerprint_ll.h"
#include "Molecule_Likelihood/key_extractor.h"
#include "Molecule_Likelihood/likelihood_status.h"
#include "Molecule_Likelihood/property_ll.h"

namespace {

using molll::FeatureCount;
using molll::MoleculeRecord;
using molll::SparseFingerprint;

// Calls a Python function that takes a string and returns a dict
// {bit: count}, or None if the molecule cannot be processed.
class CallbackKeyExtractor : public molll::KeyExtractor {
  private:
    py::function _fn;

  public:
    explicit CallbackKeyExtractor(py::function fn) : _fn(std::move(fn)) {
    }

    std::optional<SparseFingerprint> Extract(const MoleculeRecord& m) const override;
};

std::optional<SparseFingerprint>
CallbackKeyExtractor::Extract(const MoleculeRecord& m) const {
  py::object fp;
  try {
    fp = _fn(m.text);
  } catch (const py::error_already_set& e) {
    std::cerr << "CallbackKeyExtractor::Extract:extractor raised for '" << m.text << "' " << e.what() << '\n';
    return std::nullopt;
  }
  if (fp.is_none()) {
    return std::nullopt;
  }

  SparseFingerprint result;
  try {
    for (auto [bit, count] : fp.cast<py::dict>()) {
      result.push_back(FeatureCount{bit.cast<uint32_t>(), count.cast<uint32_t>()});
    }
  } catch (const py::cast_error& e) {
    std::cerr << "CallbackKeyExtractor::Extract:invalid fingerprint for '" << m.text << "' " << e.what() << '\n';
    return std::nullopt;
  }

  if (! molll::Canonicalise(result)) {
    return std::nullopt;
  }

  return result;
}

// Calls a Python function that takes a string and returns a list of
// floats, or None.
class CallbackPropertyExtractor : public molll::PropertyExtractor {
  private:
    py::function _fn;

  public:
    explicit CallbackPropertyExtractor(py::function fn) : _fn(std::move(fn)) {
    }

    std::optional<std::vector<double>> Properties(const MoleculeRecord& m) const override;
};

std::optional<std::vector<double>>
CallbackPropertyExtractor::Properties(const MoleculeRecord& m) const {
  py::object values;
  try {
    values = _fn(m.text);
  } catch (const py::error_already_set& e) {
    std::cerr << "CallbackPropertyExtractor::Properties:extractor raised for '" << m.text << "' " << e.what() << '\n';
    return std::nullopt;
  }
  if (values.is_none()) {
    return std::nullopt;
  }

  try {
    return values.cast<std::vector<double>>();
  } catch (const py::cast_error& e) {
    std::cerr << "CallbackPropertyExtractor::Properties:invalid properties for '" << m.text << "' " << e.what() << '\n';
    return std::nullopt;
  }
}

std::vector<MoleculeRecord>
ToRecords(const std::vector<std::string>& smiles) {
  std::vector<MoleculeRecord> result;
  result.reserve(smiles.size());
  for (const std::string& s : smiles) {
    result.push_back(MoleculeRecord{s, s});
  }

  return result;
}

// Raised for a model file that cannot be used.
class CorruptFormatException : public std::runtime_error {
  public:
    explicit CorruptFormatException(const std::string& msg) : std::runtime_error(msg) {
    }
};

class ModelIOException : public std::runtime_error {
  public:
    explicit ModelIOException(const std::string& msg) : std::runtime_error(msg) {
    }
};

void
ThrowIfError(const absl::Status& status) {
  if (status.ok()) {
    return;
  }

  const std::string msg(status.message());
  if (molll::IsCorruptFormat(status)) {
    throw CorruptFormatException(msg);
  }
  if (molll::IsIOError(status)) {
    throw ModelIOException(msg);
  }

  throw py::value_error(msg);
}

py::dict
SummaryToDict(const molll::AnalysisSummary& summary) {
  py::dict result;
  result["molecules_processed"] = summary.molecules_processed;
  result["molecules_skipped"] = summary.molecules_skipped;
  result["failed"] = summary.failed_ids;
  return result;
}

template <typename Model>
void
InitialiseFingerprintLL(Model& model, double alpha, double pseudo_count, uint64_t estimated_keyspace,
                        uint32_t radius) {
  molll::FingerprintLLConfig config;
  config.set_alpha(alpha);
  config.set_radius(radius);
  config.mutable_smoother()->set_pseudo_count(pseudo_count);
  config.mutable_smoother()->set_estimated_keyspace(estimated_keyspace);
  ThrowIfError(model.Initialise(config));
}

// The methods common to every model.
template <typename Model, typename Class>
void
AddModelMethods(Class& c) {
  c.def("analyze_dataset",
      [](Model& model, const std::vector<std::string>& smiles) {
        return SummaryToDict(model.AnalyzeDataset(ToRecords(smiles)));
      },
      "Gather statistics from a list of molecules"
    )
    .def("calculate_ll",
      [](const Model& model, const std::string& smiles) {
        return model.CalculateLL(MoleculeRecord{smiles, smiles});
      },
      "Log likelihood of a molecule, None if it cannot be processed"
    )
    .def("calculate_lls",
      [](const Model& model, const std::vector<std::string>& smiles) {
        return model.CalculateLLs(ToRecords(smiles));
      },
      "Log likelihood of each molecule, nan for molecules that cannot be processed"
    )
    .def("save",
      [](const Model& model, const std::string& fname) {
        ThrowIfError(model.Save(fname));
      },
      "Write the model. JSON if the name ends in .json"
    )
    .def("load",
      [](Model& model, const std::string& fname) {
        ThrowIfError(model.Load(fname));
      },
      "Replace the model with what is in a file"
    )
  ;
}

template <typename Model>
void
AddFingerprintLL(py::module_& m, const char* name) {
  py::class_<Model> c(m, name);
  c.def(py::init<const molll::KeyExtractor&>(), py::keep_alive<1, 2>())
    .def(py::init([](const molll::KeyExtractor& extractor, double alpha, double pseudo_count,
                     uint64_t estimated_keyspace, uint32_t radius) {
        auto result = std::make_unique<Model>(extractor);
        InitialiseFingerprintLL(*result, alpha, pseudo_count, estimated_keyspace, radius);
        return result;
      }),
      py::arg("extractor"), py::kw_only(),
      py::arg("alpha") = molll::FingerprintLL::kDefaultAlpha,
      py::arg("pseudo_count") = molll::Smoother::kDefaultPseudoCount,
      py::arg("estimated_keyspace") = molll::Smoother::kDefaultEstimatedKeyspace,
      py::arg("radius") = molll::FingerprintLL::kDefaultRadius,
      py::keep_alive<1, 2>()
    )
    .def_property_readonly("alpha", &Model::alpha)
    .def_property_readonly("radius", &Model::radius)
    .def_property_readonly("total", [](const Model& model) {
        return model.frequency_table().total();
      })
    .def_property_readonly("vocabulary_size", [](const Model& model) {
        return model.frequency_table().vocabulary_size();
      })
    .def("set_verbose", &Model::set_verbose)
  ;
  AddModelMethods<Model>(c);
}

}  // namespace

PYBIND11_MODULE(molll, m)
{
  py::register_exception<CorruptFormatException>(m, "CorruptFormatError", PyExc_ValueError);
  py::register_exception<ModelIOException>(m, "ModelIOError", PyExc_OSError);

  py::class_<molll::KeyExtractor>(m, "KeyExtractor");

  py::class_<molll::SvmlKeyExtractor, molll::KeyExtractor>(m, "SvmlKeyExtractor")
    .def(py::init<>())
    .def("set_skip_response", &molll::SvmlKeyExtractor::set_skip_response, "Ignore a leading response column")
  ;

  py::class_<CallbackKeyExtractor, molll::KeyExtractor>(m, "CallbackKeyExtractor")
    .def(py::init<py::function>(), "Function taking a string and returning {bit: count} or None")
  ;

  py::class_<molll::PropertyExtractor>(m, "PropertyExtractor");

  py::class_<molll::ColumnPropertyExtractor, molll::PropertyExtractor>(m, "ColumnPropertyExtractor")
    .def(py::init<>())
  ;

  py::class_<CallbackPropertyExtractor, molll::PropertyExtractor>(m, "CallbackPropertyExtractor")
    .def(py::init<py::function>(), "Function taking a string and returning a list of float or None")
  ;

  AddFingerprintLL<molll::AtomLL>(m, "AtomLL");
  AddFingerprintLL<molll::MolLL>(m, "MolLL");

  py::class_<molll::PropertyLL> prop_ll(m, "PropLL");
  prop_ll.def(py::init([](const molll::PropertyExtractor& extractor, const std::vector<std::string>& descriptors,
                          double bandwidth) {
        auto result = std::make_unique<molll::PropertyLL>(extractor);
        molll::PropertyLLConfig config;
        for (const std::string& d : descriptors) {
          config.add_descriptor_name(d);
        }
        config.set_bandwidth(bandwidth);
        ThrowIfError(result->Initialise(config));
        return result;
      }),
      py::arg("extractor"), py::kw_only(),
      py::arg("desc_list") = std::vector<std::string>{molll::PropertyLL::kDefaultDescriptor},
      py::arg("bandwidth") = molll::PropertyLL::kDefaultBandwidth,
      py::keep_alive<1, 2>()
    )
    .def_property_readonly("desc_list", &molll::PropertyLL::descriptor)
    .def_property_readonly("bandwidth", &molll::PropertyLL::bandwidth)
    .def("set_verbose", &molll::PropertyLL::set_verbose)
  ;
  AddModelMethods<molll::PropertyLL>(prop_ll);
}

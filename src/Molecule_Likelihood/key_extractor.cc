#include <algorithm>
#include <iostream>
#include <limits>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"

#include "Molecule_Likelihood/key_extractor.h"

namespace molll {

using std::cerr;

int
Canonicalise(SparseFingerprint& fp) {
  std::sort(fp.begin(), fp.end(), [](const FeatureCount& f1, const FeatureCount& f2) {
    return f1.bit < f2.bit;
  });

  size_t ndx = 0;
  for (size_t i = 0; i < fp.size(); ++i) {
    if (fp[i].count == 0) {
      continue;
    }

    if (ndx > 0 && fp[ndx - 1].bit == fp[i].bit) {
      const uint64_t sum = static_cast<uint64_t>(fp[ndx - 1].count) + fp[i].count;
      if (sum > std::numeric_limits<uint32_t>::max()) {
        return 0;
      }
      fp[ndx - 1].count = static_cast<uint32_t>(sum);
      continue;
    }

    fp[ndx] = fp[i];
    ++ndx;
  }

  fp.resize(ndx);

  return 1;
}

uint64_t
NumberFeatures(const SparseFingerprint& fp) {
  uint64_t result = 0;
  for (const FeatureCount& f : fp) {
    result += f.count;
  }

  return result;
}

std::optional<MoleculeRecord>
ParseMoleculeRecord(absl::string_view line) {
  line = absl::StripAsciiWhitespace(line);
  if (line.empty()) {
    return std::nullopt;
  }

  MoleculeRecord result;

  const auto space = std::find_if(line.begin(), line.end(), absl::ascii_isspace);
  result.id = std::string(line.begin(), space);
  result.text = std::string(absl::StripLeadingAsciiWhitespace(
                  line.substr(static_cast<size_t>(space - line.begin()))));

  return result;
}

SvmlKeyExtractor::SvmlKeyExtractor() {
  _skip_response = false;
  _verbose = 0;
}

std::optional<SparseFingerprint>
SvmlKeyExtractor::Extract(const MoleculeRecord& m) const {
  SparseFingerprint result;

  bool first_token = true;
  for (absl::string_view token : absl::StrSplit(m.text, absl::ByAnyChar(" \t"), absl::SkipEmpty())) {
    const bool is_first = first_token;
    first_token = false;

    const auto colon = token.find(':');
    if (colon == absl::string_view::npos) {
      if (is_first && _skip_response) {
        continue;
      }
      if (_verbose) {
        cerr << "SvmlKeyExtractor::Extract:invalid token '" << token << "' in " << m.id << '\n';
      }
      return std::nullopt;
    }

    FeatureCount f;
    if (! absl::SimpleAtoi(token.substr(0, colon), &f.bit) ||
        ! absl::SimpleAtoi(token.substr(colon + 1), &f.count) ||
        f.count == 0) {
      if (_verbose) {
        cerr << "SvmlKeyExtractor::Extract:invalid bit:count '" << token << "' in " << m.id << '\n';
      }
      return std::nullopt;
    }

    result.push_back(f);
  }

  if (! Canonicalise(result)) {
    if (_verbose) {
      cerr << "SvmlKeyExtractor::Extract:count overflow in " << m.id << '\n';
    }
    return std::nullopt;
  }

  return result;
}

}  // namespace molll

// src/model/characterization.cpp

#include "emx/model/characterization.h"

#include <algorithm>
#include <sstream>

namespace emx {

std::vector<usize> DifferingParameterIndices(const std::vector<CharacterizationResult>& results) {
  std::vector<usize> out;
  if (results.empty()) return out;

  // Results of one batch share the declared parameter list; positions missing
  // from a shorter list count as differing.
  usize n = 0;
  for (const auto& r : results) n = std::max(n, r.params.size());

  for (usize i = 0; i < n; ++i) {
    const std::string* first = (i < results.front().params.size()) ? &results.front().params[i] : nullptr;
    for (usize k = 1; k < results.size(); ++k) {
      const auto& p = results[k].params;
      const std::string* cur = (i < p.size()) ? &p[i] : nullptr;
      const bool same = (first && cur) ? (*first == *cur) : (first == cur);
      if (!same) {
        out.push_back(i);
        break;
      }
    }
  }
  return out;
}

std::string ModelLabel(const CharacterizationResult& result, const std::vector<usize>& indices) {
  std::ostringstream oss;
  oss << ToString(result.module);
  for (usize i : indices) {
    if (i < result.params.size()) oss << '_' << result.params[i];
  }
  return oss.str();
}

}  // namespace emx

#pragma once

#include "catalog.hpp"
#include "config.hpp"
#include "types.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace whodat {

class QuestionSelector {
public:
  // Attributes whose weights vary less than this across the window cannot
  // separate the candidates in it.
  static constexpr double kResolvedVariance = 1e-9;

  QuestionSelector();
  explicit QuestionSelector(const EngineConfig& config);

  // Picks the unasked question whose attribute best splits the top-ranked
  // candidates. Returns nullptr when nothing eligible is left.
  const Question* next(const Catalog& catalog, const std::set<std::string>& asked,
                       const ScoreMap& scores, const std::set<std::string>& excluded) const;

  std::size_t window_for(std::size_t remaining) const;

  // Population variance of attribute_key's weights across the window.
  static double discrimination(const Catalog& catalog, const std::string& attribute_key,
                               const std::vector<RankedEntity>& window);

private:
  std::size_t window_size_;
  double window_fraction_;
};

} // namespace whodat

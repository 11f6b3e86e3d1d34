#pragma once

#include "catalog.hpp"
#include "types.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace whodat::scoring {

inline constexpr double kBaselineScore = 0.0;

// Score change for an entity whose attribute weight is attribute_weight when
// the player answers answer_weight. +1 on exact agreement, -1 on full
// disagreement, linear in between.
inline double contribution(double attribute_weight, double answer_weight) {
  const double distance = attribute_weight > answer_weight ? attribute_weight - answer_weight
                                                           : answer_weight - attribute_weight;
  return 1.0 - 2.0 * detail::clip01(distance);
}

ScoreMap initialize(const Catalog& catalog);

// Applies one graded answer to every non-excluded entity. Entities missing
// from scores are an invariant violation and raise std::out_of_range.
void update(ScoreMap& scores, const Catalog& catalog, const std::string& attribute_key,
            double answer_weight, const std::set<std::string>& excluded);

// Descending by score, ties by ascending entity id. top_n == 0 returns all.
std::vector<RankedEntity> rank(const ScoreMap& scores, const std::set<std::string>& excluded,
                               std::size_t top_n = 0);

// Softmax share of entity_id among the non-excluded entities; 0 when the
// entity is excluded or unknown.
double certainty(const ScoreMap& scores, const std::set<std::string>& excluded,
                 const std::string& entity_id);

std::vector<Candidate> top_candidates(const ScoreMap& scores,
                                      const std::set<std::string>& excluded,
                                      const Catalog& catalog, std::size_t top_n);

} // namespace whodat::scoring

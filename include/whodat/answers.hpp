#pragma once

#include <array>
#include <string>
#include <string_view>

namespace whodat {

struct GradedAnswer {
  std::string_view label;
  double weight;
};

inline constexpr std::array<GradedAnswer, 4> kGradedAnswers = {{
    {"no", 0.0},
    {"probably no", 0.25},
    {"probably yes", 0.75},
    {"yes", 1.0},
}};

bool is_canonical_weight(double weight);

// Case-insensitive; surrounding whitespace is ignored. Throws InvalidAnswer.
double answer_weight_from_label(std::string_view label);

std::string label_for_weight(double weight);

} // namespace whodat

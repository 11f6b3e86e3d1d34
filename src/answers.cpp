#include "whodat/answers.hpp"

#include "whodat/errors.hpp"

#include <cctype>
#include <sstream>

namespace whodat {
namespace {

std::string normalise_label(std::string_view label) {
  std::size_t begin = 0;
  std::size_t end = label.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(label[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(label[end - 1]))) {
    --end;
  }
  std::string out;
  out.reserve(end - begin);
  for (std::size_t i = begin; i < end; ++i) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(label[i]))));
  }
  return out;
}

std::string accepted_labels() {
  std::ostringstream oss;
  for (std::size_t i = 0; i < kGradedAnswers.size(); ++i) {
    if (i > 0) {
      oss << ", ";
    }
    oss << "'" << kGradedAnswers[i].label << "'";
  }
  return oss.str();
}

} // namespace

bool is_canonical_weight(double weight) {
  for (const auto& answer : kGradedAnswers) {
    if (answer.weight == weight) {
      return true;
    }
  }
  return false;
}

double answer_weight_from_label(std::string_view label) {
  const std::string normalised = normalise_label(label);
  for (const auto& answer : kGradedAnswers) {
    if (answer.label == normalised) {
      return answer.weight;
    }
  }
  throw InvalidAnswer("Invalid answer '" + std::string(label) + "'. Expected one of " +
                      accepted_labels());
}

std::string label_for_weight(double weight) {
  for (const auto& answer : kGradedAnswers) {
    if (answer.weight == weight) {
      return std::string(answer.label);
    }
  }
  throw InvalidAnswer("Answer weight " + std::to_string(weight) +
                      " is not one of the graded levels");
}

} // namespace whodat

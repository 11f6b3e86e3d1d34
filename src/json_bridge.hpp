#pragma once

#include "../include/whodat/types.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace whodat::bridge {

nlohmann::json to_json(const Candidate& candidate);
nlohmann::json to_json(const std::vector<Candidate>& candidates);

nlohmann::json to_json(const QuestionPrompt& prompt);
nlohmann::json to_json(const GuessPrompt& guess);
nlohmann::json to_json(const Exhausted& exhausted);
nlohmann::json to_json(const Next& next);

nlohmann::json won_payload(const std::string& guess_name,
                           const std::vector<Candidate>& top_candidates);

} // namespace whodat::bridge

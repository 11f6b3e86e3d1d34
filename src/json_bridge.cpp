#include "json_bridge.hpp"

#include <variant>

namespace whodat::bridge {

nlohmann::json to_json(const Candidate& candidate) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = candidate.entity_id;
  json["name"] = candidate.name;
  json["score"] = candidate.score;
  json["certainty"] = candidate.certainty;
  return json;
}

nlohmann::json to_json(const std::vector<Candidate>& candidates) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& candidate : candidates) {
    arr.push_back(to_json(candidate));
  }
  return arr;
}

nlohmann::json to_json(const QuestionPrompt& prompt) {
  nlohmann::json json = nlohmann::json::object();
  json["status"] = "asking";
  json["question_id"] = prompt.question_id;
  json["question"] = prompt.text;
  json["attribute_key"] = prompt.attribute_key;
  json["turn"] = prompt.turn;
  return json;
}

nlohmann::json to_json(const GuessPrompt& guess) {
  nlohmann::json json = nlohmann::json::object();
  json["status"] = "guessing";
  json["guess"] = guess.name;
  json["guess_id"] = guess.entity_id;
  json["certainty"] = guess.certainty;
  json["top_candidates"] = to_json(guess.top_candidates);
  return json;
}

nlohmann::json to_json(const Exhausted& exhausted) {
  nlohmann::json json = nlohmann::json::object();
  json["status"] = "finished_lost";
  json["message"] = "I don't know this one. You win!";
  json["turn_count"] = exhausted.turn_count;
  json["excluded_count"] = exhausted.excluded_count;
  json["top_candidates"] = nlohmann::json::array();
  return json;
}

nlohmann::json to_json(const Next& next) {
  return std::visit([](const auto& value) -> nlohmann::json { return to_json(value); }, next);
}

nlohmann::json won_payload(const std::string& guess_name,
                           const std::vector<Candidate>& top_candidates) {
  nlohmann::json json = nlohmann::json::object();
  json["status"] = "finished_won";
  json["message"] = "Great! I knew it was " + guess_name + "!";
  json["guess"] = guess_name;
  json["certainty"] = 1.0;
  json["top_candidates"] = to_json(top_candidates);
  return json;
}

} // namespace whodat::bridge

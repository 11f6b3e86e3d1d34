#include "whodat/catalog.hpp"
#include "whodat/config.hpp"
#include "whodat/errors.hpp"
#include "whodat/game_engine.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

std::string ask_str(const std::string& prompt) {
  std::cout << prompt << "\n : " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer)) {
    throw std::runtime_error("input closed");
  }
  std::transform(answer.begin(), answer.end(), answer.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return answer;
}

bool ask_yn(const std::string& prompt) {
  while (true) {
    const std::string answer = ask_str(prompt + "\n(Enter 'yes' or 'no')");
    if (answer == "yes" || answer == "y") return true;
    if (answer == "no" || answer == "n") return false;
  }
}

void print_candidates(const std::vector<whodat::Candidate>& candidates) {
  for (const auto& candidate : candidates) {
    std::cout << "  " << std::setw(24) << std::left << candidate.name << std::right
              << std::fixed << std::setprecision(1) << candidate.certainty * 100.0 << "%\n";
  }
}

// Round-trips the state through the codec after every move, the way a
// stateless service would between requests.
whodat::GameState checkpoint(const whodat::GameEngine& engine, const whodat::GameState& state) {
  return engine.deserialize(engine.serialize(state));
}

int play(const whodat::GameEngine& engine) {
  auto start = engine.new_game();
  whodat::GameState state = start.state;
  whodat::Next next = start.next;

  while (true) {
    state = checkpoint(engine, state);

    if (const auto* question = std::get_if<whodat::QuestionPrompt>(&next)) {
      const std::string prompt = "Q" + std::to_string(question->turn) + ": " + question->text +
                                 "\n(yes / probably yes / probably no / no)";
      try {
        next = engine.answer(state, question->attribute_key, ask_str(prompt));
      } catch (const whodat::InvalidAnswer& error) {
        std::cout << error.what() << "\n";
      }
      continue;
    }

    if (const auto* guess = std::get_if<whodat::GuessPrompt>(&next)) {
      std::cout << "I think of:\n";
      print_candidates(guess->top_candidates);
      if (ask_yn("Is it " + guess->name + "?")) {
        auto candidates = engine.confirm_guess(state, guess->entity_id);
        std::cout << "Great! I knew it was " << guess->name << "!\n";
        print_candidates(candidates);
        return 0;
      }
      next = engine.reject_guess(state, guess->entity_id);
      continue;
    }

    std::cout << "I don't know this one. You win!\n";
    return 0;
  }
}

} // namespace

int main(int argc, char** argv) {
  whodat::CatalogPaths paths = whodat::catalog_paths_from_env();
  if (argc == 3) {
    paths.entities = argv[1];
    paths.questions = argv[2];
  } else if (argc != 1) {
    std::cerr << "usage: " << argv[0] << " [entities.json questions.json]" << std::endl;
    return 2;
  }

  try {
    auto catalog = whodat::load_catalog(paths.entities, paths.questions);
    auto engine = whodat::make_engine(catalog);
    std::cout << "Think of someone from a list of " << catalog->entity_count()
              << " and I will try to guess who it is.\n";
    return play(*engine);
  } catch (const whodat::DatasetError& error) {
    std::cerr << "[catalog] " << error.what() << std::endl;
    return 1;
  } catch (const std::exception& error) {
    std::cerr << "[engine] " << error.what() << std::endl;
    return 1;
  }
}

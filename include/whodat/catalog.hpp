#pragma once

#include "types.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace whodat {

/**
 * Catalog holds the entities and questions a game is played over. It is
 * validated once on construction and never mutated afterwards, so a single
 * instance can be shared by every game in the process.
 */
class Catalog {
public:
  // Throws DatasetError on duplicate/empty ids, out-of-range weights,
  // an empty entity list, or a question probing an attribute no entity has.
  static Catalog load(std::vector<Entity> entities, std::vector<Question> questions);

  const std::vector<Entity>& entities() const { return entities_; }
  const std::vector<Question>& questions() const { return questions_; }
  std::size_t entity_count() const { return entities_.size(); }
  std::size_t question_count() const { return questions_.size(); }

  const Entity* find_entity(const std::string& id) const;
  const Entity* find_entity_by_name(std::string_view name) const;
  const Question* find_question(const std::string& id) const;

  bool has_attribute(const std::string& attribute_key) const;
  std::vector<const Question*> questions_for_attribute(const std::string& attribute_key) const;

private:
  Catalog() = default;

  std::vector<Entity> entities_;
  std::vector<Question> questions_;
  std::unordered_map<std::string, std::size_t> entity_index_;
  std::unordered_map<std::string, std::size_t> question_index_;
  std::unordered_map<std::string, std::vector<std::size_t>> attribute_questions_;
  std::unordered_map<std::string, std::size_t> attribute_entity_counts_;
};

std::vector<Entity> entities_from_json(const nlohmann::json& document);
std::vector<Question> questions_from_json(const nlohmann::json& document);

Catalog catalog_from_json(const nlohmann::json& entities, const nlohmann::json& questions);

std::shared_ptr<const Catalog> load_catalog(const std::filesystem::path& entities_path,
                                            const std::filesystem::path& questions_path);

} // namespace whodat

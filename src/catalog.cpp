#include "whodat/catalog.hpp"

#include "whodat/errors.hpp"
#include "debug.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace whodat {
namespace {

std::string json_to_string(const nlohmann::json& value, std::string_view field,
                           std::size_t index) {
  if (!value.is_string()) {
    throw DatasetError("Expected string for field '" + std::string(field) + "' in record " +
                       std::to_string(index));
  }
  return value.get<std::string>();
}

double json_to_weight(const nlohmann::json& value, const std::string& key, std::size_t index) {
  if (!value.is_number()) {
    throw DatasetError("Expected number for attribute '" + key + "' in record " +
                       std::to_string(index));
  }
  return value.get<double>();
}

nlohmann::json read_json_file(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    throw DatasetError("Catalog file not found at: " + path.string());
  }
  if (path.extension() != ".json") {
    throw DatasetError("Catalog file must be JSON: " + path.string());
  }
  std::ifstream stream(path);
  if (!stream) {
    throw DatasetError("Failed to open catalog file: " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  try {
    return nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error& error) {
    throw DatasetError("Malformed JSON in " + path.string() + ": " + error.what());
  }
}

} // namespace

Catalog Catalog::load(std::vector<Entity> entities, std::vector<Question> questions) {
  if (entities.empty()) {
    throw DatasetError("Catalog must contain at least one entity");
  }

  Catalog catalog;
  catalog.entities_ = std::move(entities);
  catalog.questions_ = std::move(questions);

  std::unordered_set<std::string> names;
  for (std::size_t i = 0; i < catalog.entities_.size(); ++i) {
    const auto& entity = catalog.entities_[i];
    if (entity.id.empty()) {
      throw DatasetError("Entity at index " + std::to_string(i) + " has an empty id");
    }
    if (!catalog.entity_index_.emplace(entity.id, i).second) {
      throw DatasetError("Duplicate entity id '" + entity.id + "'");
    }
    if (!names.insert(entity.name).second) {
      throw DatasetError("Duplicate entity name '" + entity.name + "'");
    }
    for (const auto& [key, weight] : entity.attributes) {
      if (!std::isfinite(weight) || weight < 0.0 || weight > 1.0) {
        throw DatasetError("Entity '" + entity.id + "' attribute '" + key +
                           "' weight must be within [0, 1]");
      }
      ++catalog.attribute_entity_counts_[key];
    }
  }

  for (std::size_t i = 0; i < catalog.questions_.size(); ++i) {
    const auto& question = catalog.questions_[i];
    if (question.id.empty()) {
      throw DatasetError("Question at index " + std::to_string(i) + " has an empty id");
    }
    if (!catalog.question_index_.emplace(question.id, i).second) {
      throw DatasetError("Duplicate question id '" + question.id + "'");
    }
    if (catalog.attribute_entity_counts_.count(question.attribute_key) == 0) {
      throw DatasetError("Question '" + question.id + "' probes attribute '" +
                         question.attribute_key + "' which no entity describes");
    }
    catalog.attribute_questions_[question.attribute_key].push_back(i);
  }

  detail::debug_log("catalog", "loaded " + std::to_string(catalog.entities_.size()) +
                                   " entities, " + std::to_string(catalog.questions_.size()) +
                                   " questions");
  return catalog;
}

const Entity* Catalog::find_entity(const std::string& id) const {
  auto it = entity_index_.find(id);
  return it == entity_index_.end() ? nullptr : &entities_[it->second];
}

const Entity* Catalog::find_entity_by_name(std::string_view name) const {
  for (const auto& entity : entities_) {
    if (entity.name == name) {
      return &entity;
    }
  }
  return nullptr;
}

const Question* Catalog::find_question(const std::string& id) const {
  auto it = question_index_.find(id);
  return it == question_index_.end() ? nullptr : &questions_[it->second];
}

bool Catalog::has_attribute(const std::string& attribute_key) const {
  return attribute_entity_counts_.count(attribute_key) != 0;
}

std::vector<const Question*> Catalog::questions_for_attribute(
    const std::string& attribute_key) const {
  std::vector<const Question*> out;
  auto it = attribute_questions_.find(attribute_key);
  if (it == attribute_questions_.end()) {
    return out;
  }
  out.reserve(it->second.size());
  for (std::size_t index : it->second) {
    out.push_back(&questions_[index]);
  }
  return out;
}

std::vector<Entity> entities_from_json(const nlohmann::json& document) {
  if (!document.is_array()) {
    throw DatasetError("Entity dataset must be a JSON array");
  }
  std::vector<Entity> entities;
  entities.reserve(document.size());
  for (std::size_t i = 0; i < document.size(); ++i) {
    const auto& record = document[i];
    if (!record.is_object()) {
      throw DatasetError("Entity record " + std::to_string(i) + " must be an object");
    }
    if (!record.contains("name")) {
      throw DatasetError("Entity record " + std::to_string(i) + " is missing 'name'");
    }
    Entity entity;
    entity.name = json_to_string(record["name"], "name", i);
    entity.id = record.contains("id") ? json_to_string(record["id"], "id", i) : entity.name;

    if (!record.contains("attributes") || !record["attributes"].is_object()) {
      throw DatasetError("Entity record " + std::to_string(i) +
                         " must have an 'attributes' object");
    }
    for (const auto& item : record["attributes"].items()) {
      entity.attributes.emplace(item.key(), json_to_weight(item.value(), item.key(), i));
    }
    entities.push_back(std::move(entity));
  }
  return entities;
}

std::vector<Question> questions_from_json(const nlohmann::json& document) {
  if (!document.is_array()) {
    throw DatasetError("Question dataset must be a JSON array");
  }
  std::vector<Question> questions;
  questions.reserve(document.size());
  for (std::size_t i = 0; i < document.size(); ++i) {
    const auto& record = document[i];
    if (!record.is_object()) {
      throw DatasetError("Question record " + std::to_string(i) + " must be an object");
    }
    for (const char* field : {"id", "attribute_key"}) {
      if (!record.contains(field)) {
        throw DatasetError("Question record " + std::to_string(i) + " is missing '" + field +
                           "'");
      }
    }
    Question question;
    question.id = json_to_string(record["id"], "id", i);
    question.attribute_key = json_to_string(record["attribute_key"], "attribute_key", i);
    if (record.contains("text")) {
      question.text = json_to_string(record["text"], "text", i);
    } else if (record.contains("question")) {
      question.text = json_to_string(record["question"], "question", i);
    } else {
      throw DatasetError("Question record " + std::to_string(i) + " is missing 'text'");
    }
    questions.push_back(std::move(question));
  }
  return questions;
}

Catalog catalog_from_json(const nlohmann::json& entities, const nlohmann::json& questions) {
  return Catalog::load(entities_from_json(entities), questions_from_json(questions));
}

std::shared_ptr<const Catalog> load_catalog(const std::filesystem::path& entities_path,
                                            const std::filesystem::path& questions_path) {
  auto entities = read_json_file(entities_path);
  auto questions = read_json_file(questions_path);
  return std::make_shared<const Catalog>(catalog_from_json(entities, questions));
}

} // namespace whodat

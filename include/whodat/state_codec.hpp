#pragma once

#include "catalog.hpp"
#include "types.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace whodat::codec {

inline constexpr int kStateVersion = 1;

nlohmann::json encode(const GameState& state);

// Throws StateCorruptError on missing/mistyped fields or on ids the catalog
// does not know. Never fills in defaults.
GameState decode(const nlohmann::json& record, const Catalog& catalog);

std::string serialize(const GameState& state);
GameState deserialize(const std::string& blob, const Catalog& catalog);

} // namespace whodat::codec

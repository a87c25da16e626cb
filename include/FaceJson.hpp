#pragma once

#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "FaceTypes.hpp"

namespace faceAI {

// Boxes supplied by the caller under "faces" instead of the detector, if any.
// Every coordinate must be an integer that fits in an int; anything else
// throws std::invalid_argument.
std::optional<std::vector<BoundingBox>> parseFaces(const nlohmann::json& body);

nlohmann::json boxToJson(const BoundingBox& box);
nlohmann::json faceToJson(const FaceAttributes& face);

} // namespace faceAI

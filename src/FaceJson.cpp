#include "FaceJson.hpp"
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace faceAI {

namespace {

int readCoordinate(const json& face, const char* key) {
    auto it = face.find(key);
    if (it == face.end()) {
        throw std::invalid_argument(std::string("face box is missing \"") + key + "\"");
    }
    if (!it->is_number_integer()) {
        throw std::invalid_argument(std::string("face box \"") + key + "\" must be an integer");
    }

    bool fits = it->is_number_unsigned()
        ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : it->get<int64_t>() >= std::numeric_limits<int>::min() &&
          it->get<int64_t>() <= std::numeric_limits<int>::max();
    if (!fits) {
        throw std::invalid_argument(std::string("face box \"") + key + "\" is out of range");
    }
    return static_cast<int>(it->get<int64_t>());
}

} // namespace

std::optional<std::vector<BoundingBox>> parseFaces(const json& body) {
    if (!body.contains("faces")) {
        return std::nullopt;
    }
    const json& faces = body["faces"];
    if (!faces.is_array()) {
        throw std::invalid_argument("\"faces\" must be an array of boxes");
    }

    std::vector<BoundingBox> boxes;
    for (const auto& face : faces) {
        if (!face.is_object()) {
            throw std::invalid_argument("each face box must be an object");
        }
        BoundingBox box;
        box.left = readCoordinate(face, "left");
        box.top = readCoordinate(face, "top");
        box.right = readCoordinate(face, "right");
        box.bottom = readCoordinate(face, "bottom");
        boxes.push_back(box);
    }
    return boxes;
}

json boxToJson(const BoundingBox& box) {
    return {
        {"left", box.left},
        {"top", box.top},
        {"right", box.right},
        {"bottom", box.bottom}
    };
}

json faceToJson(const FaceAttributes& face) {
    json result;
    result["index"] = face.index;
    result["bbox"] = boxToJson(face.box);
    result["gender"] = toString(face.attributes.gender);
    result["age"] = face.attributes.ageYears;
    result["age_bucket"] = toString(face.attributes.ageBucket);
    result["emotion"] = toString(face.attributes.emotion);
    result["mood"] = toString(face.attributes.mood);
    result["summary"] = describe(face);
    return result;
}

} // namespace faceAI

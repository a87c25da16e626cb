#include "FaceTypes.hpp"
#include <sstream>

namespace faceAI {

const char* const kNoFaceMessage = "No face detected.";

BoundingBox BoundingBox::fromRect(const cv::Rect& rect) {
    BoundingBox box;
    box.left = rect.x;
    box.top = rect.y;
    box.right = rect.x + rect.width;
    box.bottom = rect.y + rect.height;
    return box;
}

bool operator==(const BoundingBox& a, const BoundingBox& b) {
    return a.left == b.left && a.top == b.top && a.right == b.right && a.bottom == b.bottom;
}

bool operator!=(const BoundingBox& a, const BoundingBox& b) {
    return !(a == b);
}

std::string toString(Gender gender) {
    switch (gender) {
        case Gender::Man:
            return "Man";
        case Gender::Woman:
            return "Woman";
    }
    return "Unknown";
}

std::string toString(AgeBucket bucket) {
    switch (bucket) {
        case AgeBucket::Underage:
            return "Underage";
        case AgeBucket::YoungAdult:
            return "Young Adult";
        case AgeBucket::Adult:
            return "Adult";
        case AgeBucket::Elder:
            return "Elder";
        case AgeBucket::Unknown:
            break;
    }
    return "Unknown";
}

std::string toString(Emotion emotion) {
    switch (emotion) {
        case Emotion::Angry:
            return "Angry";
        case Emotion::Disgust:
            return "Disgust";
        case Emotion::Fear:
            return "Fear";
        case Emotion::Happy:
            return "Happy";
        case Emotion::Sad:
            return "Sad";
        case Emotion::Surprise:
            return "Surprise";
        case Emotion::Neutral:
            return "Neutral";
    }
    return "Unknown";
}

std::string toString(Mood mood) {
    switch (mood) {
        case Mood::Positive:
            return "Positive";
        case Mood::Neutral:
            return "Neutral";
        case Mood::Negative:
            return "Negative";
    }
    return "Unknown";
}

std::string describe(const FaceAttributes& face) {
    const AttributeResult& attrs = face.attributes;
    std::ostringstream line;
    line << "Face " << face.index << ": " << toString(attrs.gender)
         << " // Age group " << toString(attrs.ageBucket) << " (" << attrs.ageYears << ")"
         << ", Mood " << toString(attrs.mood);
    return line.str();
}

} // namespace faceAI

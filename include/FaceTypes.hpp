#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace faceAI {

// Face box in image pixels; right and bottom are exclusive
struct BoundingBox {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
    cv::Rect toRect() const { return cv::Rect(left, top, width(), height()); }

    static BoundingBox fromRect(const cv::Rect& rect);
};

bool operator==(const BoundingBox& a, const BoundingBox& b);
bool operator!=(const BoundingBox& a, const BoundingBox& b);

enum class Gender {
    Man,
    Woman
};

enum class AgeBucket {
    Underage,
    YoungAdult,
    Adult,
    Elder,
    Unknown
};

// Index order is fixed by the emotion model's training labels
enum class Emotion {
    Angry = 0,
    Disgust = 1,
    Fear = 2,
    Happy = 3,
    Sad = 4,
    Surprise = 5,
    Neutral = 6
};

enum class Mood {
    Positive,
    Neutral,
    Negative
};

struct AttributeResult {
    Gender gender = Gender::Man;
    int ageYears = 0;
    AgeBucket ageBucket = AgeBucket::Unknown;
    Emotion emotion = Emotion::Neutral;
    Mood mood = Mood::Neutral;
};

struct FaceAttributes {
    int index = 0;  // 1-based, in detector order
    BoundingBox box;
    AttributeResult attributes;
};

std::string toString(Gender gender);
std::string toString(AgeBucket bucket);
std::string toString(Emotion emotion);
std::string toString(Mood mood);

// Human-readable line for one face, e.g.
// "Face 1: Woman // Age group Young Adult (24), Mood Positive"
std::string describe(const FaceAttributes& face);

// Message reported when an image has no faces
extern const char* const kNoFaceMessage;

} // namespace faceAI

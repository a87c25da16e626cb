#pragma once

#include <memory>
#include <string>
#include <vector>
#include "AttributeClassifier.hpp"
#include "FaceTypes.hpp"

namespace faceAI {

struct AgeEstimate {
    int years = -1;
    AgeBucket bucket = AgeBucket::Unknown;
};

struct EmotionEstimate {
    Emotion emotion = Emotion::Neutral;
    Mood mood = Mood::Neutral;
};

// 0-17 Underage, 18-35 Young Adult, 36-64 Adult, 65-100 Elder, else Unknown
AgeBucket ageBucketFor(int years);

// Happy/Surprise -> Positive, Neutral -> Neutral, everything else -> Negative
Mood moodFor(Emotion emotion);

// Two scores; index 0 wins only when strictly greater.
// The index polarity belongs to the gender weights in use.
class GenderClassifier : public AttributeClassifier<Gender> {
public:
    using AttributeClassifier<Gender>::AttributeClassifier;

    CodecConfig codecConfig() const override;
    Gender interpret(const std::vector<float>& scores) const override;
};

// 101 single-year bins covering ages 0 to 100
class AgeClassifier : public AttributeClassifier<AgeEstimate> {
public:
    using AttributeClassifier<AgeEstimate>::AttributeClassifier;

    static constexpr int kAgeBins = 101;

    CodecConfig codecConfig() const override;
    AgeEstimate interpret(const std::vector<float>& scores) const override;
};

// Seven scores ordered Angry, Disgust, Fear, Happy, Sad, Surprise, Neutral
class EmotionClassifier : public AttributeClassifier<EmotionEstimate> {
public:
    using AttributeClassifier<EmotionEstimate>::AttributeClassifier;

    static constexpr int kEmotionClasses = 7;

    CodecConfig codecConfig() const override;
    EmotionEstimate interpret(const std::vector<float>& scores) const override;
};

} // namespace faceAI

#include "AttributeClassifiers.hpp"
#include "FaceAIError.hpp"

namespace faceAI {

int argMax(const std::vector<float>& scores) {
    int best = -1;
    for (size_t i = 0; i < scores.size(); i++) {
        // Strict comparison keeps the first occurrence of the maximum
        if (best < 0 || scores[i] > scores[best]) {
            best = static_cast<int>(i);
        }
    }
    return best;
}

AgeBucket ageBucketFor(int years) {
    if (years < 0 || years > 100) {
        return AgeBucket::Unknown;
    }
    if (years <= 17) {
        return AgeBucket::Underage;
    }
    if (years <= 35) {
        return AgeBucket::YoungAdult;
    }
    if (years <= 64) {
        return AgeBucket::Adult;
    }
    return AgeBucket::Elder;
}

Mood moodFor(Emotion emotion) {
    switch (emotion) {
        case Emotion::Happy:
        case Emotion::Surprise:
            return Mood::Positive;
        case Emotion::Neutral:
            return Mood::Neutral;
        case Emotion::Angry:
        case Emotion::Disgust:
        case Emotion::Fear:
        case Emotion::Sad:
            break;
    }
    return Mood::Negative;
}

CodecConfig GenderClassifier::codecConfig() const {
    return rgbNormalized();
}

Gender GenderClassifier::interpret(const std::vector<float>& scores) const {
    if (scores.size() < 2) {
        throw InferenceError("gender model returned " + std::to_string(scores.size()) +
                             " scores, expected 2");
    }
    return scores[0] > scores[1] ? Gender::Woman : Gender::Man;
}

CodecConfig AgeClassifier::codecConfig() const {
    return rgbNormalized();
}

AgeEstimate AgeClassifier::interpret(const std::vector<float>& scores) const {
    AgeEstimate estimate;
    estimate.years = argMax(scores);
    estimate.bucket = ageBucketFor(estimate.years);
    return estimate;
}

CodecConfig EmotionClassifier::codecConfig() const {
    return grayNormalized();
}

EmotionEstimate EmotionClassifier::interpret(const std::vector<float>& scores) const {
    EmotionEstimate estimate;

    int index = argMax(scores);
    if (index < 0) {
        // Empty output, keep the Neutral default
        return estimate;
    }
    if (index >= kEmotionClasses) {
        throw InferenceError("emotion model returned class index " + std::to_string(index) +
                             " outside the 7 known labels");
    }

    estimate.emotion = static_cast<Emotion>(index);
    estimate.mood = moodFor(estimate.emotion);
    return estimate;
}

} // namespace faceAI

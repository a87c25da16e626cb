#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include "AttributeClassifiers.hpp"
#include "FaceAIError.hpp"
#include "TestDoubles.hpp"

using namespace faceAI;
using faceAI::fakes::FakeModel;
using faceAI::fakes::oneHot;

namespace {

std::shared_ptr<FakeModel> rgbModel(std::vector<float> output = {}) {
    return std::make_shared<FakeModel>("rgb", fakes::rgbInputSize(), std::move(output));
}

std::shared_ptr<FakeModel> grayModel(std::vector<float> output = {}) {
    return std::make_shared<FakeModel>("gray", fakes::grayInputSize(), std::move(output));
}

} // namespace

TEST(ArgMaxTest, PicksFirstOccurrenceOfMaximum) {
    EXPECT_EQ(argMax({0.1f, 0.9f, 0.3f}), 1);
    EXPECT_EQ(argMax({0.5f, 0.2f, 0.5f}), 0);
    EXPECT_EQ(argMax({0.1f, 0.7f, 0.7f, 0.7f}), 1);
    EXPECT_EQ(argMax({-3.0f, -1.0f, -2.0f}), 1);
}

TEST(ArgMaxTest, EmptyVectorHasNoIndex) {
    EXPECT_EQ(argMax({}), -1);
}

TEST(GenderClassifierTest, IndexZeroHigherMeansWoman) {
    GenderClassifier classifier(rgbModel());
    EXPECT_EQ(classifier.interpret({0.7f, 0.3f}), Gender::Woman);
}

TEST(GenderClassifierTest, IndexOneHigherMeansMan) {
    GenderClassifier classifier(rgbModel());
    EXPECT_EQ(classifier.interpret({0.3f, 0.7f}), Gender::Man);
}

TEST(GenderClassifierTest, TieResolvesToMan) {
    GenderClassifier classifier(rgbModel());
    EXPECT_EQ(classifier.interpret({0.5f, 0.5f}), Gender::Man);
}

TEST(GenderClassifierTest, TooFewScoresIsAnInferenceError) {
    GenderClassifier classifier(rgbModel());
    EXPECT_THROW(classifier.interpret({0.5f}), InferenceError);
}

TEST(GenderClassifierTest, UsesRgb224Tensor) {
    GenderClassifier classifier(rgbModel());
    EXPECT_EQ(classifier.codecConfig(), rgbNormalized(224));
}

TEST(GenderClassifierTest, ClassifyRunsTheModel) {
    auto model = rgbModel({0.9f, 0.1f});
    GenderClassifier classifier(model);

    std::vector<float> tensor(fakes::rgbInputSize(), 0.5f);
    EXPECT_EQ(classifier.classify(tensor), Gender::Woman);
    EXPECT_EQ(model->calls(), 1);
}

TEST(GenderClassifierTest, ClassifyRejectsWrongTensorLength) {
    GenderClassifier classifier(rgbModel({0.9f, 0.1f}));
    EXPECT_THROW(classifier.classify(std::vector<float>(10, 0.0f)), InferenceError);
}

TEST(AttributeClassifierTest, RequiresAModel) {
    EXPECT_THROW(GenderClassifier(nullptr), std::invalid_argument);
}

TEST(AgeClassifierTest, MaximumAtTenIsUnderage) {
    AgeClassifier classifier(rgbModel());
    AgeEstimate age = classifier.interpret(oneHot(AgeClassifier::kAgeBins, 10));

    EXPECT_EQ(age.years, 10);
    EXPECT_EQ(age.bucket, AgeBucket::Underage);
}

TEST(AgeClassifierTest, MaximumAtSeventyIsElder) {
    AgeClassifier classifier(rgbModel());
    AgeEstimate age = classifier.interpret(oneHot(AgeClassifier::kAgeBins, 70));

    EXPECT_EQ(age.years, 70);
    EXPECT_EQ(age.bucket, AgeBucket::Elder);
}

TEST(AgeClassifierTest, TiesResolveToYoungestAge) {
    AgeClassifier classifier(rgbModel());
    std::vector<float> scores(AgeClassifier::kAgeBins, 0.0f);
    scores[40] = 0.3f;
    scores[25] = 0.3f;

    EXPECT_EQ(classifier.interpret(scores).years, 25);
}

TEST(AgeClassifierTest, EmptyOutputIsUnknown) {
    AgeClassifier classifier(rgbModel());
    EXPECT_EQ(classifier.interpret({}).bucket, AgeBucket::Unknown);
}

TEST(AgeClassifierTest, BinsBeyondHundredAreUnknown) {
    AgeClassifier classifier(rgbModel());
    AgeEstimate age = classifier.interpret(oneHot(120, 110));

    EXPECT_EQ(age.years, 110);
    EXPECT_EQ(age.bucket, AgeBucket::Unknown);
}

TEST(AgeBucketTest, BucketBoundaries) {
    EXPECT_EQ(ageBucketFor(0), AgeBucket::Underage);
    EXPECT_EQ(ageBucketFor(17), AgeBucket::Underage);
    EXPECT_EQ(ageBucketFor(18), AgeBucket::YoungAdult);
    EXPECT_EQ(ageBucketFor(35), AgeBucket::YoungAdult);
    EXPECT_EQ(ageBucketFor(36), AgeBucket::Adult);
    EXPECT_EQ(ageBucketFor(64), AgeBucket::Adult);
    EXPECT_EQ(ageBucketFor(65), AgeBucket::Elder);
    EXPECT_EQ(ageBucketFor(100), AgeBucket::Elder);
    EXPECT_EQ(ageBucketFor(101), AgeBucket::Unknown);
    EXPECT_EQ(ageBucketFor(-1), AgeBucket::Unknown);
}

TEST(EmotionClassifierTest, HappyIsPositive) {
    EmotionClassifier classifier(grayModel());
    EmotionEstimate estimate = classifier.interpret(oneHot(EmotionClassifier::kEmotionClasses, 3));

    EXPECT_EQ(estimate.emotion, Emotion::Happy);
    EXPECT_EQ(estimate.mood, Mood::Positive);
}

TEST(EmotionClassifierTest, AngryIsNegative) {
    EmotionClassifier classifier(grayModel());
    EmotionEstimate estimate = classifier.interpret(oneHot(EmotionClassifier::kEmotionClasses, 0));

    EXPECT_EQ(estimate.emotion, Emotion::Angry);
    EXPECT_EQ(estimate.mood, Mood::Negative);
}

TEST(EmotionClassifierTest, NeutralStaysNeutral) {
    EmotionClassifier classifier(grayModel());
    EmotionEstimate estimate = classifier.interpret(oneHot(EmotionClassifier::kEmotionClasses, 6));

    EXPECT_EQ(estimate.emotion, Emotion::Neutral);
    EXPECT_EQ(estimate.mood, Mood::Neutral);
}

TEST(EmotionClassifierTest, EmptyOutputFallsBackToNeutral) {
    EmotionClassifier classifier(grayModel());
    EmotionEstimate estimate = classifier.interpret({});

    EXPECT_EQ(estimate.emotion, Emotion::Neutral);
    EXPECT_EQ(estimate.mood, Mood::Neutral);
}

TEST(EmotionClassifierTest, TiesResolveToLowestIndex) {
    EmotionClassifier classifier(grayModel());
    EmotionEstimate estimate = classifier.interpret({0.1f, 0.1f, 0.1f, 0.4f, 0.1f, 0.4f, 0.4f});

    EXPECT_EQ(estimate.emotion, Emotion::Happy);
}

TEST(EmotionClassifierTest, UnknownClassIndexIsAnInferenceError) {
    EmotionClassifier classifier(grayModel());
    EXPECT_THROW(classifier.interpret(oneHot(8, 7)), InferenceError);
}

TEST(EmotionClassifierTest, UsesGray48Tensor) {
    EmotionClassifier classifier(grayModel());
    EXPECT_EQ(classifier.codecConfig(), grayNormalized(48));
}

TEST(MoodTest, CollapsesSevenEmotionsToThreeMoods) {
    EXPECT_EQ(moodFor(Emotion::Angry), Mood::Negative);
    EXPECT_EQ(moodFor(Emotion::Disgust), Mood::Negative);
    EXPECT_EQ(moodFor(Emotion::Fear), Mood::Negative);
    EXPECT_EQ(moodFor(Emotion::Happy), Mood::Positive);
    EXPECT_EQ(moodFor(Emotion::Sad), Mood::Negative);
    EXPECT_EQ(moodFor(Emotion::Surprise), Mood::Positive);
    EXPECT_EQ(moodFor(Emotion::Neutral), Mood::Neutral);
}

TEST(DescribeTest, FormatsAllThreeAttributes) {
    FaceAttributes face;
    face.index = 2;
    face.attributes.gender = Gender::Woman;
    face.attributes.ageYears = 24;
    face.attributes.ageBucket = AgeBucket::YoungAdult;
    face.attributes.emotion = Emotion::Surprise;
    face.attributes.mood = Mood::Positive;

    EXPECT_EQ(describe(face), "Face 2: Woman // Age group Young Adult (24), Mood Positive");
}

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include "Base64.hpp"

using namespace faceAI;

namespace {

std::vector<unsigned char> bytes(const std::string& text) {
    return std::vector<unsigned char>(text.begin(), text.end());
}

} // namespace

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(base64Encode(bytes("Man")), "TWFu");
    EXPECT_EQ(base64Encode(bytes("Ma")), "TWE=");
    EXPECT_EQ(base64Encode(bytes("M")), "TQ==");
    EXPECT_EQ(base64Encode({}), "");
}

TEST(Base64Test, DecodesPaddedGroups) {
    EXPECT_EQ(base64Decode("TWFu"), bytes("Man"));
    EXPECT_EQ(base64Decode("TWE="), bytes("Ma"));
    EXPECT_EQ(base64Decode("TQ=="), bytes("M"));
    EXPECT_TRUE(base64Decode("").empty());
}

TEST(Base64Test, StripsDataUrlPrefixAndWhitespace) {
    EXPECT_EQ(base64Decode("data:image/png;base64,TWFu"), bytes("Man"));
    EXPECT_EQ(base64Decode("TW\nFu\r\n"), bytes("Man"));
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_THROW(base64Decode("TW*u"), std::invalid_argument);
    EXPECT_THROW(base64Decode("TQ==TQ"), std::invalid_argument);
    EXPECT_THROW(base64Decode("data:image/png;base64"), std::invalid_argument);
}

TEST(Base64Test, RejectsIncompleteGroups) {
    // A dangling 6-bit group
    EXPECT_THROW(base64Decode("QUJDR"), std::invalid_argument);
    // Unpadded tail
    EXPECT_THROW(base64Decode("TWE"), std::invalid_argument);
    // Too much padding
    EXPECT_THROW(base64Decode("TQ==="), std::invalid_argument);
    EXPECT_THROW(base64Decode("T==="), std::invalid_argument);
    // Whitespace does not count towards the group length
    EXPECT_EQ(base64Decode(" TW E= \n"), bytes("Ma"));
}

TEST(Base64Test, CarriesAnEncodedImage) {
    cv::Mat image(16, 16, CV_8UC3, cv::Scalar(12, 34, 56));
    std::vector<unsigned char> png;
    ASSERT_TRUE(cv::imencode(".png", image, png));

    cv::Mat decoded = cv::imdecode(base64Decode(base64Encode(png)), cv::IMREAD_COLOR);
    ASSERT_FALSE(decoded.empty());
    EXPECT_EQ(cv::norm(decoded, image, cv::NORM_INF), 0.0);
}

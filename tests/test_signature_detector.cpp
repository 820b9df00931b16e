#include "lib/signature_detector.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

TEST(SignatureDetectorTest, BlankDumpIsUnknownFrm3) {
    auto image = TestImages::dflash();
    auto info = SignatureDetector::detectVariant(image);
    
    EXPECT_EQ(info.label, "FRM3 Unknown");
    EXPECT_FALSE(info.marker.has_value());
    EXPECT_TRUE(info.heuristic);
}

TEST(SignatureDetectorTest, MarkerInFirstWindow) {
    auto image = TestImages::dflash();
    TestImages::putAscii(image, 0x104, "XEQ384");
    
    auto info = SignatureDetector::detectVariant(image);
    EXPECT_EQ(info.label, "FRM3 XEQ384");
    ASSERT_TRUE(info.windowOffset.has_value());
    EXPECT_EQ(*info.windowOffset, 0x100u);
}

TEST(SignatureDetectorTest, MarkerInSecondWindow) {
    auto image = TestImages::dflash();
    TestImages::putAscii(image, 0x20A, "XET512");
    
    auto info = SignatureDetector::detectVariant(image);
    EXPECT_EQ(info.label, "FRM3 XET512");
    EXPECT_EQ(*info.marker, "XET512");
    EXPECT_EQ(*info.windowOffset, 0x200u);
}

TEST(SignatureDetectorTest, FirstWindowWinsOverMarkerOrder) {
    auto image = TestImages::dflash();
    TestImages::putAscii(image, 0x100, "XET512");
    TestImages::putAscii(image, 0x200, "XEQ384");
    
    EXPECT_EQ(SignatureDetector::detectVariant(image).label, "FRM3 XET512");
}

TEST(SignatureDetectorTest, FirstMarkerWinsInsideOneWindow) {
    auto image = TestImages::dflash();
    TestImages::putAscii(image, 0x100, "XET512");
    TestImages::putAscii(image, 0x108, "XEQ384");
    
    EXPECT_EQ(SignatureDetector::detectVariant(image).label, "FRM3 XEQ384");
}

TEST(SignatureDetectorTest, MarkersOutsideWindowsAreIgnored) {
    auto image = TestImages::dflash();
    TestImages::putAscii(image, 0x300, "XEQ384");
    // Crosses the end of the first window
    TestImages::putAscii(image, 0x10D, "XET512");
    
    EXPECT_EQ(SignatureDetector::detectVariant(image).label, "FRM3 Unknown");
}

TEST(SignatureDetectorTest, OtherSizesFallBackToFrm2) {
    std::vector<uint8_t> image(16384, 0xFF);
    EXPECT_EQ(SignatureDetector::detectVariant(image).label, "FRM2");
    
    std::vector<uint8_t> empty;
    EXPECT_EQ(SignatureDetector::detectVariant(empty).label, "FRM2");
}

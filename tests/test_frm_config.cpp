#include "lib/frm_config.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

TEST(FrmConfigTest, DecodesLightingAndComfortBits) {
    auto image = TestImages::dflash(0x00);
    image[0x500] = 0x03;
    image[0x501] = 0x02;
    image[0x502] = 0x1E;
    
    auto flags = FrmConfig::decodeFlags(image);
    EXPECT_TRUE(flags.xenonHeadlights);
    EXPECT_TRUE(flags.angelEyes);
    EXPECT_FALSE(flags.autoWipers);
    EXPECT_TRUE(flags.comfortAccess);
    EXPECT_EQ(flags.followMeHomeTimer, 0x1E);
}

TEST(FrmConfigTest, IgnoresUnrelatedBits) {
    auto image = TestImages::dflash(0x00);
    image[0x500] = 0xFC;
    image[0x501] = 0xFD;
    
    auto flags = FrmConfig::decodeFlags(image);
    EXPECT_FALSE(flags.xenonHeadlights);
    EXPECT_FALSE(flags.angelEyes);
    EXPECT_TRUE(flags.autoWipers);
    EXPECT_FALSE(flags.comfortAccess);
}

TEST(FrmConfigTest, ShortImageDecodesAsDefaults) {
    std::vector<uint8_t> image(0x100, 0xFF);
    
    auto flags = FrmConfig::decodeFlags(image);
    EXPECT_FALSE(flags.xenonHeadlights);
    EXPECT_FALSE(flags.angelEyes);
    EXPECT_FALSE(flags.autoWipers);
    EXPECT_FALSE(flags.comfortAccess);
    EXPECT_EQ(flags.followMeHomeTimer, 0);
    
    EXPECT_EQ(FrmConfig::encodeConfigBlock(image), (std::vector<uint8_t>{0, 0, 0, 0}));
}

TEST(FrmConfigTest, ConfigBlockCopiesRawBytes) {
    auto image = TestImages::dflash();
    image[0x500] = 0x01;
    image[0x501] = 0x02;
    image[0x502] = 0x00;
    image[0x503] = 0x44;
    
    EXPECT_EQ(FrmConfig::encodeConfigBlock(image), (std::vector<uint8_t>{0x01, 0x02, 0x00, 0x44}));
}

TEST(FrmConfigTest, DescribeListsEveryField) {
    FrmConfig::ConfigFlags flags;
    flags.angelEyes = true;
    flags.followMeHomeTimer = 45;
    
    auto entries = FrmConfig::describe(flags);
    ASSERT_EQ(entries.size(), 5u);
    EXPECT_EQ(entries[0].second, "No");
    EXPECT_EQ(entries[1].second, "Yes");
    EXPECT_EQ(entries[4].second, "45");
}

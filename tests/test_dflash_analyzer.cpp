#include "lib/dflash_analyzer.hpp"
#include "lib/errors.hpp"
#include "lib/report_printer.hpp"
#include "utils/colors.hpp"
#include "test_helpers.hpp"
#include <sstream>
#include <gtest/gtest.h>

TEST(DFlashAnalyzerTest, RejectsWrongSizeBeforeScanning) {
    std::vector<uint8_t> image(32000, 0x42);
    
    try {
        DFlashAnalyzer::analyze(image);
        FAIL() << "expected SizeMismatchError";
    } catch (const SizeMismatchError& e) {
        EXPECT_EQ(e.expected(), 32768u);
        EXPECT_EQ(e.actual(), 32000u);
    }
    
    std::vector<uint8_t> empty;
    EXPECT_THROW(DFlashAnalyzer::analyze(empty), SizeMismatchError);
}

TEST(DFlashAnalyzerTest, ErasedDumpIsNotRepairable) {
    auto report = DFlashAnalyzer::analyze(TestImages::dflash());
    
    EXPECT_EQ(report.corruption.totalSectors, 32u);
    EXPECT_EQ(report.corruption.corruptionLevel, 0);
    EXPECT_FALSE(report.repairable);
    EXPECT_EQ(report.vehicle.variant.label, "FRM3 Unknown");
    EXPECT_FALSE(report.vehicle.vin.has_value());
    EXPECT_FALSE(report.vehicle.model.has_value());
    EXPECT_FALSE(report.vehicle.mileage.has_value());
}

TEST(DFlashAnalyzerTest, ReportsVehicleFields) {
    auto image = TestImages::dflash(0x81);
    TestImages::putAscii(image, 0x200, "XET512");
    TestImages::putAscii(image, 0x1500, "WBY123456C8901234");
    TestImages::clearMileageWindow(image);
    TestImages::putUInt32LE(image, 0x2200, 64000);
    image[0x500] = 0x02;
    image[0x501] = 0x01;
    image[0x502] = 0x3C;
    
    auto report = DFlashAnalyzer::analyze(image);
    const auto& vehicle = report.vehicle;
    
    EXPECT_EQ(vehicle.variant.label, "FRM3 XET512");
    ASSERT_TRUE(vehicle.vin.has_value());
    EXPECT_EQ(vehicle.vin->vin, "WBY123456C8901234");
    EXPECT_EQ(vehicle.vin->offset, 0x1500u);
    EXPECT_EQ(*vehicle.model, "BMW X3");
    EXPECT_EQ(*vehicle.modelYear, 2012);
    ASSERT_TRUE(vehicle.mileage.has_value());
    EXPECT_EQ(vehicle.mileage->value, 64000u);
    EXPECT_EQ(vehicle.mileage->offset, 0x2200u);
    EXPECT_FALSE(vehicle.unverifiedBigEndianMileage.has_value());
    
    EXPECT_FALSE(report.config.xenonHeadlights);
    EXPECT_TRUE(report.config.angelEyes);
    EXPECT_TRUE(report.config.autoWipers);
    EXPECT_EQ(report.config.followMeHomeTimer, 0x3C);
    
    // The cleared mileage window leaves sectors 9-11 zero-filled
    EXPECT_EQ(report.corruption.recoverableSectors, 29u);
    EXPECT_EQ(report.corruption.corruptionLevel, 91);
    EXPECT_TRUE(report.repairable);
}

TEST(DFlashAnalyzerTest, BigEndianMileageOnlyAsUnverifiedFallback) {
    auto image = TestImages::dflash();
    TestImages::clearMileageWindow(image);
    TestImages::putUInt32BE(image, 0x2300, 123456);
    
    auto report = DFlashAnalyzer::analyze(image);
    EXPECT_FALSE(report.vehicle.mileage.has_value());
    ASSERT_TRUE(report.vehicle.unverifiedBigEndianMileage.has_value());
    EXPECT_EQ(report.vehicle.unverifiedBigEndianMileage->value, 123456u);
    EXPECT_EQ(report.vehicle.unverifiedBigEndianMileage->order,
              MileageExtractor::ByteOrder::BIG_ENDIAN_ORDER);
}

TEST(DFlashAnalyzerTest, RepairThresholdIsExclusive) {
    SectorAnalyzer::CorruptionReport corruption{50, 16, 32, {}};
    EXPECT_FALSE(DFlashAnalyzer::isRepairable(corruption));
    
    corruption.corruptionLevel = 53;
    EXPECT_TRUE(DFlashAnalyzer::isRepairable(corruption));
    EXPECT_FALSE(DFlashAnalyzer::isRepairable(corruption, 60));
}

TEST(DFlashAnalyzerTest, AnalysisIsRepeatable) {
    auto image = TestImages::dflash(0x00);
    TestImages::putAscii(image, 0x1000, "WBA12345678901234");
    
    auto first = DFlashAnalyzer::analyze(image);
    auto second = DFlashAnalyzer::analyze(image);
    EXPECT_EQ(first.corruption.corruptionLevel, second.corruption.corruptionLevel);
    EXPECT_EQ(first.corruption.sectors, second.corruption.sectors);
    EXPECT_EQ(first.vehicle.vin->vin, second.vehicle.vin->vin);
}

TEST(ReportPrinterTest, SectorMapMarksEachState) {
    auto image = TestImages::dflash(0xFF);
    for (size_t i = 1024; i < 2048; i++) image[i] = 0x00;
    image[2048] = 0x12;
    
    auto report = DFlashAnalyzer::analyze(image);
    std::string map = ReportPrinter::sectorMap(report.corruption);
    
    ASSERT_EQ(map.size(), 32u);
    EXPECT_EQ(map.substr(0, 4), ".0#.");
}

TEST(ReportPrinterTest, AnalysisMentionsKeyFields) {
    Colors::setEnabled(false);
    auto image = TestImages::dflash(0x33);
    TestImages::putAscii(image, 0x1000, "WBA12345678901234");
    
    std::ostringstream out;
    ReportPrinter::printAnalysis(out, DFlashAnalyzer::analyze(image));
    std::string text = out.str();
    
    EXPECT_NE(text.find("WBA12345678901234 @ 0x1000"), std::string::npos);
    EXPECT_NE(text.find("BMW 3 Series"), std::string::npos);
    EXPECT_NE(text.find("32/32"), std::string::npos);
    EXPECT_NE(text.find("Repair possible"), std::string::npos);
}

TEST(ReportPrinterTest, HexDumpRows) {
    std::vector<uint8_t> data = {'W', 'B', 'A', 0x00, 0xFF};
    std::string dump = ReportPrinter::hexDump(data, 0, 16);
    
    EXPECT_EQ(dump.substr(0, 6), "0x0000");
    EXPECT_NE(dump.find("57 42 41 00 FF"), std::string::npos);
    EXPECT_NE(dump.find("WBA.."), std::string::npos);
}

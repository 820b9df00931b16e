#ifndef DFLASH_ANALYZER_HPP
#define DFLASH_ANALYZER_HPP

#include "lib/frm_config.hpp"
#include "lib/mileage_extractor.hpp"
#include "lib/sector_analyzer.hpp"
#include "lib/signature_detector.hpp"
#include "lib/vin_extractor.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DFlashAnalyzer {
    
    // Repairs need more than half of the sectors to still hold data
    constexpr int DEFAULT_REPAIR_THRESHOLD = 50;
    
    struct VehicleReport {
        SignatureDetector::VariantInfo variant;
        std::optional<VinExtractor::VinMatch> vin;
        std::optional<std::string> model;
        std::optional<int> modelYear;
        std::optional<MileageExtractor::MileageReading> mileage;
        
        // Only filled when the little-endian scan finds nothing. Never
        // written to the EEPROM image.
        std::optional<MileageExtractor::MileageReading> unverifiedBigEndianMileage;
    };
    
    struct AnalysisReport {
        SectorAnalyzer::CorruptionReport corruption;
        VehicleReport vehicle;
        FrmConfig::ConfigFlags config;
        bool repairable;
    };
    
    // Throws SizeMismatchError unless the image is exactly one D-Flash dump.
    AnalysisReport analyze(const std::vector<uint8_t>& image);
    
    VehicleReport extractVehicleReport(const std::vector<uint8_t>& image);
    
    bool isRepairable(const SectorAnalyzer::CorruptionReport& corruption,
                      int threshold = DEFAULT_REPAIR_THRESHOLD);
}

#endif // DFLASH_ANALYZER_HPP

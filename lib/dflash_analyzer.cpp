#include "lib/dflash_analyzer.hpp"
#include "lib/errors.hpp"
#include "lib/frm_layout.hpp"
#include "lib/vin_decoder.hpp"
#include "utils/logs.hpp"

namespace DFlashAnalyzer {
    
    AnalysisReport analyze(const std::vector<uint8_t>& image) {
        ErrorHandler::requireSize("D-Flash", FrmLayout::DFLASH_SIZE, image.size());
        
        AnalysisReport report;
        report.corruption = SectorAnalyzer::analyzeCorruption(image);
        report.vehicle = extractVehicleReport(image);
        report.config = FrmConfig::decodeFlags(image);
        report.repairable = isRepairable(report.corruption);
        
        Logs::debug("Analysis complete: " + report.vehicle.variant.label + ", " +
                   std::to_string(report.corruption.corruptionLevel) + "% recoverable");
        return report;
    }
    
    VehicleReport extractVehicleReport(const std::vector<uint8_t>& image) {
        VehicleReport vehicle;
        vehicle.variant = SignatureDetector::detectVariant(image);
        vehicle.vin = VinExtractor::findVin(image);
        
        if (vehicle.vin) {
            vehicle.model = VinDecoder::resolveModel(vehicle.vin->vin);
            vehicle.modelYear = VinDecoder::resolveModelYear(vehicle.vin->vin);
        }
        
        vehicle.mileage = MileageExtractor::findMileage(image);
        if (!vehicle.mileage) {
            vehicle.unverifiedBigEndianMileage =
                MileageExtractor::findMileage(image, MileageExtractor::ByteOrder::BIG_ENDIAN_ORDER);
        }
        return vehicle;
    }
    
    bool isRepairable(const SectorAnalyzer::CorruptionReport& corruption, int threshold) {
        return corruption.corruptionLevel > threshold;
    }
}

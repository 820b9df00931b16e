#include "lib/vin_extractor.hpp"
#include "lib/field_validators.hpp"
#include "lib/frm_layout.hpp"
#include "utils/logs.hpp"

namespace VinExtractor {
    
    ByteScanner::ScanWindow scanWindow() {
        // Covers the 0x1000, 0x1500 and 0x2000 slots used by known variants
        return ByteScanner::ScanWindow{
            FrmLayout::VIN_SCAN_START,
            FrmLayout::VIN_SCAN_END,
            FrmLayout::VIN_SCAN_STRIDE,
            FrmLayout::VIN_LENGTH
        };
    }
    
    std::optional<VinMatch> findVin(const std::vector<uint8_t>& image) {
        auto offset = ByteScanner::findFirst(image, scanWindow(),
            [](const std::vector<uint8_t>& buffer, size_t candidate) {
                std::string text = ByteScanner::decodeAscii(buffer, candidate, FrmLayout::VIN_LENGTH);
                return FieldValidators::isValidVin(text);
            });
        
        if (!offset) {
            Logs::debug("No VIN candidate passed validation");
            return std::nullopt;
        }
        
        VinMatch match;
        match.vin = ByteScanner::decodeAscii(image, *offset, FrmLayout::VIN_LENGTH);
        match.offset = *offset;
        Logs::debug("VIN " + match.vin + " found at offset " + std::to_string(match.offset));
        return match;
    }
    
    std::optional<std::string> extractVin(const std::vector<uint8_t>& image) {
        auto match = findVin(image);
        if (!match) return std::nullopt;
        return match->vin;
    }
}

#include "lib/frm_converter.hpp"
#include "lib/byte_scanner.hpp"
#include "lib/eeprom_checksum.hpp"
#include "lib/errors.hpp"
#include "lib/frm_layout.hpp"
#include "lib/mileage_extractor.hpp"
#include "lib/signature_detector.hpp"
#include "lib/vin_decoder.hpp"
#include "lib/vin_extractor.hpp"
#include "utils/logs.hpp"
#include <algorithm>
#include <utility>

namespace FrmConverter {
    
    const std::array<uint8_t, FrmLayout::EEPROM_HEADER_SIZE>& eepromHeader() {
        static const std::array<uint8_t, FrmLayout::EEPROM_HEADER_SIZE> header = {
            0xAA, 0x55, 0xFF, 0x00, // Magic
            0x01, 0x00, 0x00, 0x00, // Version
            0x00, 0x10, 0x00, 0x00, // Data offset
            0x00, 0x00, 0x00, 0x00  // Reserved
        };
        return header;
    }
    
    static VehicleData extractVehicleData(const std::vector<uint8_t>& dflash) {
        VehicleData data;
        data.variant = SignatureDetector::detectVariant(dflash).label;
        data.vin = VinExtractor::extractVin(dflash);
        if (data.vin) {
            data.model = VinDecoder::resolveModel(*data.vin);
            data.modelYear = VinDecoder::resolveModelYear(*data.vin);
        }
        data.mileage = MileageExtractor::extractMileage(dflash);
        return data;
    }
    
    static void writeHeader(std::vector<uint8_t>& eeprom) {
        const auto& header = eepromHeader();
        std::copy(header.begin(), header.end(), eeprom.begin() + FrmLayout::EEPROM_HEADER_OFFSET);
    }
    
    static void writeVehicleData(std::vector<uint8_t>& eeprom, const VehicleData& data) {
        if (data.vin) {
            std::copy(data.vin->begin(), data.vin->end(), eeprom.begin() + FrmLayout::EEPROM_VIN_OFFSET);
        }
        
        if (data.mileage) {
            ByteScanner::writeUInt32LE(eeprom, FrmLayout::EEPROM_MILEAGE_OFFSET, *data.mileage);
        }
    }
    
    static void writeConfigurationBlock(std::vector<uint8_t>& eeprom, const std::vector<uint8_t>& dflash) {
        std::vector<uint8_t> block = FrmConfig::encodeConfigBlock(dflash);
        size_t length = std::min(block.size(), FrmLayout::EEPROM_CONFIG_CAPACITY);
        std::copy(block.begin(), block.begin() + length, eeprom.begin() + FrmLayout::EEPROM_CONFIG_OFFSET);
    }
    
    ConversionResult convert(const std::vector<uint8_t>& dflash) {
        ConversionResult result;
        result.success = false;
        result.error = ConversionError::NONE;
        
        try {
            ErrorHandler::requireSize("D-Flash", FrmLayout::DFLASH_SIZE, dflash.size());
        } catch (const SizeMismatchError& e) {
            result.error = ConversionError::SIZE_MISMATCH;
            result.message = e.what();
            Logs::debug(result.message);
            return result;
        }
        
        std::vector<uint8_t> eeprom(FrmLayout::EEPROM_SIZE, FrmLayout::ERASED_BYTE);
        
        result.vehicleData = extractVehicleData(dflash);
        result.config = FrmConfig::decodeFlags(dflash);
        
        writeHeader(eeprom);
        writeVehicleData(eeprom, result.vehicleData);
        writeConfigurationBlock(eeprom, dflash);
        EepromChecksum::write(eeprom);
        
        Logs::debug("EEPROM checksum: " + std::to_string(EepromChecksum::stored(eeprom)));
        
        result.success = true;
        result.message = "Conversion completed successfully";
        result.eepromData = std::move(eeprom);
        return result;
    }
    
    std::string errorName(ConversionError error) {
        switch (error) {
            case ConversionError::NONE: return "none";
            case ConversionError::SIZE_MISMATCH: return "size mismatch";
            default: return "unknown";
        }
    }
}

#ifndef FRM_CONVERTER_HPP
#define FRM_CONVERTER_HPP

#include "lib/frm_config.hpp"
#include "lib/frm_layout.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace FrmConverter {
    
    enum class ConversionError {
        NONE,
        SIZE_MISMATCH
    };
    
    struct VehicleData {
        std::string variant;
        std::optional<std::string> vin;
        std::optional<std::string> model;
        std::optional<int> modelYear;
        std::optional<uint32_t> mileage;
    };
    
    struct ConversionResult {
        bool success;
        ConversionError error;
        std::string message;
        std::vector<uint8_t> eepromData;
        VehicleData vehicleData;
        FrmConfig::ConfigFlags config;
    };
    
    // Magic AA 55 FF 00, version 1, data offset 0x1000, 4 reserved bytes.
    const std::array<uint8_t, FrmLayout::EEPROM_HEADER_SIZE>& eepromHeader();
    
    // Rebuilds a 4 KB EEPROM image from a 32 KB D-Flash dump.
    // Fields that cannot be found are left erased (0xFF). The only failure
    // is a source of the wrong size, reported in the result.
    ConversionResult convert(const std::vector<uint8_t>& dflash);
    
    std::string errorName(ConversionError error);
}

#endif // FRM_CONVERTER_HPP

#ifndef FRM_LAYOUT_HPP
#define FRM_LAYOUT_HPP

#include <cstddef>
#include <cstdint>

namespace FrmLayout {
    
    // Source (D-Flash) geometry
    constexpr size_t DFLASH_SIZE = 32768;
    constexpr size_t SECTOR_SIZE = 1024;
    
    // Target (EEPROM) geometry
    constexpr size_t EEPROM_SIZE = 4096;
    constexpr uint8_t ERASED_BYTE = 0xFF;
    
    constexpr size_t EEPROM_HEADER_OFFSET = 0x00;
    constexpr size_t EEPROM_HEADER_SIZE = 16;
    constexpr size_t EEPROM_VIN_OFFSET = 0x10;
    constexpr size_t EEPROM_MILEAGE_OFFSET = 0x30;
    constexpr size_t EEPROM_CONFIG_OFFSET = 0x100;
    constexpr size_t EEPROM_CONFIG_CAPACITY = 1024;
    constexpr size_t CHECKSUM_SIZE = 4;
    
    // D-Flash regions
    constexpr size_t SIGNATURE_WINDOW_1 = 0x100;
    constexpr size_t SIGNATURE_WINDOW_2 = 0x200;
    constexpr size_t SIGNATURE_WINDOW_SIZE = 16;
    
    constexpr size_t VIN_LENGTH = 17;
    constexpr size_t VIN_SCAN_START = 0x1000;
    constexpr size_t VIN_SCAN_END = 0x2010;    // exclusive, last candidate 0x2000
    constexpr size_t VIN_SCAN_STRIDE = 16;
    
    constexpr size_t MILEAGE_SCAN_START = 0x2000;
    constexpr size_t MILEAGE_SCAN_END = 0x3000;
    constexpr size_t MILEAGE_SCAN_STRIDE = 4;
    
    constexpr size_t CONFIG_LIGHTING_OFFSET = 0x500;
    constexpr size_t CONFIG_COMFORT_OFFSET = 0x501;
    constexpr size_t CONFIG_TIMER_OFFSET = 0x502;
    constexpr size_t CONFIG_BLOCK_SIZE = 4;
}

#endif // FRM_LAYOUT_HPP

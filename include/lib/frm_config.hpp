#ifndef FRM_CONFIG_HPP
#define FRM_CONFIG_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace FrmConfig {
    
    struct ConfigFlags {
        bool xenonHeadlights = false;   // 0x500 bit 0
        bool angelEyes = false;         // 0x500 bit 1
        bool autoWipers = false;        // 0x501 bit 0
        bool comfortAccess = false;     // 0x501 bit 1
        uint8_t followMeHomeTimer = 0;  // 0x502 raw
    };
    
    // Missing source bytes decode as 0x00, so the record is always complete.
    ConfigFlags decodeFlags(const std::vector<uint8_t>& image);
    
    // Raw D-Flash bytes 0x500..0x503 as written to the EEPROM config block.
    std::vector<uint8_t> encodeConfigBlock(const std::vector<uint8_t>& image);
    
    std::vector<std::pair<std::string, std::string>> describe(const ConfigFlags& flags);
}

#endif // FRM_CONFIG_HPP

#include "lib/frm_config.hpp"
#include "lib/byte_scanner.hpp"
#include "lib/frm_layout.hpp"

namespace FrmConfig {
    
    ConfigFlags decodeFlags(const std::vector<uint8_t>& image) {
        uint8_t lighting = ByteScanner::byteAt(image, FrmLayout::CONFIG_LIGHTING_OFFSET);
        uint8_t comfort = ByteScanner::byteAt(image, FrmLayout::CONFIG_COMFORT_OFFSET);
        
        ConfigFlags flags;
        flags.xenonHeadlights = (lighting & 0x01) != 0;
        flags.angelEyes = (lighting & 0x02) != 0;
        flags.autoWipers = (comfort & 0x01) != 0;
        flags.comfortAccess = (comfort & 0x02) != 0;
        flags.followMeHomeTimer = ByteScanner::byteAt(image, FrmLayout::CONFIG_TIMER_OFFSET);
        return flags;
    }
    
    std::vector<uint8_t> encodeConfigBlock(const std::vector<uint8_t>& image) {
        std::vector<uint8_t> block;
        block.reserve(FrmLayout::CONFIG_BLOCK_SIZE);
        
        for (size_t i = 0; i < FrmLayout::CONFIG_BLOCK_SIZE; i++) {
            block.push_back(ByteScanner::byteAt(image, FrmLayout::CONFIG_LIGHTING_OFFSET + i));
        }
        return block;
    }
    
    std::vector<std::pair<std::string, std::string>> describe(const ConfigFlags& flags) {
        auto yesNo = [](bool value) { return std::string(value ? "Yes" : "No"); };
        
        return {
            {"Xenon headlights", yesNo(flags.xenonHeadlights)},
            {"Angel eyes", yesNo(flags.angelEyes)},
            {"Auto wipers", yesNo(flags.autoWipers)},
            {"Comfort access", yesNo(flags.comfortAccess)},
            {"Follow-me-home timer", std::to_string(flags.followMeHomeTimer)}
        };
    }
}

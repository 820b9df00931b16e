#include "lib/signature_detector.hpp"
#include "lib/byte_scanner.hpp"
#include "lib/frm_layout.hpp"
#include "utils/logs.hpp"

namespace SignatureDetector {
    
    const std::string LABEL_UNKNOWN_FRM3 = "FRM3 Unknown";
    const std::string LABEL_FRM2 = "FRM2";
    
    const std::vector<std::string>& knownMarkers() {
        static const std::vector<std::string> markers = {
            "XEQ384",
            "XET512"
        };
        return markers;
    }
    
    VariantInfo detectVariant(const std::vector<uint8_t>& image) {
        const size_t windows[] = {
            FrmLayout::SIGNATURE_WINDOW_1,
            FrmLayout::SIGNATURE_WINDOW_2
        };
        
        for (size_t window : windows) {
            for (const auto& marker : knownMarkers()) {
                if (ByteScanner::containsAscii(image, window, FrmLayout::SIGNATURE_WINDOW_SIZE, marker)) {
                    Logs::debug("Variant marker " + marker + " found in window at " +
                               std::to_string(window));
                    return VariantInfo{"FRM3 " + marker, marker, window, true};
                }
            }
        }
        
        // Size is the only remaining hint
        if (image.size() == FrmLayout::DFLASH_SIZE) {
            return VariantInfo{LABEL_UNKNOWN_FRM3, std::nullopt, std::nullopt, true};
        }
        return VariantInfo{LABEL_FRM2, std::nullopt, std::nullopt, true};
    }
}

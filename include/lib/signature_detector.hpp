#ifndef SIGNATURE_DETECTOR_HPP
#define SIGNATURE_DETECTOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SignatureDetector {
    
    struct VariantInfo {
        std::string label;
        std::optional<std::string> marker;
        std::optional<size_t> windowOffset;
        bool heuristic;     // always set, the label is a best guess
    };
    
    extern const std::string LABEL_UNKNOWN_FRM3;
    extern const std::string LABEL_FRM2;
    
    // Searches the two signature windows in order; within a window the
    // markers are tried in declaration order.
    VariantInfo detectVariant(const std::vector<uint8_t>& image);
    
    const std::vector<std::string>& knownMarkers();
}

#endif // SIGNATURE_DETECTOR_HPP

#ifndef SECTOR_ANALYZER_HPP
#define SECTOR_ANALYZER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace SectorAnalyzer {
    
    enum class SectorState {
        ERASED,         // every byte 0xFF
        ZERO_FILLED,    // every byte 0x00
        MEANINGFUL
    };
    
    struct CorruptionReport {
        int corruptionLevel;            // percentage of meaningful sectors, 0..100
        size_t recoverableSectors;
        size_t totalSectors;
        std::vector<SectorState> sectors;
    };
    
    bool isBlank(SectorState state);
    std::string stateName(SectorState state);
    
    SectorState classifySector(const std::vector<uint8_t>& image, size_t index);
    
    // Does not check the image size; a trailing partial sector is ignored.
    CorruptionReport analyzeCorruption(const std::vector<uint8_t>& image);
}

#endif // SECTOR_ANALYZER_HPP

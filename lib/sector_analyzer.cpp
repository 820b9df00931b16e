#include "lib/sector_analyzer.hpp"
#include "lib/frm_layout.hpp"
#include "utils/logs.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace SectorAnalyzer {
    
    bool isBlank(SectorState state) {
        return state == SectorState::ERASED || state == SectorState::ZERO_FILLED;
    }
    
    std::string stateName(SectorState state) {
        switch (state) {
            case SectorState::ERASED: return "erased";
            case SectorState::ZERO_FILLED: return "zero-filled";
            case SectorState::MEANINGFUL: return "meaningful";
            default: return "unknown";
        }
    }
    
    SectorState classifySector(const std::vector<uint8_t>& image, size_t index) {
        size_t start = index * FrmLayout::SECTOR_SIZE;
        size_t end = start + FrmLayout::SECTOR_SIZE;
        if (end > image.size()) {
            throw std::out_of_range("Sector " + std::to_string(index) + " lies outside the image");
        }
        
        auto first = image.begin() + start;
        auto last = image.begin() + end;
        
        if (std::all_of(first, last, [](uint8_t b) { return b == 0xFF; })) {
            return SectorState::ERASED;
        }
        if (std::all_of(first, last, [](uint8_t b) { return b == 0x00; })) {
            return SectorState::ZERO_FILLED;
        }
        return SectorState::MEANINGFUL;
    }
    
    CorruptionReport analyzeCorruption(const std::vector<uint8_t>& image) {
        CorruptionReport report;
        report.totalSectors = image.size() / FrmLayout::SECTOR_SIZE;
        report.recoverableSectors = 0;
        report.corruptionLevel = 0;
        
        for (size_t i = 0; i < report.totalSectors; i++) {
            SectorState state = classifySector(image, i);
            report.sectors.push_back(state);
            if (!isBlank(state)) {
                report.recoverableSectors++;
            }
        }
        
        if (report.totalSectors > 0) {
            double ratio = static_cast<double>(report.recoverableSectors) /
                           static_cast<double>(report.totalSectors);
            report.corruptionLevel = static_cast<int>(std::lround(ratio * 100.0));
        }
        
        Logs::debug("Sectors: " + std::to_string(report.recoverableSectors) + "/" +
                   std::to_string(report.totalSectors) + " meaningful");
        return report;
    }
}

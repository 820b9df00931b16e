#ifndef REPORT_PRINTER_HPP
#define REPORT_PRINTER_HPP

#include "lib/dflash_analyzer.hpp"
#include "lib/frm_converter.hpp"
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace ReportPrinter {
    
    void printAnalysis(std::ostream& out, const DFlashAnalyzer::AnalysisReport& report);
    void printConversion(std::ostream& out, const FrmConverter::ConversionResult& result);
    
    // One character per sector: '#' meaningful, '.' erased, '0' zero-filled
    std::string sectorMap(const SectorAnalyzer::CorruptionReport& corruption);
    
    // 16 bytes per row, offset column in hex
    std::string hexDump(const std::vector<uint8_t>& data, size_t offset, size_t length);
}

#endif // REPORT_PRINTER_HPP

#include "lib/report_printer.hpp"
#include "lib/mileage_extractor.hpp"
#include "utils/colors.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace ReportPrinter {
    
    static std::string hexOffset(size_t offset) {
        std::ostringstream out;
        out << "0x" << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << offset;
        return out.str();
    }
    
    static void printField(std::ostream& out, const std::string& name, const std::string& value) {
        out << "  " << std::left << std::setw(24) << (name + ":") << value << "\n";
    }
    
    std::string sectorMap(const SectorAnalyzer::CorruptionReport& corruption) {
        std::string map;
        for (auto state : corruption.sectors) {
            switch (state) {
                case SectorAnalyzer::SectorState::MEANINGFUL: map += '#'; break;
                case SectorAnalyzer::SectorState::ERASED: map += '.'; break;
                case SectorAnalyzer::SectorState::ZERO_FILLED: map += '0'; break;
            }
        }
        return map;
    }
    
    void printAnalysis(std::ostream& out, const DFlashAnalyzer::AnalysisReport& report) {
        const auto& corruption = report.corruption;
        const auto& vehicle = report.vehicle;
        
        out << "\n" << Colors::bold(Colors::cyan("=== D-FLASH ANALYSIS ===")) << "\n\n";
        
        out << Colors::bold("Sector Analysis:") << "\n";
        printField(out, "Recoverable sectors",
                   std::to_string(corruption.recoverableSectors) + "/" + std::to_string(corruption.totalSectors));
        printField(out, "Recoverable data", std::to_string(corruption.corruptionLevel) + "%");
        printField(out, "Sector map", sectorMap(corruption));
        
        out << "\n" << Colors::bold("Vehicle Data:") << "\n";
        printField(out, "FRM type", vehicle.variant.label + " (heuristic)");
        if (vehicle.vin) {
            printField(out, "VIN", vehicle.vin->vin + " @ " + hexOffset(vehicle.vin->offset));
        } else {
            printField(out, "VIN", Colors::yellow("not found"));
        }
        printField(out, "Model", vehicle.model ? *vehicle.model : "-");
        printField(out, "Model year", vehicle.modelYear ? std::to_string(*vehicle.modelYear) : "-");
        
        if (vehicle.mileage) {
            printField(out, "Mileage", std::to_string(vehicle.mileage->value) + " mi @ " +
                       hexOffset(vehicle.mileage->offset));
        } else if (vehicle.unverifiedBigEndianMileage) {
            printField(out, "Mileage", Colors::yellow(std::to_string(vehicle.unverifiedBigEndianMileage->value) +
                       " mi @ " + hexOffset(vehicle.unverifiedBigEndianMileage->offset) +
                       " (big-endian, unverified, not written)"));
        } else {
            printField(out, "Mileage", Colors::yellow("not found"));
        }
        
        out << "\n" << Colors::bold("Configuration:") << "\n";
        for (const auto& entry : FrmConfig::describe(report.config)) {
            printField(out, entry.first, entry.second);
        }
        
        out << "\n";
        if (report.repairable) {
            out << Colors::green("Repair possible: D-Flash data is sufficient for EEPROM reconstruction") << "\n";
        } else {
            out << Colors::red("Repair not possible: D-Flash corruption level too high (" +
                               std::to_string(corruption.corruptionLevel) + "% recoverable)") << "\n";
        }
        out << std::endl;
    }
    
    void printConversion(std::ostream& out, const FrmConverter::ConversionResult& result) {
        out << "\n" << Colors::bold(Colors::cyan("=== EEPROM CONVERSION ===")) << "\n\n";
        
        if (!result.success) {
            printField(out, "Status", Colors::red("failed (" + FrmConverter::errorName(result.error) + ")"));
            printField(out, "Reason", result.message);
            out << std::endl;
            return;
        }
        
        const auto& vehicle = result.vehicleData;
        printField(out, "Status", Colors::green("completed"));
        printField(out, "EEPROM size", std::to_string(result.eepromData.size()) + " bytes");
        printField(out, "FRM type", vehicle.variant);
        printField(out, "VIN written", vehicle.vin ? *vehicle.vin : "no (left erased)");
        printField(out, "Mileage written", vehicle.mileage ? std::to_string(*vehicle.mileage) + " mi" : "no (left erased)");
        out << std::endl;
    }
    
    std::string hexDump(const std::vector<uint8_t>& data, size_t offset, size_t length) {
        std::ostringstream out;
        size_t end = std::min(data.size(), offset + length);
        
        for (size_t row = offset; row < end; row += 16) {
            out << hexOffset(row) << "  ";
            
            std::string ascii;
            for (size_t i = row; i < row + 16; i++) {
                if (i < end) {
                    out << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
                        << static_cast<int>(data[i]) << ' ';
                    ascii += (data[i] >= 32 && data[i] <= 126) ? static_cast<char>(data[i]) : '.';
                } else {
                    out << "   ";
                }
            }
            out << " " << ascii << "\n";
        }
        return out.str();
    }
}

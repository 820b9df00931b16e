#include "lib/dump_loader.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <utility>

namespace DumpLoader {
    
    std::vector<std::string> getAcceptedExtensions() {
        return {".bin", ".hex", ".eep"};
    }
    
    bool hasAcceptedExtension(const std::string& path) {
        std::string ext = std::filesystem::path(path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        
        auto accepted = getAcceptedExtensions();
        return std::find(accepted.begin(), accepted.end(), ext) != accepted.end();
    }
    
    DumpFormat detectFormat(const std::vector<uint8_t>& content) {
        size_t sampleSize = std::min(content.size(), static_cast<size_t>(100));
        if (sampleSize == 0) {
            return DumpFormat::UNKNOWN;
        }
        
        std::string sample(content.begin(), content.begin() + sampleSize);
        
        if (sample[0] == ':') {
            bool hexOnly = std::all_of(sample.begin(), sample.end(), [](char c) {
                return c == ':' || std::isxdigit(static_cast<unsigned char>(c)) ||
                       std::isspace(static_cast<unsigned char>(c));
            });
            if (hexOnly) return DumpFormat::INTEL_HEX;
        }
        
        size_t printable = std::count_if(sample.begin(), sample.end(), [](char c) {
            unsigned char u = static_cast<unsigned char>(c);
            return u >= 32 && u <= 126;
        });
        
        // Mostly unprintable content is a raw binary dump
        if (printable * 10 < sampleSize * 7) {
            return DumpFormat::BINARY;
        }
        return DumpFormat::UNKNOWN;
    }
    
    std::string getFormatName(DumpFormat format) {
        switch (format) {
            case DumpFormat::BINARY: return "binary";
            case DumpFormat::INTEL_HEX: return "Intel HEX";
            default: return "unknown";
        }
    }
    
    static uint8_t parseHexByte(const std::string& line, size_t pos, size_t lineNumber) {
        if (pos + 2 > line.size() ||
            !std::isxdigit(static_cast<unsigned char>(line[pos])) ||
            !std::isxdigit(static_cast<unsigned char>(line[pos + 1]))) {
            throw FormatError("Malformed Intel HEX record on line " + std::to_string(lineNumber));
        }
        return static_cast<uint8_t>(std::stoul(line.substr(pos, 2), nullptr, 16));
    }
    
    std::vector<uint8_t> parseIntelHex(const std::string& text) {
        std::vector<uint8_t> data;
        std::istringstream stream(text);
        std::string line;
        size_t lineNumber = 0;
        
        while (std::getline(stream, line)) {
            lineNumber++;
            
            auto first = line.find_first_not_of(" \t\r");
            if (first == std::string::npos || line[first] != ':') continue;
            auto last = line.find_last_not_of(" \t\r");
            line = line.substr(first, last - first + 1);
            
            // ':' + count + address + type + checksum
            if (line.size() < 11) continue;
            
            uint8_t byteCount = parseHexByte(line, 1, lineNumber);
            uint8_t recordType = parseHexByte(line, 7, lineNumber);
            if (recordType != 0x00) continue;
            
            for (size_t i = 0; i < byteCount; i++) {
                data.push_back(parseHexByte(line, 9 + i * 2, lineNumber));
            }
        }
        
        return data;
    }
    
    std::vector<uint8_t> readFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw FileError(path, "Cannot open file");
        }
        
        std::vector<uint8_t> content((std::istreambuf_iterator<char>(file)),
                                     std::istreambuf_iterator<char>());
        if (file.bad()) {
            throw FileError(path, "Read failed");
        }
        return content;
    }
    
    std::vector<uint8_t> loadDump(const std::string& path) {
        if (!hasAcceptedExtension(path)) {
            throw FileError(path, "Invalid file extension. Only .bin, .hex, and .eep files are supported");
        }
        
        std::vector<uint8_t> content = readFile(path);
        DumpFormat format = detectFormat(content);
        Logs::debug("Detected " + getFormatName(format) + " content in " + path);
        
        std::vector<uint8_t> data;
        if (format == DumpFormat::INTEL_HEX) {
            data = parseIntelHex(std::string(content.begin(), content.end()));
            Logs::info("Decoded Intel HEX dump: " + formatFileSize(data.size()));
        } else {
            if (format == DumpFormat::UNKNOWN) {
                Logs::warning("Content of " + path + " looks like text; reading it as raw binary");
            }
            data = std::move(content);
        }
        
        if (data.size() < MIN_DUMP_SIZE || data.size() > MAX_DUMP_SIZE) {
            throw FileError(path, "Invalid file size. Expected ~32KB D-Flash dump, got " +
                            std::to_string(data.size()) + " bytes");
        }
        
        return data;
    }
    
    void saveImage(const std::string& path, const std::vector<uint8_t>& data) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw FileError(path, "Cannot open file for writing");
        }
        
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            throw FileError(path, "Write failed");
        }
    }
    
    std::string formatFileSize(size_t bytes) {
        if (bytes == 0) return "0 Bytes";
        
        static const char* units[] = {"Bytes", "KB", "MB"};
        double value = static_cast<double>(bytes);
        int unit = 0;
        while (value >= 1024.0 && unit < 2) {
            value /= 1024.0;
            unit++;
        }
        
        std::ostringstream out;
        out << std::fixed << std::setprecision(1) << value;
        std::string text = out.str();
        if (text.size() > 2 && text.compare(text.size() - 2, 2, ".0") == 0) {
            text.erase(text.size() - 2);
        }
        return text + " " + units[unit];
    }
}

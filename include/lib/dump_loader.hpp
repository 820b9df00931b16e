#ifndef DUMP_LOADER_HPP
#define DUMP_LOADER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace DumpLoader {
    
    enum class DumpFormat {
        BINARY,
        INTEL_HEX,
        UNKNOWN
    };
    
    // Payload sizes accepted before the exact-size check in the core
    constexpr size_t MIN_DUMP_SIZE = 30000;
    constexpr size_t MAX_DUMP_SIZE = 64000;
    
    bool hasAcceptedExtension(const std::string& path);
    std::vector<std::string> getAcceptedExtensions();
    
    DumpFormat detectFormat(const std::vector<uint8_t>& content);
    std::string getFormatName(DumpFormat format);
    
    // Concatenates the payload of data records (type 00) in file order.
    // Record addresses and checksums are not interpreted.
    std::vector<uint8_t> parseIntelHex(const std::string& text);
    
    std::vector<uint8_t> readFile(const std::string& path);
    std::vector<uint8_t> loadDump(const std::string& path);
    void saveImage(const std::string& path, const std::vector<uint8_t>& data);
    
    std::string formatFileSize(size_t bytes);
}

#endif // DUMP_LOADER_HPP

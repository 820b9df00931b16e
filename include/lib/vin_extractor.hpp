#ifndef VIN_EXTRACTOR_HPP
#define VIN_EXTRACTOR_HPP

#include "lib/byte_scanner.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace VinExtractor {
    
    struct VinMatch {
        std::string vin;
        size_t offset;
    };
    
    ByteScanner::ScanWindow scanWindow();
    
    std::optional<VinMatch> findVin(const std::vector<uint8_t>& image);
    std::optional<std::string> extractVin(const std::vector<uint8_t>& image);
}

#endif // VIN_EXTRACTOR_HPP

#ifndef MILEAGE_EXTRACTOR_HPP
#define MILEAGE_EXTRACTOR_HPP

#include "lib/byte_scanner.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace MileageExtractor {
    
    enum class ByteOrder {
        LITTLE_ENDIAN_ORDER,    // canonical, the only order written to EEPROM
        BIG_ENDIAN_ORDER        // analysis only, unverified on real dumps
    };
    
    struct MileageReading {
        uint32_t value;
        size_t offset;
        ByteOrder order;
    };
    
    ByteScanner::ScanWindow scanWindow();
    
    std::optional<MileageReading> findMileage(const std::vector<uint8_t>& image,
                                              ByteOrder order = ByteOrder::LITTLE_ENDIAN_ORDER);
    
    std::optional<uint32_t> extractMileage(const std::vector<uint8_t>& image);
    
    const char* byteOrderName(ByteOrder order);
}

#endif // MILEAGE_EXTRACTOR_HPP

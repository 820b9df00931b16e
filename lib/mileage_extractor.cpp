#include "lib/mileage_extractor.hpp"
#include "lib/field_validators.hpp"
#include "lib/frm_layout.hpp"
#include "utils/logs.hpp"

namespace MileageExtractor {
    
    ByteScanner::ScanWindow scanWindow() {
        return ByteScanner::ScanWindow{
            FrmLayout::MILEAGE_SCAN_START,
            FrmLayout::MILEAGE_SCAN_END,
            FrmLayout::MILEAGE_SCAN_STRIDE,
            4
        };
    }
    
    static uint32_t decode(const std::vector<uint8_t>& image, size_t offset, ByteOrder order) {
        if (order == ByteOrder::BIG_ENDIAN_ORDER) {
            return ByteScanner::readUInt32BE(image, offset);
        }
        return ByteScanner::readUInt32LE(image, offset);
    }
    
    std::optional<MileageReading> findMileage(const std::vector<uint8_t>& image, ByteOrder order) {
        auto offset = ByteScanner::findFirst(image, scanWindow(),
            [order](const std::vector<uint8_t>& buffer, size_t candidate) {
                return FieldValidators::isPlausibleMileage(decode(buffer, candidate, order));
            });
        
        if (!offset) {
            Logs::debug(std::string("No plausible ") + byteOrderName(order) + " mileage found");
            return std::nullopt;
        }
        
        MileageReading reading{decode(image, *offset, order), *offset, order};
        Logs::debug("Mileage " + std::to_string(reading.value) + " (" + byteOrderName(order) +
                   ") at offset " + std::to_string(reading.offset));
        return reading;
    }
    
    std::optional<uint32_t> extractMileage(const std::vector<uint8_t>& image) {
        auto reading = findMileage(image, ByteOrder::LITTLE_ENDIAN_ORDER);
        if (!reading) return std::nullopt;
        return reading->value;
    }
    
    const char* byteOrderName(ByteOrder order) {
        switch (order) {
            case ByteOrder::LITTLE_ENDIAN_ORDER: return "little-endian";
            case ByteOrder::BIG_ENDIAN_ORDER: return "big-endian";
            default: return "unknown";
        }
    }
}

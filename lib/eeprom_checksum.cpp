#include "lib/eeprom_checksum.hpp"
#include "lib/byte_scanner.hpp"
#include "lib/errors.hpp"
#include "lib/frm_layout.hpp"

namespace EepromChecksum {
    
    static size_t tailOffset(const std::vector<uint8_t>& image) {
        if (image.size() < FrmLayout::CHECKSUM_SIZE) {
            throw FormatError("Image of " + std::to_string(image.size()) +
                              " bytes cannot hold a checksum");
        }
        return image.size() - FrmLayout::CHECKSUM_SIZE;
    }
    
    uint32_t compute(const std::vector<uint8_t>& image) {
        size_t end = tailOffset(image);
        
        uint32_t sum = 0;
        for (size_t i = 0; i < end; i++) {
            sum += image[i];    // wraps modulo 2^32
        }
        return sum;
    }
    
    void write(std::vector<uint8_t>& image) {
        ByteScanner::writeUInt32LE(image, tailOffset(image), compute(image));
    }
    
    uint32_t stored(const std::vector<uint8_t>& image) {
        return ByteScanner::readUInt32LE(image, tailOffset(image));
    }
    
    bool verify(const std::vector<uint8_t>& image) {
        return compute(image) == stored(image);
    }
}

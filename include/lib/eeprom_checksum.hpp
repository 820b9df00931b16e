#ifndef EEPROM_CHECKSUM_HPP
#define EEPROM_CHECKSUM_HPP

#include <cstdint>
#include <vector>

// Additive checksum stored in the last four bytes of an EEPROM image.
//
// Sum of every byte before the tail, modulo 2^32, written little-endian.
// It only catches gross corruption (it is blind to reordered bytes), but
// external programmers check exactly this arithmetic, so it must not be
// replaced by a CRC.
namespace EepromChecksum {
    
    // Throws FormatError for images shorter than the checksum field.
    uint32_t compute(const std::vector<uint8_t>& image);
    void write(std::vector<uint8_t>& image);
    uint32_t stored(const std::vector<uint8_t>& image);
    bool verify(const std::vector<uint8_t>& image);
}

#endif // EEPROM_CHECKSUM_HPP

#ifndef BYTE_SCANNER_HPP
#define BYTE_SCANNER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ByteScanner {
    
    // Offsets [start, end) stepped by stride; each candidate covers width bytes.
    struct ScanWindow {
        size_t start;
        size_t end;
        size_t stride;
        size_t width;
    };
    
    std::vector<size_t> candidateOffsets(const ScanWindow& window, size_t bufferSize);
    
    // First candidate, in ascending offset order, accepted by the predicate.
    // The predicate is called with (buffer, offset) and may read width bytes.
    template <typename Predicate>
    std::optional<size_t> findFirst(const std::vector<uint8_t>& buffer,
                                    const ScanWindow& window,
                                    Predicate accept) {
        for (size_t offset : candidateOffsets(window, buffer.size())) {
            if (accept(buffer, offset)) {
                return offset;
            }
        }
        return std::nullopt;
    }
    
    uint32_t readUInt32LE(const std::vector<uint8_t>& buffer, size_t offset);
    uint32_t readUInt32BE(const std::vector<uint8_t>& buffer, size_t offset);
    void writeUInt32LE(std::vector<uint8_t>& buffer, size_t offset, uint32_t value);
    
    // Byte at offset, or fallback when the offset lies past the end.
    uint8_t byteAt(const std::vector<uint8_t>& buffer, size_t offset, uint8_t fallback = 0x00);
    
    // Tolerant ASCII decode: bytes >= 0x80 become '?', never throws.
    // Truncated at the end of the buffer.
    std::string decodeAscii(const std::vector<uint8_t>& buffer, size_t offset, size_t length);
    
    bool containsAscii(const std::vector<uint8_t>& buffer, size_t offset, size_t length,
                       const std::string& marker);
}

#endif // BYTE_SCANNER_HPP

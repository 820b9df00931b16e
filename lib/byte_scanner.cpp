#include "lib/byte_scanner.hpp"
#include <algorithm>

namespace ByteScanner {
    
    std::vector<size_t> candidateOffsets(const ScanWindow& window, size_t bufferSize) {
        std::vector<size_t> offsets;
        if (window.stride == 0 || window.width > bufferSize) {
            return offsets;
        }
        
        for (size_t offset = window.start; offset < window.end; offset += window.stride) {
            if (offset + window.width > bufferSize) break;
            offsets.push_back(offset);
        }
        return offsets;
    }
    
    uint32_t readUInt32LE(const std::vector<uint8_t>& buffer, size_t offset) {
        return static_cast<uint32_t>(buffer.at(offset)) |
               (static_cast<uint32_t>(buffer.at(offset + 1)) << 8) |
               (static_cast<uint32_t>(buffer.at(offset + 2)) << 16) |
               (static_cast<uint32_t>(buffer.at(offset + 3)) << 24);
    }
    
    uint32_t readUInt32BE(const std::vector<uint8_t>& buffer, size_t offset) {
        return (static_cast<uint32_t>(buffer.at(offset)) << 24) |
               (static_cast<uint32_t>(buffer.at(offset + 1)) << 16) |
               (static_cast<uint32_t>(buffer.at(offset + 2)) << 8) |
               static_cast<uint32_t>(buffer.at(offset + 3));
    }
    
    void writeUInt32LE(std::vector<uint8_t>& buffer, size_t offset, uint32_t value) {
        buffer.at(offset) = static_cast<uint8_t>(value & 0xFF);
        buffer.at(offset + 1) = static_cast<uint8_t>((value >> 8) & 0xFF);
        buffer.at(offset + 2) = static_cast<uint8_t>((value >> 16) & 0xFF);
        buffer.at(offset + 3) = static_cast<uint8_t>((value >> 24) & 0xFF);
    }
    
    uint8_t byteAt(const std::vector<uint8_t>& buffer, size_t offset, uint8_t fallback) {
        return offset < buffer.size() ? buffer[offset] : fallback;
    }
    
    std::string decodeAscii(const std::vector<uint8_t>& buffer, size_t offset, size_t length) {
        std::string text;
        if (offset >= buffer.size()) {
            return text;
        }
        
        size_t end = std::min(buffer.size(), offset + length);
        text.reserve(end - offset);
        for (size_t i = offset; i < end; i++) {
            uint8_t byte = buffer[i];
            text.push_back(byte < 0x80 ? static_cast<char>(byte) : '?');
        }
        return text;
    }
    
    bool containsAscii(const std::vector<uint8_t>& buffer, size_t offset, size_t length,
                       const std::string& marker) {
        if (marker.empty()) return false;
        
        std::string window = decodeAscii(buffer, offset, length);
        return window.find(marker) != std::string::npos;
    }
}

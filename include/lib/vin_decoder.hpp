#ifndef VIN_DECODER_HPP
#define VIN_DECODER_HPP

#include <optional>
#include <string>

namespace VinDecoder {
    
    extern const std::string UNKNOWN_MODEL;
    
    // Model from the manufacturer prefix (first three characters).
    // Unmapped prefixes give UNKNOWN_MODEL; invalid VINs give nothing.
    std::optional<std::string> resolveModel(const std::string& vin);
    
    // Model year from the tenth character. No fallback: an unmapped
    // code gives nothing.
    std::optional<int> resolveModelYear(const std::string& vin);
    
    std::optional<int> yearForCode(char code);
}

#endif // VIN_DECODER_HPP

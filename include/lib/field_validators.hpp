#ifndef FIELD_VALIDATORS_HPP
#define FIELD_VALIDATORS_HPP

#include <cstdint>
#include <string>

namespace FieldValidators {
    
    constexpr uint32_t MAX_PLAUSIBLE_MILEAGE = 1000000;
    
    // A-H, J-N, P, R-Z, 0-9. Uppercase only.
    bool isVinCharacter(char c);
    
    // Syntax only: length and alphabet. No check digit.
    bool isValidVin(const std::string& vin);
    
    // 0 < value < 1,000,000 miles
    bool isPlausibleMileage(uint32_t value);
}

#endif // FIELD_VALIDATORS_HPP

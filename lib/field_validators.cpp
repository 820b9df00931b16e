#include "lib/field_validators.hpp"
#include "lib/frm_layout.hpp"

namespace FieldValidators {
    
    bool isVinCharacter(char c) {
        if (c >= '0' && c <= '9') return true;
        if (c < 'A' || c > 'Z') return false;
        
        // Letters that read like digits are never used
        return c != 'I' && c != 'O' && c != 'Q';
    }
    
    bool isValidVin(const std::string& vin) {
        if (vin.size() != FrmLayout::VIN_LENGTH) {
            return false;
        }
        
        for (char c : vin) {
            if (!isVinCharacter(c)) {
                return false;
            }
        }
        return true;
    }
    
    bool isPlausibleMileage(uint32_t value) {
        return value > 0 && value < MAX_PLAUSIBLE_MILEAGE;
    }
}

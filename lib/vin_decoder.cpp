#include "lib/vin_decoder.hpp"
#include "lib/field_validators.hpp"
#include <map>

namespace VinDecoder {
    
    const std::string UNKNOWN_MODEL = "BMW (Unknown Model)";
    
    static const std::map<std::string, std::string>& modelTable() {
        static const std::map<std::string, std::string> models = {
            {"WBA", "BMW 3 Series"},
            {"WBY", "BMW X3"},
            {"5UX", "BMW X3 (US)"},
            {"WBX", "BMW X1"},
            {"WBS", "BMW M Series"},
            {"4US", "BMW (US Market)"}
        };
        return models;
    }
    
    static const std::map<char, int>& yearTable() {
        static const std::map<char, int> years = {
            {'1', 2001}, {'2', 2002}, {'3', 2003}, {'4', 2004}, {'5', 2005},
            {'6', 2006}, {'7', 2007}, {'8', 2008}, {'9', 2009}, {'A', 2010},
            {'B', 2011}, {'C', 2012}, {'D', 2013}, {'E', 2014}, {'F', 2015},
            {'G', 2016}, {'H', 2017}, {'J', 2018}, {'K', 2019}, {'L', 2020},
            {'M', 2021}, {'N', 2022}, {'P', 2023}, {'R', 2024}, {'S', 2025}
        };
        return years;
    }
    
    std::optional<std::string> resolveModel(const std::string& vin) {
        if (!FieldValidators::isValidVin(vin)) {
            return std::nullopt;
        }
        
        auto it = modelTable().find(vin.substr(0, 3));
        if (it == modelTable().end()) {
            return UNKNOWN_MODEL;
        }
        return it->second;
    }
    
    std::optional<int> resolveModelYear(const std::string& vin) {
        if (!FieldValidators::isValidVin(vin)) {
            return std::nullopt;
        }
        return yearForCode(vin[9]);
    }
    
    std::optional<int> yearForCode(char code) {
        auto it = yearTable().find(code);
        if (it == yearTable().end()) {
            return std::nullopt;
        }
        return it->second;
    }
}

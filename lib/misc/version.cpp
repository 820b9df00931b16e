#include "misc/version.hpp"
#include "utils/colors.hpp"
#include <iostream>

namespace Version {
    const std::string VERSION = "1.2.0";
    const std::string TOOL_NAME = "frmrestore";
    const std::string DESCRIPTION = "FRM D-Flash analyzer and EEPROM rebuilder";
    
    void printVersion() {
        std::cout << Colors::bold(TOOL_NAME) << " v" << VERSION << std::endl;
        std::cout << DESCRIPTION << std::endl;
    }
    
    void printBanner() {
        std::cout << Colors::cyan(R"(
  ___ ___ __  __   ___        _                
 | __| _ \  \/  | | _ \___ __| |_ ___ _ _ ___  
 | _||   / |\/| | |   / -_|_-<  _/ _ \ '_/ -_) 
 |_| |_|_\_|  |_| |_|_\___/__/\__\___/_| \___| 
)") << std::endl;
        std::cout << Colors::bold(TOOL_NAME) << " v" << VERSION << " - ";
        std::cout << DESCRIPTION << std::endl;
        std::cout << std::endl;
    }
}

#ifndef VERSION_HPP
#define VERSION_HPP

#include <string>

namespace Version {
    extern const std::string VERSION;
    extern const std::string TOOL_NAME;
    extern const std::string DESCRIPTION;
    
    void printVersion();
    void printBanner();
}

#endif // VERSION_HPP

#include "utils/logs.hpp"
#include "utils/colors.hpp"
#include <atomic>
#include <iostream>

namespace Logs {
    static std::atomic<bool> verbose{false};
    
    void info(const std::string& message) {
        std::cout << Colors::cyan("[INFO] ") << message << std::endl;
    }
    
    void success(const std::string& message) {
        std::cout << Colors::green("[SUCCESS] ") << message << std::endl;
    }
    
    void warning(const std::string& message) {
        std::cout << Colors::yellow("[WARNING] ") << message << std::endl;
    }
    
    void error(const std::string& message) {
        std::cerr << Colors::red("[ERROR] ") << message << std::endl;
    }
    
    void fatal(const std::string& message) {
        std::cerr << Colors::bold(Colors::red("[FATAL] ")) << message << std::endl;
    }
    
    void debug(const std::string& message) {
        if (!verbose.load()) return;
        std::cout << Colors::blue("[DEBUG] ") << message << std::endl;
    }
    
    void setVerbose(bool enabled) {
        verbose.store(enabled);
    }
    
    bool isVerbose() {
        return verbose.load();
    }
}

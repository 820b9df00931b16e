#include "lib/errors.hpp"
#include "utils/logs.hpp"

FrmRestoreException::FrmRestoreException(const std::string& msg) : message(msg) {}

const char* FrmRestoreException::what() const noexcept {
    return message.c_str();
}

SizeMismatchError::SizeMismatchError(const std::string& subject, size_t expected, size_t actual)
    : FrmRestoreException("Invalid " + subject + " size. Expected " + std::to_string(expected) +
                          " bytes, got " + std::to_string(actual) + " bytes"),
      expectedSize(expected), actualSize(actual) {}

size_t SizeMismatchError::expected() const noexcept {
    return expectedSize;
}

size_t SizeMismatchError::actual() const noexcept {
    return actualSize;
}

FileError::FileError(const std::string& file, const std::string& cause)
    : FrmRestoreException("File error with " + file + ": " + cause) {}

FormatError::FormatError(const std::string& msg)
    : FrmRestoreException("Format error: " + msg) {}

namespace ErrorHandler {
    void handleFatalError(const std::string& file, const std::string& cause) {
        std::string name = file;
        size_t slash = name.find_last_of('/');
        if (slash != std::string::npos) {
            name = name.substr(slash + 1);
        }
        
        Logs::fatal("Fatal Error: Cannot process " + name + ", cause: " + cause);
    }
    
    void requireSize(const std::string& subject, size_t expected, size_t actual) {
        if (expected != actual) {
            throw SizeMismatchError(subject, expected, actual);
        }
    }
}

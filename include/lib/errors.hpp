#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>
#include <exception>
#include <cstddef>

class FrmRestoreException : public std::exception {
private:
    std::string message;
    
public:
    explicit FrmRestoreException(const std::string& msg);
    const char* what() const noexcept override;
};

// Thrown when a buffer does not have the exact length a layout requires.
class SizeMismatchError : public FrmRestoreException {
private:
    size_t expectedSize;
    size_t actualSize;
    
public:
    SizeMismatchError(const std::string& subject, size_t expected, size_t actual);
    size_t expected() const noexcept;
    size_t actual() const noexcept;
};

class FileError : public FrmRestoreException {
public:
    explicit FileError(const std::string& file, const std::string& cause);
};

class FormatError : public FrmRestoreException {
public:
    explicit FormatError(const std::string& msg);
};

namespace ErrorHandler {
    void handleFatalError(const std::string& file, const std::string& cause);
    void requireSize(const std::string& subject, size_t expected, size_t actual);
}

#endif // ERRORS_HPP

#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace bprof {

// Root of everything the loader, profiler and writers throw on purpose.
class error : public std::runtime_error {
public:
    explicit error(const std::string& message) : std::runtime_error(message) {}
};

// Unreadable input, unwritable output, missing template.
class io_error : public error {
public:
    explicit io_error(const std::string& message) : error("IO error: " + message) {}
};

class unsupported_format_error : public io_error {
public:
    explicit unsupported_format_error(const std::string& path)
        : io_error("unsupported file type: " + path) {}
};

// Malformed dataset content.
class dataset_error : public error {
public:
    explicit dataset_error(const std::string& message) : error("Dataset error: " + message) {}
};

class unrectangular_input_error : public dataset_error {
public:
    unrectangular_input_error(const std::string& where, std::size_t expected, std::size_t got)
        : dataset_error(where + ": expected " + std::to_string(expected) +
                        " values, got " + std::to_string(got)) {}
};

class type_mismatch_error : public dataset_error {
public:
    explicit type_mismatch_error(const std::string& column)
        : dataset_error("column '" + column + "' storage does not match its logical type") {}
};

}

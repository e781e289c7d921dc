#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    NotFound,          // ticker or resource absent
    SourceUnavailable  // store or filesystem failure, may be transient
};

class DataError : public std::runtime_error {
public:
    DataError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    static DataError not_found(const std::string& message) {
        return DataError(ErrorKind::NotFound, message);
    }

    static DataError unavailable(const std::string& message) {
        return DataError(ErrorKind::SourceUnavailable, message);
    }

private:
    ErrorKind kind_;
};

const char* to_string(ErrorKind kind);

#pragma once

#include <stdexcept>
#include <string>

namespace trendlab {

// Rejected request: raised before any bar is fetched
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class DataErrorKind {
    NOT_FOUND,   // unknown symbol or no bars in range
    UPSTREAM     // provider unavailable, rate limited, unreadable payload
};

// Bar provider failure. The core never retries; it propagates these unchanged.
class DataError : public std::runtime_error {
public:
    DataError(DataErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    DataErrorKind kind() const { return kind_; }

private:
    DataErrorKind kind_;
};

inline const char* dataErrorKindToString(DataErrorKind kind) {
    return (kind == DataErrorKind::NOT_FOUND) ? "not_found" : "upstream";
}

inline int statusCodeFor(DataErrorKind kind) {
    return (kind == DataErrorKind::NOT_FOUND) ? 404 : 502;
}

} // namespace trendlab

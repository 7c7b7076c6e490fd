#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    Io,               // Input file missing or unreadable
    MalformedRecord,  // Log line with bad field count or non-numeric field
    LayoutMismatch,   // Log references a layer, key or combo the layout lacks
    InvalidLayout,    // Layout sources are unparsable or inconsistent
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Io:
            return "io";
        case ErrorKind::MalformedRecord:
            return "malformed record";
        case ErrorKind::LayoutMismatch:
            return "layout mismatch";
        case ErrorKind::InvalidLayout:
            return "invalid layout";
    }
    return "unknown";
}

/**
 * @brief Error raised by every keystat stage.
 *
 * Stages throw; pipeline tasks catch it, log it and mark their output as
 * unsuccessful so that no partial statistics are reported.
 */
class KeylogError : public std::runtime_error {
   private:
    ErrorKind kind_;

   public:
    KeylogError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
};

#pragma once

#include <stdexcept>
#include <string>

namespace asciidoc::core {

// Raised for malformed input and failed includes. line/column are 0 when
// the error is not tied to a source position.
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, int line, int column)
        : std::runtime_error(message), line_(line), column_(column) {}

    explicit ParseError(const std::string& message)
        : ParseError(message, 0, 0) {}

    std::string message() const { return what(); }
    int line() const { return line_; }
    int column() const { return column_; }

private:
    int line_;
    int column_;
};

}  // namespace asciidoc::core

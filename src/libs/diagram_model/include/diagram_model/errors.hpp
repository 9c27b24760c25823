#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace diagram_model {

enum class ErrorKind {
    Schema, // malformed input, unknown tag, broken reference
    Layout, // level assignment impossible (cycle)
    Style,  // palette entry missing or illegible
    Config  // malformed configuration resource
};

std::string_view to_string(ErrorKind kind);

// Terminal failure of one generation run. subject() names the offending
// node id, field or palette key.
class DiagramError : public std::runtime_error {
public:
    DiagramError(ErrorKind kind, std::string subject, const std::string& message);

    ErrorKind kind() const { return kind_; }
    const std::string& subject() const { return subject_; }

private:
    ErrorKind kind_;
    std::string subject_;
};

} // namespace diagram_model

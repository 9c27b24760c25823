#include <diagram_model/errors.hpp>
#include <utility>

namespace diagram_model {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Schema: return "schema";
    case ErrorKind::Layout: return "layout";
    case ErrorKind::Style: return "style";
    case ErrorKind::Config: return "config";
    }
    return "unknown";
}

DiagramError::DiagramError(ErrorKind kind, std::string subject, const std::string& message)
    : std::runtime_error(std::string(to_string(kind)) + " error: " + message)
    , kind_(kind)
    , subject_(std::move(subject))
{
}

} // namespace diagram_model

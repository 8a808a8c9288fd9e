#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace cmdtree {

// ============================================================================
// Error Taxonomy
// ============================================================================

// Base of every error raised while loading a command tree
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * An implementation source could not be turned into candidates at all
 * (bad native module, missing translator, spec file in group position).
 *
 * location() is the dot-joined tree path of the element being loaded and
 * cause() holds the original exception.
 */
class LoadFailure : public Error {
public:
    LoadFailure(const std::string& location, std::exception_ptr cause);
    LoadFailure(const std::string& location, const std::string& cause_message);

    const std::string& location() const { return location_; }
    std::exception_ptr cause() const { return cause_; }
    const std::string& cause_message() const { return cause_message_; }

    // Rethrows cause() if there is one
    void rethrow_cause() const;

private:
    std::string location_;
    std::exception_ptr cause_;
    std::string cause_message_;
};

// The tree or a document violates a structural rule
class LayoutError : public Error {
public:
    explicit LayoutError(const std::string& message) : Error(message) {}
};

// Well formed, but nothing implements the requested release track
class ReleaseTrackNotImplementedError : public Error {
public:
    explicit ReleaseTrackNotImplementedError(const std::string& message) : Error(message) {}
};

// Message text of an exception_ptr, or "unknown error"
std::string describe_exception(std::exception_ptr ex);

} // namespace cmdtree

#ifndef TYCLASS_DIAGNOSTIC_H
#define TYCLASS_DIAGNOSTIC_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace tyclass {

struct SourceLoc {
    uint32_t line = 0;
    uint32_t column = 0;
};

class DiagnosticError : public std::runtime_error {
  public:
    DiagnosticError(std::string message, std::size_t line, std::size_t column)
        : std::runtime_error(build_message(message, line, column)), line_(line), column_(column) {}

    std::size_t line() const {
        return line_;
    }
    std::size_t column() const {
        return column_;
    }

  private:
    static std::string build_message(const std::string& message, std::size_t line,
                                     std::size_t column) {
        return "error: " + message + " at " + std::to_string(line) + ":" + std::to_string(column);
    }

    std::size_t line_;
    std::size_t column_;
};

// Load-time rejections. Any of these aborts acceptance of the whole program.
enum class LoadErrorKind {
    OrphanInstance,
    SuperclassCycle,
    FunctionalDependencyCycle,
    FunctionalDependencyConflict,
    OverlappingInstances,
    InvalidDeclaration,
};

class LoadError : public DiagnosticError {
  public:
    LoadError(LoadErrorKind kind, std::string subject, const std::string& message,
              SourceLoc loc = {})
        : DiagnosticError(message, loc.line, loc.column), kind_(kind),
          subject_(std::move(subject)) {}

    LoadErrorKind kind() const {
        return kind_;
    }

    /// Name of the offending class or instance.
    const std::string& subject() const {
        return subject_;
    }

  private:
    LoadErrorKind kind_;
    std::string subject_;
};

// Resolution-time failures. Recoverable per call site.
enum class ResolutionErrorKind {
    NoInstanceFound,
    AmbiguousInstance,
    ResolutionDepthExceeded,
    InvalidConstraint,
};

class ResolutionError : public DiagnosticError {
  public:
    ResolutionError(ResolutionErrorKind kind, std::string constraint, const std::string& message,
                    SourceLoc loc = {}, std::string blocking_instance = "")
        : DiagnosticError(message, loc.line, loc.column), kind_(kind),
          constraint_(std::move(constraint)), blocking_instance_(std::move(blocking_instance)) {}

    ResolutionErrorKind kind() const {
        return kind_;
    }

    /// Printed form of the constraint that could not be discharged.
    const std::string& constraint() const {
        return constraint_;
    }

    /// For AmbiguousInstance, the chain entry that stopped the search.
    const std::string& blocking_instance() const {
        return blocking_instance_;
    }

    // Users see ambiguity and absence as the same failure.
    bool reported_as_no_instance() const {
        return kind_ == ResolutionErrorKind::NoInstanceFound ||
               kind_ == ResolutionErrorKind::AmbiguousInstance;
    }

  private:
    ResolutionErrorKind kind_;
    std::string constraint_;
    std::string blocking_instance_;
};

const char* to_string(LoadErrorKind kind);
const char* to_string(ResolutionErrorKind kind);

} // namespace tyclass

#endif // TYCLASS_DIAGNOSTIC_H

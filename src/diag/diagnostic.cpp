#include "diag/diagnostic.h"

namespace tyclass {

const char* to_string(LoadErrorKind kind) {
    switch (kind) {
    case LoadErrorKind::OrphanInstance:
        return "orphan instance";
    case LoadErrorKind::SuperclassCycle:
        return "superclass cycle";
    case LoadErrorKind::FunctionalDependencyCycle:
        return "functional dependency cycle";
    case LoadErrorKind::FunctionalDependencyConflict:
        return "functional dependency conflict";
    case LoadErrorKind::OverlappingInstances:
        return "overlapping instances";
    case LoadErrorKind::InvalidDeclaration:
        return "invalid declaration";
    }
    return "unknown";
}

const char* to_string(ResolutionErrorKind kind) {
    switch (kind) {
    case ResolutionErrorKind::NoInstanceFound:
        return "no instance found";
    case ResolutionErrorKind::AmbiguousInstance:
        return "ambiguous instance";
    case ResolutionErrorKind::ResolutionDepthExceeded:
        return "resolution depth exceeded";
    case ResolutionErrorKind::InvalidConstraint:
        return "invalid constraint";
    }
    return "unknown";
}

} // namespace tyclass

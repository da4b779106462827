#ifndef TYCLASS_CHECK_PASS_H
#define TYCLASS_CHECK_PASS_H

#include "diag/diagnostic.h"
#include "program/program.h"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace tyclass::checks {

/// Base class for load-time well-formedness passes over a fully assembled
/// program. Passes never stop at the first problem: each appends one
/// LoadError per violation so that all of them can be reported together.
struct CheckPass {
    virtual ~CheckPass() = default;

    /// Human-readable name of this pass (for logging).
    virtual std::string name() const = 0;

    virtual void run(const Program& program, std::vector<LoadError>& errors) = 0;
};

/// Run a sequence of passes in order, logging each failing pass to `log`.
/// Returns the number of passes that reported at least one error.
inline int run_checks(const Program& program, std::vector<std::unique_ptr<CheckPass>>& passes,
                      std::vector<LoadError>& errors, std::ostream* log = nullptr) {
    int failed = 0;
    for (auto& pass : passes) {
        size_t before = errors.size();
        pass->run(program, errors);
        if (errors.size() == before)
            continue;
        ++failed;
        if (log)
            *log << pass->name() << ": " << errors.size() - before << " error(s)\n";
    }
    return failed;
}

} // namespace tyclass::checks

#endif // TYCLASS_CHECK_PASS_H

#ifndef TYCLASS_CHECKS_ORPHAN_CHECK_H
#define TYCLASS_CHECKS_ORPHAN_CHECK_H

#include "checks/check_pass.h"

#include <optional>
#include <string>

namespace tyclass::checks {

/// Global uniqueness of instances.
///
/// An instance may only live in the module that defines its class, or in a
/// module that defines the outermost constructor of one of its top-level head
/// types (the first head type, for single-parameter classes). Anywhere else
/// it is an orphan: two unrelated modules could then both declare it.
class OrphanCheckPass : public CheckPass {
  public:
    std::string name() const override {
        return "Orphan Check";
    }
    void run(const Program& program, std::vector<LoadError>& errors) override;

    /// Returns the rejection reason, or nullopt if the instance is admissible.
    static std::optional<std::string> check_instance(const Program& program,
                                                     const InstanceInfo& instance);
};

} // namespace tyclass::checks

#endif // TYCLASS_CHECKS_ORPHAN_CHECK_H

#ifndef TYCLASS_CHECKS_OVERLAP_CHECK_H
#define TYCLASS_CHECKS_OVERLAP_CHECK_H

#include "checks/check_pass.h"

namespace tyclass::checks {

/// Instances of one class that sit in different chains must not overlap:
/// only a chain orders its entries, so two unordered instances whose heads
/// unify would make resolution depend on load order. For classes with
/// functional dependencies, instances in different chains must also agree
/// on determined positions wherever their determiner positions unify.
class OverlapCheckPass : public CheckPass {
  public:
    std::string name() const override {
        return "Overlap Check";
    }
    void run(const Program& program, std::vector<LoadError>& errors) override;

  private:
    void check_pair(const Program& program, const ClassInfo& cls, const InstanceInfo& first,
                    const InstanceInfo& second, std::vector<LoadError>& errors);
};

} // namespace tyclass::checks

#endif // TYCLASS_CHECKS_OVERLAP_CHECK_H

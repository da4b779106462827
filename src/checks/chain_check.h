#ifndef TYCLASS_CHECKS_CHAIN_CHECK_H
#define TYCLASS_CHECKS_CHAIN_CHECK_H

#include "checks/check_pass.h"

namespace tyclass::checks {

/// Structural validity of instance chains and instance heads: every chain
/// is non-empty and targets one class, heads have the class's arity and use
/// only declared constructors and pattern variables, and prerequisites name
/// known classes with the right number of arguments. Heads must also let
/// each functional dependency determine its outputs.
class ChainCheckPass : public CheckPass {
  public:
    std::string name() const override {
        return "Chain Check";
    }
    void run(const Program& program, std::vector<LoadError>& errors) override;

  private:
    void check_chain(const Program& program, ChainId id, std::vector<LoadError>& errors);
    void check_instance(const Program& program, const InstanceInfo& instance,
                        std::vector<LoadError>& errors);
    void check_coverage(const InstanceInfo& instance, const ClassInfo& cls,
                        std::vector<LoadError>& errors);
    void check_head_type(const Program& program, const InstanceInfo& instance, const Type& type,
                         std::vector<LoadError>& errors);
};

} // namespace tyclass::checks

#endif // TYCLASS_CHECKS_CHAIN_CHECK_H

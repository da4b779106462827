#ifndef TYCLASS_CHECKS_CLASS_CHECK_H
#define TYCLASS_CHECKS_CLASS_CHECK_H

#include "checks/check_pass.h"

namespace tyclass::checks {

/// Class declarations: superclass constraints refer to known classes and
/// only to the class's own parameters, no class is its own transitive
/// superclass, and functional dependencies are well formed.
class ClassCheckPass : public CheckPass {
  public:
    std::string name() const override {
        return "Class Check";
    }
    void run(const Program& program, std::vector<LoadError>& errors) override;

  private:
    void check_superclasses(const Program& program, const ClassInfo& cls,
                            std::vector<LoadError>& errors);
};

} // namespace tyclass::checks

#endif // TYCLASS_CHECKS_CLASS_CHECK_H

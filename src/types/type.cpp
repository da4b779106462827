#include "types/type.h"

#include <algorithm>

namespace tyclass {

bool contains_kind(const Type& type, TypeKind kind) {
    if (type.kind == kind)
        return true;
    return std::any_of(type.args.begin(), type.args.end(),
                       [kind](const Type& arg) { return contains_kind(arg, kind); });
}

bool contains_existential(const Type& type) {
    return contains_kind(type, TypeKind::Existential);
}

bool contains_var(const Type& type) {
    return contains_kind(type, TypeKind::Var);
}

void collect_vars(const Type& type, std::vector<std::string>& out) {
    if (type.is_var()) {
        if (std::find(out.begin(), out.end(), type.name) == out.end())
            out.push_back(type.name);
        return;
    }
    for (const auto& arg : type.args)
        collect_vars(arg, out);
}

} // namespace tyclass

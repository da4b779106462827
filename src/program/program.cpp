#include "program/program.h"

namespace tyclass {

template <typename Id>
static std::optional<Id> lookup(const std::unordered_map<std::string, Id>& ids,
                                const std::string& name) {
    auto it = ids.find(name);
    if (it == ids.end())
        return std::nullopt;
    return it->second;
}

std::optional<ModuleId> Program::find_module(const std::string& name) const {
    return lookup(module_ids_, name);
}

std::optional<TypeId> Program::find_type(const std::string& name) const {
    return lookup(type_ids_, name);
}

std::optional<ClassId> Program::find_class(const std::string& name) const {
    return lookup(class_ids_, name);
}

std::optional<InstanceId> Program::find_instance(const std::string& name) const {
    return lookup(instance_ids_, name);
}

std::optional<ModuleId> Program::defining_module_of_type(const std::string& name) const {
    auto id = find_type(name);
    if (!id)
        return std::nullopt;
    return types_[*id].module;
}

std::vector<InstanceId> Program::instances_of(ClassId id) const {
    std::vector<InstanceId> result;
    for (ChainId chain_id : class_info(id).chains) {
        const auto& ids = chains_[chain_id].instances;
        result.insert(result.end(), ids.begin(), ids.end());
    }
    return result;
}

} // namespace tyclass

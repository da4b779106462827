#include "solver/chain_resolver.h"

#include "types/type_printer.h"

#include <optional>
#include <string>

namespace tyclass::solver {

static const char* match_kind_name(MatchKind kind) {
    switch (kind) {
    case MatchKind::Matched:
        return "matched";
    case MatchKind::Ambiguous:
        return "ambiguous";
    case MatchKind::NoMatch:
        return "no match";
    }
    return "?";
}

ResolutionResult ChainResolver::resolve(ClassId class_id, const Constraint& constraint,
                                        uint32_t depth) const {
    const auto& cls = program_.class_info(class_id);

    std::optional<AmbiguousStop> first_ambiguity;
    for (ChainId chain_id : cls.chains) {
        ResolutionResult result = resolve_chain(chain_id, constraint, depth);
        if (std::holds_alternative<Resolved>(result))
            return result;
        if (auto* stop = std::get_if<AmbiguousStop>(&result); stop && !first_ambiguity)
            first_ambiguity = *stop;
    }

    if (first_ambiguity)
        return *first_ambiguity;
    return NotFound{};
}

ResolutionResult ChainResolver::resolve_chain(ChainId chain_id, const Constraint& constraint,
                                              uint32_t depth) const {
    const auto& chain = program_.chain(chain_id);
    const auto& cls = program_.class_info(chain.class_id);
    std::vector<bool> outputs = fundeps_.output_positions(cls, constraint.args);

    for (InstanceId id : chain.instances) {
        const auto& instance = program_.instance(id);
        Substitution improvements;
        MatchResult result = try_instance(instance, constraint.args, outputs, improvements);

        if (trace_) {
            *trace_ << std::string((static_cast<size_t>(depth) + 1) * 2, ' ') << instance.name
                    << " vs " << TypePrinter::constraint_to_string(constraint) << ": "
                    << match_kind_name(kind_of(result)) << "\n";
        }

        if (auto* matched = std::get_if<Matched>(&result))
            return Resolved{id, std::move(matched->subst), std::move(improvements)};
        if (std::holds_alternative<Ambiguous>(result))
            return AmbiguousStop{id};
    }
    return NotFound{};
}

MatchResult ChainResolver::try_instance(const InstanceInfo& instance,
                                        const std::vector<Type>& args,
                                        const std::vector<bool>& outputs,
                                        Substitution& improvements) const {
    MatchResult result = matcher_.match(instance.head, args, outputs);
    auto* matched = std::get_if<Matched>(&result);
    if (!matched)
        return result;

    MatchKind kind = MatchKind::Matched;
    for (size_t i = 0; i < outputs.size() && i < instance.head.size(); ++i) {
        if (!outputs[i])
            continue;
        kind = combine(kind, fundeps_.improve(instance.head[i], args[i], matched->subst,
                                              improvements));
        if (kind == MatchKind::NoMatch)
            return NoMatch{};
    }

    if (kind == MatchKind::Ambiguous)
        return Ambiguous{};
    return result;
}

} // namespace tyclass::solver

#include "capability_registry.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>

std::vector<std::string> ExposedToolSet::names() const {
    std::vector<std::string> out;
    out.reserve(owners_.size());
    for (const auto& [tool, owner] : owners_) out.push_back(tool);
    return out;
}

std::string ExposedToolSet::owner(const std::string& tool) const {
    auto it = owners_.find(tool);
    return it == owners_.end() ? "" : it->second;
}

Result<ExposedToolSet> CapabilityRegistry::compose(const std::set<std::string>& core_tools,
                                                   const std::vector<ProviderDescriptor>& providers) {
    std::vector<const ProviderDescriptor*> active;
    for (const auto& p : providers) {
        if (p.enabled && p.enabled()) active.push_back(&p);
    }
    std::sort(active.begin(), active.end(),
              [](const ProviderDescriptor* a, const ProviderDescriptor* b) { return a->name < b->name; });

    for (size_t i = 1; i < active.size(); i++) {
        if (active[i]->name == active[i - 1]->name) {
            return Result<ExposedToolSet>::Err(ErrorKind::Configuration,
                fmt::format("Provider '{}' is registered more than once", active[i]->name));
        }
    }

    std::map<std::string, std::set<std::string>> claims;
    for (const auto& tool : core_tools) claims[tool].insert(CORE_OWNER);
    std::set<std::string> suppressed;
    for (const auto* p : active) {
        for (const auto& tool : p->contributes) claims[tool].insert(p->name);
        suppressed.insert(p->suppresses.begin(), p->suppresses.end());
    }

    for (const auto& tool : suppressed) {
        if (claims.erase(tool)) rexec_debug(fmt::format("Tool {} suppressed", tool));
    }

    ExposedToolSet exposed;
    for (const auto& [tool, owners] : claims) {
        if (owners.size() > 1) {
            std::string who;
            for (const auto& o : owners) who += (who.empty() ? "" : ", ") + o;
            return Result<ExposedToolSet>::Err(ErrorKind::Configuration,
                fmt::format("Tool '{}' is claimed by more than one provider: {}", tool, who));
        }
        exposed.owners_[tool] = *owners.begin();
    }

    std::vector<std::string> names;
    for (const auto* p : active) names.push_back(p->name);
    rexec_log(fmt::format("Exposing {} tools (providers: {})", exposed.size(),
                          names.empty() ? "none" : fmt::format("{}", fmt::join(names, ", "))));
    return Result<ExposedToolSet>::Ok(exposed);
}

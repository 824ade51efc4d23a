#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>

// An optional module that adds tools and may hide tools owned by others
struct ProviderDescriptor {
    std::string name;
    std::function<bool()> enabled;
    std::set<std::string> contributes;
    std::set<std::string> suppresses;
};

// Tools exposed for the life of the process, each with exactly one owner
class ExposedToolSet {
public:
    bool contains(const std::string& tool) const { return owners_.count(tool) > 0; }
    std::vector<std::string> names() const;
    // "core" or the provider name; empty when not exposed
    std::string owner(const std::string& tool) const;
    size_t size() const { return owners_.size(); }

private:
    friend class CapabilityRegistry;
    std::map<std::string, std::string> owners_;
};

class CapabilityRegistry {
public:
    static constexpr const char* CORE_OWNER = "core";

    // Unions the core set with every enabled provider's tools, subtracts the
    // union of their suppressions once, then rejects any tool still claimed
    // by more than one owner. The result does not depend on provider order.
    static Result<ExposedToolSet> compose(const std::set<std::string>& core_tools,
                                          const std::vector<ProviderDescriptor>& providers);
};

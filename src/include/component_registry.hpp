#pragma once

#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "error.hpp"

namespace asftoken {

/**
 * Membership check for allocated component namespaces.
 *
 * Implementations must be safe to call from several threads. A definitive
 * answer is returned as a bool; an implementation that cannot reach its
 * backing store returns a RegistryUnavailable error instead of `false`.
 */
class ComponentRegistry {
public:
    virtual ~ComponentRegistry() = default;

    virtual Result<bool> isAllocated(const std::string& component) const = 0;
};

/**
 * In-memory registry backed by a set of component names.
 *
 * Usage:
 *   StaticComponentRegistry registry({"sample", "atr"});
 *   auto allocated = registry.isAllocated("sample");
 */
class StaticComponentRegistry : public ComponentRegistry {
public:
    StaticComponentRegistry() = default;

    /**
     * @throws std::invalid_argument if any component is not 3-6 lowercase letters
     */
    explicit StaticComponentRegistry(const std::vector<std::string>& components);

    Result<bool> isAllocated(const std::string& component) const override;

    /**
     * Add a component to the allocation set.
     * @return true if newly added, false if it was already allocated,
     *         InvalidComponentFormat if the name is malformed
     */
    Result<bool> allocate(const std::string& component);

    // Remove a component; returns false when it was not allocated
    bool release(const std::string& component);

    std::size_t size() const;

    // Allocated components in sorted order
    std::vector<std::string> components() const;

private:
    mutable std::mutex mutex_;
    std::set<std::string> components_;
};

} // namespace asftoken

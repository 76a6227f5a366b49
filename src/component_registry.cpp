#include "component_registry.hpp"

#include <stdexcept>
#include <crow/logging.h>

#include "token_grammar.hpp"

namespace asftoken {

StaticComponentRegistry::StaticComponentRegistry(const std::vector<std::string>& components) {
    for (const auto& component : components) {
        if (!isValidComponent(component)) {
            throw std::invalid_argument("Invalid component '" + component +
                                        "': must be 3-6 lowercase ASCII letters");
        }
        if (!components_.insert(component).second) {
            CROW_LOG_DEBUG << "Ignoring duplicate component: " << component;
        }
    }
}

Result<bool> StaticComponentRegistry::isAllocated(const std::string& component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return components_.count(component) > 0;
}

Result<bool> StaticComponentRegistry::allocate(const std::string& component) {
    if (!isValidComponent(component)) {
        return Error::InvalidComponentFormat(component);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    bool inserted = components_.insert(component).second;
    if (inserted) {
        CROW_LOG_INFO << "Allocated component: " << component;
    }
    return inserted;
}

bool StaticComponentRegistry::release(const std::string& component) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool erased = components_.erase(component) > 0;
    if (erased) {
        CROW_LOG_INFO << "Released component: " << component;
    }
    return erased;
}

std::size_t StaticComponentRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return components_.size();
}

std::vector<std::string> StaticComponentRegistry::components() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(components_.begin(), components_.end());
}

} // namespace asftoken

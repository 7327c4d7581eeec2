#include "PortRegistry.hpp"

namespace nearme::domain {

bool PortRegistry::registerPortWithName(std::shared_ptr<ports::ISendPort> port, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return !ports_.insert_or_assign(name, std::move(port)).second;
}

bool PortRegistry::removePortNameMapping(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ports_.erase(name) > 0;
}

std::shared_ptr<ports::ISendPort> PortRegistry::lookupPortByName(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ports_.find(name);
    return it != ports_.end() ? it->second : nullptr;
}

} // namespace nearme::domain

/// @file lobby_factory_registry.cpp
/// @brief LobbyFactoryRegistry implementation.

#include "lcs/service/lobby_factory_registry.hpp"

#include <algorithm>
#include <mutex>

#include "lcs/foundation/service_logger.hpp"

namespace lcs::service {

using lcs::foundation::LogCategory;

bool LobbyFactoryRegistry::registerFactory(const std::string& factoryId,
                                           LobbyFactory factory) {
    bool replaced = false;
    {
        std::unique_lock lock(mutex_);
        auto [it, inserted] = factories_.insert_or_assign(factoryId, std::move(factory));
        replaced = !inserted;
    }

    if (replaced) {
        LCS_LOG_WARN(LogCategory::Registry,
                     "Lobby factory '" + factoryId + "' was overwritten");
    } else {
        LCS_LOG_DEBUG(LogCategory::Registry,
                      "Lobby factory '" + factoryId + "' registered");
    }
    return replaced;
}

std::optional<LobbyFactory> LobbyFactoryRegistry::resolve(const std::string& factoryId) const {
    std::shared_lock lock(mutex_);

    auto it = factories_.find(factoryId);
    if (it == factories_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LobbyFactoryRegistry::contains(const std::string& factoryId) const {
    std::shared_lock lock(mutex_);
    return factories_.contains(factoryId);
}

std::vector<std::string> LobbyFactoryRegistry::factoryIds() const {
    std::vector<std::string> ids;
    {
        std::shared_lock lock(mutex_);
        ids.reserve(factories_.size());
        for (const auto& [id, factory] : factories_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t LobbyFactoryRegistry::size() const {
    std::shared_lock lock(mutex_);
    return factories_.size();
}

void LobbyFactoryRegistry::clear() {
    std::unique_lock lock(mutex_);
    factories_.clear();
}

}  // namespace lcs::service

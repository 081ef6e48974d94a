#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace economy::adapters::secondary {

/**
 * @brief Таблица мьютексов по id аккаунта
 *
 * Мьютекс создаётся при первом обращении и живёт, пока жива таблица
 * (аккаунты не удаляются). Захват нескольких id только в каноническом
 * порядке, иначе встречные переводы могут взаимно заблокироваться.
 */
class AccountLockTable {
public:
    using Guard = std::vector<std::unique_lock<std::mutex>>;

    AccountLockTable() = default;

    AccountLockTable(const AccountLockTable&) = delete;
    AccountLockTable& operator=(const AccountLockTable&) = delete;

    std::shared_ptr<std::mutex> mutexFor(const std::string& accountId) {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(accountId);
            if (it != map_.end()) {
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& slot = map_[accountId];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        return slot;
    }

    /**
     * @brief Захватить мьютексы по порядку; ids уже отсортированы и без дублей
     */
    Guard lockAll(const std::vector<std::string>& orderedIds) {
        Guard guards;
        guards.reserve(orderedIds.size());
        for (const auto& id : orderedIds) {
            guards.emplace_back(*mutexFor(id));
        }
        return guards;
    }

    std::size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> map_;
};

} // namespace economy::adapters::secondary

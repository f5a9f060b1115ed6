#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>

/**
 * @brief Потокобезопасный реестр shared_ptr-значений
 *
 * Используется для объектов, живущих дольше одного запроса
 * (например, мьютексы агрегатов по accountId).
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    /**
     * @brief Найти значение или атомарно создать его конструктором по умолчанию
     *
     * Два потока, одновременно запросившие отсутствующий ключ,
     * получат один и тот же объект.
     */
    std::shared_ptr<V> findOrCreate(const K &key)
    {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end())
            {
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto &slot = map_[key];
        if (!slot)
        {
            slot = std::make_shared<V>();
        }
        return slot;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};

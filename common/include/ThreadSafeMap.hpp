#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <functional>

/**
 * @brief Потокобезопасная карта ключ → shared_ptr<V>
 *
 * Чтение под shared_lock, запись под unique_lock.
 * Значения никогда не копируются: все вызывающие получают один и тот же объект.
 * Запись живёт, пока её кто-то держит: releaseIfUnused() удаляет ключ,
 * когда единственная ссылка на значение осталась в самой карте.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    using Factory = std::function<std::shared_ptr<V>()>;

    ThreadSafeMap() = default;

    /**
     * @brief Найти значение или атомарно создать его через factory
     *
     * Два потока с одним ключом всегда получают один и тот же экземпляр.
     * Копия shared_ptr делается под блокировкой карты, поэтому
     * releaseIfUnused() не может удалить значение, которое уже выдано.
     */
    std::shared_ptr<V> findOrInsert(const K &key, const Factory &factory)
    {
        // Fast path: ключ уже есть
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end())
                return it->second;
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end())
            return it->second;

        auto value = factory();
        map_.emplace(key, value);
        return value;
    }

    /**
     * @brief Удалить ключ, если на значение больше никто не ссылается
     *
     * Вызывающий должен сначала отпустить свою копию shared_ptr.
     * @return true, если запись удалена
     */
    bool releaseIfUnused(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end() || it->second.use_count() > 1)
            return false;
        map_.erase(it);
        return true;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};

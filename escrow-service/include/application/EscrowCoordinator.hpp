#pragma once

#include "domain/EscrowErrors.hpp"
#include "settings/IEscrowSettings.hpp"
#include <ThreadSafeMap.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <iostream>

namespace escrow::application {

/**
 * @brief Точка сериализации изменений одного escrow-платежа
 *
 * На каждый ключ (ID платежа) заводится свой timed_mutex, который живёт,
 * пока хотя бы один поток его держит или ждёт. Все команды,
 * меняющие платёж, выполняются внутри execute(); ожидание блокировки
 * ограничено таймаутом, после которого бросается ContentionException.
 *
 * @example
 * ```cpp
 * auto result = coordinator->execute(paymentId, [&] {
 *     auto payment = repository->findById(paymentId);
 *     ...
 *     return payment->remainingBalance();
 * });
 * ```
 */
class EscrowCoordinator {
public:
    explicit EscrowCoordinator(std::shared_ptr<settings::IEscrowSettings> settings)
        : timeout_(settings->getLockTimeout())
    {
        std::cout << "[EscrowCoordinator] Created, lock timeout "
                  << timeout_.count() << "ms" << std::endl;
    }

    template<typename Action>
    auto execute(const std::string& key, Action&& action) -> decltype(action()) {
        KeyLease lease(locks_, key);

        std::unique_lock<std::timed_mutex> lock(lease.mutex(), std::defer_lock);
        if (!lock.try_lock_for(timeout_)) {
            std::cout << "[EscrowCoordinator] Lock timeout for " << key << std::endl;
            throw domain::ContentionException(
                "Could not acquire lock for " + key + " within " +
                std::to_string(timeout_.count()) + "ms, retry later.");
        }

        return action();
    }

    std::chrono::milliseconds timeout() const { return timeout_; }

    /**
     * @brief Число ключей, по которым сейчас кто-то держит или ждёт блокировку
     */
    size_t trackedKeys() const { return locks_.size(); }

private:
    /**
     * @brief Ссылка на мьютекс ключа на время одного execute()
     *
     * Пока lease жив, запись в карте не удаляется. Последний вышедший
     * удаляет ключ, поэтому карта не растёт с числом платежей.
     */
    class KeyLease {
    public:
        KeyLease(ThreadSafeMap<std::string, std::timed_mutex>& locks, const std::string& key)
            : locks_(locks)
            , key_(key)
            , mutex_(locks.findOrInsert(key, [] { return std::make_shared<std::timed_mutex>(); }))
        {}

        ~KeyLease() {
            mutex_.reset();
            locks_.releaseIfUnused(key_);
        }

        KeyLease(const KeyLease&) = delete;
        KeyLease& operator=(const KeyLease&) = delete;

        std::timed_mutex& mutex() { return *mutex_; }

    private:
        ThreadSafeMap<std::string, std::timed_mutex>& locks_;
        std::string key_;
        std::shared_ptr<std::timed_mutex> mutex_;
    };

    std::chrono::milliseconds timeout_;
    ThreadSafeMap<std::string, std::timed_mutex> locks_;
};

} // namespace escrow::application

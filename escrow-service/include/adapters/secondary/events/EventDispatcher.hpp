#pragma once

#include "ports/output/IEventConsumer.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <functional>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace escrow::adapters::secondary {

/**
 * @brief Что сделать с сообщением после обработки
 */
enum class DispatchOutcome {
    ACK,      ///< обработано (или повтор не поможет и ошибка залогирована)
    REQUEUE,  ///< временная ошибка, вернуть в очередь
    REJECT    ///< обработчик упал, повтор не поможет
};

inline std::string toString(DispatchOutcome outcome) {
    switch (outcome) {
        case DispatchOutcome::ACK: return "ACK";
        case DispatchOutcome::REQUEUE: return "REQUEUE";
        case DispatchOutcome::REJECT: return "REJECT";
    }
    return "UNKNOWN";
}

/**
 * @brief Подписки и выполнение обработчиков вне потока соединения
 *
 * Обработчики выполняются в собственном потоке диспетчера по одному
 * сообщению за раз, в порядке submit(). Поток соединения AMQP только ставит
 * сообщение в очередь и получает итог через callback, поэтому долгий
 * обработчик (закрытие периода) не останавливает heartbeat.
 *
 * @example
 * ```cpp
 * dispatcher.submit(routingKey, body, [this, tag](DispatchOutcome outcome) {
 *     boost::asio::post(io_, [this, tag, outcome] { settle(tag, outcome); });
 * });
 * ```
 */
class EventDispatcher {
public:
    using Completion = std::function<void(DispatchOutcome)>;

    EventDispatcher() : pool_(1) {}

    ~EventDispatcher() {
        stop();
    }

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void subscribe(const std::vector<std::string>& routingKeys, ports::output::EventHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& key : routingKeys) {
            subscriptions_[key].push_back(handler);
        }
    }

    std::set<std::string> routingKeys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::set<std::string> keys;
        for (const auto& [key, handlers] : subscriptions_) {
            keys.insert(key);
        }
        return keys;
    }

    /**
     * @brief Поставить сообщение в очередь; done вызывается из потока диспетчера
     */
    void submit(const std::string& routingKey, const std::string& body, Completion done) {
        boost::asio::post(pool_, [this, routingKey, body, done = std::move(done)]() {
            done(dispatch(routingKey, body));
        });
    }

    /**
     * @brief Выполнить все обработчики ключа в текущем потоке
     *
     * REQUEUE побеждает REJECT: если хотя бы один обработчик просит повтор,
     * сообщение возвращается в очередь.
     */
    DispatchOutcome dispatch(const std::string& routingKey, const std::string& body) {
        std::vector<ports::output::EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = subscriptions_.find(routingKey);
            if (it != subscriptions_.end()) {
                handlers = it->second;
            }
        }

        if (handlers.empty()) {
            std::cout << "[EventDispatcher] No handlers for " << routingKey << std::endl;
            return DispatchOutcome::ACK;
        }

        DispatchOutcome outcome = DispatchOutcome::ACK;
        for (const auto& handler : handlers) {
            try {
                handler(routingKey, body);
            } catch (const ports::output::RetryableEventError& e) {
                std::cerr << "[EventDispatcher] " << routingKey << " will be redelivered: " << e.what() << std::endl;
                outcome = DispatchOutcome::REQUEUE;
            } catch (const std::exception& e) {
                std::cerr << "[EventDispatcher] Handler for " << routingKey << " failed: " << e.what() << std::endl;
                if (outcome != DispatchOutcome::REQUEUE) {
                    outcome = DispatchOutcome::REJECT;
                }
            }
        }
        return outcome;
    }

    /**
     * @brief Дождаться текущего обработчика; сообщения в очереди отбрасываются
     *
     * Неподтверждённые сообщения брокер доставит повторно после закрытия канала.
     */
    void stop() {
        std::lock_guard<std::mutex> lock(stopMutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        pool_.stop();
        pool_.join();
    }

private:
    boost::asio::thread_pool pool_;
    std::mutex stopMutex_;
    bool stopped_ = false;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> subscriptions_;
};

} // namespace escrow::adapters::secondary

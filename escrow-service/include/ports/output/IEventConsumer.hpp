// include/ports/output/IEventConsumer.hpp
#pragma once

#include <string>
#include <vector>
#include <functional>
#include <stdexcept>

namespace escrow::ports::output {

/**
 * @brief Событие не обработано по временной причине, доставку нужно повторить
 *
 * Обработчик бросает его вместо подтверждения: сообщение возвращается в очередь.
 * Любое другое исключение означает, что повтор не поможет.
 */
class RetryableEventError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// (routingKey, JSON body)
using EventHandler = std::function<void(const std::string& routingKey, const std::string& message)>;

/**
 * @brief Подписка на входящие события заказов, доставки, выплат и периодов
 *
 * subscribe() вызывается до start(): привязки очереди создаются при подключении.
 * Обработчики выполняются вне потока соединения. Результат обработчика
 * определяет судьбу сообщения: возврат → ack, RetryableEventError → requeue,
 * другое исключение → reject без повтора.
 *
 * @example
 * ```cpp
 * eventConsumer->subscribe({"order.payment_confirmed", "shipment.delivered"},
 *     [this](const std::string& routingKey, const std::string& message) {
 *         handle(routingKey, message);
 *     });
 * eventConsumer->start();
 * ```
 */
class IEventConsumer {
public:
    virtual ~IEventConsumer() = default;

    virtual void subscribe(const std::vector<std::string>& routingKeys, EventHandler handler) = 0;

    virtual void start() = 0;

    virtual void stop() = 0;
};

} // namespace escrow::ports::output

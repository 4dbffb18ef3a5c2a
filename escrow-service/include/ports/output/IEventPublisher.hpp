#pragma once

#include <string>

namespace escrow::ports::output {

/**
 * @brief Публикация событий escrow и settlement
 *
 * Доставка best-effort: ошибка публикации не откатывает уже
 * сохранённое изменение, вызывающий только логирует её.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "escrow.released")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace escrow::ports::output

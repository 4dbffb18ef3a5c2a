#pragma once

#include "ports/output/IEventConsumer.hpp"
#include <gmock/gmock.h>
#include <map>

namespace escrow::tests {

/**
 * @brief Mock IEventConsumer: запоминает обработчики, deliver() вызывает их
 */
class MockEventConsumer : public ports::output::IEventConsumer {
public:
    void subscribe(const std::vector<std::string>& routingKeys, ports::output::EventHandler handler) override {
        for (const auto& key : routingKeys) {
            handlers_[key] = handler;
        }
    }

    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));

    bool isSubscribed(const std::string& routingKey) const {
        return handlers_.count(routingKey) > 0;
    }

    void deliver(const std::string& routingKey, const std::string& message) {
        auto it = handlers_.find(routingKey);
        if (it != handlers_.end()) {
            it->second(routingKey, message);
        }
    }

private:
    std::map<std::string, ports::output::EventHandler> handlers_;
};

} // namespace escrow::tests

#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "adapters/secondary/events/EventDispatcher.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <atomic>
#include <set>
#include <iostream>

namespace escrow::adapters::secondary {

/**
 * @brief RabbitMQ: публикация и потребление событий escrow
 *
 * Exchange topic (RABBITMQ_EXCHANGE), очередь именованная и durable
 * (RABBITMQ_QUEUE), поэтому события между перезапусками не теряются.
 *
 * Канал AMQP-CPP не потокобезопасен: publish() только ставит отправку в
 * io_context, с каналом работает один поток. После обрыва соединения
 * адаптер переподключается с растущей паузой (1s, 2s, 4s ... 30s) и заново
 * привязывает все подписки.
 *
 * Входящие сообщения обрабатывает EventDispatcher в своём потоке;
 * ack/reject возвращаются в io_context после завершения обработчика.
 * Итог от канала, который уже переподключён, отбрасывается: брокер
 * сам доставит такое сообщение заново.
 */
class RabbitMQAdapter : public ports::output::IEventPublisher,
                        public ports::output::IEventConsumer {
public:
    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , work_(boost::asio::make_work_guard(io_))
        , reconnectTimer_(io_)
        , connectionHandler_(io_, [this](const std::string& reason) { scheduleReconnect(reason); })
    {
        std::cout << "[RabbitMQAdapter] Created for " << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << settings_->getExchange()
                  << " queue=" << settings_->getQueue() << std::endl;
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_) {
            std::cerr << "[RabbitMQAdapter] Cannot publish " << routingKey << ": not running" << std::endl;
            return;
        }

        boost::asio::post(io_, [this, routingKey, message]() {
            if (!channel_ || !channel_->usable()) {
                std::cerr << "[RabbitMQAdapter] Dropped " << routingKey << ": channel not ready" << std::endl;
                return;
            }
            channel_->publish(settings_->getExchange(), routingKey, message);
            std::cout << "[RabbitMQAdapter] Published " << routingKey << " (" << message.size() << " bytes)" << std::endl;
        });
    }

    /**
     * @brief Подписка действует и после переподключения
     */
    void subscribe(const std::vector<std::string>& routingKeys,
                   ports::output::EventHandler handler) override {
        dispatcher_.subscribe(routingKeys, std::move(handler));
    }

    void start() override {
        if (running_.exchange(true)) {
            return;
        }

        boost::asio::post(io_, [this]() { connect(); });
        worker_ = std::thread([this]() {
            try {
                io_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQAdapter] Started" << std::endl;
    }

    void stop() override {
        if (!running_.exchange(false)) {
            return;
        }

        // Сначала дождаться текущего обработчика, потом закрыть соединение
        dispatcher_.stop();

        boost::asio::post(io_, [this]() {
            reconnectTimer_.cancel();
            if (connection_) {
                connection_->close();
            }
        });
        work_.reset();
        io_.stop();

        if (worker_.joinable()) {
            worker_.join();
        }

        channel_.reset();
        connection_.reset();
        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

private:
    /**
     * @brief Обработчик TCP-соединения, сообщающий об обрыве
     */
    class ConnectionHandler : public AMQP::LibBoostAsioHandler {
    public:
        ConnectionHandler(boost::asio::io_context& io, std::function<void(const std::string&)> onFailure)
            : AMQP::LibBoostAsioHandler(io), onFailure_(std::move(onFailure)) {}

        void onReady(AMQP::TcpConnection*) override {
            std::cout << "[RabbitMQAdapter] Connection ready" << std::endl;
        }

        void onError(AMQP::TcpConnection*, const char* message) override {
            onFailure_(message);
        }

        void onLost(AMQP::TcpConnection*) override {
            onFailure_("connection lost");
        }

    private:
        std::function<void(const std::string&)> onFailure_;
    };

    static constexpr std::chrono::seconds kMaxBackoff{30};

    void connect() {
        if (!running_) {
            return;
        }

        connection_ = std::make_unique<AMQP::TcpConnection>(&connectionHandler_, AMQP::Address(settings_->getAddress()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());
        ++channelGeneration_;

        channel_->onError([](const char* message) {
            std::cerr << "[RabbitMQAdapter] Channel error: " << message << std::endl;
        });

        channel_->declareExchange(settings_->getExchange(), AMQP::topic, AMQP::durable)
            .onSuccess([this]() { declareQueue(); })
            .onError([](const char* message) {
                std::cerr << "[RabbitMQAdapter] Exchange error: " << message << std::endl;
            });
    }

    void declareQueue() {
        channel_->declareQueue(settings_->getQueue(), AMQP::durable)
            .onSuccess([this](const std::string& name, uint32_t pending, uint32_t) {
                std::cout << "[RabbitMQAdapter] Queue " << name << " ready, " << pending << " pending" << std::endl;

                std::set<std::string> keys = dispatcher_.routingKeys();
                for (const auto& key : keys) {
                    channel_->bindQueue(settings_->getExchange(), name, key);
                }
                std::cout << "[RabbitMQAdapter] Bound " << keys.size() << " routing keys" << std::endl;

                backoff_ = std::chrono::seconds(1);
                consume(name);
            })
            .onError([](const char* message) {
                std::cerr << "[RabbitMQAdapter] Queue error: " << message << std::endl;
            });
    }

    void consume(const std::string& queue) {
        channel_->setQos(settings_->getPrefetch());
        channel_->consume(queue)
            .onReceived([this](const AMQP::Message& msg, uint64_t tag, bool redelivered) {
                std::string routingKey = msg.routingkey();
                std::string body(msg.body(), msg.bodySize());
                uint64_t generation = channelGeneration_;

                std::cout << "[RabbitMQAdapter] Received " << routingKey
                          << (redelivered ? " (redelivered)" : "") << std::endl;

                dispatcher_.submit(routingKey, body, [this, tag, generation, routingKey](DispatchOutcome outcome) {
                    boost::asio::post(io_, [this, tag, generation, routingKey, outcome]() {
                        settle(tag, generation, routingKey, outcome);
                    });
                });
            })
            .onError([](const char* message) {
                std::cerr << "[RabbitMQAdapter] Consume error: " << message << std::endl;
            });
    }

    // Вызывается из io-потока
    void settle(uint64_t tag, uint64_t generation, const std::string& routingKey, DispatchOutcome outcome) {
        if (!channel_ || generation != channelGeneration_ || !channel_->usable()) {
            std::cerr << "[RabbitMQAdapter] Channel replaced, " << routingKey
                      << " (" << toString(outcome) << ") left to broker redelivery" << std::endl;
            return;
        }

        switch (outcome) {
            case DispatchOutcome::ACK:
                channel_->ack(tag);
                break;
            case DispatchOutcome::REQUEUE:
                channel_->reject(tag, AMQP::requeue);
                break;
            case DispatchOutcome::REJECT:
                channel_->reject(tag);
                break;
        }
    }

    // Вызывается из io-потока
    void scheduleReconnect(const std::string& reason) {
        if (!running_) {
            return;
        }

        std::cerr << "[RabbitMQAdapter] " << reason << ", reconnecting in " << backoff_.count() << "s" << std::endl;

        reconnectTimer_.expires_after(backoff_);
        reconnectTimer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec || !running_) {
                return;
            }
            channel_.reset();
            connection_.reset();
            connect();
        });
        backoff_ = std::min(backoff_ * 2, kMaxBackoff);
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;

    std::atomic<bool> running_;
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::steady_timer reconnectTimer_;
    std::chrono::seconds backoff_{1};
    ConnectionHandler connectionHandler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;
    uint64_t channelGeneration_ = 0;  // только из io-потока
    std::thread worker_;

    EventDispatcher dispatcher_;
};

} // namespace escrow::adapters::secondary

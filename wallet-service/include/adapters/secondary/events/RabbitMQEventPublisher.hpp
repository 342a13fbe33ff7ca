#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <memory>
#include <thread>
#include <atomic>
#include <iostream>

namespace wallet::adapters::secondary {

/**
 * @brief Публикация уведомлений журнала в RabbitMQ
 *
 * Архитектура:
 * - Exchange: topic (wallet.events)
 * - Routing keys: ledger.funding, ledger.transfer, ledger.trade
 *
 * Доставка fire-and-forget: publish() ставит отправку в io_context
 * рабочего потока и сразу возвращается. Ошибки только логируются.
 */
class RabbitMQEventPublisher : public ports::output::IEventPublisher {
public:
    explicit RabbitMQEventPublisher(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ioContext_()
        , workGuard_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        std::cout << "[RabbitMQEventPublisher] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchangeName_ << std::endl;
    }

    ~RabbitMQEventPublisher() override {
        stop();
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_) {
            std::cerr << "[RabbitMQEventPublisher] Cannot publish " << routingKey
                      << ": not connected" << std::endl;
            return;
        }

        boost::asio::post(ioContext_, [this, routingKey, message]() {
            if (!channel_ || !channel_->usable()) {
                std::cerr << "[RabbitMQEventPublisher] Channel not usable, dropped "
                          << routingKey << std::endl;
                return;
            }
            try {
                channel_->publish(exchangeName_, routingKey, message);
                std::cout << "[RabbitMQEventPublisher] Published " << routingKey
                          << ": " << message.substr(0, 100) << "..." << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQEventPublisher] Publish error: " << e.what() << std::endl;
            }
        });
    }

    void start() {
        if (running_.exchange(true)) return;

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQEventPublisher] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQEventPublisher] Started" << std::endl;
    }

    void stop() {
        if (!running_.exchange(false)) return;

        workGuard_.reset();
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQEventPublisher] Stopped" << std::endl;
    }

private:
    void connect() {
        std::string connStr = "amqp://" + settings_->getUser() + ":" +
                              settings_->getPassword() + "@" +
                              settings_->getHost() + ":" +
                              std::to_string(settings_->getPort()) + "/";

        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_,
            AMQP::Address(connStr));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                std::cout << "[RabbitMQEventPublisher] Exchange declared: " << exchangeName_ << std::endl;
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQEventPublisher] Exchange error: " << msg << std::endl;
            });
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;

    std::atomic<bool> running_;
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;
};

} // namespace wallet::adapters::secondary

/**
 * @file counting_sink.hpp
 * @brief 按级别计数的 spdlog sink；ScopedCountingLogger 安装到共享 logger 并在析构时恢复
 */

#pragma once

#include <vesta_device/log.hpp>

#include <memory>
#include <mutex>
#include <string>

#include <spdlog/sinks/base_sink.h>

namespace vesta_test {

class CountingSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    int errors = 0;
    int warnings = 0;
    std::string lastMessage;

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        if (msg.level == spdlog::level::err) ++errors;
        if (msg.level == spdlog::level::warn) ++warnings;
        lastMessage.assign(msg.payload.data(), msg.payload.size());
    }
    void flush_() override {}
};

class ScopedCountingLogger {
public:
    ScopedCountingLogger() : sink_(std::make_shared<CountingSink>()) {
        auto logger = std::make_shared<spdlog::logger>("vesta", sink_);
        logger->set_level(spdlog::level::trace);
        vesta_device::SetLogger(logger);
    }
    ~ScopedCountingLogger() { vesta_device::SetLogger(nullptr); }

    ScopedCountingLogger(const ScopedCountingLogger&) = delete;
    ScopedCountingLogger& operator=(const ScopedCountingLogger&) = delete;

    int Errors() const { return sink_->errors; }
    int Warnings() const { return sink_->warnings; }
    const std::string& LastMessage() const { return sink_->lastMessage; }

private:
    std::shared_ptr<CountingSink> sink_;
};

}  // namespace vesta_test

#pragma once

#include "ports/input/IBankService.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <iostream>

namespace economy::application {

/**
 * @brief Фоновый поток начисления процентов
 *
 * Раз в interval вызывает accrueDailyInterest(). Первый запуск: сразу после start().
 * Запуски внутри одних суток ничего не начисляют повторно.
 */
class InterestScheduler {
public:
    InterestScheduler(std::shared_ptr<ports::input::IBankService> bank,
                      std::chrono::milliseconds interval = std::chrono::hours{1})
        : bank_(std::move(bank))
        , interval_(interval)
        , running_(false)
        , tickCount_(0)
    {}

    ~InterestScheduler() {
        stop();
    }

    // Non-copyable, non-movable
    InterestScheduler(const InterestScheduler&) = delete;
    InterestScheduler& operator=(const InterestScheduler&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        std::cout << "[InterestScheduler] Started, interval "
                  << std::chrono::duration_cast<std::chrono::seconds>(interval_).count() << "s" << std::endl;

        thread_ = std::thread([this]() {
            while (running_) {
                doTick();

                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, interval_, [this]() { return !running_; });
            }
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false)) {
                return;
            }
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        std::cout << "[InterestScheduler] Stopped" << std::endl;
    }

    bool isRunning() const { return running_; }

    uint64_t tickCount() const { return tickCount_; }

    /**
     * @brief Выполнить один запуск вручную (для тестов)
     */
    void manualTick() {
        doTick();
    }

private:
    std::shared_ptr<ports::input::IBankService> bank_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> tickCount_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;

    void doTick() {
        try {
            auto report = bank_->accrueDailyInterest();
            if (report.failedAccounts > 0) {
                std::cerr << "[InterestScheduler] " << report.failedAccounts
                          << " accounts failed, will retry on next run" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[InterestScheduler] Accrual run failed: " << e.what() << std::endl;
        }
        ++tickCount_;
    }
};

} // namespace economy::application

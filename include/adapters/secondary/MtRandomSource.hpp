#pragma once

#include "ports/output/IRandomSource.hpp"
#include <random>
#include <mutex>
#include <stdexcept>
#include <iostream>

namespace economy::adapters::secondary {

/**
 * @brief Генератор на mt19937_64, общий для всех сервисов
 *
 * Потокобезопасен: сервисы вызываются конкурентно.
 */
class MtRandomSource : public ports::output::IRandomSource {
public:
    MtRandomSource() : rng_(std::random_device{}()) {
        std::cout << "[MtRandomSource] Created" << std::endl;
    }

    explicit MtRandomSource(uint64_t seed) : rng_(seed) {}

    int64_t uniformInt(int64_t min, int64_t max) override {
        if (max < min) {
            throw std::invalid_argument("uniformInt: max < min");
        }
        std::uniform_int_distribution<int64_t> dist(min, max);
        std::lock_guard<std::mutex> lock(mutex_);
        return dist(rng_);
    }

    double uniformUnit() override {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        std::lock_guard<std::mutex> lock(mutex_);
        return dist(rng_);
    }

private:
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

} // namespace economy::adapters::secondary

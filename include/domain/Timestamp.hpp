#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace economy::domain {

/**
 * @brief Временная метка (UTC)
 *
 * Хранится как time_point system_clock, в БД: миллисекунды от эпохи.
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(millis)));
    }

    int64_t toMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    template <typename Rep, typename Period>
    Timestamp operator+(std::chrono::duration<Rep, Period> d) const {
        return Timestamp(value + std::chrono::duration_cast<std::chrono::system_clock::duration>(d));
    }

    template <typename Rep, typename Period>
    Timestamp operator-(std::chrono::duration<Rep, Period> d) const {
        return Timestamp(value - std::chrono::duration_cast<std::chrono::system_clock::duration>(d));
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
};

} // namespace economy::domain

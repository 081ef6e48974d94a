#pragma once

#include <cstdint>

namespace economy::ports::output {

/**
 * @brief Единственный источник случайности в движке
 *
 * Все выплаты и исходы ограблений берут числа только отсюда, поэтому
 * в тестах можно подставить заранее заданную последовательность.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Равномерное целое из [min, max] включительно
     */
    virtual int64_t uniformInt(int64_t min, int64_t max) = 0;

    /**
     * @brief Равномерное число из [0, 1)
     */
    virtual double uniformUnit() = 0;
};

} // namespace economy::ports::output

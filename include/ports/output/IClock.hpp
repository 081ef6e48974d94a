#pragma once

#include "domain/Timestamp.hpp"

namespace economy::ports::output {

/**
 * @brief Источник текущего времени
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::Timestamp now() = 0;
};

} // namespace economy::ports::output

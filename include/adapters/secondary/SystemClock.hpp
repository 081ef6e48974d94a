#pragma once

#include "ports/output/IClock.hpp"

namespace economy::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() override {
        return domain::Timestamp::now();
    }
};

} // namespace economy::adapters::secondary

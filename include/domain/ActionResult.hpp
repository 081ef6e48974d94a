#pragma once

#include "Rejection.hpp"
#include <variant>
#include <stdexcept>

namespace economy::domain {

/**
 * @brief Результат действия: либо полезная нагрузка, либо отказ
 *
 * Нарушение бизнес-правил: нормальный результат, а не исключение.
 * Исключения зарезервированы для инфраструктуры и дефектов.
 */
template <typename T>
class ActionResult {
public:
    static ActionResult accepted(T value) {
        return ActionResult(std::move(value));
    }

    static ActionResult rejected(Rejection rejection) {
        return ActionResult(std::move(rejection));
    }

    bool isAccepted() const {
        return std::holds_alternative<T>(data_);
    }

    bool isRejected() const {
        return !isAccepted();
    }

    /**
     * @throws std::logic_error если результат: отказ
     */
    const T& value() const {
        if (!isAccepted()) {
            throw std::logic_error("ActionResult::value() on rejected result: "
                                   + std::get<Rejection>(data_).message);
        }
        return std::get<T>(data_);
    }

    /**
     * @throws std::logic_error если результат: успех
     */
    const Rejection& rejection() const {
        if (isAccepted()) {
            throw std::logic_error("ActionResult::rejection() on accepted result");
        }
        return std::get<Rejection>(data_);
    }

    RejectReason reason() const {
        return rejection().reason;
    }

private:
    explicit ActionResult(T value) : data_(std::move(value)) {}
    explicit ActionResult(Rejection rejection) : data_(std::move(rejection)) {}

    std::variant<T, Rejection> data_;
};

} // namespace economy::domain

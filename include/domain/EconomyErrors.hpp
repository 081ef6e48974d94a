#pragma once

#include <stdexcept>
#include <string>

namespace economy::domain {

/**
 * @brief Хранилище недоступно (таймаут, обрыв соединения, исчерпаны повторы)
 *
 * Изменения не применены, вызывающий может повторить операцию.
 */
class StoreUnavailableError : public std::runtime_error {
public:
    explicit StoreUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Конфликт транзакций (serialization failure / deadlock)
 *
 * Атомарная единица откатилась целиком и может быть выполнена заново.
 */
class TransactionConflictError : public std::runtime_error {
public:
    explicit TransactionConflictError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Нарушение инварианта леджера: дефект, а не отказ пользователю
 */
class InvariantViolationError : public std::logic_error {
public:
    explicit InvariantViolationError(const std::string& message)
        : std::logic_error(message) {}
};

} // namespace economy::domain

#pragma once

#include <string>
#include <stdexcept>

namespace economy::domain {

/**
 * @brief Тип банковской операции
 */
enum class TransactionType {
    DEPOSIT,        ///< Наличные → вклад
    WITHDRAW,       ///< Вклад → наличные
    TRANSFER_IN,    ///< Входящий перевод на вклад
    TRANSFER_OUT,   ///< Исходящий перевод с вклада
    INTEREST        ///< Ежедневные проценты
};

/**
 * @brief Строковое представление (совпадает со значениями в bank_transactions)
 */
inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::DEPOSIT:      return "deposit";
        case TransactionType::WITHDRAW:     return "withdraw";
        case TransactionType::TRANSFER_IN:  return "transfer_in";
        case TransactionType::TRANSFER_OUT: return "transfer_out";
        case TransactionType::INTEREST:     return "interest";
        default: return "unknown";
    }
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionType parseTransactionType(const std::string& str) {
    if (str == "deposit")      return TransactionType::DEPOSIT;
    if (str == "withdraw")     return TransactionType::WITHDRAW;
    if (str == "transfer_in")  return TransactionType::TRANSFER_IN;
    if (str == "transfer_out") return TransactionType::TRANSFER_OUT;
    if (str == "interest")     return TransactionType::INTEREST;
    throw std::invalid_argument("Unknown transaction type: " + str);
}

/**
 * @brief Знак изменения вклада для операции (+1 / -1)
 */
inline int savingsSign(TransactionType type) {
    switch (type) {
        case TransactionType::WITHDRAW:
        case TransactionType::TRANSFER_OUT:
            return -1;
        default:
            return 1;
    }
}

} // namespace economy::domain

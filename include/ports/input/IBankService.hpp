#pragma once

#include "domain/ActionResult.hpp"
#include "domain/BankResults.hpp"
#include <string>
#include <cstdint>

namespace economy::ports::input {

/**
 * @brief Интерфейс банка: вклад, снятие, переводы, проценты
 */
class IBankService {
public:
    virtual ~IBankService() = default;

    /**
     * @brief Положить наличные на вклад
     */
    virtual domain::ActionResult<domain::BankReceipt> deposit(
        const std::string& userId,
        const std::string& displayName,
        int64_t amount
    ) = 0;

    /**
     * @brief Снять с вклада в наличные (с дневным лимитом)
     */
    virtual domain::ActionResult<domain::BankReceipt> withdraw(
        const std::string& userId,
        const std::string& displayName,
        int64_t amount
    ) = 0;

    /**
     * @brief Перевод со вклада на вклад другого пользователя
     *
     * Получатель должен уже существовать: перевод не создаёт аккаунт.
     */
    virtual domain::ActionResult<domain::TransferReceipt> transfer(
        const std::string& fromUserId,
        const std::string& fromDisplayName,
        const std::string& toUserId,
        int64_t amount
    ) = 0;

    /**
     * @brief Начислить дневные проценты всем аккаунтам с вкладом
     *
     * Каждый аккаунт: отдельная атомарная единица. Повторный запуск в тот же
     * день пропускает уже обработанные аккаунты.
     */
    virtual domain::InterestReport accrueDailyInterest() = 0;

    virtual domain::ActionResult<domain::BankInfo> getBankInfo(const std::string& userId) = 0;
};

} // namespace economy::ports::input

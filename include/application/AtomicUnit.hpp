// include/application/AtomicUnit.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "domain/EconomyErrors.hpp"
#include <optional>
#include <string>
#include <vector>
#include <type_traits>
#include <iostream>

namespace economy::application {

/**
 * @brief Выполнить fn как одну атомарную единицу над accountIds
 *
 * При TransactionConflictError единица повторяется целиком, не более
 * maxRetries раз, затем StoreUnavailableError. Отказы (Rejection)
 * возвращаются из fn как обычный результат и не повторяются.
 */
template <typename Fn>
auto runAtomically(ports::output::ILedgerStore& store,
                   const std::vector<std::string>& accountIds,
                   int maxRetries,
                   const std::string& component,
                   Fn&& fn) -> std::invoke_result_t<Fn&, ports::output::ILedgerSession&>
{
    using Result = std::invoke_result_t<Fn&, ports::output::ILedgerSession&>;

    for (int attempt = 0;; ++attempt) {
        std::optional<Result> result;
        try {
            store.execute(accountIds, [&](ports::output::ILedgerSession& session) {
                result.emplace(fn(session));
            });
            return std::move(*result);

        } catch (const domain::TransactionConflictError& e) {
            if (attempt >= maxRetries) {
                std::cerr << "[" << component << "] Giving up after " << (attempt + 1)
                          << " attempts: " << e.what() << std::endl;
                throw domain::StoreUnavailableError("Transaction conflict persisted: " + std::string(e.what()));
            }
            std::cerr << "[" << component << "] Transaction conflict, retry "
                      << (attempt + 1) << "/" << maxRetries << std::endl;
        }
    }
}

/**
 * @brief Прочитать согласованный снимок и вернуть результат fn
 */
template <typename Fn>
auto readSnapshot(ports::output::ILedgerStore& store, Fn&& fn)
    -> std::invoke_result_t<Fn&, ports::output::ILedgerReader&>
{
    using Result = std::invoke_result_t<Fn&, ports::output::ILedgerReader&>;

    std::optional<Result> result;
    store.read([&](ports::output::ILedgerReader& reader) {
        result.emplace(fn(reader));
    });
    return std::move(*result);
}

} // namespace economy::application

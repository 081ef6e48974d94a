#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IBankService.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace economy::adapters::primary {

/**
 * @brief HTTP Handler банка
 *
 * Endpoints:
 * - GET  /api/v1/economy/bank?user_id=
 * - POST /api/v1/economy/bank/deposit   body: {"user_id", "display_name", "amount"}
 * - POST /api/v1/economy/bank/withdraw  body: {"user_id", "display_name", "amount"}
 * - POST /api/v1/economy/bank/transfer  body: {"user_id", "display_name", "to_user_id", "amount"}
 * - POST /api/v1/economy/bank/interest  (административный запуск начисления)
 */
class BankHandler : public IHttpHandler
{
public:
    explicit BankHandler(std::shared_ptr<ports::input::IBankService> bankService)
        : bankService_(std::move(bankService))
    {
        std::cout << "[BankHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded(res, "BankHandler", [&]() {
            const std::string method = req.getMethod();
            const std::string path = http::pathWithoutQuery(req.getPath());

            if (path == "/api/v1/economy/bank") {
                if (method != "GET") {
                    http::sendError(res, 405, "Method not allowed");
                    return;
                }
                auto userId = http::requireQueryParam(http::queryParams(req), "user_id");
                http::sendResult(res, bankService_->getBankInfo(userId));
                return;
            }

            if (method != "POST") {
                http::sendError(res, 405, "Method not allowed");
                return;
            }

            if (path == "/api/v1/economy/bank/interest") {
                auto report = bankService_->accrueDailyInterest();
                http::sendJson(res, 200, toJson(report));
            } else if (path == "/api/v1/economy/bank/deposit") {
                handleMove(req, res, true);
            } else if (path == "/api/v1/economy/bank/withdraw") {
                handleMove(req, res, false);
            } else if (path == "/api/v1/economy/bank/transfer") {
                handleTransfer(req, res);
            } else {
                http::sendError(res, 404, "Not found");
            }
        });
    }

private:
    std::shared_ptr<ports::input::IBankService> bankService_;

    void handleMove(IRequest& req, IResponse& res, bool deposit)
    {
        auto body = nlohmann::json::parse(req.getBody());
        auto userId = http::requireId(body, "user_id");
        auto displayName = http::optionalString(body, "display_name", userId);
        auto amount = http::requireAmount(body);

        if (deposit) {
            http::sendResult(res, bankService_->deposit(userId, displayName, amount));
        } else {
            http::sendResult(res, bankService_->withdraw(userId, displayName, amount));
        }
    }

    void handleTransfer(IRequest& req, IResponse& res)
    {
        auto body = nlohmann::json::parse(req.getBody());
        auto fromId = http::requireId(body, "user_id");
        auto fromName = http::optionalString(body, "display_name", fromId);
        auto toId = http::requireId(body, "to_user_id");
        auto amount = http::requireAmount(body);

        http::sendResult(res, bankService_->transfer(fromId, fromName, toId, amount));
    }
};

} // namespace economy::adapters::primary

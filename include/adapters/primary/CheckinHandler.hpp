#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ICheckinService.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace economy::adapters::primary {

/**
 * @brief HTTP Handler ежедневных отметок
 *
 * Endpoints:
 * - POST /api/v1/economy/checkin   body: {"user_id", "display_name"}
 * - GET  /api/v1/economy/checkin?user_id=
 */
class CheckinHandler : public IHttpHandler
{
public:
    explicit CheckinHandler(std::shared_ptr<ports::input::ICheckinService> checkinService)
        : checkinService_(std::move(checkinService))
    {
        std::cout << "[CheckinHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded(res, "CheckinHandler", [&]() {
            const std::string method = req.getMethod();
            if (method == "POST") {
                auto body = nlohmann::json::parse(req.getBody());
                auto userId = http::requireId(body, "user_id");
                auto displayName = http::optionalString(body, "display_name", userId);
                http::sendResult(res, checkinService_->checkin(userId, displayName));
            } else if (method == "GET") {
                auto params = http::queryParams(req);
                auto userId = http::requireQueryParam(params, "user_id");
                http::sendResult(res, checkinService_->getCheckinInfo(userId));
            } else {
                http::sendError(res, 405, "Method not allowed");
            }
        });
    }

private:
    std::shared_ptr<ports::input::ICheckinService> checkinService_;
};

} // namespace economy::adapters::primary

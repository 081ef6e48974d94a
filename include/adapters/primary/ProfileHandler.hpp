#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IProfileService.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace economy::adapters::primary {

/**
 * @brief HTTP Handler профиля
 *
 * Endpoints:
 * - GET /api/v1/economy/profile?user_id=
 * - GET /api/v1/economy/activities?user_id=&limit=
 */
class ProfileHandler : public IHttpHandler
{
public:
    explicit ProfileHandler(std::shared_ptr<ports::input::IProfileService> profileService)
        : profileService_(std::move(profileService))
    {
        std::cout << "[ProfileHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded(res, "ProfileHandler", [&]() {
            if (req.getMethod() != "GET") {
                http::sendError(res, 405, "Method not allowed");
                return;
            }

            const std::string path = http::pathWithoutQuery(req.getPath());
            auto params = http::queryParams(req);
            auto userId = http::requireQueryParam(params, "user_id");

            if (path == "/api/v1/economy/profile") {
                http::sendResult(res, profileService_->getProfile(userId));
            } else if (path == "/api/v1/economy/activities") {
                auto limit = http::limitParam(params, "limit", kDefaultActivities);
                auto result = profileService_->getRecentActivities(userId, limit);
                if (result.isRejected()) {
                    http::sendJson(res, 422, toJson(result.rejection()));
                    return;
                }

                nlohmann::json response;
                response["user_id"] = userId;
                response["activities"] = toJsonArray(result.value());
                http::sendJson(res, 200, response);
            } else {
                http::sendError(res, 404, "Not found");
            }
        });
    }

private:
    static constexpr size_t kDefaultActivities = 10;

    std::shared_ptr<ports::input::IProfileService> profileService_;
};

} // namespace economy::adapters::primary

#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IRobberyService.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace economy::adapters::primary {

/**
 * @brief HTTP Handler ограблений
 *
 * Endpoints:
 * - POST /api/v1/economy/rob            body: {"user_id", "display_name", "victim_id"}
 * - GET  /api/v1/economy/rob/stats?user_id=
 * - GET  /api/v1/economy/rob/targets?user_id=&limit=
 */
class RobberyHandler : public IHttpHandler
{
public:
    explicit RobberyHandler(std::shared_ptr<ports::input::IRobberyService> robberyService)
        : robberyService_(std::move(robberyService))
    {
        std::cout << "[RobberyHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded(res, "RobberyHandler", [&]() {
            const std::string method = req.getMethod();
            const std::string path = http::pathWithoutQuery(req.getPath());

            if (path == "/api/v1/economy/rob") {
                if (method != "POST") {
                    http::sendError(res, 405, "Method not allowed");
                    return;
                }
                auto body = nlohmann::json::parse(req.getBody());
                auto robberId = http::requireId(body, "user_id");
                auto robberName = http::optionalString(body, "display_name", robberId);
                auto victimId = http::requireId(body, "victim_id");
                http::sendResult(res, robberyService_->rob(robberId, robberName, victimId));
                return;
            }

            if (method != "GET") {
                http::sendError(res, 405, "Method not allowed");
                return;
            }

            auto params = http::queryParams(req);
            if (path == "/api/v1/economy/rob/stats") {
                auto userId = http::requireQueryParam(params, "user_id");
                http::sendResult(res, robberyService_->getRobberyStats(userId));
            } else if (path == "/api/v1/economy/rob/targets") {
                auto userId = http::requireQueryParam(params, "user_id");
                auto limit = http::limitParam(params, "limit", kDefaultTargets);
                auto targets = robberyService_->getRobberyTargets(userId, limit);

                nlohmann::json response;
                response["targets"] = toJsonArray(targets);
                response["count"] = targets.size();
                http::sendJson(res, 200, response);
            } else {
                http::sendError(res, 404, "Not found");
            }
        });
    }

private:
    static constexpr size_t kDefaultTargets = 10;

    std::shared_ptr<ports::input::IRobberyService> robberyService_;
};

} // namespace economy::adapters::primary

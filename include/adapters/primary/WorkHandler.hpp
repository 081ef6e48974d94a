#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IWorkService.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace economy::adapters::primary {

/**
 * @brief HTTP Handler работ
 *
 * Endpoints:
 * - GET  /api/v1/economy/jobs?user_id=
 * - POST /api/v1/economy/work         body: {"user_id", "display_name", "job"}
 * - GET  /api/v1/economy/work/stats?user_id=
 */
class WorkHandler : public IHttpHandler
{
public:
    explicit WorkHandler(std::shared_ptr<ports::input::IWorkService> workService)
        : workService_(std::move(workService))
    {
        std::cout << "[WorkHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded(res, "WorkHandler", [&]() {
            const std::string method = req.getMethod();
            const std::string path = http::pathWithoutQuery(req.getPath());

            if (path == "/api/v1/economy/work") {
                if (method != "POST") {
                    http::sendError(res, 405, "Method not allowed");
                    return;
                }
                handleWork(req, res);
            } else if (path == "/api/v1/economy/jobs" || path == "/api/v1/economy/work/stats") {
                if (method != "GET") {
                    http::sendError(res, 405, "Method not allowed");
                    return;
                }
                auto userId = http::requireQueryParam(http::queryParams(req), "user_id");
                if (path == "/api/v1/economy/jobs") {
                    http::sendResult(res, workService_->getJobBoard(userId));
                } else {
                    http::sendResult(res, workService_->getWorkStatistics(userId));
                }
            } else {
                http::sendError(res, 404, "Not found");
            }
        });
    }

private:
    std::shared_ptr<ports::input::IWorkService> workService_;

    void handleWork(IRequest& req, IResponse& res)
    {
        auto body = nlohmann::json::parse(req.getBody());
        auto userId = http::requireId(body, "user_id");
        auto displayName = http::optionalString(body, "display_name", userId);
        auto job = http::optionalString(body, "job", "");
        if (job.empty()) {
            http::sendError(res, 400, "Missing field: job");
            return;
        }
        http::sendResult(res, workService_->work(userId, displayName, job));
    }
};

} // namespace economy::adapters::primary

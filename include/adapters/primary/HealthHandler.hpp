#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/IClock.hpp"
#include "settings/DbSettings.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace economy::adapters::primary {

/**
 * @brief HTTP Handler для проверки здоровья сервиса
 *
 * Endpoint: GET /health
 */
class HealthHandler : public IHttpHandler
{
public:
    HealthHandler(
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::DbSettings> dbSettings
    ) : clock_(std::move(clock))
      , dbSettings_(std::move(dbSettings))
    {
        std::cout << "[HealthHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        if (req.getMethod() != "GET") {
            http::sendError(res, 405, "Method not allowed");
            return;
        }

        nlohmann::json response;
        response["status"] = "ok";
        response["timestamp"] = clock_->now().toString();
        response["store"] = dbSettings_->usePostgres() ? "postgres" : "memory";
        response["version"] = "1.0.0";

        http::sendJson(res, 200, response);
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<settings::DbSettings> dbSettings_;
};

} // namespace economy::adapters::primary

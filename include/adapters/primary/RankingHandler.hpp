#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IRankingService.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace economy::adapters::primary {

/**
 * @brief HTTP Handler рейтингов
 *
 * Endpoints:
 * - GET /api/v1/economy/ranking?metric=&limit=   (metric по умолчанию assets, limit: 10)
 * - GET /api/v1/economy/rank?user_id=&metric=
 */
class RankingHandler : public IHttpHandler
{
public:
    explicit RankingHandler(std::shared_ptr<ports::input::IRankingService> rankingService)
        : rankingService_(std::move(rankingService))
    {
        std::cout << "[RankingHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        http::guarded(res, "RankingHandler", [&]() {
            if (req.getMethod() != "GET") {
                http::sendError(res, 405, "Method not allowed");
                return;
            }

            const std::string path = http::pathWithoutQuery(req.getPath());
            auto params = http::queryParams(req);
            auto metric = metricParam(params);

            if (path == "/api/v1/economy/ranking") {
                auto limit = http::limitParam(params, "limit", kDefaultTop);
                http::sendJson(res, 200, toJson(rankingService_->topN(metric, limit)));
            } else if (path == "/api/v1/economy/rank") {
                auto userId = http::requireQueryParam(params, "user_id");
                http::sendResult(res, rankingService_->rank(userId, metric));
            } else {
                http::sendError(res, 404, "Not found");
            }
        });
    }

private:
    static constexpr size_t kDefaultTop = 10;

    std::shared_ptr<ports::input::IRankingService> rankingService_;

    static domain::RankingMetric metricParam(const std::map<std::string, std::string>& params)
    {
        auto it = params.find("metric");
        if (it == params.end() || it->second.empty()) {
            return domain::RankingMetric::TOTAL_ASSETS;
        }
        return domain::parseRankingMetric(it->second);
    }
};

} // namespace economy::adapters::primary

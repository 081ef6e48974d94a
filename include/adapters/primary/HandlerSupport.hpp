// include/adapters/primary/HandlerSupport.hpp
#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/JsonMapping.hpp"
#include "domain/ActionResult.hpp"
#include "domain/EconomyErrors.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <stdexcept>
#include <iostream>

namespace economy::adapters::primary {

/**
 * @brief Общие функции HTTP handlers экономики
 *
 * Коды ответа:
 * - 200: действие выполнено
 * - 422: отказ по бизнес-правилу (тело: reason, message, details)
 * - 400: некорректный запрос
 * - 405: неподдерживаемый метод
 * - 503: хранилище недоступно
 * - 500: прочие ошибки
 */
namespace http {

inline std::string pathWithoutQuery(const std::string& fullPath) {
    auto pos = fullPath.find('?');
    return pos == std::string::npos ? fullPath : fullPath.substr(0, pos);
}

namespace detail {

inline int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace detail

/**
 * @brief Декодирование компонента query string: %XX и '+' как пробел
 *
 * Неполная или нехексовая последовательность после '%' остаётся как есть.
 */
inline std::string urlDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out.push_back(' ');
            continue;
        }
        if (c == '%' && i + 2 < value.size()) {
            int hi = detail::hexDigit(value[i + 1]);
            int lo = detail::hexDigit(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

/**
 * @brief Query параметры из URL, с fallback на req.getParams()
 *
 * SimpleRequest в тестах не разбирает query string, BeastRequestAdapter разбирает.
 */
inline std::map<std::string, std::string> queryParams(IRequest& req) {
    std::map<std::string, std::string> params;

    const std::string fullPath = req.getPath();
    auto pos = fullPath.find('?');
    if (pos != std::string::npos) {
        std::string query = fullPath.substr(pos + 1);
        size_t start = 0;
        while (start < query.size()) {
            auto amp = query.find('&', start);
            std::string pair = amp == std::string::npos
                ? query.substr(start)
                : query.substr(start, amp - start);

            auto eq = pair.find('=');
            if (eq != std::string::npos && eq > 0) {
                params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
            }

            if (amp == std::string::npos) {
                break;
            }
            start = amp + 1;
        }
    }

    if (params.empty()) {
        params = req.getParams();
    }
    return params;
}

inline void sendJson(IResponse& res, int status, const nlohmann::json& body) {
    res.setStatus(status);
    res.setHeader("Content-Type", "application/json");
    res.setBody(body.dump());
}

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    sendJson(res, status, error);
}

template <typename T>
void sendResult(IResponse& res, const domain::ActionResult<T>& result) {
    if (result.isAccepted()) {
        sendJson(res, 200, toJson(result.value()));
    } else {
        sendJson(res, 422, toJson(result.rejection()));
    }
}

/**
 * @brief Обязательный идентификатор из тела запроса
 *
 * Чат-платформы присылают ID и строкой, и числом: принимаем оба.
 *
 * @throws std::invalid_argument если поле отсутствует или пустое
 */
inline std::string requireId(const nlohmann::json& body, const std::string& key) {
    if (!body.contains(key)) {
        throw std::invalid_argument("Missing field: " + key);
    }
    const auto& value = body.at(key);
    std::string id;
    if (value.is_string()) {
        id = value.get<std::string>();
    } else if (value.is_number_integer()) {
        id = std::to_string(value.get<int64_t>());
    } else {
        throw std::invalid_argument("Field " + key + " must be a string or an integer");
    }
    if (id.empty()) {
        throw std::invalid_argument("Field " + key + " must not be empty");
    }
    return id;
}

inline std::string optionalString(const nlohmann::json& body,
                                  const std::string& key,
                                  const std::string& fallback) {
    if (!body.contains(key) || body.at(key).is_null()) {
        return fallback;
    }
    return body.at(key).get<std::string>();
}

/**
 * @throws std::invalid_argument если сумма отсутствует или не целая
 */
inline int64_t requireAmount(const nlohmann::json& body, const std::string& key = "amount") {
    if (!body.contains(key) || !body.at(key).is_number_integer()) {
        throw std::invalid_argument("Field " + key + " must be an integer");
    }
    return body.at(key).get<int64_t>();
}

/**
 * @throws std::invalid_argument если параметра нет в query
 */
inline std::string requireQueryParam(const std::map<std::string, std::string>& params,
                                     const std::string& key) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) {
        throw std::invalid_argument("Missing query parameter: " + key);
    }
    return it->second;
}

/**
 * @brief Неотрицательное целое из query (limit), иначе fallback
 *
 * @throws std::invalid_argument если значение не число
 */
inline size_t limitParam(const std::map<std::string, std::string>& params,
                         const std::string& key,
                         size_t fallback) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) {
        return fallback;
    }
    size_t value = 0;
    for (char c : it->second) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Query parameter " + key + " must be a non-negative integer");
        }
        value = value * 10 + static_cast<size_t>(c - '0');
        if (value > 1000000) {
            throw std::invalid_argument("Query parameter " + key + " is too large");
        }
    }
    return value;
}

/**
 * @brief Выполнить обработчик, переведя исключения в HTTP статусы
 */
template <typename Fn>
void guarded(IResponse& res, const char* component, Fn&& fn) {
    try {
        fn();
    } catch (const nlohmann::json::exception& e) {
        sendError(res, 400, std::string("Invalid JSON: ") + e.what());
    } catch (const std::invalid_argument& e) {
        sendError(res, 400, e.what());
    } catch (const domain::StoreUnavailableError& e) {
        std::cerr << "[" << component << "] Store unavailable: " << e.what() << std::endl;
        sendError(res, 503, "Service temporarily unavailable");
    } catch (const std::exception& e) {
        std::cerr << "[" << component << "] Error: " << e.what() << std::endl;
        sendError(res, 500, "Internal server error");
    }
}

} // namespace http

} // namespace economy::adapters::primary

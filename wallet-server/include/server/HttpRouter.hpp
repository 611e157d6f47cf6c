#pragma once

#include "adapters/primary/HttpErrors.hpp"

#include <IHttpHandler.hpp>
#include <SimpleRequest.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace walletgate::server {

/**
 * @brief Таблица маршрутов (method, path) -> handler
 *
 * Паттерн может заканчиваться на "*": это ровно один сегмент пути,
 * хэндлер читает его через getPathParam(0).
 */
class HttpRouter {
public:
    void addHandler(const std::string& method, const std::string& pattern, std::shared_ptr<IHttpHandler> handler) {
        routes_.push_back(Route{method, pattern, std::move(handler)});
    }

    /**
     * @brief Найти маршрут и выполнить хэндлер
     *
     * 404 если путь неизвестен, 405 если путь есть, но метод другой.
     * Исключения хэндлера превращаются в 500.
     */
    void dispatch(SimpleRequest& req, IResponse& res) const {
        bool pathKnown = false;
        for (const auto& route : routes_) {
            if (!matches(route.pattern, req.getPath())) {
                continue;
            }
            pathKnown = true;
            if (route.method != req.getMethod()) {
                continue;
            }

            req.setPathPattern(route.pattern);
            try {
                route.handler->handle(req, res);
            } catch (const std::exception& e) {
                std::cerr << "[HttpRouter] Handler error on " << req.getMethod() << " "
                          << req.getPath() << ": " << e.what() << std::endl;
                adapters::primary::sendError(res, protocol::ErrorCode::INTERNAL_ERROR, "Internal server error");
            }
            return;
        }

        if (pathKnown) {
            adapters::primary::sendJson(res, 405, {{"error", "Method not allowed"}});
        } else {
            adapters::primary::sendError(res, protocol::ErrorCode::NOT_FOUND, "Endpoint not found");
        }
    }

    static bool matches(const std::string& pattern, const std::string& path) {
        if (pattern.empty() || pattern.back() != '*') {
            return pattern == path;
        }
        const auto prefix = pattern.substr(0, pattern.size() - 1);
        if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
            return false;
        }
        return path.find('/', prefix.size()) == std::string::npos;
    }

    size_t size() const { return routes_.size(); }

private:
    struct Route {
        std::string method;
        std::string pattern;
        std::shared_ptr<IHttpHandler> handler;
    };

    std::vector<Route> routes_;
};

} // namespace walletgate::server

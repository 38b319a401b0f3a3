/**
 * @file router.h
 * @brief (method, path) dispatch table
 */

#pragma once

#include "connection.h"
#include "http_message.h"

#include <map>
#include <string>
#include <utility>

namespace voxserve {

/**
 * @brief Exact-match dispatch on method and path
 *
 * OPTIONS on any path answers the CORS preflight; everything unmatched is
 * 404 NOT_FOUND.
 */
class Router {
public:
    void add_route(const std::string& method, const std::string& path, RequestHandler handler);

    void get(const std::string& path, RequestHandler handler) { add_route("GET", path, std::move(handler)); }
    void post(const std::string& path, RequestHandler handler) { add_route("POST", path, std::move(handler)); }

    HttpResponse dispatch(const HttpRequest& request, RequestContext& context) const;

    bool has_route(const std::string& method, const std::string& path) const;
    size_t route_count() const { return routes_.size(); }

private:
    std::map<std::pair<std::string, std::string>, RequestHandler> routes_;
};

} // namespace voxserve

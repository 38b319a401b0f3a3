/**
 * @file router.cpp
 * @brief Request router implementation
 */

#include "voxserve/router.h"

namespace voxserve {

void Router::add_route(const std::string& method, const std::string& path, RequestHandler handler) {
    routes_[{method, path}] = std::move(handler);
}

bool Router::has_route(const std::string& method, const std::string& path) const {
    return routes_.count({method, path}) > 0;
}

HttpResponse Router::dispatch(const HttpRequest& request, RequestContext& context) const {
    if (request.method == "OPTIONS") {
        return make_preflight_response();
    }

    auto it = routes_.find({request.method, request.path});
    if (it == routes_.end()) {
        return make_error_response(ErrorCode::NotFound,
                                   "Endpoint not found: " + request.method + " " + request.path);
    }
    return it->second(request, context);
}

} // namespace voxserve

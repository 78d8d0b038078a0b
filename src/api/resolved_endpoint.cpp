#include "api/resolved_endpoint.hpp"

#include <stdexcept>

ResolvedEndpoint::ResolvedEndpoint(std::string profile_id, int port,
                                   std::optional<std::string> ws_endpoint)
    : profile_id_(std::move(profile_id)), port_(port), ws_endpoint_(std::move(ws_endpoint)) {
    if (!valid_port(port)) {
        throw std::invalid_argument("invalid debug port: " + std::to_string(port));
    }
    if (ws_endpoint_ && ws_endpoint_->empty()) {
        ws_endpoint_.reset();
    }
}

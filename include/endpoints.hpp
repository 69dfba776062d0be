#pragma once
#include "router.hpp"
#include "bridge/bridge.hpp"
#include "logger/metrics.hpp"

class Endpoints
{
public:
    Endpoints(const Bridge& br, BridgeMetrics& metrics);

    void install(Router& router) const;

    [[nodiscard]] Router::Response handle_health(const Router::Request& req) const;
    [[nodiscard]] Router::Response handle_decode(const Router::Request& req) const;
    [[nodiscard]] Router::Response handle_encode(const Router::Request& req) const;

private:
    const Bridge& bridge;
    BridgeMetrics& mts;
};

#pragma once
#include <atomic>
#include <chrono>
#include <algorithm>
#include <cstdint>
#include <format>
#include <string>

struct BridgeMetrics
{
    std::atomic<uint64_t> connections_accepted{0};
    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> decodes_ok{0};
    std::atomic<uint64_t> decodes_failed{0};
    std::atomic<uint64_t> encodes_ok{0};
    std::atomic<uint64_t> encodes_failed{0};
    std::atomic<uint64_t> not_found{0};
    std::atomic<uint64_t> bytes_received{0};
    std::atomic<uint64_t> bytes_sent{0};
    std::atomic<uint64_t> errors{0};
    std::atomic<uint64_t> timeouts{0};

    std::chrono::steady_clock::time_point start_time{std::chrono::steady_clock::now()};

    BridgeMetrics() = default;

    void reset()
    {
        start_time = std::chrono::steady_clock::now();
        connections_accepted = 0;
        requests = 0;
        decodes_ok = 0;
        decodes_failed = 0;
        encodes_ok = 0;
        encodes_failed = 0;
        not_found = 0;
        bytes_received = 0;
        bytes_sent = 0;
        errors = 0;
        timeouts = 0;
    }
};

template<>
struct std::formatter<BridgeMetrics>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const BridgeMetrics& s, std::format_context& fc) const
    {
        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - s.start_time).count();

        uint64_t reqs = s.requests.load();
        uint64_t dec_ok = s.decodes_ok.load();
        uint64_t dec_fail = s.decodes_failed.load();
        uint64_t enc_ok = s.encodes_ok.load();
        uint64_t enc_fail = s.encodes_failed.load();

        constexpr double KB = 1024.0;

        auto out = fc.out();
        out = std::format_to(out, "\n============================================================\n");
        out = std::format_to(out, "BRIDGE METRICS REPORT\n");
        out = std::format_to(out, "============================================================\n");
        out = std::format_to(out, "Uptime: {}s ({:.2f}h)\n\n", uptime, uptime / 3600.0);
        out = std::format_to(out, "--- TRAFFIC ---\n");
        out = std::format_to(out, "  Connections:     {}\n", s.connections_accepted.load());
        out = std::format_to(out, "  Requests:        {}\n", reqs);
        out = std::format_to(out, "  Rate:            {:.1f}/sec\n", static_cast<double>(reqs) / std::max<int64_t>(uptime, 1));
        out = std::format_to(out, "  Not found:       {}\n\n", s.not_found.load());
        out = std::format_to(out, "--- CONVERSIONS ---\n");
        out = std::format_to(out, "  Decode ok/fail:  {}/{}\n", dec_ok, dec_fail);
        out = std::format_to(out, "  Encode ok/fail:  {}/{}\n\n", enc_ok, enc_fail);
        out = std::format_to(out, "--- BANDWIDTH ---\n");
        out = std::format_to(out, "  Received:        {:.2f} KB\n", s.bytes_received.load() / KB);
        out = std::format_to(out, "  Sent:            {:.2f} KB\n\n", s.bytes_sent.load() / KB);
        out = std::format_to(out, "--- ERRORS ---\n");
        out = std::format_to(out, "  Errors:          {}\n", s.errors.load());
        out = std::format_to(out, "  Timeouts:        {}\n", s.timeouts.load());
        return std::format_to(out, "============================================================");
    }
};

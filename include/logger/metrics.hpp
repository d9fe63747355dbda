#pragma once
#include <atomic>
#include <chrono>
#include <algorithm>
#include <cstdint>
#include <format>

struct ServerMetrics
{
    std::atomic<uint64_t> connections_accepted{0};
    std::atomic<uint64_t> connections_closed{0};
    std::atomic<uint64_t> handshakes_completed{0};
    std::atomic<uint64_t> handshakes_failed{0};
    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> logins_successful{0};
    std::atomic<uint64_t> logins_failed{0};
    std::atomic<uint64_t> sessions_rejected{0};
    std::atomic<uint64_t> static_served{0};
    std::atomic<uint64_t> errors{0};
    std::atomic<uint64_t> timeouts{0};

    std::chrono::steady_clock::time_point start_time{std::chrono::steady_clock::now()};
};

template<>
struct std::formatter<ServerMetrics>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const ServerMetrics& s, std::format_context& fc) const
    {
        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - s.start_time).count();

        uint64_t conns_accepted = s.connections_accepted.load();
        uint64_t conns_closed = s.connections_closed.load();
        uint64_t hs_completed = s.handshakes_completed.load();
        uint64_t hs_failed = s.handshakes_failed.load();
        uint64_t reqs = s.requests.load();

        auto out = fc.out();
        out = std::format_to(out, "\n============================================================\n");
        out = std::format_to(out, "SERVER METRICS REPORT\n");
        out = std::format_to(out, "============================================================\n");
        out = std::format_to(out, "Uptime: {}s ({:.2f}h)\n\n", uptime, uptime / 3600.0);
        out = std::format_to(out, "--- CONNECTIONS ---\n");
        out = std::format_to(out, "  Accepted:        {}\n", conns_accepted);
        out = std::format_to(out, "  Closed:          {}\n", conns_closed);
        out = std::format_to(out, "  Active:          {}\n\n", conns_accepted - conns_closed);
        out = std::format_to(out, "--- TLS HANDSHAKES ---\n");
        out = std::format_to(out, "  Completed:       {}\n", hs_completed);
        out = std::format_to(out, "  Failed:          {}\n\n", hs_failed);
        out = std::format_to(out, "--- REQUESTS ---\n");
        out = std::format_to(out, "  Total:           {}\n", reqs);
        out = std::format_to(out, "  Static files:    {}\n", s.static_served.load());
        out = std::format_to(out, "  Rate:            {:.1f}/sec\n\n",
                             static_cast<double>(reqs) / std::max<int64_t>(uptime, 1));
        out = std::format_to(out, "--- AUTHENTICATION ---\n");
        out = std::format_to(out, "  Logins ok:       {}\n", s.logins_successful.load());
        out = std::format_to(out, "  Logins failed:   {}\n", s.logins_failed.load());
        out = std::format_to(out, "  Sessions denied: {}\n\n", s.sessions_rejected.load());
        out = std::format_to(out, "--- ERRORS ---\n");
        out = std::format_to(out, "  Errors:          {}\n", s.errors.load());
        out = std::format_to(out, "  Timeouts:        {}\n", s.timeouts.load());
        return std::format_to(out, "============================================================");
    }
};

/*

stats.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <atomic>
#include <cstdint>


namespace triagexx
{


/**
Plain copy of the pipeline counters.
**/
struct pipeline_stats_snapshot
{
    std::uint64_t requests = 0;
    std::uint64_t classified = 0;
    std::uint64_t fallbacks = 0;
    std::uint64_t gateway_timeouts = 0;
    std::uint64_t gateway_errors = 0;
    std::uint64_t cancellations = 0;

    bool operator==(const pipeline_stats_snapshot&) const = default;
};


/**
Diagnostic counters shared by all requests of a pipeline.

Every counter is updated independently, so a snapshot taken while requests are running may be off by the requests in
flight.
**/
class pipeline_stats
{
public:

    pipeline_stats() = default;

    pipeline_stats(const pipeline_stats&) = delete;

    void operator=(const pipeline_stats&) = delete;

    std::atomic<std::uint64_t> requests{0};
    std::atomic<std::uint64_t> classified{0};
    std::atomic<std::uint64_t> fallbacks{0};
    std::atomic<std::uint64_t> gateway_timeouts{0};
    std::atomic<std::uint64_t> gateway_errors{0};
    std::atomic<std::uint64_t> cancellations{0};

    static void bump(std::atomic<std::uint64_t>& counter)
    {
        counter.fetch_add(1, std::memory_order_relaxed);
    }

    pipeline_stats_snapshot snapshot() const
    {
        pipeline_stats_snapshot s;
        s.requests = requests.load(std::memory_order_relaxed);
        s.classified = classified.load(std::memory_order_relaxed);
        s.fallbacks = fallbacks.load(std::memory_order_relaxed);
        s.gateway_timeouts = gateway_timeouts.load(std::memory_order_relaxed);
        s.gateway_errors = gateway_errors.load(std::memory_order_relaxed);
        s.cancellations = cancellations.load(std::memory_order_relaxed);
        return s;
    }
};


} // namespace triagexx

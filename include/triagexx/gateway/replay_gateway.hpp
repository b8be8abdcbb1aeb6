/*

replay_gateway.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <json/json.h>
#include <triagexx/detail/asio_decl.hpp>
#include <triagexx/detail/log.hpp>
#include <triagexx/detail/result.hpp>
#include <triagexx/gateway/gateway.hpp>


namespace triagexx
{


/**
Gateway answering every request with a recorded outcome, optionally after a simulated latency.

The recorded outcome is immutable, so one instance may serve concurrent requests.
**/
class replay_gateway : public classification_gateway
{
public:

    /**
    Replaying a candidate output.
    **/
    explicit replay_gateway(Json::Value candidate, std::chrono::milliseconds latency = std::chrono::milliseconds{0}) :
        outcome_(std::move(candidate)), latency_(latency)
    {
    }

    /**
    Replaying a failure.
    **/
    explicit replay_gateway(error failure, std::chrono::milliseconds latency = std::chrono::milliseconds{0}) :
        outcome_(std::unexpected(std::move(failure))), latency_(latency)
    {
    }

    replay_gateway(const replay_gateway&) = delete;

    replay_gateway(replay_gateway&&) = delete;

    void operator=(const replay_gateway&) = delete;

    void operator=(replay_gateway&&) = delete;

    asio::awaitable<result<Json::Value>> classify(const classification_request& request) override
    {
        calls_.fetch_add(1, std::memory_order_relaxed);
        const std::size_t payload_keys = request.payload.size();
        if (latency_.count() > 0)
        {
            asio::steady_timer timer(co_await asio::this_coro::executor);
            timer.expires_after(latency_);
            asio::error_code ec;
            co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            if (ec)
                co_return fail<Json::Value>(error_code::gateway_cancelled, "Replay interrupted.", ec.message());
        }
        TRIAGEXX_TRACE("gateway", "replaying outcome for a payload of " + std::to_string(payload_keys) + " fields");
        co_return outcome_;
    }

    std::string name() const override
    {
        return "replay";
    }

    /**
    Number of classification calls received so far.
    **/
    std::uint64_t calls() const
    {
        return calls_.load(std::memory_order_relaxed);
    }

private:
    const result<Json::Value> outcome_;
    const std::chrono::milliseconds latency_;
    std::atomic<std::uint64_t> calls_{0};
};


} // namespace triagexx

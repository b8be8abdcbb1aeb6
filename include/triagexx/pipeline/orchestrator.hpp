/*

orchestrator.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Single entry point from a provider message to a triage output.

*/


#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <json/json.h>
#include <triagexx/detail/asio_decl.hpp>
#include <triagexx/detail/log.hpp>
#include <triagexx/detail/result.hpp>
#include <triagexx/gateway/gateway.hpp>
#include <triagexx/mime/decoder.hpp>
#include <triagexx/mime/raw_message.hpp>
#include <triagexx/pipeline/stats.hpp>
#include <triagexx/signals/extractor.hpp>
#include <triagexx/timestamp.hpp>
#include <triagexx/triage/normalizer.hpp>
#include <triagexx/triage/output.hpp>
#include <triagexx/triage/taxonomy.hpp>
#include <triagexx/triage_config.hpp>


namespace triagexx
{


/**
Stages a request goes through. Every request ends in `COMPLETED`; `CLASSIFICATION_FAILED` continues to `NORMALIZED`
through the fallback output.
**/
enum class stage_t {RECEIVED, PARSED, SIGNALS_EXTRACTED, CLASSIFIED, CLASSIFICATION_FAILED, NORMALIZED, COMPLETED};


inline std::string_view to_string(stage_t stage)
{
    switch (stage)
    {
        case stage_t::RECEIVED:
            return "received";
        case stage_t::PARSED:
            return "parsed";
        case stage_t::SIGNALS_EXTRACTED:
            return "signals_extracted";
        case stage_t::CLASSIFIED:
            return "classified";
        case stage_t::CLASSIFICATION_FAILED:
            return "classification_failed";
        case stage_t::NORMALIZED:
            return "normalized";
        case stage_t::COMPLETED:
            return "completed";
    }
    return "received";
}


/**
State of one request: the stages it went through and whether its caller gave up on it.

`abort()` may be called from any thread; the rest belongs to the request's own executor.
**/
class request_context
{
public:

    request_context() = default;

    request_context(const request_context&) = delete;

    request_context(request_context&&) = delete;

    void operator=(const request_context&) = delete;

    void operator=(request_context&&) = delete;

    /**
    Abandoning the pending classification, if any; the request then completes with the fallback output.
    **/
    void abort()
    {
        aborted_.store(true, std::memory_order_release);
        std::lock_guard lock(mutex_);
        if (canceller_)
            canceller_();
    }

    bool aborted() const
    {
        return aborted_.load(std::memory_order_acquire);
    }

    const std::vector<stage_t>& stages() const
    {
        return stages_;
    }

    std::optional<stage_t> stage() const
    {
        if (stages_.empty())
            return std::nullopt;
        return stages_.back();
    }

private:

    friend class pipeline;

    void enter(stage_t stage)
    {
        stages_.push_back(stage);
        TRIAGEXX_DEBUG("pipeline", "stage " + std::string(to_string(stage)));
    }

    void attach(std::function<void()> canceller)
    {
        std::lock_guard lock(mutex_);
        canceller_ = std::move(canceller);
    }

    void detach()
    {
        std::lock_guard lock(mutex_);
        canceller_ = nullptr;
    }

    std::atomic<bool> aborted_{false};
    std::mutex mutex_;
    std::function<void()> canceller_;
    std::vector<stage_t> stages_;
};


/**
Triage pipeline: decoding, signal extraction, classification under a timeout, normalization.

A pipeline holds only read-only state and atomic counters, so any number of requests may run through it concurrently.
A request suspends only while waiting for the classification. Requests sharing a multi-threaded executor must each be
spawned on their own strand. The gateway must outlive every request, including abandoned classification calls.
**/
class pipeline
{
public:

    using clock_fn = std::function<sys_seconds()>;

    /// Current time truncated to seconds
    static sys_seconds system_now()
    {
        return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    }

    pipeline(triage_config config, classification_gateway& gateway, const taxonomy& tax = standard_taxonomy(),
        clock_fn clock = &pipeline::system_now) :
        config_(std::move(config)), taxonomy_(tax), gateway_(gateway), clock_(std::move(clock)), decoder_(config_),
        normalizer_(config_, tax)
    {
    }

    pipeline(const pipeline&) = delete;

    pipeline(pipeline&&) = delete;

    void operator=(const pipeline&) = delete;

    void operator=(pipeline&&) = delete;

    /**
    Triaging a message.

    @param msg Provider message.
    @param ctx Request state; must outlive the returned operation.
    @return    Triage output, the fallback output if the classification failed, timed out or was aborted.
    **/
    asio::awaitable<triage_output> run(raw_message msg, request_context& ctx);

    /**
    Triaging a message with a private request state.
    **/
    asio::awaitable<triage_output> run(raw_message msg);

    /**
    Triaging a message on a private event loop, for synchronous callers.

    An abandoned classification call is destroyed with the event loop instead of being awaited.
    **/
    triage_output run_blocking(const raw_message& msg);

    const pipeline_stats& stats() const
    {
        return stats_;
    }

    const triage_config& config() const
    {
        return config_;
    }

private:

    /**
    Outcome of one classification call, shared between the waiting request and the gateway coroutine.
    **/
    struct call_state
    {
        explicit call_state(const asio::any_io_executor& executor) : deadline(executor)
        {
        }

        asio::steady_timer deadline;
        std::optional<result<Json::Value>> outcome;
        bool settled = false;
    };

    static asio::awaitable<result<Json::Value>> call_gateway(classification_gateway& gateway,
        std::shared_ptr<const classification_request> request);

    asio::awaitable<result<Json::Value>> classify(classification_request request, request_context& ctx);

    signals_bundle extract_signals(const normalized_message& msg) const;

    const triage_config config_;
    const taxonomy& taxonomy_;
    classification_gateway& gateway_;
    const clock_fn clock_;
    const mime_decoder decoder_;
    const signal_extractor extractor_;
    const result_normalizer normalizer_;
    pipeline_stats stats_;
};


inline asio::awaitable<result<Json::Value>> pipeline::call_gateway(classification_gateway& gateway,
    std::shared_ptr<const classification_request> request)
{
    co_return co_await gateway.classify(*request);
}


inline asio::awaitable<result<Json::Value>> pipeline::classify(classification_request request, request_context& ctx)
{
    if (ctx.aborted())
    {
        pipeline_stats::bump(stats_.cancellations);
        TRIAGEXX_WARN("pipeline", "request aborted before classification");
        co_return fail<Json::Value>(error_code::gateway_cancelled, "Request aborted.");
    }

    auto executor = co_await asio::this_coro::executor;
    auto state = std::make_shared<call_state>(executor);
    state->deadline.expires_after(config_.gateway_timeout);
    ctx.attach([state]()
    {
        asio::post(state->deadline.get_executor(), [state]()
        {
            state->deadline.cancel();
        });
    });

    if (ctx.aborted())
    {
        // Aborted before the canceller was attached, nothing would wake the wait.
        ctx.detach();
        pipeline_stats::bump(stats_.cancellations);
        TRIAGEXX_WARN("pipeline", "request aborted before classification");
        co_return fail<Json::Value>(error_code::gateway_cancelled, "Request aborted.");
    }

    auto req = std::make_shared<const classification_request>(std::move(request));
    asio::co_spawn(executor, call_gateway(gateway_, req), [state](std::exception_ptr ex, result<Json::Value> res)
    {
        if (state->settled)
            return;
        if (ex)
        {
            try
            {
                std::rethrow_exception(ex);
            }
            catch (const std::exception& exc)
            {
                res = fail<Json::Value>(error_code::gateway_error, "Gateway failure.", exc.what());
            }
            catch (...)
            {
                res = fail<Json::Value>(error_code::gateway_error, "Gateway failure.", "unknown exception");
            }
        }
        state->outcome = std::move(res);
        state->deadline.cancel();
    });

    if (!state->outcome)
    {
        asio::error_code ec;
        co_await state->deadline.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
    state->settled = true;
    ctx.detach();

    if (state->outcome)
    {
        result<Json::Value> outcome = std::move(*state->outcome);
        if (outcome && !outcome->isObject())
            outcome = fail<Json::Value>(error_code::gateway_invalid_response, "Classification is not an object.");
        if (!outcome)
        {
            pipeline_stats::bump(stats_.gateway_errors);
            TRIAGEXX_WARN("pipeline", gateway_.name() + " gateway failed: " + outcome.error().to_string());
        }
        co_return outcome;
    }
    if (ctx.aborted())
    {
        pipeline_stats::bump(stats_.cancellations);
        TRIAGEXX_WARN("pipeline", "classification abandoned, request aborted");
        co_return fail<Json::Value>(error_code::gateway_cancelled, "Request aborted.");
    }
    pipeline_stats::bump(stats_.gateway_timeouts);
    TRIAGEXX_WARN("pipeline", gateway_.name() + " gateway timed out after " +
        std::to_string(config_.gateway_timeout.count()) + " ms");
    co_return fail<Json::Value>(error_code::gateway_timeout, "Classification timed out.");
}


inline signals_bundle pipeline::extract_signals(const normalized_message& msg) const
{
    try
    {
        return extractor_.extract(msg);
    }
    catch (const std::runtime_error& exc)
    {
        // Regex engines give up on pathological input; the message is then treated as signal free.
        TRIAGEXX_WARN("pipeline", std::string("signal extraction gave up: ") + exc.what());
        return signals_bundle{};
    }
}


inline asio::awaitable<triage_output> pipeline::run(raw_message msg, request_context& ctx)
{
    pipeline_stats::bump(stats_.requests);
    ctx.enter(stage_t::RECEIVED);
    const sys_seconds received_at = clock_();

    const normalized_message message = decoder_.decode(msg);
    ctx.enter(stage_t::PARSED);

    const signals_bundle signals = extract_signals(message);
    ctx.enter(stage_t::SIGNALS_EXTRACTED);

    const sys_seconds reference = reference_time(message, received_at);
    result<Json::Value> candidate = co_await classify(build_classification_request(message, signals, taxonomy_, config_), ctx);

    triage_output out;
    if (candidate)
    {
        ctx.enter(stage_t::CLASSIFIED);
        pipeline_stats::bump(stats_.classified);
        out = normalizer_.normalize(*candidate, message, signals, reference, clock_());
    }
    else
    {
        ctx.enter(stage_t::CLASSIFICATION_FAILED);
        pipeline_stats::bump(stats_.fallbacks);
        out = normalizer_.fallback(message, reference, clock_(), candidate.error());
    }
    ctx.enter(stage_t::NORMALIZED);
    ctx.enter(stage_t::COMPLETED);
    co_return out;
}


inline asio::awaitable<triage_output> pipeline::run(raw_message msg)
{
    request_context ctx;
    co_return co_await run(std::move(msg), ctx);
}


inline triage_output pipeline::run_blocking(const raw_message& msg)
{
    asio::io_context io;
    std::optional<triage_output> out;
    std::exception_ptr failure;
    asio::co_spawn(io, run(msg), [&io, &out, &failure](std::exception_ptr ex, triage_output res)
    {
        if (ex)
            failure = ex;
        else
            out = std::move(res);
        io.stop();
    });
    io.run();
    if (failure)
        std::rethrow_exception(failure);
    if (!out)
        throw std::logic_error("triage request did not complete");
    return std::move(*out);
}


} // namespace triagexx

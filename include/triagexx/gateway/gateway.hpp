/*

gateway.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Boundary to the external classification service.

*/


#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <json/json.h>
#include <triagexx/detail/asio_decl.hpp>
#include <triagexx/detail/result.hpp>
#include <triagexx/gateway/prompt.hpp>
#include <triagexx/mime/normalized_message.hpp>
#include <triagexx/signals/signals.hpp>
#include <triagexx/timestamp.hpp>
#include <triagexx/triage/taxonomy.hpp>
#include <triagexx/triage_config.hpp>


namespace triagexx
{


/**
Everything a classification service is given for one message.
**/
struct classification_request
{
    std::string system_prompt;

    /// Message and signals, serialized as the user content
    Json::Value payload;

    std::vector<std::string> allowed_categories;
    std::vector<std::string> allowed_action_keys;

    /// Sampling hint, services without one ignore it
    double temperature = 0.2;
};


/**
Classification service.

Implementations complete with the untrusted candidate output or an error; they may suspend for as long as they need,
the caller bounds the wait and abandons the call on timeout or cancellation. A call may therefore outlive its caller's
interest, so implementations must not keep references to the request past their first suspension point unless they
copied it.
**/
class classification_gateway
{
public:

    virtual ~classification_gateway() = default;

    /**
    Classifying a message.

    @param request Prompt, payload and allowed values.
    @return        Candidate output, or a gateway error.
    **/
    virtual asio::awaitable<result<Json::Value>> classify(const classification_request& request) = 0;

    /**
    Name used in logs.
    **/
    virtual std::string name() const = 0;
};


namespace gateway_detail
{

inline Json::Value string_array(const std::vector<std::string>& items, std::size_t limit = static_cast<std::size_t>(-1))
{
    Json::Value array(Json::arrayValue);
    for (std::size_t i = 0; i < items.size() && i < limit; ++i)
        array.append(items[i]);
    return array;
}

} // namespace gateway_detail


/**
Building the classification request of a message.

@param msg     Decoded message.
@param signals Signals of the message, each kind capped at `max_signals_per_kind`.
@param tax     Taxonomy the service must choose among.
@param config  Configuration.
@return        Request ready for `classification_gateway::classify`.
**/
inline classification_request build_classification_request(const normalized_message& msg, const signals_bundle& signals,
    const taxonomy& tax, const triage_config& config)
{
    using gateway_detail::string_array;
    const std::size_t cap = config.max_signals_per_kind;

    Json::Value payload(Json::objectValue);
    payload["messageId"] = msg.message_id;
    payload["threadId"] = msg.thread_id;
    payload["subject"] = msg.subject;
    payload["from"]["name"] = msg.sender.name;
    payload["from"]["email"] = msg.sender.address;
    payload["to"] = string_array(msg.to);
    payload["cc"] = string_array(msg.cc);
    payload["sentAt"] = msg.sent_at ? Json::Value(format_iso(*msg.sent_at)) : Json::Value(Json::nullValue);
    payload["snippet"] = msg.snippet;
    payload["bodyText"] = msg.body_text;
    payload["bodyTruncated"] = msg.body_truncated;

    Json::Value& sig = payload["signals"];
    sig["links"] = string_array(signals.urls, cap);
    sig["money"] = Json::Value(Json::arrayValue);
    for (std::size_t i = 0; i < signals.money.size() && i < cap; ++i)
    {
        const money_mention& m = signals.money[i];
        Json::Value item(Json::objectValue);
        item["text"] = m.raw_text;
        item["currency"] = m.currency ? Json::Value(*m.currency) : Json::Value(Json::nullValue);
        item["amount"] = m.amount ? Json::Value(*m.amount) : Json::Value(Json::nullValue);
        sig["money"].append(item);
    }
    sig["timePhrases"] = Json::Value(Json::arrayValue);
    for (std::size_t i = 0; i < signals.time_phrases.size() && i < cap; ++i)
    {
        Json::Value item(Json::objectValue);
        item["text"] = signals.time_phrases[i].raw_text;
        item["kind"] = std::string(to_string(signals.time_phrases[i].kind));
        sig["timePhrases"].append(item);
    }

    classification_request request;
    request.system_prompt = system_prompt(tax);
    request.payload = std::move(payload);
    request.allowed_categories = tax.category_names();
    request.allowed_action_keys = tax.action_keys();
    request.temperature = config.temperature;
    return request;
}


} // namespace triagexx

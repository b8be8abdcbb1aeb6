/*

normalizer.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Repairing an untrusted classification into a valid triage output.

*/


#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <json/json.h>
#include <boost/algorithm/string.hpp>
#include <triagexx/detail/ascii.hpp>
#include <triagexx/detail/log.hpp>
#include <triagexx/detail/result.hpp>
#include <triagexx/detail/utf8.hpp>
#include <triagexx/mime/normalized_message.hpp>
#include <triagexx/signals/extractor.hpp>
#include <triagexx/signals/signals.hpp>
#include <triagexx/timestamp.hpp>
#include <triagexx/triage/coerce.hpp>
#include <triagexx/triage/deadline.hpp>
#include <triagexx/triage/output.hpp>
#include <triagexx/triage/taxonomy.hpp>
#include <triagexx/triage_config.hpp>


namespace triagexx
{


/// Debug note added when fewer evidence snippets than the minimum remain.
inline constexpr std::string_view NOTE_EVIDENCE_BELOW_MINIMUM = "evidence_below_minimum";

/// Debug note added when a deadline text could not be resolved to an instant.
inline constexpr std::string_view NOTE_DEADLINE_UNRESOLVED = "deadline_unresolved";


/**
Instant relative phrases of a message are resolved against: when it was sent, else when it was received, else now.
**/
inline sys_seconds reference_time(const normalized_message& msg, sys_seconds now)
{
    if (msg.sent_at)
        return msg.sent_at->utc;
    if (msg.internal_date)
        return *msg.internal_date;
    return now;
}


/**
Normalizer of classification results.

Every rule has a deterministic default, so normalization never fails; running it again on its own output (as JSON)
yields the same output.
**/
class result_normalizer
{
public:

    explicit result_normalizer(triage_config config, const taxonomy& tax = standard_taxonomy()) :
        config_(std::move(config)), taxonomy_(tax)
    {
    }

    /**
    Normalizing a candidate output.

    @param candidate    Classification response, possibly malformed.
    @param msg          Message the candidate was produced for.
    @param signals      Signals of the message.
    @param reference    Instant relative deadlines are resolved against.
    @param generated_at Instant reported as the debug timestamp.
    @return             Output satisfying every invariant checked by `check_invariants`.
    **/
    triage_output normalize(const Json::Value& candidate, const normalized_message& msg, const signals_bundle& signals,
        sys_seconds reference, sys_seconds generated_at) const;

    /**
    Building the substitute output used when no classification is available.

    It has the fallback category and action key, the fallback confidence, the sender as the only person, the
    fallback model marker as model version, and a `fallback:<reason>` debug note.
    **/
    triage_output fallback(const normalized_message& msg, sys_seconds reference, sys_seconds generated_at,
        const error& cause) const;

    /**
    Meeting topic of a subject: leading `Re:`, `Fwd:` and `Fw:` prefixes removed.
    **/
    static std::string subject_to_topic(std::string_view subject);

    const triage_config& config() const
    {
        return config_;
    }

private:

    void normalize_urgency(const Json::Value& candidate, const signals_bundle& signals, const deadline_resolver& resolver,
        triage_output& out) const;

    void normalize_task(const Json::Value& candidate, const deadline_resolver& resolver, triage_output& out) const;

    void normalize_actions(const Json::Value& candidate, triage_output& out) const;

    void normalize_evidence(const Json::Value& candidate, triage_output& out) const;

    void normalize_entities(const Json::Value& candidate, const normalized_message& msg, const deadline_resolver& resolver,
        triage_output& out) const;

    static void backfill_sender(const normalized_message& msg, entity_set& entities);

    triage_config config_;
    const taxonomy& taxonomy_;
};


inline std::string result_normalizer::subject_to_topic(std::string_view subject)
{
    std::string_view s = detail::trim_view(subject);
    for (;;)
    {
        std::size_t n = 0;
        while (n < s.size() && detail::is_ascii_alpha(s[n]))
            ++n;
        const std::string_view word = s.substr(0, n);
        if (!detail::iequals_ascii(word, "re") && !detail::iequals_ascii(word, "fwd") && !detail::iequals_ascii(word, "fw"))
            break;
        const std::string_view rest = detail::trim_view(s.substr(n));
        if (rest.empty() || rest.front() != ':')
            break;
        s = detail::trim_view(rest.substr(1));
    }
    return std::string(s);
}


inline void result_normalizer::normalize_urgency(const Json::Value& candidate, const signals_bundle& signals,
    const deadline_resolver& resolver, triage_output& out) const
{
    const Json::Value& u = coerce::member(candidate, "urgency_signals");
    urgency_info& urgency = out.urgency_signals;
    urgency.urgency = parse_level(coerce::trimmed(coerce::member(u, "urgency"))).value_or(level_t::MEDIUM);
    urgency.reason = coerce::trimmed(coerce::member(u, "reason"));
    urgency.deadline_text = coerce::optional_trimmed(coerce::member(u, "deadline_text"));

    if (auto reply_by = coerce::optional_trimmed(coerce::member(u, "reply_by")))
    {
        auto ts = parse_iso_with_offset(*reply_by);
        if (ts && in_iso_year_range(ts->local()))
            urgency.reply_by = *ts;
        else
        {
            // Free text or a timestamp without offset.
            if (!parse_iso8601(*reply_by) && !urgency.deadline_text)
                urgency.deadline_text = *reply_by;
            if (auto resolved = resolver.resolve(*reply_by))
                urgency.reply_by = resolved->when;
        }
    }
    if (!urgency.reply_by && urgency.deadline_text)
    {
        if (auto resolved = resolver.resolve(*urgency.deadline_text))
            urgency.reply_by = resolved->when;
    }

    const bool claimed = coerce::as_bool(coerce::member(u, "deadline_detected"));
    if (claimed && !urgency.deadline_text && !urgency.reply_by)
    {
        // Detected without any text: the first one-off phrase found in the message that resolves.
        for (const auto& phrase : signals.time_phrases)
        {
            if (phrase.kind == phrase_kind_t::RECURRING)
                continue;
            if (auto resolved = resolver.resolve(phrase.raw_text))
            {
                urgency.deadline_text = phrase.raw_text;
                urgency.reply_by = resolved->when;
                break;
            }
        }
    }
    urgency.deadline_detected = claimed || urgency.deadline_text.has_value() || urgency.reply_by.has_value();

    if (urgency.deadline_text && !urgency.reply_by)
    {
        TRIAGEXX_DEBUG("normalizer", "deadline text not resolvable");
        out.debug.notes.emplace_back(NOTE_DEADLINE_UNRESOLVED);
    }
}


inline void result_normalizer::normalize_task(const Json::Value& candidate, const deadline_resolver& resolver,
    triage_output& out) const
{
    const Json::Value& t = coerce::member(candidate, "task_proposal");
    if (!t.isObject())
        return;

    auto resolve_iso = [&resolver](const Json::Value& v) -> std::optional<std::string>
    {
        auto text = coerce::optional_trimmed(v);
        if (!text)
            return std::nullopt;
        auto resolved = resolver.resolve(*text);
        if (!resolved)
            return std::nullopt;
        return resolved->iso();
    };

    task_info task;
    task.type = coerce::optional_trimmed(coerce::member(t, "type"));
    task.title = coerce::trimmed(coerce::member(t, "title"));
    task.description = coerce::trimmed(coerce::member(t, "description"));
    task.priority = parse_level(coerce::trimmed(coerce::member(t, "priority"))).value_or(level_t::MEDIUM);
    task.status = "open";
    task.scheduled_for = resolve_iso(coerce::member(t, "scheduled_for"));
    task.due_at = resolve_iso(coerce::member(t, "due_at"));
    task.waiting_on = coerce::optional_trimmed(coerce::member(t, "waiting_on"));
    if (!task.due_at && out.urgency_signals.reply_by)
        task.due_at = format_iso(*out.urgency_signals.reply_by);
    out.task_proposal = std::move(task);
}


inline void result_normalizer::normalize_actions(const Json::Value& candidate, triage_output& out) const
{
    struct ranked
    {
        std::int64_t rank;
        recommended_action action;
    };
    std::vector<ranked> actions;
    for (const auto& item : coerce::as_list(coerce::member(candidate, "recommended_actions")))
    {
        if (!item.isObject())
            continue;
        recommended_action a;
        a.key = coerce::trimmed(coerce::member(item, "key"));
        if (a.key.empty())
            continue;
        a.label = coerce::trimmed(coerce::member(item, "label"));
        a.kind = parse_action_kind(coerce::trimmed(coerce::member(item, "kind"))).value_or(action_kind_t::SECONDARY);
        actions.push_back(ranked{coerce::as_int(coerce::member(item, "rank")).value_or(1), std::move(a)});
    }

    std::stable_sort(actions.begin(), actions.end(), [](const ranked& x, const ranked& y)
    {
        return x.rank < y.rank;
    });
    if (actions.size() > config_.max_recommended_actions)
        actions.resize(config_.max_recommended_actions);
    int rank = 0;
    for (auto& r : actions)
    {
        r.action.rank = ++rank;
        out.recommended_actions.push_back(std::move(r.action));
    }
}


inline void result_normalizer::normalize_evidence(const Json::Value& candidate, triage_output& out) const
{
    for (const auto& item : coerce::as_list(coerce::member(candidate, "evidence")))
    {
        if (out.evidence.size() == config_.max_evidence)
            break;
        auto text = coerce::as_string(item);
        if (!text)
            continue;
        std::string snippet = detail::collapse_whitespace(*text);
        if (detail::utf8_length(snippet) > config_.max_evidence_chars)
            snippet = detail::trim_copy(detail::utf8_truncate(snippet, config_.max_evidence_chars));
        if (snippet.empty())
            continue;
        const bool seen = std::any_of(out.evidence.begin(), out.evidence.end(), [&snippet](const std::string& e)
        {
            return boost::algorithm::iequals(e, snippet);
        });
        if (!seen)
            out.evidence.push_back(std::move(snippet));
    }
    if (out.evidence.size() < config_.min_evidence)
    {
        TRIAGEXX_DEBUG("normalizer", "evidence below minimum: " + std::to_string(out.evidence.size()));
        out.debug.notes.emplace_back(NOTE_EVIDENCE_BELOW_MINIMUM);
    }
}


inline void result_normalizer::backfill_sender(const normalized_message& msg, entity_set& entities)
{
    const std::string& sender = msg.sender.address;
    if (sender.empty())
        return;
    for (auto& p : entities.people)
    {
        if (boost::algorithm::iequals(p.email, sender))
        {
            p.role = "sender";
            return;
        }
    }
    entities.people.insert(entities.people.begin(), person_ref{sender, "sender"});
}


inline void result_normalizer::normalize_entities(const Json::Value& candidate, const normalized_message& msg,
    const deadline_resolver& resolver, triage_output& out) const
{
    const Json::Value& e = coerce::member(candidate, "entities");
    entity_set& entities = out.entities;

    for (const auto& item : coerce::as_list(coerce::member(e, "people")))
    {
        person_ref person;
        if (item.isObject())
        {
            person.email = coerce::trimmed(coerce::member(item, "email"));
            person.role = detail::to_lower_ascii(coerce::trimmed(coerce::member(item, "role")));
        }
        else
        {
            person.email = coerce::trimmed(item);
            person.role = "mentioned";
        }
        if (person.email.empty())
            continue;
        auto dup = std::find_if(entities.people.begin(), entities.people.end(), [&person](const person_ref& p)
        {
            return boost::algorithm::iequals(p.email, person.email);
        });
        if (dup == entities.people.end())
            entities.people.push_back(std::move(person));
        else if (dup->role.empty())
            dup->role = person.role;
    }
    backfill_sender(msg, entities);

    // Dates get an ISO value; the first one naming a clock time becomes the meeting start.
    std::optional<resolved_time> best;
    for (const auto& item : coerce::as_list(coerce::member(e, "dates")))
    {
        date_ref date;
        std::optional<std::string> iso;
        if (item.isObject())
        {
            date.text = coerce::trimmed(coerce::member(item, "text"));
            iso = coerce::optional_trimmed(coerce::member(item, "iso"));
            const std::string type = detail::to_lower_ascii(coerce::trimmed(coerce::member(item, "type")));
            date.type = type.empty() ? "other" : type;
        }
        else
            date.text = coerce::trimmed(item);
        if (date.text.empty() && !iso)
            continue;
        if (date.text.empty())
            date.text = *iso;

        std::optional<resolved_time> resolved;
        if (iso)
            resolved = resolver.resolve(*iso);
        if (!resolved)
            resolved = resolver.resolve(date.text);
        if (resolved)
        {
            date.iso = resolved->iso();
            if (!best && resolved->has_time)
                best = resolved;
        }
        entities.dates.push_back(std::move(date));
    }

    for (const auto& item : coerce::as_list(coerce::member(e, "money")))
    {
        money_ref money;
        if (item.isObject())
        {
            money.text = coerce::trimmed(coerce::member(item, "text"));
            money.amount = coerce::as_double(coerce::member(item, "amount"));
            const std::string currency = boost::algorithm::to_upper_copy(coerce::trimmed(coerce::member(item, "currency")));
            if (currency.size() == 3 && std::all_of(currency.begin(), currency.end(), detail::is_ascii_alpha))
                money.currency = currency;
            else if (!currency.empty())
                money.currency = signal_extractor::currency_code(currency);
        }
        else
            money.text = coerce::trimmed(item);
        if (money.text.empty() && !money.amount)
            continue;
        entities.money.push_back(std::move(money));
    }

    for (const auto& item : coerce::as_list(coerce::member(e, "docs")))
    {
        doc_ref doc;
        if (item.isObject())
        {
            doc.title = coerce::optional_trimmed(coerce::member(item, "title"));
            doc.url = coerce::optional_trimmed(coerce::member(item, "url"));
            doc.type = coerce::optional_trimmed(coerce::member(item, "type"));
        }
        else if (auto text = coerce::optional_trimmed(item))
        {
            if (detail::istarts_with_ascii(*text, "http://") || detail::istarts_with_ascii(*text, "https://"))
                doc.url = text;
            else
                doc.title = text;
        }
        if (!doc.title && !doc.url && !doc.type)
            continue;
        entities.docs.push_back(std::move(doc));
    }

    std::optional<std::string> start_zone;
    const Json::Value& m = coerce::member(e, "meeting");
    if (m.isObject())
    {
        meeting_ref meeting;
        meeting.topic = coerce::optional_trimmed(coerce::member(m, "topic"));
        meeting.tz = coerce::optional_trimmed(coerce::member(m, "tz"));
        if (auto start = coerce::optional_trimmed(coerce::member(m, "start_at")))
        {
            if (auto resolved = resolver.resolve(*start))
            {
                meeting.start_at = resolved->iso();
                start_zone = resolved->zone_name;
            }
        }
        entities.meeting = std::move(meeting);
    }

    const bool wants_meeting = out.major_category == "schedule_and_time" ||
        out.sub_action_key.rfind("SCHEDULE_", 0) == 0;
    if (!wants_meeting)
        return;
    if (!entities.meeting)
        entities.meeting = meeting_ref{};
    meeting_ref& meeting = *entities.meeting;
    if (!meeting.topic)
    {
        std::string topic = subject_to_topic(msg.subject);
        if (!topic.empty())
            meeting.topic = std::move(topic);
    }
    if (!meeting.start_at && best)
    {
        meeting.start_at = best->iso();
        start_zone = best->zone_name;
    }
    if (!meeting.tz && start_zone)
        meeting.tz = start_zone;
}


inline triage_output result_normalizer::normalize(const Json::Value& candidate, const normalized_message& msg,
    const signals_bundle& signals, sys_seconds reference, sys_seconds generated_at) const
{
    triage_output out;
    const deadline_resolver resolver(reference, config_.default_utc_offset);

    // Confidence
    if (auto confidence = coerce::as_double(coerce::member(candidate, "confidence")))
        out.confidence = std::clamp(*confidence, 0.0, 1.0);
    else
        out.confidence = config_.missing_confidence;

    // Category and action key, each replaced independently when outside the taxonomy.
    const std::string category = taxonomy::canonical_category(coerce::trimmed(coerce::member(candidate, "major_category")));
    if (taxonomy_.is_category(category))
        out.major_category = category;
    else
    {
        TRIAGEXX_DEBUG("normalizer", "category `" + category + "` replaced by " + taxonomy_.fallback_category());
        out.major_category = taxonomy_.fallback_category();
    }
    const std::string key = taxonomy::canonical_action_key(coerce::trimmed(coerce::member(candidate, "sub_action_key")));
    if (taxonomy_.is_action_key(key))
        out.sub_action_key = key;
    else
    {
        TRIAGEXX_DEBUG("normalizer", "action key `" + key + "` replaced by " + taxonomy_.fallback_action_key());
        out.sub_action_key = taxonomy_.fallback_action_key();
    }

    out.explicit_task = coerce::as_bool(coerce::member(candidate, "explicit_task"));

    out.suggested_reply_action = coerce::string_list(coerce::member(candidate, "suggested_reply_action"));
    if (out.suggested_reply_action.size() > config_.max_suggested_replies)
        out.suggested_reply_action.resize(config_.max_suggested_replies);

    // Deadlines
    normalize_urgency(candidate, signals, resolver, out);
    normalize_task(candidate, resolver, out);

    // Entities: signals are deliberately not merged in, only the sender is guaranteed.
    normalize_entities(candidate, msg, resolver, out);

    // List bounds
    normalize_actions(candidate, out);
    normalize_evidence(candidate, out);

    const Json::Value& summary = coerce::member(candidate, "extracted_summary");
    out.extracted_summary.ask = coerce::trimmed(coerce::member(summary, "ask"));
    out.extracted_summary.success_criteria = coerce::trimmed(coerce::member(summary, "success_criteria"));
    out.extracted_summary.missing_info = coerce::string_list(coerce::member(summary, "missing_info"));
    if (out.extracted_summary.missing_info.size() > config_.max_missing_info)
        out.extracted_summary.missing_info.resize(config_.max_missing_info);

    // Debug metadata comes from the configuration only.
    out.debug.timestamp = format_iso_utc(generated_at);
    out.debug.model_version = config_.model_version;
    out.debug.prompt_version = config_.prompt_version;
    return out;
}


inline triage_output result_normalizer::fallback(const normalized_message& msg, sys_seconds reference,
    sys_seconds generated_at, const error& cause) const
{
    triage_output out = normalize(Json::Value(Json::nullValue), msg, signals_bundle{}, reference, generated_at);
    out.confidence = config_.fallback_confidence;
    out.debug.model_version = config_.fallback_model_marker;
    out.debug.notes.insert(out.debug.notes.begin(), "fallback:" + std::string(error_code_token(cause.code())));
    TRIAGEXX_INFO("normalizer", "fallback output for message " + msg.message_id + ": " + cause.to_string());
    return out;
}


} // namespace triagexx

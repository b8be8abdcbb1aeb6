/*

output.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Finalized triage output and its JSON form.

*/


#pragma once

#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <json/json.h>
#include <triagexx/detail/ascii.hpp>
#include <triagexx/detail/utf8.hpp>
#include <triagexx/timestamp.hpp>
#include <triagexx/triage/taxonomy.hpp>
#include <triagexx/triage_config.hpp>


namespace triagexx
{


/**
Level shared by the urgency assessment and the task priority.
**/
enum class level_t {LOW, MEDIUM, HIGH, CRITICAL};


inline std::string_view to_string(level_t level)
{
    switch (level)
    {
        case level_t::LOW:
            return "low";
        case level_t::MEDIUM:
            return "medium";
        case level_t::HIGH:
            return "high";
        case level_t::CRITICAL:
            return "critical";
    }
    return "medium";
}


/**
Reading a level, case insensitive and trimmed.
**/
inline std::optional<level_t> parse_level(std::string_view text)
{
    const std::string t = detail::to_lower_ascii(detail::trim_view(text));
    if (t == "low")
        return level_t::LOW;
    if (t == "medium")
        return level_t::MEDIUM;
    if (t == "high")
        return level_t::HIGH;
    if (t == "critical")
        return level_t::CRITICAL;
    return std::nullopt;
}


enum class action_kind_t {PRIMARY, SECONDARY, DANGER};


inline std::string_view to_string(action_kind_t kind)
{
    switch (kind)
    {
        case action_kind_t::PRIMARY:
            return "PRIMARY";
        case action_kind_t::SECONDARY:
            return "SECONDARY";
        case action_kind_t::DANGER:
            return "DANGER";
    }
    return "SECONDARY";
}


inline std::optional<action_kind_t> parse_action_kind(std::string_view text)
{
    const std::string t = detail::to_screaming_snake(text);
    if (t == "PRIMARY")
        return action_kind_t::PRIMARY;
    if (t == "SECONDARY")
        return action_kind_t::SECONDARY;
    if (t == "DANGER")
        return action_kind_t::DANGER;
    return std::nullopt;
}


struct person_ref
{
    std::string email;
    std::string role;

    bool operator==(const person_ref&) const = default;
};


struct date_ref
{
    std::string text;
    /// `YYYY-MM-DD`, or a date time with offset when the text names a clock time
    std::optional<std::string> iso;
    std::string type = "other";

    bool operator==(const date_ref&) const = default;
};


struct money_ref
{
    std::string text;
    std::optional<double> amount;
    std::optional<std::string> currency;

    bool operator==(const money_ref&) const = default;
};


struct doc_ref
{
    std::optional<std::string> title;
    std::optional<std::string> url;
    std::optional<std::string> type;

    bool operator==(const doc_ref&) const = default;
};


struct meeting_ref
{
    std::optional<std::string> topic;
    std::optional<std::string> start_at;
    /// IANA zone name
    std::optional<std::string> tz;

    bool operator==(const meeting_ref&) const = default;
};


struct entity_set
{
    std::vector<person_ref> people;
    std::vector<date_ref> dates;
    std::vector<money_ref> money;
    std::vector<doc_ref> docs;
    std::optional<meeting_ref> meeting;

    bool operator==(const entity_set&) const = default;
};


struct task_info
{
    std::optional<std::string> type;
    std::string title;
    std::string description;
    level_t priority = level_t::MEDIUM;
    std::string status = "open";
    std::optional<std::string> scheduled_for;
    std::optional<std::string> due_at;
    std::optional<std::string> waiting_on;

    bool operator==(const task_info&) const = default;
};


struct recommended_action
{
    std::string key;
    std::string label;
    action_kind_t kind = action_kind_t::SECONDARY;
    int rank = 1;

    bool operator==(const recommended_action&) const = default;
};


struct urgency_info
{
    level_t urgency = level_t::MEDIUM;
    bool deadline_detected = false;
    std::optional<std::string> deadline_text;
    std::optional<zoned_timestamp> reply_by;
    std::string reason;

    bool operator==(const urgency_info&) const = default;
};


struct summary_info
{
    std::string ask;
    std::string success_criteria;
    std::vector<std::string> missing_info;

    bool operator==(const summary_info&) const = default;
};


/**
Metadata injected from the process configuration, never taken from the classification.
**/
struct debug_info
{
    std::string timestamp;
    std::string model_version;
    std::string prompt_version;
    std::vector<std::string> notes;

    bool operator==(const debug_info&) const = default;
};


/**
Finalized triage of one message. Built once by the normalizer, never mutated afterwards.
**/
struct triage_output
{
    std::string major_category;
    std::string sub_action_key;
    bool explicit_task = false;
    double confidence = 0.0;
    std::vector<std::string> suggested_reply_action;
    std::optional<task_info> task_proposal;
    std::vector<recommended_action> recommended_actions;
    urgency_info urgency_signals;
    summary_info extracted_summary;
    entity_set entities;
    std::vector<std::string> evidence;
    debug_info debug;

    bool operator==(const triage_output&) const = default;
};


namespace output_detail
{

inline Json::Value optional_string(const std::optional<std::string>& value)
{
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

inline Json::Value string_array(const std::vector<std::string>& values)
{
    Json::Value arr(Json::arrayValue);
    for (const auto& v : values)
        arr.append(v);
    return arr;
}

} // namespace output_detail


/**
Serializing the output object; absent optional fields are emitted as `null`.
**/
inline Json::Value to_json(const triage_output& out)
{
    using namespace output_detail;
    Json::Value root(Json::objectValue);
    root["major_category"] = out.major_category;
    root["sub_action_key"] = out.sub_action_key;
    root["explicit_task"] = out.explicit_task;
    root["confidence"] = out.confidence;
    root["suggested_reply_action"] = string_array(out.suggested_reply_action);

    if (out.task_proposal)
    {
        const task_info& t = *out.task_proposal;
        Json::Value task(Json::objectValue);
        task["type"] = optional_string(t.type);
        task["title"] = t.title;
        task["description"] = t.description;
        task["priority"] = std::string(to_string(t.priority));
        task["status"] = t.status;
        task["scheduled_for"] = optional_string(t.scheduled_for);
        task["due_at"] = optional_string(t.due_at);
        task["waiting_on"] = optional_string(t.waiting_on);
        root["task_proposal"] = task;
    }
    else
        root["task_proposal"] = Json::Value(Json::nullValue);

    Json::Value actions(Json::arrayValue);
    for (const auto& a : out.recommended_actions)
    {
        Json::Value action(Json::objectValue);
        action["key"] = a.key;
        action["label"] = a.label;
        action["kind"] = std::string(to_string(a.kind));
        action["rank"] = a.rank;
        actions.append(action);
    }
    root["recommended_actions"] = actions;

    Json::Value urgency(Json::objectValue);
    urgency["urgency"] = std::string(to_string(out.urgency_signals.urgency));
    urgency["deadline_detected"] = out.urgency_signals.deadline_detected;
    urgency["deadline_text"] = optional_string(out.urgency_signals.deadline_text);
    urgency["reply_by"] = out.urgency_signals.reply_by ? Json::Value(format_iso(*out.urgency_signals.reply_by)) :
        Json::Value(Json::nullValue);
    urgency["reason"] = out.urgency_signals.reason;
    root["urgency_signals"] = urgency;

    Json::Value summary(Json::objectValue);
    summary["ask"] = out.extracted_summary.ask;
    summary["success_criteria"] = out.extracted_summary.success_criteria;
    summary["missing_info"] = string_array(out.extracted_summary.missing_info);
    root["extracted_summary"] = summary;

    Json::Value entities(Json::objectValue);
    Json::Value people(Json::arrayValue);
    for (const auto& p : out.entities.people)
    {
        Json::Value person(Json::objectValue);
        person["email"] = p.email;
        person["role"] = p.role;
        people.append(person);
    }
    entities["people"] = people;
    Json::Value dates(Json::arrayValue);
    for (const auto& d : out.entities.dates)
    {
        Json::Value date(Json::objectValue);
        date["text"] = d.text;
        date["iso"] = optional_string(d.iso);
        date["type"] = d.type;
        dates.append(date);
    }
    entities["dates"] = dates;
    Json::Value money(Json::arrayValue);
    for (const auto& m : out.entities.money)
    {
        Json::Value item(Json::objectValue);
        item["text"] = m.text;
        item["amount"] = m.amount ? Json::Value(*m.amount) : Json::Value(Json::nullValue);
        item["currency"] = optional_string(m.currency);
        money.append(item);
    }
    entities["money"] = money;
    Json::Value docs(Json::arrayValue);
    for (const auto& d : out.entities.docs)
    {
        Json::Value doc(Json::objectValue);
        doc["title"] = optional_string(d.title);
        doc["url"] = optional_string(d.url);
        doc["type"] = optional_string(d.type);
        docs.append(doc);
    }
    entities["docs"] = docs;
    if (out.entities.meeting)
    {
        Json::Value meeting(Json::objectValue);
        meeting["topic"] = optional_string(out.entities.meeting->topic);
        meeting["start_at"] = optional_string(out.entities.meeting->start_at);
        meeting["tz"] = optional_string(out.entities.meeting->tz);
        entities["meeting"] = meeting;
    }
    else
        entities["meeting"] = Json::Value(Json::nullValue);
    root["entities"] = entities;

    root["evidence"] = string_array(out.evidence);

    Json::Value debug(Json::objectValue);
    debug["timestamp"] = out.debug.timestamp;
    debug["model_version"] = out.debug.model_version;
    debug["prompt_version"] = out.debug.prompt_version;
    debug["notes"] = string_array(out.debug.notes);
    root["debug"] = debug;
    return root;
}


/**
Wrapping the output object into the response envelope `{ "output": { ... } }`.
**/
inline Json::Value to_response_json(const triage_output& out)
{
    Json::Value envelope(Json::objectValue);
    envelope["output"] = to_json(out);
    return envelope;
}


/**
Writing a JSON value as text.

@param value  Value to write.
@param pretty Indented output if true, a single line otherwise.
**/
inline std::string write_json(const Json::Value& value, bool pretty = true)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}


namespace output_detail
{

// `YYYY-MM-DD...` text with a year from 0001 to 9999.
inline bool iso_text_in_range(const std::string& text)
{
    if (text.size() < 10 || text[4] != '-' || text.compare(0, 4, "0000") == 0)
        return false;
    for (std::size_t i = 0; i < 4; ++i)
        if (!detail::is_ascii_digit(text[i]))
            return false;
    return true;
}

} // namespace output_detail


/**
Listing the violated output invariants; an empty list means the output honours the contract.

A non-empty result is a defect of the normalizer, never a runtime condition.

@param out            Output to check.
@param tax            Taxonomy the output was normalized against.
@param config         Configuration bounding the lists.
@param sender_address Address of the message sender, which must then be listed with the `sender` role.
**/
inline std::vector<std::string> check_invariants(const triage_output& out, const taxonomy& tax = standard_taxonomy(),
    const triage_config& config = triage_config{}, std::string_view sender_address = {})
{
    std::vector<std::string> violations;
    auto check = [&violations](bool ok, std::string what)
    {
        if (!ok)
            violations.push_back(std::move(what));
    };

    check(tax.is_category(out.major_category), "major_category `" + out.major_category + "` not in taxonomy");
    check(!out.sub_action_key.empty(), "sub_action_key empty");
    check(out.sub_action_key == detail::to_screaming_snake(out.sub_action_key), "sub_action_key not canonical");
    check(std::isfinite(out.confidence) && out.confidence >= 0.0 && out.confidence <= 1.0, "confidence out of [0, 1]");
    check(out.suggested_reply_action.size() <= config.max_suggested_replies, "too many suggested replies");

    check(out.recommended_actions.size() <= config.max_recommended_actions, "too many recommended actions");
    for (std::size_t i = 0; i < out.recommended_actions.size(); ++i)
    {
        const auto& a = out.recommended_actions[i];
        check(!a.key.empty(), "recommended action without key");
        check(i == 0 || a.rank > out.recommended_actions[i - 1].rank, "recommended action ranks not strictly ascending");
    }

    check(out.evidence.size() <= config.max_evidence, "too many evidence snippets");
    for (const auto& e : out.evidence)
        check(!e.empty() && detail::utf8_length(e) <= config.max_evidence_chars, "evidence snippet empty or too long");
    check(out.extracted_summary.missing_info.size() <= config.max_missing_info, "too many missing_info items");

    const auto& urgency = out.urgency_signals;
    check(!urgency.deadline_text.has_value() || !urgency.deadline_text->empty(), "deadline_text empty instead of null");
    check(!(urgency.deadline_text || urgency.reply_by) || urgency.deadline_detected,
        "deadline present but deadline_detected false");
    check(!urgency.reply_by || std::abs(urgency.reply_by->offset.count()) <= MAX_OFFSET_MINUTES, "reply_by offset out of range");
    check(!urgency.reply_by || in_iso_year_range(urgency.reply_by->local()), "reply_by year out of range");

    if (out.task_proposal)
    {
        const task_info& task = *out.task_proposal;
        check(task.status == "open", "task status not open");
        check(!task.due_at || output_detail::iso_text_in_range(*task.due_at), "task due_at not an ISO date");
        check(!task.scheduled_for || output_detail::iso_text_in_range(*task.scheduled_for),
            "task scheduled_for not an ISO date");
    }
    for (const auto& d : out.entities.dates)
        check(!d.iso || output_detail::iso_text_in_range(*d.iso), "date entity iso not an ISO date");
    if (out.entities.meeting && out.entities.meeting->start_at)
        check(output_detail::iso_text_in_range(*out.entities.meeting->start_at), "meeting start_at not an ISO date");

    std::size_t senders = 0;
    bool sender_listed = sender_address.empty();
    for (const auto& p : out.entities.people)
    {
        check(!p.email.empty(), "person without email");
        if (p.role != "sender")
            continue;
        ++senders;
        if (detail::iequals_ascii(p.email, sender_address))
            sender_listed = true;
    }
    check(senders <= 1, "more than one person with the sender role");
    check(sender_listed, "sender missing from entities.people");

    check(!out.debug.timestamp.empty(), "debug timestamp missing");
    check(!out.debug.model_version.empty(), "debug model_version missing");
    check(!out.debug.prompt_version.empty(), "debug prompt_version missing");
    return violations;
}


} // namespace triagexx

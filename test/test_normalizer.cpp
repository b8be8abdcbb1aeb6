/*

test_normalizer.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE normalizer_test

#include <algorithm>
#include <chrono>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <json/json.h>
#include <boost/test/unit_test.hpp>
#include <triagexx/signals/extractor.hpp>
#include <triagexx/triage/normalizer.hpp>


using namespace triagexx;
using namespace std::chrono;


namespace
{

Json::Value parse(const std::string& text)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value value;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &value, &errors))
        throw std::runtime_error("bad test JSON: " + errors);
    return value;
}

triage_config pacific_config()
{
    triage_config cfg;
    cfg.default_utc_offset = minutes{-480};
    return cfg;
}

const result_normalizer& normalizer()
{
    static const result_normalizer instance(pacific_config());
    return instance;
}

// Sent Tuesday 2026-02-10 at 09:30 Pacific time.
normalized_message message()
{
    normalized_message msg;
    msg.message_id = "msg-1";
    msg.subject = "Re: Budget sync";
    msg.sender = mail_address{"Alice Martin", "alice@example.com"};
    msg.sent_at = zoned_timestamp::from_local(local_seconds{local_days{year{2026} / 2 / 10}} + hours{9} + minutes{30},
        minutes{-480});
    return msg;
}

const sys_seconds GENERATED_AT = sys_days{year{2026} / 2 / 10} + hours{18};

triage_output normalize(const Json::Value& candidate, const signals_bundle& signals = signals_bundle{})
{
    const normalized_message msg = message();
    return normalizer().normalize(candidate, msg, signals, reference_time(msg, GENERATED_AT), GENERATED_AT);
}

// Invariant violations, the sender of message() included.
std::vector<std::string> violations(const triage_output& out)
{
    return check_invariants(out, standard_taxonomy(), pacific_config(), "alice@example.com");
}

bool has_note(const triage_output& out, std::string_view note)
{
    return std::find(out.debug.notes.begin(), out.debug.notes.end(), note) != out.debug.notes.end();
}

} // namespace


BOOST_AUTO_TEST_CASE(confidence_clamped)
{
    BOOST_TEST(normalize(parse(R"({"confidence": 1.7})")).confidence == 1.0);
    BOOST_TEST(normalize(parse(R"({"confidence": -0.2})")).confidence == 0.0);
    BOOST_TEST(normalize(parse(R"({"confidence": "0.42"})")).confidence == 0.42);
    BOOST_TEST(normalize(parse(R"({"confidence": 1})")).confidence == 1.0);
}


BOOST_AUTO_TEST_CASE(confidence_defaulted)
{
    Json::Value nan(Json::objectValue);
    nan["confidence"] = std::numeric_limits<double>::quiet_NaN();
    BOOST_TEST(normalize(nan).confidence == 0.5);
    BOOST_TEST(normalize(parse(R"({"confidence": "high"})")).confidence == 0.5);
    BOOST_TEST(normalize(parse(R"({"confidence": null})")).confidence == 0.5);
    BOOST_TEST(normalize(parse("{}")).confidence == 0.5);
}


BOOST_AUTO_TEST_CASE(category_and_key_replaced_independently)
{
    auto out = normalize(parse(R"({"major_category": "Financial and Admin", "sub_action_key": "pay the bill"})"));
    BOOST_TEST(out.major_category == "financial_and_admin");
    BOOST_TEST(out.sub_action_key == "OTHER");

    out = normalize(parse(R"({"major_category": "spam", "sub_action_key": "finance-pay-invoice"})"));
    BOOST_TEST(out.major_category == "other");
    BOOST_TEST(out.sub_action_key == "FINANCE_PAY_INVOICE");

    out = normalize(parse(R"({"major_category": 12, "sub_action_key": ["x"]})"));
    BOOST_TEST(out.major_category == "other");
    BOOST_TEST(out.sub_action_key == "OTHER");
}


BOOST_AUTO_TEST_CASE(flags_and_short_lists)
{
    auto out = normalize(parse(R"({
        "explicit_task": "yes",
        "suggested_reply_action": ["Confirm", "  ", "Decline", "Ask for agenda", "Forward"],
        "extracted_summary": {"ask": " Approve the budget ", "success_criteria": "Signed off",
            "missing_info": ["owner", "amount", "date", "venue"]}
    })"));
    BOOST_TEST(out.explicit_task);
    BOOST_TEST((out.suggested_reply_action == std::vector<std::string>{"Confirm", "Decline", "Ask for agenda"}));
    BOOST_TEST(out.extracted_summary.ask == "Approve the budget");
    BOOST_TEST(out.extracted_summary.missing_info.size() == 3u);

    // A lone string stands for a one element list.
    out = normalize(parse(R"({"suggested_reply_action": "Confirm"})"));
    BOOST_TEST((out.suggested_reply_action == std::vector<std::string>{"Confirm"}));
}


BOOST_AUTO_TEST_CASE(sender_always_present)
{
    auto out = normalize(parse("{}"));
    BOOST_TEST_REQUIRE(out.entities.people.size() == 1u);
    BOOST_TEST(out.entities.people[0].email == "alice@example.com");
    BOOST_TEST(out.entities.people[0].role == "sender");

    out = normalize(parse(R"({"entities": {"people": [
        {"email": "bob@example.com", "role": "Recipient"},
        "carol@example.com",
        {"email": "ALICE@example.com", "role": "cc"},
        {"email": "bob@example.com", "role": "other"},
        {"email": ""}
    ]}})"));
    BOOST_TEST_REQUIRE(out.entities.people.size() == 3u);
    BOOST_TEST(out.entities.people[0].role == "recipient");
    BOOST_TEST(out.entities.people[1].email == "carol@example.com");
    BOOST_TEST(out.entities.people[1].role == "mentioned");
    BOOST_TEST(out.entities.people[2].email == "ALICE@example.com");
    BOOST_TEST(out.entities.people[2].role == "sender");
}


BOOST_AUTO_TEST_CASE(actions_ranked_and_bounded)
{
    auto out = normalize(parse(R"({"recommended_actions": [
        {"key": "a", "label": "A", "kind": "danger", "rank": 5},
        {"key": "b", "label": "B", "kind": "primary", "rank": 1},
        {"key": "c", "label": "C", "rank": 3},
        {"key": "d", "label": "D", "kind": "weird", "rank": "2"},
        {"key": "e", "label": "E"},
        {"key": " ", "label": "no key", "rank": 0},
        {"key": "g", "label": "G", "rank": 4},
        "not an action"
    ]})"));
    BOOST_TEST_REQUIRE(out.recommended_actions.size() == 4u);
    std::vector<std::string> keys;
    for (const auto& a : out.recommended_actions)
        keys.push_back(a.key);
    BOOST_TEST((keys == std::vector<std::string>{"b", "e", "d", "c"}));
    for (std::size_t i = 0; i < out.recommended_actions.size(); ++i)
        BOOST_TEST(out.recommended_actions[i].rank == static_cast<int>(i + 1));
    BOOST_TEST((out.recommended_actions[0].kind == action_kind_t::PRIMARY));
    BOOST_TEST((out.recommended_actions[2].kind == action_kind_t::SECONDARY));
}


BOOST_AUTO_TEST_CASE(evidence_bounded)
{
    Json::Value candidate(Json::objectValue);
    Json::Value& evidence = candidate["evidence"] = Json::Value(Json::arrayValue);
    evidence.append("  Please   approve\nthe budget ");
    evidence.append("please approve the budget");
    evidence.append("");
    evidence.append(42);
    evidence.append(std::string(300, 'x'));
    evidence.append("one too many");

    auto out = normalize(candidate);
    BOOST_TEST_REQUIRE(out.evidence.size() == 3u);
    BOOST_TEST(out.evidence[0] == "Please approve the budget");
    BOOST_TEST(out.evidence[1] == "42");
    BOOST_TEST(out.evidence[2].size() == 240u);
    BOOST_TEST(!has_note(out, NOTE_EVIDENCE_BELOW_MINIMUM));
}


BOOST_AUTO_TEST_CASE(missing_evidence_noted)
{
    auto out = normalize(parse(R"({"evidence": ["   ", null]})"));
    BOOST_TEST(out.evidence.empty());
    BOOST_TEST(has_note(out, NOTE_EVIDENCE_BELOW_MINIMUM));
}


BOOST_AUTO_TEST_CASE(deadline_text_resolved)
{
    auto out = normalize(parse(R"({"urgency_signals": {"urgency": "HIGH", "deadline_text": "tomorrow 3pm",
        "reason": "asked for today"}})"));
    const auto& u = out.urgency_signals;
    BOOST_TEST(to_string(u.urgency) == "high");
    BOOST_TEST(u.deadline_detected);
    BOOST_TEST_REQUIRE(u.reply_by.has_value());
    BOOST_TEST(format_iso(*u.reply_by) == "2026-02-11T15:00:00-08:00");
    BOOST_TEST(!has_note(out, NOTE_DEADLINE_UNRESOLVED));
}


BOOST_AUTO_TEST_CASE(reply_by_forms)
{
    auto out = normalize(parse(R"({"urgency_signals": {"reply_by": "2026-02-12T10:00:00+01:00"}})"));
    BOOST_TEST_REQUIRE(out.urgency_signals.reply_by.has_value());
    BOOST_TEST(format_iso(*out.urgency_signals.reply_by) == "2026-02-12T10:00:00+01:00");
    BOOST_TEST(out.urgency_signals.deadline_detected);
    BOOST_TEST(!out.urgency_signals.deadline_text.has_value());

    // Free text in reply_by becomes the deadline text as well.
    out = normalize(parse(R"({"urgency_signals": {"reply_by": "Friday EOD"}})"));
    BOOST_TEST_REQUIRE(out.urgency_signals.reply_by.has_value());
    BOOST_TEST(format_iso(*out.urgency_signals.reply_by) == "2026-02-13T17:00:00-08:00");
    BOOST_TEST(*out.urgency_signals.deadline_text == "Friday EOD");

    // Missing offset: read in the default offset.
    out = normalize(parse(R"({"urgency_signals": {"reply_by": "2026-02-12T10:00:00"}})"));
    BOOST_TEST(format_iso(*out.urgency_signals.reply_by) == "2026-02-12T10:00:00-08:00");
    BOOST_TEST(!out.urgency_signals.deadline_text.has_value());
}


BOOST_AUTO_TEST_CASE(unresolvable_deadline_noted)
{
    auto out = normalize(parse(R"({"urgency_signals": {"deadline_text": "when the board meets", "reply_by": ""}})"));
    BOOST_TEST(out.urgency_signals.deadline_detected);
    BOOST_TEST(!out.urgency_signals.reply_by.has_value());
    BOOST_TEST(*out.urgency_signals.deadline_text == "when the board meets");
    BOOST_TEST(has_note(out, NOTE_DEADLINE_UNRESOLVED));
    BOOST_TEST(to_json(out)["urgency_signals"]["reply_by"].isNull());

    out = normalize(parse(R"({"urgency_signals": {"deadline_text": "  "}})"));
    BOOST_TEST(!out.urgency_signals.deadline_detected);
    BOOST_TEST(!out.urgency_signals.deadline_text.has_value());
}


BOOST_AUTO_TEST_CASE(detected_deadline_taken_from_signals)
{
    signals_bundle signals;
    signals.time_phrases = {{"every Monday", phrase_kind_t::RECURRING}, {"by tomorrow 3pm PT", phrase_kind_t::RELATIVE}};
    auto out = normalize(parse(R"({"urgency_signals": {"deadline_detected": true}})"), signals);
    BOOST_TEST(*out.urgency_signals.deadline_text == "by tomorrow 3pm PT");
    BOOST_TEST(format_iso(*out.urgency_signals.reply_by) == "2026-02-11T15:00:00-08:00");

    // Signals are only consulted when the classification claims a deadline.
    out = normalize(parse("{}"), signals);
    BOOST_TEST(!out.urgency_signals.deadline_detected);
    BOOST_TEST(!out.urgency_signals.reply_by.has_value());
}


BOOST_AUTO_TEST_CASE(task_proposal_normalized)
{
    auto out = normalize(parse(R"({"task_proposal": {"type": "approval", "title": " Approve budget ", "priority": "urgent",
        "status": "done", "due_at": "Friday", "scheduled_for": "sometime", "waiting_on": ""}})"));
    BOOST_TEST_REQUIRE(out.task_proposal.has_value());
    const task_info& task = *out.task_proposal;
    BOOST_TEST(task.title == "Approve budget");
    BOOST_TEST((task.priority == level_t::MEDIUM));
    BOOST_TEST(task.status == "open");
    BOOST_TEST(*task.due_at == "2026-02-13");
    BOOST_TEST(!task.scheduled_for.has_value());
    BOOST_TEST(!task.waiting_on.has_value());

    BOOST_TEST(!normalize(parse(R"({"task_proposal": "do it"})")).task_proposal.has_value());
}


BOOST_AUTO_TEST_CASE(task_due_defaults_to_reply_by)
{
    auto out = normalize(parse(R"({"urgency_signals": {"deadline_text": "tomorrow 3pm"},
        "task_proposal": {"title": "Send numbers", "priority": "High"}})"));
    BOOST_TEST_REQUIRE(out.task_proposal.has_value());
    BOOST_TEST(*out.task_proposal->due_at == "2026-02-11T15:00:00-08:00");
    BOOST_TEST((out.task_proposal->priority == level_t::HIGH));
}


BOOST_AUTO_TEST_CASE(entity_values)
{
    auto out = normalize(parse(R"({"entities": {
        "dates": [{"text": "March 3", "type": "Deadline"}, "in 2 hours", {"text": "someday"}, {"iso": ""}],
        "money": [{"text": "$1,200.50", "amount": "1200.5", "currency": "usd"}, {"text": "20 euros", "currency": "euros"},
            "about 5 bucks", {"text": ""}],
        "docs": ["https://docs.example.com/d/1", "Q1 plan", {"title": "Deck", "type": "slides"}, {}]
    }})"));
    const entity_set& e = out.entities;
    BOOST_TEST_REQUIRE(e.dates.size() == 3u);
    BOOST_TEST(*e.dates[0].iso == "2026-03-03");
    BOOST_TEST(e.dates[0].type == "deadline");
    BOOST_TEST(*e.dates[1].iso == "2026-02-10T11:30:00-08:00");
    BOOST_TEST(e.dates[1].type == "other");
    BOOST_TEST(!e.dates[2].iso.has_value());

    BOOST_TEST_REQUIRE(e.money.size() == 3u);
    BOOST_TEST(*e.money[0].amount == 1200.5);
    BOOST_TEST(*e.money[0].currency == "USD");
    BOOST_TEST(*e.money[1].currency == "EUR");
    BOOST_TEST(!e.money[2].amount.has_value());

    BOOST_TEST_REQUIRE(e.docs.size() == 3u);
    BOOST_TEST(*e.docs[0].url == "https://docs.example.com/d/1");
    BOOST_TEST(*e.docs[1].title == "Q1 plan");
    BOOST_TEST(*e.docs[2].type == "slides");

    // Not a scheduling message: no meeting is made up.
    BOOST_TEST(!e.meeting.has_value());
}


BOOST_AUTO_TEST_CASE(meeting_filled_for_scheduling)
{
    auto out = normalize(parse(R"({"major_category": "schedule_and_time", "sub_action_key": "schedule propose time",
        "entities": {"dates": [{"text": "March 3"}, {"text": "Thursday 2pm", "type": "meeting"}]}})"));
    BOOST_TEST(out.sub_action_key == "SCHEDULE_PROPOSE_TIME");
    BOOST_TEST_REQUIRE(out.entities.meeting.has_value());
    const meeting_ref& m = *out.entities.meeting;
    BOOST_TEST(*m.topic == "Budget sync");
    BOOST_TEST(*m.start_at == "2026-02-12T14:00:00-08:00");
    BOOST_TEST(*m.tz == "America/Los_Angeles");
}


BOOST_AUTO_TEST_CASE(meeting_values_kept)
{
    auto out = normalize(parse(R"({"major_category": "other", "sub_action_key": "SCHEDULE_RSVP",
        "entities": {"meeting": {"topic": "Offsite", "start_at": "2026-03-01T09:00:00+01:00", "tz": "Europe/Paris"}}})"));
    BOOST_TEST_REQUIRE(out.entities.meeting.has_value());
    BOOST_TEST(*out.entities.meeting->topic == "Offsite");
    BOOST_TEST(*out.entities.meeting->start_at == "2026-03-01T09:00:00+01:00");
    BOOST_TEST(*out.entities.meeting->tz == "Europe/Paris");
}


BOOST_AUTO_TEST_CASE(subject_topics)
{
    BOOST_TEST(result_normalizer::subject_to_topic("RE: Fwd: fw : Budget") == "Budget");
    BOOST_TEST(result_normalizer::subject_to_topic("Review notes") == "Review notes");
    BOOST_TEST(result_normalizer::subject_to_topic("Re:") == "");
}


BOOST_AUTO_TEST_CASE(debug_metadata_from_configuration)
{
    auto out = normalize(parse(R"({"debug": {"model_version": "evil", "notes": ["injected"]}})"));
    BOOST_TEST(out.debug.model_version == "classifier-v1");
    BOOST_TEST(out.debug.prompt_version == "triage-v3-2026-02");
    BOOST_TEST(out.debug.timestamp == "2026-02-10T18:00:00+00:00");
    BOOST_TEST(!has_note(out, "injected"));
}


BOOST_AUTO_TEST_CASE(fallback_output)
{
    const normalized_message msg = message();
    auto out = normalizer().fallback(msg, reference_time(msg, GENERATED_AT), GENERATED_AT,
        error(error_code::gateway_timeout, "Classification timed out."));
    BOOST_TEST(out.major_category == "other");
    BOOST_TEST(out.sub_action_key == "OTHER");
    BOOST_TEST(out.confidence == 0.0);
    BOOST_TEST(out.debug.model_version == "fallback");
    BOOST_TEST_REQUIRE(!out.debug.notes.empty());
    BOOST_TEST(out.debug.notes.front() == "fallback:gateway_timeout");
    BOOST_TEST(!out.task_proposal.has_value());
    BOOST_TEST(out.recommended_actions.empty());
    BOOST_TEST_REQUIRE(out.entities.people.size() == 1u);
    BOOST_TEST(out.entities.people[0].role == "sender");
    BOOST_TEST(check_invariants(out).empty());
}


BOOST_AUTO_TEST_CASE(garbage_candidates)
{
    for (const char* text : {"[1, 2]", "\"hello\"", "null", "42", R"({"entities": [], "urgency_signals": 3})"})
    {
        auto out = normalize(parse(text));
        BOOST_TEST(check_invariants(out).empty(), text);
        BOOST_TEST(out.major_category == "other");
    }
}


BOOST_AUTO_TEST_CASE(normalization_idempotent)
{
    const Json::Value candidate = parse(R"({
        "major_category": "Schedule and Time",
        "sub_action_key": "schedule-confirm-time",
        "explicit_task": true,
        "confidence": 0.83,
        "suggested_reply_action": ["Confirm Thursday"],
        "task_proposal": {"type": "meeting", "title": "Confirm sync", "priority": "high", "due_at": "Friday",
            "waiting_on": "Bob"},
        "recommended_actions": [{"key": "CONFIRM", "label": "Confirm", "kind": "PRIMARY", "rank": 2},
            {"key": "DECLINE", "label": "Decline", "kind": "DANGER", "rank": 9}],
        "urgency_signals": {"urgency": "high", "deadline_text": "tomorrow 3pm", "reason": "meeting soon"},
        "extracted_summary": {"ask": "Confirm the time", "success_criteria": "Time agreed", "missing_info": ["room"]},
        "entities": {
            "people": [{"email": "bob@example.com", "role": "recipient"}],
            "dates": [{"text": "Thursday 2pm", "type": "meeting"}, {"text": "March 3"}],
            "money": [{"text": "$40", "amount": 40, "currency": "USD"}],
            "docs": [{"title": "Agenda", "url": "https://docs.example.com/a", "type": "doc"}]
        },
        "evidence": ["Can we meet Thursday at 2pm?"]
    })");
    const triage_output first = normalize(candidate);
    BOOST_TEST(violations(first).empty());
    const triage_output second = normalize(to_json(first));
    BOOST_TEST((second == first));
    BOOST_TEST(write_json(to_json(second)) == write_json(to_json(first)));
}


BOOST_AUTO_TEST_CASE(reference_time_order)
{
    normalized_message msg = message();
    const sys_seconds now = sys_days{year{2030} / 1 / 1};
    BOOST_TEST((reference_time(msg, now) == msg.sent_at->utc));
    msg.sent_at.reset();
    msg.internal_date = sys_days{year{2026} / 2 / 9};
    BOOST_TEST((reference_time(msg, now) == *msg.internal_date));
    msg.internal_date.reset();
    BOOST_TEST((reference_time(msg, now) == now));
}


BOOST_AUTO_TEST_CASE(overflowing_deadline_left_unresolved)
{
    triage_output out;
    BOOST_REQUIRE_NO_THROW(out = normalize(parse(R"({"urgency_signals": {"deadline_text": "reply in 99999999999 days"}})")));
    BOOST_TEST(out.urgency_signals.deadline_detected);
    BOOST_TEST(*out.urgency_signals.deadline_text == "reply in 99999999999 days");
    BOOST_TEST(!out.urgency_signals.reply_by.has_value());
    BOOST_TEST(has_note(out, "deadline_unresolved"));
    BOOST_TEST(violations(out).empty());
}


BOOST_AUTO_TEST_CASE(overflowing_body_phrase_ignored)
{
    normalized_message msg = message();
    msg.body_text = "Please pay in 99999999999 days.";
    const signal_extractor extractor;
    const signals_bundle signals = extractor.extract(msg);
    BOOST_TEST_REQUIRE(!signals.time_phrases.empty());

    triage_output out;
    BOOST_REQUIRE_NO_THROW(out = normalizer().normalize(parse(R"({"urgency_signals": {"deadline_detected": true}})"),
        msg, signals, reference_time(msg, GENERATED_AT), GENERATED_AT));
    BOOST_TEST(out.urgency_signals.deadline_detected);
    BOOST_TEST(!out.urgency_signals.deadline_text.has_value());
    BOOST_TEST(!out.urgency_signals.reply_by.has_value());
    BOOST_TEST(violations(out).empty());
}


BOOST_AUTO_TEST_CASE(normalization_idempotent_for_far_dates)
{
    const Json::Value candidate = parse(R"({
        "task_proposal": {"title": "Pay", "due_at": "in 2000000000 months", "scheduled_for": "in 2000000000 business days"},
        "urgency_signals": {"deadline_text": "in 2000000000 days", "reply_by": "0000-01-01T00:00:00+00:00"},
        "entities": {"dates": [{"text": "in 99999999999 hours"}]}
    })");
    const triage_output first = normalize(candidate);
    BOOST_TEST(!first.urgency_signals.reply_by.has_value());
    BOOST_TEST_REQUIRE(first.task_proposal.has_value());
    BOOST_TEST(!first.task_proposal->due_at.has_value());
    BOOST_TEST(!first.task_proposal->scheduled_for.has_value());
    BOOST_TEST_REQUIRE(first.entities.dates.size() == 1u);
    BOOST_TEST(!first.entities.dates[0].iso.has_value());
    BOOST_TEST(violations(first).empty());

    const triage_output second = normalize(to_json(first));
    BOOST_TEST((second == first));
}


BOOST_AUTO_TEST_CASE(sender_listed_in_every_output)
{
    const triage_output out = normalize(parse(R"({"entities": {"people": ["carol@example.com"]}})"));
    BOOST_TEST(violations(out).empty());
    BOOST_TEST(!check_invariants(out, standard_taxonomy(), pacific_config(), "dave@example.com").empty());
}

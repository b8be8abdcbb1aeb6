/*

prompt.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Instructions sent with every classification request.

*/


#pragma once

#include <string>
#include <triagexx/triage/taxonomy.hpp>


namespace triagexx
{


/**
Category guide: one line per category with its description, followed by the disambiguation rule.
**/
inline std::string category_guide(const taxonomy& tax)
{
    std::string guide = "Choose exactly ONE major_category:\n\n";
    for (const auto& c : tax.categories())
        guide += "- " + c.name + ": " + c.description + "\n";
    guide +=
        "\nDisambiguation rule:\n"
        "- Prefer the category that represents the *blocking next action*.\n"
        "- Example: if the email asks you to confirm a meeting time, it is schedule_and_time.\n"
        "- Example: if the email asks you to approve/sign-off on a contract (even with a date mentioned),\n"
        "  it is decisions_and_approvals.\n";
    return guide;
}


/**
Action key guide: the keys of each group under its heading, the fallback key last.
**/
inline std::string action_key_guide(const taxonomy& tax)
{
    std::string guide =
        "Choose ONE sub_action_key.\n\n"
        "This is the \"verb\" / action classification for the email.\n"
        "Use one of the recommended keys below when possible.\n"
        "If none fit, use " + tax.fallback_action_key() + ".\n";
    for (const auto& g : tax.groups())
    {
        guide += "\n" + g.heading + " (major_category = " + g.category + "):\n";
        for (const auto& k : g.keys)
            guide += "- " + k + "\n";
    }
    guide += "\nFallback:\n- " + tax.fallback_action_key() + "\n";
    return guide;
}


/**
Field requirements of the output object.
**/
inline const char* field_rules()
{
    return
        "=== FIELD REQUIREMENTS ===\n\n"
        "1) major_category: pick ONE from the list above.\n\n"
        "2) sub_action_key: pick ONE from the recommended keys above. Use SCREAMING_SNAKE_CASE.\n\n"
        "3) explicit_task: true if there is a concrete action beyond just reading/replying (work to do,\n"
        "   a task to track, a document to review, a payment to make, etc.).\n\n"
        "4) confidence: calibrated probability 0.0-1.0 for the classification.\n\n"
        "5) suggested_reply_action: an array of 0-3 short action phrases the user could take as\n"
        "   quick-reply options. Return an empty array if no reply is needed.\n\n"
        "6) task_proposal: if the email implies any trackable work, provide:\n"
        "   - type: short snake_case task type (e.g. reply_required, review_document, pay_invoice)\n"
        "   - title: 1-line human-readable task title\n"
        "   - description: 1-2 sentence description of what needs to be done\n"
        "   - priority: \"low\" | \"medium\" | \"high\" | \"critical\"\n"
        "   - status: always \"open\"\n"
        "   - scheduled_for: ISO date if a natural scheduling date is obvious, else null\n"
        "   - due_at: ISO datetime if a deadline is stated or strongly implied, else null\n"
        "   - waiting_on: who/what is blocking progress, else null\n"
        "   If no task is implied, set task_proposal to null.\n\n"
        "7) recommended_actions: array of 1-4 ranked UI actions:\n"
        "   - key: snake_case action identifier (e.g. generate_reply, review_activity, mark_safe)\n"
        "   - label: short human-readable button label\n"
        "   - kind: \"PRIMARY\", \"SECONDARY\" or \"DANGER\"\n"
        "   - rank: integer starting at 1 (1 = most important)\n\n"
        "8) urgency_signals:\n"
        "   - urgency: \"low\" | \"medium\" | \"high\" | \"critical\"\n"
        "   - deadline_detected: true if the email contains a stated or implied deadline\n"
        "   - deadline_text: the raw text of the deadline if detected, else null\n"
        "   - reply_by: ISO datetime if a reply deadline can be inferred, else null\n"
        "   - reason: 1 sentence explaining the urgency assessment\n\n"
        "9) extracted_summary:\n"
        "   - ask: 1 sentence describing what the sender wants from the recipient\n"
        "   - success_criteria: 1 sentence defining what \"done\" looks like\n"
        "   - missing_info: array of 0-3 strings identifying gaps the recipient needs to fill\n\n"
        "10) entities:\n"
        "   - entities.people: include at least the sender email with role \"sender\" if available.\n"
        "     Other roles: \"recipient\", \"mentioned\", \"account_owner\"\n"
        "   - entities.dates: dates/times mentioned, with text, iso (with offset when a time is present)\n"
        "     and type (meeting_time, deadline, event_time, other)\n"
        "   - entities.money: monetary amounts with text, amount (float), currency\n"
        "   - entities.docs: document references with title, url, type\n"
        "   - entities.meeting: if about a meeting, include topic, start_at (ISO), tz (IANA preferred).\n"
        "     Set to null if not about a meeting.\n\n"
        "11) evidence: array of 1-3 short verbatim snippets from the email body that justify the\n"
        "    classification. Do NOT invent evidence.\n\n"
        "=== OUTPUT RULES ===\n"
        "- Output MUST be a single JSON object with exactly these keys.\n"
        "- Do NOT include Markdown.\n";
}


/**
Complete system prompt of a taxonomy.
**/
inline std::string system_prompt(const taxonomy& tax = standard_taxonomy())
{
    return "You are an email triage engine.\n\n"
        "You will be given a JSON object representing a single email message.\n"
        "Your task: return a strict JSON object matching the output fields below.\n\n" +
        category_guide(tax) + "\n" + action_key_guide(tax) + "\n" + field_rules();
}


} // namespace triagexx

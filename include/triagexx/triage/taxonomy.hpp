/*

taxonomy.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>
#include <triagexx/detail/ascii.hpp>


namespace triagexx
{


struct category_info
{
    std::string name;
    std::string description;
};


/**
Action keys offered for one category, with the heading used in the prompt.
**/
struct action_group
{
    std::string category;
    std::string heading;
    std::vector<std::string> keys;
};


/**
Fixed set of categories and action keys the classification must choose among.
**/
class taxonomy
{
public:

    taxonomy(std::vector<category_info> categories, std::vector<action_group> groups, std::string fallback_category,
        std::string fallback_action_key) :
        categories_(std::move(categories)), groups_(std::move(groups)), fallback_category_(std::move(fallback_category)),
        fallback_action_key_(std::move(fallback_action_key))
    {
    }

    const std::vector<category_info>& categories() const
    {
        return categories_;
    }

    const std::vector<action_group>& groups() const
    {
        return groups_;
    }

    const std::string& fallback_category() const
    {
        return fallback_category_;
    }

    const std::string& fallback_action_key() const
    {
        return fallback_action_key_;
    }

    bool is_category(std::string_view name) const
    {
        return std::any_of(categories_.begin(), categories_.end(), [name](const category_info& c)
        {
            return c.name == name;
        });
    }

    bool is_action_key(std::string_view key) const
    {
        if (key == fallback_action_key_)
            return true;
        for (const auto& g : groups_)
            if (std::find(g.keys.begin(), g.keys.end(), key) != g.keys.end())
                return true;
        return false;
    }

    /**
    All category names, in declaration order.
    **/
    std::vector<std::string> category_names() const
    {
        std::vector<std::string> names;
        names.reserve(categories_.size());
        for (const auto& c : categories_)
            names.push_back(c.name);
        return names;
    }

    /**
    All action keys in declaration order, the fallback key last.
    **/
    std::vector<std::string> action_keys() const
    {
        std::vector<std::string> keys;
        for (const auto& g : groups_)
            keys.insert(keys.end(), g.keys.begin(), g.keys.end());
        keys.push_back(fallback_action_key_);
        return keys;
    }

    /**
    Canonical category spelling: lower case words joined by `_`.
    **/
    static std::string canonical_category(std::string_view name)
    {
        return detail::to_lower_ascii(detail::to_screaming_snake(name));
    }

    /**
    Canonical action key spelling: SCREAMING_SNAKE_CASE.
    **/
    static std::string canonical_action_key(std::string_view key)
    {
        return detail::to_screaming_snake(key);
    }

private:
    std::vector<category_info> categories_;
    std::vector<action_group> groups_;
    std::string fallback_category_;
    std::string fallback_action_key_;
};


/**
Taxonomy used by default: ten categories plus `other`, each with its recommended action keys.
**/
inline const taxonomy& standard_taxonomy()
{
    static const taxonomy instance(
        {
            {"core_communication", "direct human-to-human conversation expecting a reply/ack/clarification."},
            {"decisions_and_approvals", "you must approve/reject/choose/confirm permission or a decision."},
            {"schedule_and_time", "coordinate time/date, meeting scheduling, confirming/rescheduling times, deadlines as scheduling."},
            {"documents_and_review", "main action is review/comment/edit a doc/deck/contract/spec."},
            {"financial_and_admin", "money, billing, invoices, receipts, subscriptions, compliance/admin records."},
            {"people_and_process", "ownership/roles, handoffs, workflows, process changes."},
            {"information_and_org", "FYI updates, announcements, status reports (read/know, usually no reply)."},
            {"learning_and_awareness", "articles, reports, webinars, courses, \"read later\" resources."},
            {"social_and_people", "intros, networking, invites, congrats/celebrations."},
            {"meta_and_systems", "automated alerts/notifications/security/system messages."},
            {"other", "none of the above."}
        },
        {
            {"schedule_and_time", "Schedule & Time", {"SCHEDULE_PROPOSE_TIME", "SCHEDULE_CONFIRM_TIME", "SCHEDULE_RESCHEDULE",
                "SCHEDULE_RSVP", "SCHEDULE_ADD_CALENDAR_BLOCK", "SCHEDULE_DEADLINE_CONFIRM"}},
            {"decisions_and_approvals", "Decisions & Approvals", {"DECISION_APPROVE_REJECT", "DECISION_CHOOSE_OPTION",
                "DECISION_CONFIRM_OUTCOME"}},
            {"core_communication", "Core Communication", {"COMM_REPLY_REQUIRED", "COMM_CLARIFICATION_REQUEST",
                "COMM_STATUS_UPDATE_RESPONSE"}},
            {"documents_and_review", "Documents & Review", {"DOC_REVIEW_REQUEST", "DOC_COMMENT_REQUEST", "DOC_SIGNOFF_REQUEST"}},
            {"financial_and_admin", "Financial & Admin", {"FINANCE_PAY_INVOICE", "FINANCE_APPROVE_EXPENSE",
                "FINANCE_UPDATE_BILLING", "FINANCE_RENEW_CANCEL"}},
            {"meta_and_systems", "Meta & Systems", {"SYSTEM_ALERT", "SYSTEM_SECURITY", "SYSTEM_NOTIFICATION"}},
            {"social_and_people", "Social & People", {"SOCIAL_INTRO", "SOCIAL_INVITE", "SOCIAL_CONGRATS"}},
            {"people_and_process", "People & Process", {"PROCESS_HANDOFF", "PROCESS_OWNERSHIP_CHANGE", "PROCESS_WORKFLOW_UPDATE"}},
            {"information_and_org", "Information & Org", {"INFO_FYI", "INFO_STATUS_REPORT", "INFO_ANNOUNCEMENT"}},
            {"learning_and_awareness", "Learning & Awareness", {"LEARN_ARTICLE", "LEARN_WEBINAR", "LEARN_COURSE"}}
        },
        "other", "OTHER");
    return instance;
}


} // namespace triagexx

#include "server/documents.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <stdexcept>
#include "common/json_utils.hpp"

namespace codify::server {
using namespace std;
using namespace nlohmann;

const char *get_contest_state_name(contest_state state) {
    switch (state) {
        case contest_state::UPCOMING: return "Upcoming";
        case contest_state::ACTIVE: return "Active";
        case contest_state::COMPLETED: return "Completed";
        case contest_state::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

contest_state parse_contest_state(const string &name) {
    string lower = boost::to_lower_copy(name);
    if (lower == "upcoming") return contest_state::UPCOMING;
    if (lower == "active") return contest_state::ACTIVE;
    if (lower == "completed") return contest_state::COMPLETED;
    if (lower == "cancelled") return contest_state::CANCELLED;
    throw invalid_argument("Unrecognized contest status " + name);
}

problem_attempt *participant::find_attempt(const string &problem_id) {
    for (auto &attempt : problems_attempted)
        if (attempt.problem_id == problem_id) return &attempt;
    return nullptr;
}

bool contest::is_active_at(time_t now) const {
    return state == contest_state::ACTIVE && start_time <= now && now <= end_time;
}

contest_problem *contest::find_problem(const string &problem_id) {
    for (auto &p : problems)
        if (p.problem_id == problem_id) return &p;
    return nullptr;
}

const contest_problem *contest::find_problem(const string &problem_id) const {
    return const_cast<contest *>(this)->find_problem(problem_id);
}

participant *contest::find_participant(const string &user_id) {
    for (auto &p : participants)
        if (p.user_id == user_id) return &p;
    return nullptr;
}

const participant *contest::find_participant(const string &user_id) const {
    return const_cast<contest *>(this)->find_participant(user_id);
}

void contest::update_average_score() {
    if (participants.empty()) {
        analytics.average_score = 0;
        return;
    }
    long long total = 0;
    for (auto &p : participants) total += p.score;
    analytics.average_score = (double)total / participants.size();
}

void to_json(json &j, const user &u) {
    j = {{"id", u.id}, {"name", u.name}, {"email", u.email}};
}

void from_json(const json &j, user &u) {
    j.at("id").get_to(u.id);
    assign_optional(j, u.name, "name");
    assign_optional(j, u.email, "email");
}

void to_json(json &j, const problem &p) {
    j = {{"id", p.id},
         {"title", p.title},
         {"testCases", p.test_cases},
         {"isActive", p.is_active},
         {"totalSubmissions", p.total_submissions},
         {"successfulSubmissions", p.successful_submissions}};
}

void from_json(const json &j, problem &p) {
    j.at("id").get_to(p.id);
    assign_optional(j, p.title, "title");
    assign_optional(j, p.test_cases, "testCases");
    assign_optional(j, p.is_active, "isActive");
    assign_optional(j, p.total_submissions, "totalSubmissions");
    assign_optional(j, p.successful_submissions, "successfulSubmissions");
}

void to_json(json &j, const problem_attempt &attempt) {
    j = {{"problemId", attempt.problem_id},
         {"attempts", attempt.attempts},
         {"solved", attempt.solved},
         {"score", attempt.score},
         {"lastAttemptTime", attempt.last_attempt_time}};
}

void from_json(const json &j, problem_attempt &attempt) {
    j.at("problemId").get_to(attempt.problem_id);
    assign_optional(j, attempt.attempts, "attempts");
    assign_optional(j, attempt.solved, "solved");
    assign_optional(j, attempt.score, "score");
    assign_optional(j, attempt.last_attempt_time, "lastAttemptTime");
}

void to_json(json &j, const participant &p) {
    j = {{"userId", p.user_id},
         {"name", p.name},
         {"score", p.score},
         {"submissions", p.submissions},
         {"lastActivityTime", p.last_activity_time},
         {"problemsAttempted", p.problems_attempted}};
}

void from_json(const json &j, participant &p) {
    j.at("userId").get_to(p.user_id);
    assign_optional(j, p.name, "name");
    assign_optional(j, p.score, "score");
    assign_optional(j, p.submissions, "submissions");
    assign_optional(j, p.last_activity_time, "lastActivityTime");
    assign_optional(j, p.problems_attempted, "problemsAttempted");
}

void to_json(json &j, const contest_problem &p) {
    j = {{"problemId", p.problem_id},
         {"title", p.title},
         {"points", p.points},
         {"attemptCount", p.attempt_count},
         {"solvedCount", p.solved_count}};
    if (p.manual_test_cases) j["manualTestCases"] = *p.manual_test_cases;
}

void from_json(const json &j, contest_problem &p) {
    j.at("problemId").get_to(p.problem_id);
    assign_optional(j, p.title, "title");
    assign_optional(j, p.points, "points");
    assign_optional(j, p.attempt_count, "attemptCount");
    assign_optional(j, p.solved_count, "solvedCount");
    if (exists(j, "manualTestCases")) {
        auto cases = j.at("manualTestCases").get<vector<test_case>>();
        if (!cases.empty()) p.manual_test_cases = move(cases);
    }
}

void to_json(json &j, const contest &c) {
    j = {{"id", c.id},
         {"title", c.title},
         {"status", get_contest_state_name(c.state)},
         {"startTime", c.start_time},
         {"endTime", c.end_time},
         {"allowedLanguages", c.allowed_languages},
         {"problems", c.problems},
         {"participants", c.participants},
         {"analytics", {{"totalSubmissions", c.analytics.total_submissions},
                        {"successfulSubmissions", c.analytics.successful_submissions},
                        {"averageScore", c.analytics.average_score}}}};
}

void from_json(const json &j, contest &c) {
    j.at("id").get_to(c.id);
    assign_optional(j, c.title, "title");
    c.state = parse_contest_state(get_value_def<string>(j, "Upcoming", "status"));
    j.at("startTime").get_to(c.start_time);
    j.at("endTime").get_to(c.end_time);
    assign_optional(j, c.allowed_languages, "allowedLanguages");
    assign_optional(j, c.problems, "problems");
    assign_optional(j, c.participants, "participants");
    assign_optional(j, c.analytics.total_submissions, "analytics", "totalSubmissions");
    assign_optional(j, c.analytics.successful_submissions, "analytics", "successfulSubmissions");
    assign_optional(j, c.analytics.average_score, "analytics", "averageScore");
}

}  // namespace codify::server

#include "server/memory_store.hpp"
#include <fmt/core.h>
#include "common/json_utils.hpp"

namespace codify::server {
using namespace std;
using namespace nlohmann;

memory_store::memory_store(size_t journal_limit)
    : journal_limit(journal_limit) {}

memory_store::memory_store(const json &seed, size_t journal_limit)
    : journal_limit(journal_limit) {
    if (exists(seed, "users"))
        for (auto &u : seed.at("users").get<vector<user>>()) users[u.id] = u;
    if (exists(seed, "problems"))
        for (auto &p : seed.at("problems").get<vector<problem>>()) problems[p.id] = p;
    if (exists(seed, "contests"))
        for (auto &c : seed.at("contests").get<vector<contest>>()) contests[c.id] = c;
}

template <typename T>
static optional<T> find_copy(const map<string, T> &items, const string &id) {
    auto it = items.find(id);
    if (it == items.end()) return nullopt;
    return it->second;
}

optional<user> memory_store::load_user(const string &user_id) {
    lock_guard<mutex> guard(mut);
    return find_copy(users, user_id);
}

void memory_store::save_user(const user &u) {
    lock_guard<mutex> guard(mut);
    users[u.id] = u;
}

optional<problem> memory_store::load_problem(const string &problem_id) {
    lock_guard<mutex> guard(mut);
    return find_copy(problems, problem_id);
}

void memory_store::save_problem(const problem &p) {
    lock_guard<mutex> guard(mut);
    problems[p.id] = p;
}

optional<contest> memory_store::load_contest(const string &contest_id) {
    lock_guard<mutex> guard(mut);
    return find_copy(contests, contest_id);
}

void memory_store::save_contest(const contest &c) {
    lock_guard<mutex> guard(mut);
    contests[c.id] = c;
}

string memory_store::next_submission_id() {
    lock_guard<mutex> guard(mut);
    return fmt::format("{:08d}", ++submission_counter);
}

void memory_store::persist_submission(const submission &submit) {
    lock_guard<mutex> guard(mut);
    submitted[submit.id] = submit;
    status_journal.emplace_back(submit.id, submit.status);
    while (status_journal.size() > journal_limit) status_journal.pop_front();
}

optional<submission> memory_store::load_submission(const string &submission_id) {
    lock_guard<mutex> guard(mut);
    return find_copy(submitted, submission_id);
}

vector<pair<string, submission_status>> memory_store::journal() const {
    lock_guard<mutex> guard(mut);
    return {status_journal.begin(), status_journal.end()};
}

vector<submission> memory_store::submissions() const {
    lock_guard<mutex> guard(mut);
    vector<submission> result;
    for (auto &[id, submit] : submitted) result.push_back(submit);
    return result;
}

json memory_store::dump() const {
    lock_guard<mutex> guard(mut);
    json users_json = json::array(), problems_json = json::array(), contests_json = json::array(), submissions_json = json::array();
    for (auto &[id, u] : users) users_json.push_back(u);
    for (auto &[id, p] : problems) problems_json.push_back(p);
    for (auto &[id, c] : contests) contests_json.push_back(c);
    for (auto &[id, s] : submitted) submissions_json.push_back(s);
    return {{"users", users_json}, {"problems", problems_json}, {"contests", contests_json}, {"submissions", submissions_json}};
}

}  // namespace codify::server

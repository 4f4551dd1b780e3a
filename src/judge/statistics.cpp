#include "judge/statistics.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace codify {
using namespace std;
using namespace codify::server;

statistics_updater::statistics_updater(data_store &store)
    : store(store) {}

void statistics_updater::apply(const submission &submit) noexcept {
    try {
        if (submit.contest_id.empty())
            update_problem_stats(submit);
        else
            update_contest_stats(submit, current_time());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to update statistics of " << submit << ": " << ex.what() << endl
                   << boost::diagnostic_information(ex);
    }
}

void statistics_updater::update_problem_stats(const submission &submit) {
    lock_guard<mutex> guard(mut);
    auto p = store.load_problem(submit.problem_id);
    if (!p) throw not_found_error("Problem " + submit.problem_id + " not found");

    ++p->total_submissions;
    if (submit.status == submission_status::ACCEPTED)
        ++p->successful_submissions;
    store.save_problem(*p);
}

void statistics_updater::update_contest_stats(const submission &submit, time_t now) {
    lock_guard<mutex> guard(mut);
    auto c = store.load_contest(submit.contest_id);
    if (!c) throw not_found_error("Contest " + submit.contest_id + " not found");

    bool accepted = submit.status == submission_status::ACCEPTED;

    ++c->analytics.total_submissions;
    if (accepted) ++c->analytics.successful_submissions;

    if (participant *p = c->find_participant(submit.user_id)) {
        ++p->submissions;
        p->last_activity_time = now;

        problem_attempt *attempt = p->find_attempt(submit.problem_id);
        if (!attempt) {
            p->problems_attempted.push_back({submit.problem_id});
            attempt = &p->problems_attempted.back();
        }
        ++attempt->attempts;
        attempt->last_attempt_time = now;

        if (submit.score > attempt->score) {
            p->score += submit.score - attempt->score;
            attempt->score = submit.score;
            if (accepted) attempt->solved = true;
        }
    } else {
        LOG(WARNING) << submit << " belongs to a user who is not a participant of contest " << c->id;
    }

    if (contest_problem *cp = c->find_problem(submit.problem_id)) {
        ++cp->attempt_count;
        if (accepted) ++cp->solved_count;
    }

    c->update_average_score();
    store.save_contest(*c);
}

}  // namespace codify

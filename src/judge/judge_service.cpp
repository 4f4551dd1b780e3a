#include "judge/judge_service.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace codify {
using namespace std;
using namespace codify::server;

bool run_result::success() const {
    return kind == outcome_kind::SUCCESS;
}

judge_service::judge_service(data_store &store,
                             const toolchain_registry &registry,
                             const workspace_manager &workspaces,
                             size_t interactive_concurrency,
                             size_t judging_concurrency,
                             const execution_limits &interactive_limits,
                             const execution_limits &judging_limits)
    : store(store),
      registry(registry),
      runner(workspaces),
      harness(workspaces, runner),
      statistics(store),
      interactive(interactive_concurrency),
      judging(judging_concurrency),
      interactive_limits(interactive_limits),
      judging_limits(judging_limits) {}

static bool blank(const string &value) {
    return boost::trim_copy(value).empty();
}

judge_job judge_service::prepare_job(const submit_request &request, const string &language) {
    judge_job job;

    if (request.contest_id.empty()) {
        auto p = store.load_problem(request.problem_id);
        if (!p) throw not_found_error("Problem " + request.problem_id + " not found");
        job.test_cases = p->test_cases;
        job.max_score = STANDALONE_MAX_SCORE;
        return job;
    }

    auto c = store.load_contest(request.contest_id);
    if (!c) throw not_found_error("Contest " + request.contest_id + " not found");

    if (!c->find_participant(request.user_id))
        throw validation_error(validation_error::reason::NOT_REGISTERED,
                               "User " + request.user_id + " is not registered for contest " + c->id);

    if (!c->is_active_at(current_time()))
        throw validation_error(validation_error::reason::CONTEST_NOT_ACTIVE, "Contest " + c->id + " is not active");

    if (!c->find_problem(request.problem_id))
        throw not_found_error("Problem " + request.problem_id + " not found in contest " + c->id);

    if (!c->allowed_languages.empty()) {
        bool allowed = false;
        for (auto &allowed_language : c->allowed_languages)
            if (registry.normalize(allowed_language) == language) allowed = true;
        if (!allowed)
            throw validation_error(validation_error::reason::LANGUAGE_NOT_ALLOWED,
                                   "Language " + language + " is not allowed in contest " + c->id);
    }

    auto config = store.load_contest_problem(request.contest_id, request.problem_id);
    if (!config) throw not_found_error("Referenced problem " + request.problem_id + " not found");
    job.test_cases = move(config->test_cases);
    job.max_score = config->points;
    return job;
}

submit_ack judge_service::submit(const submit_request &request) {
    if (blank(request.user_id) || blank(request.problem_id) || blank(request.code) || blank(request.language))
        throw validation_error(validation_error::reason::MISSING_FIELDS, "Missing required fields");

    const toolchain &tc = registry.resolve(request.language);

    if (request.code.size() > MAX_CODE_LENGTH)
        throw validation_error(validation_error::reason::CODE_TOO_LONG,
                               "Code exceeds " + to_string(MAX_CODE_LENGTH) + " characters");

    if (!store.load_user(request.user_id))
        throw not_found_error("User " + request.user_id + " not found");

    judge_job job = prepare_job(request, tc.language);
    if (job.test_cases.empty())
        throw validation_error(validation_error::reason::NO_TEST_CASES, "No test cases found for this problem");

    submission submit;
    submit.id = store.next_submission_id();
    submit.user_id = request.user_id;
    submit.problem_id = request.problem_id;
    submit.contest_id = request.contest_id;
    submit.code = request.code;
    submit.language = tc.language;
    submit.status = submission_status::PENDING;
    submit.total_test_cases = job.test_cases.size();
    submit.max_score = job.max_score;
    submit.submitted_at = current_time();
    store.persist_submission(submit);

    job.submission_id = submit.id;
    queue.push(job);

    LOG(INFO) << submit << " queued with " << submit.total_test_cases << " test cases";
    return {submit.id, submit.status, submit.total_test_cases, "Submission received and queued for evaluation"};
}

submission judge_service::get_submission(const string &submission_id) {
    auto submit = store.load_submission(submission_id);
    if (!submit) throw not_found_error("Submission " + submission_id + " not found");
    return *submit;
}

run_result judge_service::compile_and_run(const string &code, const string &language, const string &input) {
    if (blank(code) || blank(language))
        throw validation_error(validation_error::reason::MISSING_FIELDS, "Code and language are required");

    const toolchain &tc = registry.resolve(language);

    scoped_admission slot(interactive);
    execution_outcome outcome = runner.execute(tc, code, input, interactive_limits);
    if (outcome.fault == error_type::CONFIGURATION)
        throw configuration_error(outcome.error);

    return {tc.language, outcome.kind, outcome.fault, outcome.output, outcome.error, outcome.elapsed, outcome.memory_used};
}

void judge_service::evaluate(const judge_job &job, scoped_admission &slot) {
    auto loaded = store.load_submission(job.submission_id);
    if (!loaded) throw not_found_error("Submission " + job.submission_id + " not found");
    submission submit = move(*loaded);

    submit.status = submission_status::RUNNING;
    store.persist_submission(submit);
    LOG(INFO) << submit << " is running";

    const toolchain &tc = registry.resolve(submit.language);
    evaluation eval = harness.evaluate(submit.code, tc, job.test_cases, judging_limits);

    submit.test_case_results = move(eval.results);
    submit.compilation_output = move(eval.compilation_output);
    submit.total_test_cases = job.test_cases.size();
    submit.passed_test_cases = 0;
    submit.execution_time = 0;
    submit.memory_used = 0;
    for (auto &result : submit.test_case_results) {
        if (result.status == test_case_status::PASSED) ++submit.passed_test_cases;
        submit.execution_time += result.execution_time;
        submit.memory_used = max(submit.memory_used, result.memory_used);
    }
    submit.max_score = job.max_score;
    submit.score = compute_score(submit.passed_test_cases, submit.total_test_cases, submit.max_score);
    submit.status = summarize_status(submit.test_case_results);
    submit.evaluated_at = current_time();
    store.persist_submission(submit);

    LOG(INFO) << submit << " finished: " << get_display_message(submit.status)
              << ", passed " << submit.passed_test_cases << "/" << submit.total_test_cases
              << ", score " << submit.score << "/" << submit.max_score;

    // 终态已经保存，先归还名额再更新统计数据
    slot.release();
    statistics.apply(submit);
}

void judge_service::fail(const judge_job &job, const string &reason) noexcept {
    const string &submission_id = job.submission_id;
    try {
        auto submit = store.load_submission(submission_id);
        if (!submit) {
            LOG(ERROR) << "Submission " << submission_id << " disappeared while judging: " << reason;
            return;
        }
        submit->status = submission_status::RUNTIME_ERROR;
        submit->compilation_output.clear();

        // 每组测试数据都要有结果
        submit->test_case_results.clear();
        for (size_t i = 0; i < job.test_cases.size(); ++i) {
            test_case_result result;
            result.index = i;
            result.input = job.test_cases[i].input;
            result.expected_output = job.test_cases[i].output;
            result.status = test_case_status::ERROR;
            result.error = error_type::RUNTIME;
            result.error_message = reason;
            submit->test_case_results.push_back(move(result));
        }
        submit->total_test_cases = job.test_cases.size();
        submit->passed_test_cases = 0;
        submit->score = 0;
        submit->execution_time = 0;
        submit->memory_used = 0;
        submit->evaluated_at = current_time();
        store.persist_submission(*submit);
        LOG(ERROR) << *submit << " failed: " << reason;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to mark submission " << submission_id << " as failed: " << ex.what();
    }
}

void judge_service::process(const judge_job &job) noexcept {
    try {
        scoped_admission slot(judging);
        try {
            evaluate(job, slot);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Error while judging submission " << job.submission_id << endl
                       << boost::diagnostic_information(ex);
            fail(job, ex.what());
        }
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to acquire judging slot for submission " << job.submission_id << ": " << ex.what();
        fail(job, ex.what());
    }
}

bool judge_service::process_next() {
    judge_job job;
    if (!queue.try_pop(job)) return false;
    process(job);
    return true;
}

concurrent_queue<judge_job> &judge_service::jobs() {
    return queue;
}

admission_controller::snapshot judge_service::interactive_stats() const {
    return interactive.stats();
}

admission_controller::snapshot judge_service::judging_stats() const {
    return judging.stats();
}

const toolchain_registry &judge_service::toolchains() const {
    return registry;
}

}  // namespace codify

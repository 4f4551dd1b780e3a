#include "judge/submission.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/rational.hpp>
#include "common/json_utils.hpp"

namespace codify {
using namespace std;
using namespace nlohmann;

submission_status summarize_status(const vector<test_case_result> &results) {
    bool compilation = false, runtime = false, timeout = false;
    size_t passed = 0;
    for (auto &result : results) {
        if (result.status == test_case_status::ERROR) {
            if (result.error == error_type::COMPILATION)
                compilation = true;
            else
                runtime = true;  // 包括输出超限和评测环境配置错误
        } else if (result.status == test_case_status::TIMEOUT) {
            timeout = true;
        } else if (result.status == test_case_status::PASSED) {
            ++passed;
        }
    }

    if (compilation) return submission_status::COMPILATION_ERROR;
    if (runtime) return submission_status::RUNTIME_ERROR;
    if (timeout) return submission_status::TIME_LIMIT_EXCEEDED;
    if (passed == results.size()) return submission_status::ACCEPTED;
    return submission_status::WRONG_ANSWER;
}

int compute_score(size_t passed, size_t total, int max_score) {
    if (total == 0) return 0;
    boost::rational<long long> ratio((long long)passed, (long long)total);
    return (int)boost::rational_cast<long long>(ratio * (long long)max_score);
}

bool output_matches(const string &actual, const string &expected) {
    return boost::trim_copy(actual) == boost::trim_copy(expected);
}

void to_json(json &j, const test_case &tc) {
    j = {{"input", tc.input}, {"output", tc.output}, {"isHidden", tc.hidden}};
}

void from_json(const json &j, test_case &tc) {
    j.at("input").get_to(tc.input);
    j.at("output").get_to(tc.output);
    assign_optional(j, tc.hidden, "isHidden");
}

void to_json(json &j, const test_case_result &result) {
    j = {{"testCaseIndex", result.index},
         {"input", result.input},
         {"expectedOutput", result.expected_output},
         {"actualOutput", result.actual_output},
         {"status", get_status_name(result.status)},
         {"errorType", get_error_type_name(result.error)},
         {"executionTime", result.execution_time},
         {"memoryUsed", result.memory_used},
         {"errorMessage", result.error_message}};
}

void from_json(const json &j, test_case_result &result) {
    j.at("testCaseIndex").get_to(result.index);
    assign_optional(j, result.input, "input");
    assign_optional(j, result.expected_output, "expectedOutput");
    assign_optional(j, result.actual_output, "actualOutput");
    result.status = parse_test_case_status(j.at("status").get<string>());
    result.error = parse_error_type(get_value_def<string>(j, "none", "errorType"));
    assign_optional(j, result.execution_time, "executionTime");
    assign_optional(j, result.memory_used, "memoryUsed");
    assign_optional(j, result.error_message, "errorMessage");
}

void to_json(json &j, const submission &submit) {
    j = {{"id", submit.id},
         {"userId", submit.user_id},
         {"problemId", submit.problem_id},
         {"code", submit.code},
         {"language", submit.language},
         {"status", get_status_name(submit.status)},
         {"totalTestCases", submit.total_test_cases},
         {"passedTestCases", submit.passed_test_cases},
         {"score", submit.score},
         {"maxScore", submit.max_score},
         {"testCaseResults", submit.test_case_results},
         {"compilationOutput", submit.compilation_output},
         {"executionTime", submit.execution_time},
         {"memoryUsed", submit.memory_used},
         {"isPublic", submit.is_public},
         {"submittedAt", submit.submitted_at},
         {"evaluatedAt", submit.evaluated_at}};
    if (submit.contest_id.empty())
        j["contestId"] = nullptr;
    else
        j["contestId"] = submit.contest_id;
}

void from_json(const json &j, submission &submit) {
    j.at("id").get_to(submit.id);
    j.at("userId").get_to(submit.user_id);
    j.at("problemId").get_to(submit.problem_id);
    assign_optional(j, submit.contest_id, "contestId");
    j.at("code").get_to(submit.code);
    j.at("language").get_to(submit.language);
    submit.status = parse_submission_status(j.at("status").get<string>());
    assign_optional(j, submit.total_test_cases, "totalTestCases");
    assign_optional(j, submit.passed_test_cases, "passedTestCases");
    assign_optional(j, submit.score, "score");
    assign_optional(j, submit.max_score, "maxScore");
    assign_optional(j, submit.test_case_results, "testCaseResults");
    assign_optional(j, submit.compilation_output, "compilationOutput");
    assign_optional(j, submit.execution_time, "executionTime");
    assign_optional(j, submit.memory_used, "memoryUsed");
    assign_optional(j, submit.is_public, "isPublic");
    assign_optional(j, submit.submitted_at, "submittedAt");
    assign_optional(j, submit.evaluated_at, "evaluatedAt");
}

}  // namespace codify

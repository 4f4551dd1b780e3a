#include "gtest/gtest.h"
#include "judge/submission.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace codify;

static test_case_result make(test_case_status status, error_type error = error_type::NONE) {
    test_case_result result;
    result.status = status;
    result.error = error;
    return result;
}

TEST(SubmissionTest, AllPassedIsAccepted) {
    EXPECT_EQ(summarize_status({make(test_case_status::PASSED), make(test_case_status::PASSED)}),
              submission_status::ACCEPTED);
}

TEST(SubmissionTest, AnyFailureIsWrongAnswer) {
    EXPECT_EQ(summarize_status({make(test_case_status::PASSED), make(test_case_status::FAILED)}),
              submission_status::WRONG_ANSWER);
}

TEST(SubmissionTest, CompilationErrorTakesPrecedence) {
    EXPECT_EQ(summarize_status({make(test_case_status::TIMEOUT, error_type::TIMEOUT),
                                make(test_case_status::ERROR, error_type::RUNTIME),
                                make(test_case_status::ERROR, error_type::COMPILATION)}),
              submission_status::COMPILATION_ERROR);
}

TEST(SubmissionTest, RuntimeErrorBeatsTimeout) {
    EXPECT_EQ(summarize_status({make(test_case_status::TIMEOUT, error_type::TIMEOUT),
                                make(test_case_status::ERROR, error_type::RUNTIME),
                                make(test_case_status::PASSED)}),
              submission_status::RUNTIME_ERROR);
}

TEST(SubmissionTest, OutputLimitAndConfigurationAreRuntimeErrors) {
    EXPECT_EQ(summarize_status({make(test_case_status::ERROR, error_type::OUTPUT_LIMIT)}),
              submission_status::RUNTIME_ERROR);
    EXPECT_EQ(summarize_status({make(test_case_status::ERROR, error_type::CONFIGURATION)}),
              submission_status::RUNTIME_ERROR);
}

TEST(SubmissionTest, TimeoutBeatsWrongAnswer) {
    EXPECT_EQ(summarize_status({make(test_case_status::FAILED), make(test_case_status::TIMEOUT, error_type::TIMEOUT)}),
              submission_status::TIME_LIMIT_EXCEEDED);
}

TEST(SubmissionTest, ScoreIsFlooredProportion) {
    EXPECT_EQ(compute_score(3, 3, 100), 100);
    EXPECT_EQ(compute_score(0, 3, 100), 0);
    EXPECT_EQ(compute_score(2, 3, 100), 66);
    EXPECT_EQ(compute_score(1, 3, 50), 16);
    EXPECT_EQ(compute_score(1, 2, 50), 25);
    EXPECT_EQ(compute_score(0, 0, 100), 0);
}

TEST(SubmissionTest, OutputComparisonTrimsOnlyEnds) {
    EXPECT_TRUE(output_matches("  3\n\n", "3"));
    EXPECT_TRUE(output_matches("a b\n", "a b"));
    EXPECT_FALSE(output_matches("a  b", "a b"));
    EXPECT_FALSE(output_matches("3\n4", "3 4"));
}

TEST(SubmissionTest, StatusNamesRoundTrip) {
    for (auto status : {submission_status::PENDING, submission_status::RUNNING, submission_status::ACCEPTED,
                        submission_status::WRONG_ANSWER, submission_status::COMPILATION_ERROR,
                        submission_status::RUNTIME_ERROR, submission_status::TIME_LIMIT_EXCEEDED,
                        submission_status::MEMORY_LIMIT_EXCEEDED})
        EXPECT_EQ(parse_submission_status(get_status_name(status)), status);
    EXPECT_STREQ(get_status_name(submission_status::WRONG_ANSWER), "wrong_answer");
    EXPECT_STREQ(get_display_message(submission_status::TIME_LIMIT_EXCEEDED), "Time Limit Exceeded");
    EXPECT_THROW(parse_submission_status("judging"), invalid_argument);
    EXPECT_FALSE(is_terminal(submission_status::PENDING));
    EXPECT_FALSE(is_terminal(submission_status::RUNNING));
    EXPECT_TRUE(is_terminal(submission_status::WRONG_ANSWER));
}

TEST(SubmissionTest, SerializesToCamelCaseDocument) {
    submission submit;
    submit.id = "00000001";
    submit.user_id = "alice";
    submit.problem_id = "sum";
    submit.code = "print(3)";
    submit.language = "python";
    submit.status = submission_status::WRONG_ANSWER;
    submit.total_test_cases = 2;
    submit.passed_test_cases = 1;
    submit.score = 50;
    submit.submitted_at = 1000;
    submit.evaluated_at = 1001;

    test_case_result result;
    result.index = 1;
    result.input = "10 20";
    result.expected_output = "30";
    result.actual_output = "3";
    result.status = test_case_status::FAILED;
    submit.test_case_results.push_back(result);

    nlohmann::json j = submit;
    EXPECT_EQ(j.at("status"), "wrong_answer");
    EXPECT_TRUE(j.at("contestId").is_null());
    EXPECT_EQ(j.at("testCaseResults").at(0).at("expectedOutput"), "30");
    EXPECT_EQ(j.at("testCaseResults").at(0).at("errorType"), "none");

    submission parsed = j.get<submission>();
    EXPECT_EQ(parsed.status, submission_status::WRONG_ANSWER);
    EXPECT_EQ(parsed.contest_id, "");
    EXPECT_JSON_EQ(nlohmann::json(parsed), j);
}

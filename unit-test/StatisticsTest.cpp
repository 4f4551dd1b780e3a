#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/statistics.hpp"
#include "server/memory_store.hpp"
#include "test/fixtures.hpp"
#include "test/mock_data_store.hpp"

using namespace std;
using namespace codify;
using namespace codify::server;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class StatisticsTest : public ::testing::Test {
protected:
    StatisticsTest()
        : store(make_seed(current_time())), statistics(store) {}

    submission contest_submission(const string &user, const string &problem, submission_status status, int score) {
        submission submit;
        submit.id = store.next_submission_id();
        submit.user_id = user;
        submit.problem_id = problem;
        submit.contest_id = "live";
        submit.status = status;
        submit.score = score;
        return submit;
    }

    participant participant_of(const string &user) {
        auto c = store.load_contest("live");
        return *c->find_participant(user);
    }

    memory_store store;
    statistics_updater statistics;
};

TEST_F(StatisticsTest, StandaloneSubmissionUpdatesProblem) {
    submission submit;
    submit.problem_id = "sum";
    submit.status = submission_status::ACCEPTED;
    statistics.apply(submit);
    submit.status = submission_status::WRONG_ANSWER;
    statistics.apply(submit);

    auto p = store.load_problem("sum");
    EXPECT_EQ(p->total_submissions, 2);
    EXPECT_EQ(p->successful_submissions, 1);

    // 比赛数据不受影响
    EXPECT_EQ(store.load_contest("live")->analytics.total_submissions, 0);
}

TEST_F(StatisticsTest, ContestSubmissionDoesNotUpdateProblem) {
    statistics.apply(contest_submission("alice", "sum", submission_status::ACCEPTED, 50));
    EXPECT_EQ(store.load_problem("sum")->total_submissions, 0);
}

TEST_F(StatisticsTest, FirstContestAttemptCreatesRecord) {
    statistics.update_contest_stats(contest_submission("alice", "sum", submission_status::WRONG_ANSWER, 16), 1234);

    auto c = store.load_contest("live");
    EXPECT_EQ(c->analytics.total_submissions, 1);
    EXPECT_EQ(c->analytics.successful_submissions, 0);

    participant alice = *c->find_participant("alice");
    EXPECT_EQ(alice.submissions, 1);
    EXPECT_EQ(alice.last_activity_time, 1234);
    EXPECT_EQ(alice.score, 16);
    ASSERT_EQ(alice.problems_attempted.size(), 1u);
    EXPECT_EQ(alice.problems_attempted[0].problem_id, "sum");
    EXPECT_EQ(alice.problems_attempted[0].attempts, 1);
    EXPECT_EQ(alice.problems_attempted[0].score, 16);
    EXPECT_FALSE(alice.problems_attempted[0].solved);
    EXPECT_EQ(alice.problems_attempted[0].last_attempt_time, 1234);

    EXPECT_EQ(c->find_problem("sum")->attempt_count, 1);
    EXPECT_EQ(c->find_problem("sum")->solved_count, 0);
}

TEST_F(StatisticsTest, BestScoreIsKeptAcrossAttempts) {
    statistics.apply(contest_submission("alice", "sum", submission_status::WRONG_ANSWER, 33));
    statistics.apply(contest_submission("alice", "sum", submission_status::WRONG_ANSWER, 16));
    EXPECT_EQ(participant_of("alice").score, 33);

    statistics.apply(contest_submission("alice", "sum", submission_status::ACCEPTED, 50));
    participant alice = participant_of("alice");
    EXPECT_EQ(alice.score, 50);
    EXPECT_EQ(alice.problems_attempted[0].score, 50);
    EXPECT_EQ(alice.problems_attempted[0].attempts, 3);
    EXPECT_TRUE(alice.problems_attempted[0].solved);
    EXPECT_EQ(alice.submissions, 3);

    // 更低分的提交不会降低已有成绩，也不会取消 solved
    statistics.apply(contest_submission("alice", "sum", submission_status::WRONG_ANSWER, 0));
    alice = participant_of("alice");
    EXPECT_EQ(alice.score, 50);
    EXPECT_TRUE(alice.problems_attempted[0].solved);
    EXPECT_EQ(alice.problems_attempted[0].attempts, 4);
}

TEST_F(StatisticsTest, TotalScoreSumsBestScoresPerProblem) {
    statistics.apply(contest_submission("alice", "sum", submission_status::WRONG_ANSWER, 33));
    statistics.apply(contest_submission("alice", "manual_1", submission_status::ACCEPTED, 30));
    statistics.apply(contest_submission("alice", "sum", submission_status::ACCEPTED, 50));

    participant alice = participant_of("alice");
    EXPECT_EQ(alice.score, 80);
    EXPECT_EQ(alice.problems_attempted.size(), 2u);
}

TEST_F(StatisticsTest, TiedScoreDoesNotChangeRecord) {
    statistics.apply(contest_submission("alice", "sum", submission_status::WRONG_ANSWER, 33));
    statistics.apply(contest_submission("alice", "sum", submission_status::WRONG_ANSWER, 33));
    participant alice = participant_of("alice");
    EXPECT_EQ(alice.score, 33);
    EXPECT_EQ(alice.problems_attempted[0].attempts, 2);
    EXPECT_FALSE(alice.problems_attempted[0].solved);
}

TEST_F(StatisticsTest, AverageScoreCoversAllParticipants) {
    statistics.apply(contest_submission("alice", "sum", submission_status::ACCEPTED, 50));
    statistics.apply(contest_submission("bob", "sum", submission_status::WRONG_ANSWER, 16));

    auto c = store.load_contest("live");
    EXPECT_DOUBLE_EQ(c->analytics.average_score, 33.0);
    EXPECT_EQ(c->analytics.total_submissions, 2);
    EXPECT_EQ(c->analytics.successful_submissions, 1);
    EXPECT_EQ(c->find_problem("sum")->attempt_count, 2);
    EXPECT_EQ(c->find_problem("sum")->solved_count, 1);
}

TEST_F(StatisticsTest, MissingProblemIsReported) {
    submission submit;
    submit.problem_id = "missing";
    EXPECT_THROW(statistics.update_problem_stats(submit), not_found_error);
    // apply 只记录日志
    EXPECT_NO_THROW(statistics.apply(submit));
}

TEST(StatisticsStoreFailureTest, StoreFailureIsSwallowedAndLogged) {
    mock::data_store store;
    statistics_updater statistics(store);

    problem p;
    p.id = "sum";
    EXPECT_CALL(store, load_problem("sum")).WillOnce(Return(p));
    EXPECT_CALL(store, save_problem(_)).WillOnce(Throw(runtime_error("store is unavailable")));

    submission submit;
    submit.problem_id = "sum";
    submit.status = submission_status::ACCEPTED;
    EXPECT_NO_THROW(statistics.apply(submit));
}

#pragma once

#include <ctime>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "judge/submission.hpp"

namespace codify::server {

struct user {
    std::string id;
    std::string name;
    std::string email;
};

/**
 * @brief 题库中的题目
 */
struct problem {
    std::string id;
    std::string title;
    std::vector<test_case> test_cases;
    bool is_active = true;

    // 只统计非比赛提交
    int total_submissions = 0;
    int successful_submissions = 0;
};

enum class contest_state {
    UPCOMING,
    ACTIVE,
    COMPLETED,
    CANCELLED
};

const char *get_contest_state_name(contest_state state);
contest_state parse_contest_state(const std::string &name);

/**
 * @brief 选手在比赛中某道题的提交情况
 */
struct problem_attempt {
    std::string problem_id;
    int attempts = 0;
    bool solved = false;

    /**
     * @brief 该题所有提交中的最高分
     */
    int score = 0;

    std::time_t last_attempt_time = 0;
};

struct participant {
    std::string user_id;
    std::string name;

    /**
     * @brief 所有题目最高分之和
     */
    int score = 0;

    int submissions = 0;
    std::time_t last_activity_time = 0;
    std::vector<problem_attempt> problems_attempted;

    problem_attempt *find_attempt(const std::string &problem_id);
};

/**
 * @brief 比赛中的题目
 * 可以引用题库中的题目，也可以直接在比赛中给出测试数据
 */
struct contest_problem {
    std::string problem_id;
    std::string title;
    int points = 100;

    /**
     * @brief 比赛中直接给出的测试数据，为空时使用题库中的测试数据
     */
    std::optional<std::vector<test_case>> manual_test_cases;

    int attempt_count = 0;
    int solved_count = 0;
};

struct contest_analytics {
    int total_submissions = 0;
    int successful_submissions = 0;
    double average_score = 0;
};

struct contest {
    std::string id;
    std::string title;
    contest_state state = contest_state::UPCOMING;
    std::time_t start_time = 0;
    std::time_t end_time = 0;

    /**
     * @brief 允许使用的语言，为空时允许所有语言
     */
    std::vector<std::string> allowed_languages;

    std::vector<contest_problem> problems;
    std::vector<participant> participants;
    contest_analytics analytics;

    /**
     * @brief 比赛是否正在进行：状态为 ACTIVE 且 now 在比赛时间内
     */
    bool is_active_at(std::time_t now) const;

    contest_problem *find_problem(const std::string &problem_id);
    const contest_problem *find_problem(const std::string &problem_id) const;

    participant *find_participant(const std::string &user_id);
    const participant *find_participant(const std::string &user_id) const;

    /**
     * @brief 根据所有选手的得分重新计算平均分
     */
    void update_average_score();
};

void to_json(nlohmann::json &j, const user &u);
void from_json(const nlohmann::json &j, user &u);
void to_json(nlohmann::json &j, const problem &p);
void from_json(const nlohmann::json &j, problem &p);
void to_json(nlohmann::json &j, const problem_attempt &attempt);
void from_json(const nlohmann::json &j, problem_attempt &attempt);
void to_json(nlohmann::json &j, const participant &p);
void from_json(const nlohmann::json &j, participant &p);
void to_json(nlohmann::json &j, const contest_problem &p);
void from_json(const nlohmann::json &j, contest_problem &p);
void to_json(nlohmann::json &j, const contest &c);
void from_json(const nlohmann::json &j, contest &c);

}  // namespace codify::server

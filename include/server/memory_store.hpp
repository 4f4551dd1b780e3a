#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <utility>
#include <vector>
#include "server/data_store.hpp"

namespace codify::server {

/**
 * @brief 保存在内存中的存储
 * 可以从 JSON 文档初始化：
 * @code{.json}
 * {
 *     "users": [{"id": "u1", "name": "Alice"}],
 *     "problems": [{"id": "p1", "title": "A+B", "testCases": [{"input": "1 2", "output": "3"}]}],
 *     "contests": []
 * }
 * @endcode
 * 每次保存提交时都会记录提交的状态，可以用来检查状态转移的顺序。
 * 记录最多保留 journal_limit 条，超出时丢弃最早的记录。
 */
struct memory_store : public data_store {
    static constexpr std::size_t DEFAULT_JOURNAL_LIMIT = 100000;

    explicit memory_store(std::size_t journal_limit = DEFAULT_JOURNAL_LIMIT);
    explicit memory_store(const nlohmann::json &seed, std::size_t journal_limit = DEFAULT_JOURNAL_LIMIT);

    std::optional<user> load_user(const std::string &user_id) override;
    std::optional<problem> load_problem(const std::string &problem_id) override;
    void save_problem(const problem &p) override;
    std::optional<contest> load_contest(const std::string &contest_id) override;
    void save_contest(const contest &c) override;
    std::string next_submission_id() override;
    void persist_submission(const submission &submit) override;
    std::optional<submission> load_submission(const std::string &submission_id) override;

    void save_user(const user &u);

    /**
     * @brief 按保存顺序返回最近的提交状态变化
     */
    std::vector<std::pair<std::string, submission_status>> journal() const;

    std::vector<submission> submissions() const;

    /**
     * @brief 导出为和初始化时相同格式的 JSON 文档
     */
    nlohmann::json dump() const;

private:
    mutable std::mutex mut;
    std::map<std::string, user> users;
    std::map<std::string, problem> problems;
    std::map<std::string, contest> contests;
    std::map<std::string, submission> submitted;
    std::deque<std::pair<std::string, submission_status>> status_journal;
    std::size_t journal_limit;
    unsigned long long submission_counter = 0;
};

}  // namespace codify::server

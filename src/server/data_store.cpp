#include "server/data_store.hpp"

namespace codify::server {
using namespace std;

data_store::~data_store() {}

optional<contest_problem_config> data_store::load_contest_problem(const string &contest_id, const string &problem_id) {
    auto c = load_contest(contest_id);
    if (!c) return nullopt;
    const contest_problem *cp = c->find_problem(problem_id);
    if (!cp) return nullopt;

    contest_problem_config config;
    config.points = cp->points;
    if (cp->manual_test_cases) {
        config.test_cases = *cp->manual_test_cases;
    } else {
        auto p = load_problem(problem_id);
        if (!p) return nullopt;
        config.test_cases = p->test_cases;
    }
    return config;
}

}  // namespace codify::server

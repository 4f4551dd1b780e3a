#include "test/fixtures.hpp"

namespace codify {
using namespace std;
using namespace nlohmann;

json make_seed(time_t now) {
    json users = json::array({{{"id", "alice"}, {"name", "Alice"}},
                              {{"id", "bob"}, {"name", "Bob"}},
                              {{"id", "carol"}, {"name", "Carol"}}});

    json problems = json::array({{{"id", "echo"},
                                  {"title", "Echo"},
                                  {"testCases", {{{"input", "hello"}, {"output", "hello"}},
                                                 {{"input", "world"}, {"output", "world"}}}}},
                                 {{"id", "sum"},
                                  {"title", "A+B"},
                                  {"testCases", {{{"input", "1 2"}, {"output", "3"}},
                                                 {{"input", "10 20"}, {"output", "30"}},
                                                 {{"input", "5 5"}, {"output", "10"}, {"isHidden", true}}}}},
                                 {{"id", "empty"}, {"title", "Empty"}, {"testCases", json::array()}}});

    json participants = json::array({{{"userId", "alice"}, {"name", "Alice"}},
                                     {{"userId", "bob"}, {"name", "Bob"}}});

    json contests = json::array({{{"id", "live"},
                                  {"title", "Live Contest"},
                                  {"status", "Active"},
                                  {"startTime", now - 3600},
                                  {"endTime", now + 3600},
                                  {"problems", {{{"problemId", "sum"}, {"title", "A+B"}, {"points", 50}},
                                                {{"problemId", "manual_1"},
                                                 {"title", "Manual"},
                                                 {"points", 30},
                                                 {"manualTestCases", json::array({{{"input", "x"}, {"output", "x"}}})}}}},
                                  {"participants", participants}},
                                 {{"id", "future"},
                                  {"title", "Future Contest"},
                                  {"status", "Upcoming"},
                                  {"startTime", now + 3600},
                                  {"endTime", now + 7200},
                                  {"problems", json::array({{{"problemId", "sum"}, {"points", 50}}})},
                                  {"participants", participants}},
                                 {{"id", "restricted"},
                                  {"title", "Python Only"},
                                  {"status", "Active"},
                                  {"startTime", now - 3600},
                                  {"endTime", now + 3600},
                                  {"allowedLanguages", json::array({"py"})},
                                  {"problems", json::array({{{"problemId", "sum"}, {"points", 100}}})},
                                  {"participants", participants}}});

    return {{"users", users}, {"problems", problems}, {"contests", contests}};
}

}  // namespace codify

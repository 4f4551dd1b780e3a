#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace codify {
using namespace std;

// clang-format off
static const unordered_map<submission_status, const char *> status_display = boost::assign::map_list_of
    (submission_status::PENDING, "Pending")
    (submission_status::RUNNING, "Running")
    (submission_status::ACCEPTED, "Accepted")
    (submission_status::WRONG_ANSWER, "Wrong Answer")
    (submission_status::COMPILATION_ERROR, "Compilation Error")
    (submission_status::RUNTIME_ERROR, "Runtime Error")
    (submission_status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (submission_status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded");

static const unordered_map<submission_status, const char *> status_names = boost::assign::map_list_of
    (submission_status::PENDING, "pending")
    (submission_status::RUNNING, "running")
    (submission_status::ACCEPTED, "accepted")
    (submission_status::WRONG_ANSWER, "wrong_answer")
    (submission_status::COMPILATION_ERROR, "compilation_error")
    (submission_status::RUNTIME_ERROR, "runtime_error")
    (submission_status::TIME_LIMIT_EXCEEDED, "time_limit_exceeded")
    (submission_status::MEMORY_LIMIT_EXCEEDED, "memory_limit_exceeded");

static const unordered_map<test_case_status, const char *> test_case_names = boost::assign::map_list_of
    (test_case_status::PASSED, "passed")
    (test_case_status::FAILED, "failed")
    (test_case_status::ERROR, "error")
    (test_case_status::TIMEOUT, "timeout");

static const unordered_map<error_type, const char *> error_type_names = boost::assign::map_list_of
    (error_type::NONE, "none")
    (error_type::COMPILATION, "compilation")
    (error_type::RUNTIME, "runtime")
    (error_type::TIMEOUT, "timeout")
    (error_type::OUTPUT_LIMIT, "output_limit")
    (error_type::CONFIGURATION, "configuration");
// clang-format on

template <typename EnumT>
static EnumT parse_name(const unordered_map<EnumT, const char *> &names, const string &name) {
    for (auto &[value, text] : names)
        if (name == text) return value;
    throw invalid_argument("Unrecognized status " + name);
}

const char *get_display_message(submission_status stat) {
    return status_display.at(stat);
}

const char *get_status_name(submission_status stat) {
    return status_names.at(stat);
}

submission_status parse_submission_status(const string &name) {
    return parse_name(status_names, name);
}

const char *get_status_name(test_case_status stat) {
    return test_case_names.at(stat);
}

test_case_status parse_test_case_status(const string &name) {
    return parse_name(test_case_names, name);
}

const char *get_error_type_name(error_type type) {
    return error_type_names.at(type);
}

error_type parse_error_type(const string &name) {
    return parse_name(error_type_names, name);
}

bool is_terminal(submission_status stat) {
    return stat != submission_status::PENDING && stat != submission_status::RUNNING;
}

}  // namespace codify

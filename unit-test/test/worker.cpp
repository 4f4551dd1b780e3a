#include "test/worker.hpp"
#include <thread>

namespace codify {
using namespace std;

size_t drain_queue(judge_service &service) {
    size_t count = 0;
    while (service.process_next()) ++count;
    return count;
}

bool wait_until_judged(judge_service &service, const vector<string> &submission_ids, chrono::milliseconds timeout) {
    auto deadline = chrono::steady_clock::now() + timeout;
    while (true) {
        bool judged = true;
        for (auto &id : submission_ids)
            if (!is_terminal(service.get_submission(id).status)) judged = false;
        if (judged) return true;
        if (chrono::steady_clock::now() >= deadline) return false;
        this_thread::sleep_for(chrono::milliseconds(20));
    }
}

}  // namespace codify

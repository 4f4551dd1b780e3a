#include "common/admission_controller.hpp"
#include <stdexcept>

namespace codify {
using namespace std;

admission_controller::admission_controller(size_t max_concurrency)
    : max_concurrency(max_concurrency) {
    if (max_concurrency == 0)
        throw invalid_argument("admission controller requires a positive concurrency limit");
}

void admission_controller::acquire() {
    unique_lock<mutex> lock(mut);
    if (waiters.empty() && in_flight < max_concurrency) {
        ++in_flight;
        return;
    }

    waiter self;
    waiters.push_back(&self);
    self.cond.wait(lock, [&self] { return self.granted; });
    // 名额已经由 release 转交，in_flight 不变
}

void admission_controller::release() {
    lock_guard<mutex> lock(mut);
    if (!waiters.empty()) {
        waiter *next = waiters.front();
        waiters.pop_front();
        next->granted = true;
        // 持有锁时通知，保证 next 在被唤醒前仍然有效
        next->cond.notify_one();
    } else if (in_flight > 0) {
        --in_flight;
    }
}

admission_controller::snapshot admission_controller::stats() const {
    lock_guard<mutex> lock(mut);
    return {max_concurrency, in_flight, waiters.size()};
}

scoped_admission::scoped_admission(admission_controller &controller)
    : controller(&controller) {
    controller.acquire();
}

scoped_admission::scoped_admission(scoped_admission &&other) noexcept
    : controller(other.controller) {
    other.controller = nullptr;
}

scoped_admission::~scoped_admission() {
    release();
}

void scoped_admission::release() {
    if (controller) {
        controller->release();
        controller = nullptr;
    }
}

}  // namespace codify

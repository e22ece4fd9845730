#include "solo/timer.hpp"
#include "solo/logger.hpp"

namespace solo {

CountdownTimer::CountdownTimer(std::chrono::milliseconds delay, std::function<void()> onElapsed)
    : state_(std::make_shared<State>()) {
    state_->delay = delay;
    state_->onElapsed = std::move(onElapsed);
}

CountdownTimer::~CountdownTimer() {
    cancel();
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            // Destroyed from onElapsed: the thread only touches its State.
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void CountdownTimer::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([state = state_](std::stop_token stopToken) { wait(state, stopToken); });
}

void CountdownTimer::cancel() {
    thread_.request_stop();
}

void CountdownTimer::wait(const std::shared_ptr<State>& state, std::stop_token stopToken) {
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->cv.wait_for(lock, stopToken, state->delay, [] { return false; });
    }

    if (stopToken.stop_requested()) {
        LOG_DEBUG("Countdown cancelled");
        return;
    }

    state->elapsed = true;
    LOG_DEBUG("Countdown elapsed after " + std::to_string(state->delay.count()) + " ms");
    if (state->onElapsed) state->onElapsed();
}

} // namespace solo

#ifndef SOLO_TIMER_HPP
#define SOLO_TIMER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace solo {

// One-shot countdown running on its own jthread.
class CountdownTimer {
public:
    CountdownTimer(std::chrono::milliseconds delay, std::function<void()> onElapsed);
    ~CountdownTimer();

    void start();

    // Safe to call from any thread, including from inside onElapsed.
    void cancel();

    bool elapsed() const { return state_->elapsed.load(); }

    CountdownTimer(const CountdownTimer&) = delete;
    CountdownTimer& operator=(const CountdownTimer&) = delete;

private:
    // Owned jointly with the running thread, so onElapsed may destroy the
    // timer.
    struct State {
        std::chrono::milliseconds delay;
        std::function<void()> onElapsed;
        std::mutex mutex;
        std::condition_variable_any cv;
        std::atomic<bool> elapsed{false};
    };

    static void wait(const std::shared_ptr<State>& state, std::stop_token stopToken);

    std::shared_ptr<State> state_;
    std::jthread thread_;
};

} // namespace solo

#endif // SOLO_TIMER_HPP

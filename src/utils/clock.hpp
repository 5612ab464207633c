#pragma once

#include <atomic>
#include <chrono>

namespace kestrel::utils {

class Clock {
public:
    virtual ~Clock() = default;
    virtual long long NowMs() const = 0;
};

class SystemClock : public Clock {
public:
    long long NowMs() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    static const SystemClock& Instance() {
        static const SystemClock clock;
        return clock;
    }
};

// Virtual time source; only moves when told to.
class ManualClock : public Clock {
public:
    explicit ManualClock(long long start_ms = 0) : now_ms_(start_ms) {}

    long long NowMs() const override { return now_ms_.load(); }
    void SetMs(long long now_ms) { now_ms_.store(now_ms); }
    void AdvanceMs(long long delta_ms) { now_ms_.fetch_add(delta_ms); }

private:
    std::atomic<long long> now_ms_;
};

}  // namespace kestrel::utils

#pragma once

// Sets a re-entrancy flag for the lifetime of the guard and restores the previous value.
class SuspendGuard {
public:
    explicit SuspendGuard(bool& flag) : flag_(flag), previous_(flag) { flag_ = true; }
    ~SuspendGuard() { flag_ = previous_; }

    SuspendGuard(const SuspendGuard&) = delete;
    SuspendGuard& operator=(const SuspendGuard&) = delete;

private:
    bool& flag_;
    bool previous_;
};

#pragma once

#include <functional>
#include <utility>
#include <vector>

// Cleanup closures collected during setup, released once in reverse order.
class DisposerList {
public:
    using Disposer = std::function<void()>;

    DisposerList() = default;
    ~DisposerList() { dispose(); }

    DisposerList(const DisposerList&) = delete;
    DisposerList& operator=(const DisposerList&) = delete;

    void push(Disposer disposer) {
        if (disposer) disposers_.push_back(std::move(disposer));
    }

    void dispose() {
        std::vector<Disposer> pending;
        pending.swap(disposers_);
        for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
            (*it)();
        }
    }

    bool empty() const { return disposers_.empty(); }
    std::size_t size() const { return disposers_.size(); }

private:
    std::vector<Disposer> disposers_;
};

#pragma once

#include <mutex>
#include <vector>

// Mailbox from worker threads to the thread that owns session state.
// Workers post; the owner drains in posting order.
template <typename T>
class CompletionQueue {
public:
    void post(T item) {
        std::lock_guard lock(mutex_);
        items_.push_back(std::move(item));
    }

    std::vector<T> drain() {
        std::vector<T> out;
        std::lock_guard lock(mutex_);
        out.swap(items_);
        return out;
    }

private:
    std::mutex mutex_;
    std::vector<T> items_;
};

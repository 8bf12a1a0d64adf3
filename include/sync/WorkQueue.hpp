#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <optional>

namespace bk::sync {

// Shared claim-next-index cursor over [0, size). Each index is handed out exactly once.
class WorkQueue {
public:
    explicit WorkQueue(const size_t size) : size_(size) {}

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // nullopt once exhausted
    std::optional<size_t> claim() noexcept {
        const auto i = next_.fetch_add(1, std::memory_order_relaxed);
        if (i >= size_) return std::nullopt;
        return i;
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }

    [[nodiscard]] size_t claimed() const noexcept {
        return std::min(next_.load(std::memory_order_relaxed), size_);
    }

    [[nodiscard]] bool exhausted() const noexcept { return claimed() == size_; }

private:
    const size_t size_;
    std::atomic<size_t> next_{0};
};

}

#pragma once

#include <atomic>
#include <memory>

namespace labsync {

/**
 * @brief Cooperative cancellation flag passed into every suspension point
 *
 * A token observes its own flag and, if it was created with child(), the
 * flag of its parent. Cancelling a parent cancels every child; cancelling a
 * child leaves the parent and siblings untouched. Copies share state.
 *
 * Cancellation never interrupts a call in progress. Loops check
 * is_canceled() before starting the next remote round-trip or chunk.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true); }

    [[nodiscard]] bool is_canceled() const noexcept {
        if (flag_->load()) {
            return true;
        }
        return parent_ && parent_->is_canceled();
    }

    [[nodiscard]] CancellationToken child() const {
        CancellationToken token;
        token.parent_ = std::make_shared<CancellationToken>(*this);
        return token;
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::shared_ptr<CancellationToken> parent_;
};

} // namespace labsync

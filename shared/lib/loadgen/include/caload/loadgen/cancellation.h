/**
 * @file cancellation.h
 * @brief Run-scoped cancellation signal
 *
 * A CancellationSource owns the flag; stages observe it through
 * CancellationTokens. Cancelling stops dispatch of new items only;
 * calls already in flight run to completion.
 */

#pragma once

#include <atomic>
#include <memory>

namespace caload::loadgen {

class CancellationSource;

class CancellationToken {
public:
    /// Token that is never cancelled
    CancellationToken() = default;

    bool isCancelled() const noexcept {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<const std::atomic<bool>> flag_;
};

class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(flag_); }

    /// Async-signal-safe (lock-free atomic store)
    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    bool isCancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

    /// Raw flag for installation into a signal handler; owned by this source
    std::atomic<bool>* rawFlag() noexcept { return flag_.get(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace caload::loadgen

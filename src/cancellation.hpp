#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace yourapi {

/// Lets one thread abandon a blocking call running on another.
/// A token is one-shot: once cancelled it stays cancelled.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    /// Runs a callback when the token is cancelled, for as long as the
    /// subscription lives. If the token is already cancelled the callback
    /// runs immediately. Callbacks run under the token's lock and must not
    /// call back into the token. A null token makes this a no-op.
    class Subscription {
    public:
        Subscription(const CancellationToken* token, Callback callback);
        ~Subscription();

        Subscription(const Subscription&)            = delete;
        Subscription& operator=(const Subscription&) = delete;

    private:
        const CancellationToken* mToken;
        std::uint64_t            mId = 0;
    };

    void cancel();
    bool isCancelled() const;

    /// Block for @p delay or until cancel() is called. Delays too long for
    /// the clock are shortened to a century.
    /// @return false if the token was (or became) cancelled.
    bool waitFor(std::chrono::seconds delay) const;

private:
    mutable std::mutex                        mMutex;
    mutable std::condition_variable           mCondition;
    mutable std::map<std::uint64_t, Callback> mCallbacks;
    mutable std::uint64_t                     mNextId = 1;
    bool                                      mCancelled = false;

    std::uint64_t addCallback(Callback callback) const;
    void removeCallback(std::uint64_t id) const;
};

} // namespace yourapi

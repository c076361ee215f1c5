#include "cancellation.hpp"

#include <algorithm>
#include <utility>

namespace yourapi {

namespace {

// steady_clock counts nanoseconds in 64 bits; anything past ~292 years
// overflows when wait_for converts it.
constexpr std::chrono::seconds kMaxWait = std::chrono::hours(24 * 365 * 100);

} // namespace

CancellationToken::Subscription::Subscription(const CancellationToken* token,
                                              Callback callback)
    : mToken(token)
{
    if (mToken) {
        mId = mToken->addCallback(std::move(callback));
    }
}

CancellationToken::Subscription::~Subscription() {
    if (mToken && mId != 0) {
        mToken->removeCallback(mId);
    }
}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mCancelled) return;
        mCancelled = true;
        for (auto& entry : mCallbacks) {
            entry.second();
        }
        mCallbacks.clear();
    }
    mCondition.notify_all();
}

bool CancellationToken::isCancelled() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mCancelled;
}

bool CancellationToken::waitFor(std::chrono::seconds delay) const {
    const auto bounded = std::min(delay, kMaxWait);
    std::unique_lock<std::mutex> lock(mMutex);
    return !mCondition.wait_for(lock, bounded, [this] { return mCancelled; });
}

std::uint64_t CancellationToken::addCallback(Callback callback) const {
    std::lock_guard<std::mutex> lock(mMutex);
    if (mCancelled) {
        callback();
        return 0;
    }
    const auto id = mNextId++;
    mCallbacks.emplace(id, std::move(callback));
    return id;
}

void CancellationToken::removeCallback(std::uint64_t id) const {
    std::lock_guard<std::mutex> lock(mMutex);
    mCallbacks.erase(id);
}

} // namespace yourapi

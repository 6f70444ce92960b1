// Admission controller: per-endpoint state, counting semaphore and the
// degrade/restore rules.
#include "openxfer/AdmissionController.hpp"
#include "openxfer/Log.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>

namespace openxfer {

// Counting semaphore whose waiters can be cancelled or woken by close().
// release() may push the count above the initial capacity; callers only
// release what they acquired.
class AdmissionController::Semaphore {
public:
    explicit Semaphore(int permits) : permits_(permits) {}

    bool tryAcquire() {
        std::lock_guard<std::mutex> lk(m_);
        if (closed_ || permits_ <= 0) return false;
        --permits_;
        return true;
    }

    void acquire(const CancelCB& shouldCancel) {
        std::unique_lock<std::mutex> lk(m_);
        while (permits_ <= 0) {
            if (closed_) throw CancelledError("Endpoint was reset while waiting for a permit");
            if (shouldCancel && shouldCancel()) throw CancelledError("Cancelled while waiting for a permit");
            cv_.wait_for(lk, std::chrono::milliseconds(50));
        }
        if (closed_) throw CancelledError("Endpoint was reset while waiting for a permit");
        --permits_;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lk(m_);
            ++permits_;
        }
        cv_.notify_one();
    }

    int available() const {
        std::lock_guard<std::mutex> lk(m_);
        return permits_;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(m_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    int permits_ = 0;
    bool closed_ = false;
};

struct AdmissionController::EndpointState {
    EndpointState(Protocol p, ProtocolLimits limits)
        : protocol(p), minLimit(limits.minConcurrent), maxLimit(limits.maxConcurrent), currentLimit(limits.maxConcurrent) {}

    const Protocol protocol;
    const int minLimit;
    const int maxLimit;

    std::mutex lock; // serializes limit changes and semaphore rebuilds
    std::atomic<int> currentLimit;
    std::atomic<int> consecutiveTimeouts{0};
    std::atomic<int> consecutiveSuccesses{0};
    std::atomic<int> activeTasks{0};
    std::atomic<bool> degraded{false};
    std::shared_ptr<Semaphore> semaphore; // guarded by lock
};

ThrottleOutcome classifyException(const std::exception& ex) {
    if (dynamic_cast<const TimeoutError*>(&ex)) return ThrottleOutcome::Timeout;
    std::string msg = ex.what();
    std::transform(msg.begin(), msg.end(), msg.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (msg.find("timeout") != std::string::npos || msg.find("timed out") != std::string::npos)
        return ThrottleOutcome::Timeout;
    return ThrottleOutcome::Failure;
}

AdmissionController::AdmissionController() = default;
AdmissionController::~AdmissionController() = default;

AdmissionController::Permit::Permit(AdmissionController* owner,
                                    std::shared_ptr<EndpointState> state,
                                    std::shared_ptr<Semaphore> sem,
                                    bool acquired,
                                    std::string key)
    : owner_(owner), state_(std::move(state)), sem_(std::move(sem)), acquired_(acquired), key_(std::move(key)) {}

AdmissionController::Permit::Permit(Permit&& other) noexcept
    : owner_(other.owner_),
      state_(std::move(other.state_)),
      sem_(std::move(other.sem_)),
      acquired_(other.acquired_),
      key_(std::move(other.key_)) {
    other.owner_ = nullptr;
    other.acquired_ = false;
}

AdmissionController::Permit::~Permit() {
    if (state_) state_->activeTasks.fetch_sub(1);
    if (acquired_ && sem_) sem_->release();
}

void AdmissionController::Permit::record(ThrottleOutcome outcome) {
    if (owner_ && state_) owner_->recordOutcome(*state_, outcome, key_);
}

ProtocolLimits AdmissionController::limitsLocked(Protocol protocol, const std::string& key) const {
    ProtocolLimits base = protocolLimits(protocol);
    if (protocol == Protocol::Local) return base;
    int max = base.maxConcurrent;
    auto it = recommendedThreads_.find(key);
    if (it != recommendedThreads_.end() && it->second > 0) {
        max = it->second;
    } else if (userLimit_ > 0) {
        max = userLimit_;
    }
    return ProtocolLimits{max, std::max(1, max / 2)};
}

ProtocolLimits AdmissionController::limitsFor(Protocol protocol, const std::string& key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return limitsLocked(protocol, key);
}

std::shared_ptr<AdmissionController::EndpointState>
AdmissionController::stateFor(Protocol protocol, const std::string& key) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = states_.find(key);
    if (it != states_.end()) return it->second;
    auto st = std::make_shared<EndpointState>(protocol, limitsLocked(protocol, key));
    LOGD("throttle: new state for %s (limit %d, range %d..%d)",
         key.c_str(), st->currentLimit.load(), st->minLimit, st->maxLimit);
    states_.emplace(key, st);
    return st;
}

std::shared_ptr<AdmissionController::EndpointState>
AdmissionController::findState(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = states_.find(key);
    return it == states_.end() ? nullptr : it->second;
}

AdmissionController::Permit AdmissionController::admit(Protocol protocol,
                                                       const std::string& key,
                                                       bool highPriority,
                                                       const CancelCB& shouldCancel) {
    if (!highPriority && isExclusiveModeActive(key)) {
        LOGD("throttle: %s is exclusive, refusing background call", key.c_str());
        throw CancelledError("Endpoint " + key + " is reserved by a foreground session");
    }

    auto st = stateFor(protocol, key);
    std::shared_ptr<Semaphore> sem;
    {
        std::lock_guard<std::mutex> lk(st->lock);
        const int limit = st->currentLimit.load();
        const int active = st->activeTasks.load();
        if (!st->semaphore) {
            st->semaphore = std::make_shared<Semaphore>(limit);
        } else if (st->semaphore->available() + active != limit) {
            if (active == 0) {
                LOGD("throttle: rebuilding semaphore for %s with %d permits", key.c_str(), limit);
                st->semaphore = std::make_shared<Semaphore>(limit);
            } else {
                LOGD("throttle: capacity change for %s deferred, %d tasks in flight", key.c_str(), active);
            }
        }
        sem = st->semaphore;
    }

    bool acquired = false;
    if (highPriority) {
        acquired = sem->tryAcquire();
        if (!acquired) LOGD("throttle: high-priority bypass on %s", key.c_str());
    } else {
        sem->acquire(shouldCancel);
        acquired = true;
    }
    st->activeTasks.fetch_add(1);
    return Permit(this, std::move(st), std::move(sem), acquired, key);
}

void AdmissionController::recordOutcome(EndpointState& st, ThrottleOutcome outcome, const std::string& key) {
    switch (outcome) {
        case ThrottleOutcome::Success: {
            st.consecutiveTimeouts.store(0);
            if (st.consecutiveSuccesses.fetch_add(1) + 1 < kRestoreThreshold) break;
            std::lock_guard<std::mutex> lk(st.lock);
            if (st.consecutiveSuccesses.load() >= kRestoreThreshold && st.currentLimit.load() < st.maxLimit) {
                const int next = st.currentLimit.fetch_add(1) + 1;
                st.consecutiveSuccesses.store(0);
                st.consecutiveTimeouts.store(0);
                st.degraded.store(false);
                LOGI("throttle: %s restored to %d concurrent operations", key.c_str(), next);
            }
            break;
        }
        case ThrottleOutcome::Timeout: {
            st.consecutiveSuccesses.store(0);
            if (st.consecutiveTimeouts.fetch_add(1) + 1 < kDegradeThreshold) break;
            std::lock_guard<std::mutex> lk(st.lock);
            if (st.consecutiveTimeouts.load() >= kDegradeThreshold && st.currentLimit.load() > st.minLimit) {
                const int next = st.currentLimit.fetch_sub(1) - 1;
                st.consecutiveTimeouts.store(0);
                st.consecutiveSuccesses.store(0);
                st.degraded.store(true);
                LOGW("throttle: %s degraded to %d concurrent operations", key.c_str(), next);
            }
            break;
        }
        case ThrottleOutcome::Failure:
            break;
    }
}

void AdmissionController::setUserNetworkLimit(int n) {
    if (n < 0) n = 0;
    std::lock_guard<std::mutex> lk(mtx_);
    if (n == userLimit_) return;
    userLimit_ = n;
    // In-flight calls keep their old state object until they finish.
    states_.clear();
    LOGI("throttle: user network limit set to %d, endpoint state cleared", n);
}

int AdmissionController::userNetworkLimit() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return userLimit_;
}

void AdmissionController::setRecommendedThreads(const std::string& endpointKey, int n) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (n > 0) recommendedThreads_[endpointKey] = n;
    else recommendedThreads_.erase(endpointKey);
    states_.erase(endpointKey);
    LOGI("throttle: recommended threads for %s = %d", endpointKey.c_str(), n);
}

void AdmissionController::setRecommendedBufferSize(const std::string& endpointKey, std::size_t bytes) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (bytes > 0) bufferSizes_[endpointKey] = bytes;
    else bufferSizes_.erase(endpointKey);
}

std::size_t AdmissionController::recommendedBufferSize(const std::string& endpointKey) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = bufferSizes_.find(endpointKey);
    return it == bufferSizes_.end() ? kDefaultBufferSize : it->second;
}

void AdmissionController::activateExclusiveMode(const std::string& endpointKey) {
    std::lock_guard<std::mutex> lk(mtx_);
    exclusive_.insert(endpointKey);
    LOGI("throttle: exclusive mode on for %s", endpointKey.c_str());
}

void AdmissionController::deactivateExclusiveMode(const std::string& endpointKey) {
    std::lock_guard<std::mutex> lk(mtx_);
    exclusive_.erase(endpointKey);
    LOGI("throttle: exclusive mode off for %s", endpointKey.c_str());
}

bool AdmissionController::isExclusiveModeActive(const std::string& endpointKey) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return exclusive_.count(endpointKey) > 0;
}

int AdmissionController::forceReset(const std::string& endpointKey) {
    std::shared_ptr<EndpointState> st;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = states_.find(endpointKey);
        if (it == states_.end()) return 0;
        st = it->second;
        states_.erase(it);
    }
    int inFlight = 0;
    {
        std::lock_guard<std::mutex> slk(st->lock);
        inFlight = st->activeTasks.exchange(0);
        if (st->semaphore) st->semaphore->close();
    }
    LOGW("throttle: force reset of %s (%d tasks were in flight)", endpointKey.c_str(), inFlight);
    return inFlight;
}

IoTuning AdmissionController::ioTuning(const std::string& endpointKey) const {
    IoTuning t;
    t.timeout = isDegraded(endpointKey) ? kDegradedTimeout : kNormalTimeout;
    t.chunkSize = recommendedBufferSize(endpointKey);
    return t;
}

bool AdmissionController::isDegraded(const std::string& endpointKey) const {
    auto st = findState(endpointKey);
    return st && st->degraded.load();
}

int AdmissionController::currentLimit(const std::string& endpointKey) const {
    auto st = findState(endpointKey);
    return st ? st->currentLimit.load() : 0;
}

int AdmissionController::activeTaskCount(const std::string& endpointKey) const {
    auto st = findState(endpointKey);
    return st ? st->activeTasks.load() : 0;
}

std::optional<ThrottleSnapshot> AdmissionController::snapshot(const std::string& endpointKey) const {
    auto st = findState(endpointKey);
    if (!st) return std::nullopt;
    ThrottleSnapshot s;
    s.currentLimit = st->currentLimit.load();
    s.minLimit = st->minLimit;
    s.maxLimit = st->maxLimit;
    s.consecutiveTimeouts = st->consecutiveTimeouts.load();
    s.consecutiveSuccesses = st->consecutiveSuccesses.load();
    s.activeTasks = st->activeTasks.load();
    s.degraded = st->degraded.load();
    return s;
}

} // namespace openxfer

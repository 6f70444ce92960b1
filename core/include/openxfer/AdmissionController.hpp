// Per-endpoint adaptive concurrency limiter. Every network-bound operation runs
// through withThrottle(); the limit shrinks after repeated timeouts and grows
// back after a run of successes.
#pragma once
#include "TransferResult.hpp"
#include "TransferTypes.hpp"
#include <cctype>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>

namespace openxfer {

enum class ThrottleOutcome { Success, Timeout, Failure };

// Outcome classification of returned values. Values of other types count
// as success.
template <typename T>
ThrottleOutcome classifyOutcome(const T&) { return ThrottleOutcome::Success; }

inline ThrottleOutcome classifyOutcome(const ClientError& e) {
    if (e.empty()) return ThrottleOutcome::Success;
    return e.timedOut ? ThrottleOutcome::Timeout : ThrottleOutcome::Failure;
}

inline ThrottleOutcome classifyOutcome(const TransferResult& r) {
    if (r.ok()) return ThrottleOutcome::Success;
    return r.is(ErrorKind::NetworkError) && r.error().timedOut ? ThrottleOutcome::Timeout : ThrottleOutcome::Failure;
}

ThrottleOutcome classifyException(const std::exception& ex);

// Copy of one endpoint's state, for diagnostics and tests.
struct ThrottleSnapshot {
    int currentLimit = 0;
    int minLimit = 0;
    int maxLimit = 0;
    int consecutiveTimeouts = 0;
    int consecutiveSuccesses = 0;
    int activeTasks = 0;
    bool degraded = false;
};

class AdmissionController {
public:
    static constexpr int kDegradeThreshold = 3;
    static constexpr int kRestoreThreshold = 10;
    static constexpr std::size_t kDefaultBufferSize = 64 * 1024;
    static constexpr std::chrono::milliseconds kNormalTimeout{20000};
    static constexpr std::chrono::milliseconds kDegradedTimeout{60000};

    AdmissionController();
    ~AdmissionController();
    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    // Runs op() under the endpoint's limit. Local work runs inline. Throws
    // CancelledError when exclusive mode refuses a low-priority call or when
    // shouldCancel fires while waiting; exceptions from op() are rethrown.
    template <typename Fn>
    auto withThrottle(Protocol protocol,
                      const std::string& endpointKey,
                      bool highPriority,
                      Fn&& op,
                      const CancelCB& shouldCancel = {}) -> decltype(op());

    // Global ceiling for network protocols; 0 restores the protocol defaults.
    // Clears all endpoint state when the value changes.
    void setUserNetworkLimit(int n);
    int userNetworkLimit() const;

    // Per-endpoint override from a speed test; clears that endpoint's state.
    void setRecommendedThreads(const std::string& endpointKey, int n);
    void setRecommendedBufferSize(const std::string& endpointKey, std::size_t bytes);
    std::size_t recommendedBufferSize(const std::string& endpointKey) const;
    // Client timeout (longer while degraded) and chunk size for the endpoint.
    IoTuning ioTuning(const std::string& endpointKey) const;

    // While active, low-priority calls on the endpoint fail with CancelledError.
    void activateExclusiveMode(const std::string& endpointKey);
    void deactivateExclusiveMode(const std::string& endpointKey);
    bool isExclusiveModeActive(const std::string& endpointKey) const;

    // Drops the endpoint's state and wakes its waiters with CancelledError.
    // Returns the number of tasks that were in flight.
    int forceReset(const std::string& endpointKey);

    bool isDegraded(const std::string& endpointKey) const;
    // 0 when the endpoint has no state yet.
    int currentLimit(const std::string& endpointKey) const;
    int activeTaskCount(const std::string& endpointKey) const;
    std::optional<ThrottleSnapshot> snapshot(const std::string& endpointKey) const;

    // Effective bounds: max from recommended threads, then the user limit,
    // then the static table; min = max(1, max / 2).
    ProtocolLimits limitsFor(Protocol protocol, const std::string& endpointKey) const;

private:
    struct EndpointState;
    class Semaphore;

    // Held for the duration of one throttled call; releases on destruction.
    class Permit {
    public:
        Permit(AdmissionController* owner,
               std::shared_ptr<EndpointState> state,
               std::shared_ptr<Semaphore> sem,
               bool acquired,
               std::string key);
        Permit(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit& operator=(Permit&&) = delete;
        ~Permit();

        void record(ThrottleOutcome outcome);

    private:
        AdmissionController* owner_ = nullptr;
        std::shared_ptr<EndpointState> state_;
        std::shared_ptr<Semaphore> sem_;
        bool acquired_ = false;
        std::string key_;
    };

    Permit admit(Protocol protocol, const std::string& key, bool highPriority, const CancelCB& shouldCancel);
    std::shared_ptr<EndpointState> stateFor(Protocol protocol, const std::string& key);
    std::shared_ptr<EndpointState> findState(const std::string& key) const;
    ProtocolLimits limitsLocked(Protocol protocol, const std::string& key) const;
    void recordOutcome(EndpointState& st, ThrottleOutcome outcome, const std::string& key);

    mutable std::mutex mtx_; // protects the maps below
    std::unordered_map<std::string, std::shared_ptr<EndpointState>> states_;
    std::unordered_map<std::string, int> recommendedThreads_;
    std::unordered_map<std::string, std::size_t> bufferSizes_;
    std::unordered_set<std::string> exclusive_;
    int userLimit_ = 0;
};

template <typename Fn>
auto AdmissionController::withThrottle(Protocol protocol,
                                       const std::string& endpointKey,
                                       bool highPriority,
                                       Fn&& op,
                                       const CancelCB& shouldCancel) -> decltype(op()) {
    using R = decltype(op());
    if (protocol == Protocol::Local) return op();

    Permit permit = admit(protocol, endpointKey, highPriority, shouldCancel);
    try {
        if constexpr (std::is_void_v<R>) {
            op();
            permit.record(ThrottleOutcome::Success);
        } else {
            R result = op();
            permit.record(classifyOutcome(result));
            return result;
        }
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& ex) {
        permit.record(classifyException(ex));
        throw;
    }
}

} // namespace openxfer

// Progress helpers: throttled reporting and mapping of sub-phases into a
// larger [from, to] range.
#pragma once
#include "TransferTypes.hpp"
#include <chrono>
#include <cstdint>

namespace openxfer {

// Turns raw byte counts into TransferProgress and forwards at most one update
// per interval. The first update and the final one (done >= total) always pass.
class ProgressThrottle {
public:
    explicit ProgressThrottle(ProgressCB cb,
                              std::chrono::milliseconds interval = std::chrono::milliseconds(100));

    void report(std::uint64_t done, std::uint64_t total);
    // Emits the final 1.0 update unless report() already did.
    void finish(std::uint64_t total);
    // Adapter for client callbacks.
    ByteProgressCB byteCallback();
    std::chrono::milliseconds elapsed() const;

private:
    using clock = std::chrono::steady_clock;
    ProgressCB cb_;
    std::chrono::milliseconds interval_;
    clock::time_point start_;
    clock::time_point last_;
    bool first_ = true;
    bool finished_ = false;
};

// Maps fraction f of a sub-phase to from + f * (to - from).
ProgressCB sliceProgress(const ProgressCB& cb, double from, double to);

} // namespace openxfer

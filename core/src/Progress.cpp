#include "openxfer/Progress.hpp"

namespace openxfer {

ProgressThrottle::ProgressThrottle(ProgressCB cb, std::chrono::milliseconds interval)
    : cb_(std::move(cb)), interval_(interval), start_(clock::now()), last_(start_) {}

void ProgressThrottle::report(std::uint64_t done, std::uint64_t total) {
    if (!cb_ || finished_) return;
    const auto now = clock::now();
    const bool last = total > 0 && done >= total;
    if (!first_ && !last && now - last_ < interval_) return;
    first_ = false;
    finished_ = last;
    last_ = now;

    TransferProgress p;
    p.bytesTransferred = done;
    p.totalBytes = total;
    p.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_);
    p.fraction = total > 0 ? static_cast<double>(done) / static_cast<double>(total) : 0.0;
    if (p.fraction > 1.0) p.fraction = 1.0;
    cb_(p);
}

void ProgressThrottle::finish(std::uint64_t total) {
    if (!cb_ || finished_) return;
    finished_ = true;
    TransferProgress p;
    p.bytesTransferred = total;
    p.totalBytes = total;
    p.elapsed = elapsed();
    p.fraction = 1.0;
    cb_(p);
}

ByteProgressCB ProgressThrottle::byteCallback() {
    if (!cb_) return {};
    return [this](std::size_t done, std::size_t total) { report(done, total); };
}

std::chrono::milliseconds ProgressThrottle::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start_);
}

ProgressCB sliceProgress(const ProgressCB& cb, double from, double to) {
    if (!cb) return {};
    return [cb, from, to](const TransferProgress& p) {
        TransferProgress scaled = p;
        scaled.fraction = from + p.fraction * (to - from);
        cb(scaled);
    };
}

} // namespace openxfer

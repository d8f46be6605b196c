#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

#include <dscv/Version.hpp>

namespace dscv {

/// Estimates link strength from acknowledgement samples.
///
/// Every ack cycle contributes one sample: 0 when the ack-wait timer
/// expired, otherwise the instantaneous success rate 100 * received / sent.
/// Strength is the unweighted mean of the most recent `window` samples.
/// Samples are only recorded while the session is connected; otherwise
/// recordAck() leaves the window untouched and reports 0.
class LinkQualityMonitor {
public:
    explicit LinkQualityMonitor(size_t window = STRENGTH_WINDOW,
                                float deadThreshold = DEAD_LINK_THRESHOLD);

    /// Clears samples and both counters (start of a new connection).
    void reset();

    void recordSent() { ++sent_; }
    void recordReceived() { ++received_; }

    uint64_t sent() const { return sent_; }
    uint64_t received() const { return received_; }

    /// 100 * received / sent, clamped to [0, 100]. 100 before any send.
    float successRate() const;

    float recordAck(bool success, bool connected);

    /// Mean of the current window, 0 when empty.
    float strength() const;

    bool isLinkDead(float strength) const { return strength < deadThreshold_; }

    const std::deque<float>& samples() const { return samples_; }
    size_t window() const { return window_; }

private:
    size_t window_;
    float deadThreshold_;
    uint64_t sent_ = 0;
    uint64_t received_ = 0;
    std::deque<float> samples_;
};

} // namespace dscv

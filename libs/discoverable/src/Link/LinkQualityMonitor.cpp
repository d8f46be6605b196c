#include <dscv/Link/LinkQualityMonitor.hpp>
#include <algorithm>
#include <numeric>

namespace dscv {

LinkQualityMonitor::LinkQualityMonitor(size_t window, float deadThreshold)
    : window_(std::max<size_t>(window, 1))
    , deadThreshold_(deadThreshold)
{
}

void LinkQualityMonitor::reset()
{
    samples_.clear();
    sent_ = 0;
    received_ = 0;
}

float LinkQualityMonitor::successRate() const
{
    if (sent_ == 0)
        return 100.0f;

    float rate = 100.0f * static_cast<float>(received_) / static_cast<float>(sent_);
    return std::clamp(rate, 0.0f, 100.0f);
}

float LinkQualityMonitor::recordAck(bool success, bool connected)
{
    if (!connected)
        return 0.0f;

    samples_.push_back(success ? successRate() : 0.0f);
    while (samples_.size() > window_)
        samples_.pop_front();

    return strength();
}

float LinkQualityMonitor::strength() const
{
    if (samples_.empty())
        return 0.0f;

    float sum = std::accumulate(samples_.begin(), samples_.end(), 0.0f);
    return sum / static_cast<float>(samples_.size());
}

} // namespace dscv

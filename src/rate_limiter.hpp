#pragma once
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>

namespace webscout {

// Sliding one-minute window per client key (the remote address for HTTP).
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(int requests_per_minute)
        : rpm_(requests_per_minute) {}

    bool allow(const std::string& key) {
        return allow(key, Clock::now());
    }

    bool allow(const std::string& key, Clock::time_point now) {
        if (rpm_ <= 0) return true;  // 0 = unlimited

        std::lock_guard<std::mutex> lock(mutex_);
        auto cutoff = now - std::chrono::seconds(60);

        auto& stamps = windows_[key];
        while (!stamps.empty() && stamps.front() <= cutoff) {
            stamps.pop_front();
        }
        if (static_cast<int>(stamps.size()) >= rpm_) {
            return false;
        }
        stamps.push_back(now);

        // Forget idle clients so the map does not grow without bound.
        if (windows_.size() > 1024) {
            for (auto it = windows_.begin(); it != windows_.end();) {
                if (it->second.empty() || it->second.back() <= cutoff) it = windows_.erase(it);
                else ++it;
            }
        }
        return true;
    }

private:
    int rpm_;
    std::mutex mutex_;
    std::map<std::string, std::deque<Clock::time_point>> windows_;
};

} // namespace webscout

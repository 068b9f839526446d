#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
namespace rdlink::interfaces {
using TimerId = uint64_t;
inline constexpr TimerId kInvalidTimerId = 0;
class ITimerScheduler {
public:
    virtual ~ITimerScheduler() = default;
    virtual TimerId ScheduleOnce(std::chrono::milliseconds delay, std::function<void()> callback) = 0;
    virtual TimerId ScheduleRepeating(std::chrono::milliseconds interval, std::function<void()> callback) = 0;
    // Unknown or already-fired ids are ignored.
    virtual void Cancel(TimerId id) = 0;
    [[nodiscard]] virtual std::chrono::milliseconds Now() const = 0;
};
}

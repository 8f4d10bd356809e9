/**
 * @file Timer.cpp
 * @brief Timer implementation
 */

#include <QiLandscape/Platform/Timer.h>

#include <cstdio>
#include <utility>

namespace Qi::Landscape::Platform {

Timer::Timer(bool autoStart) {
    if (autoStart) {
        Start();
    }
}

void Timer::Start() {
    startTime_ = Clock::now();
    running_ = true;
}

double Timer::ElapsedMs() const {
    if (!running_) {
        return 0.0;
    }
    return std::chrono::duration<double, std::milli>(Clock::now() - startTime_).count();
}

ScopedTimer::ScopedTimer(std::string name)
    : name_(std::move(name))
    , timer_(true) {
}

ScopedTimer::~ScopedTimer() {
    std::printf("%s: %.3f ms\n", name_.c_str(), timer_.ElapsedMs());
}

} // namespace Qi::Landscape::Platform

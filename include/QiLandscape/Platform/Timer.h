#pragma once

/**
 * @file Timer.h
 * @brief Millisecond timing for profile output
 *
 * Usage:
 * @code
 * Timer timer(true);
 * // ... work ...
 * double elapsed = timer.ElapsedMs();
 *
 * {
 *     ScopedTimer scoped("ComposeOpinionMap");
 *     // ... work ...
 * }  // Prints: "ComposeOpinionMap: 1.234 ms"
 * @endcode
 */

#include <QiLandscape/Core/Export.h>

#include <chrono>
#include <string>

namespace Qi::Landscape::Platform {

/**
 * @brief Stopwatch on std::chrono::steady_clock
 */
class QILANDSCAPE_API Timer {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Construct and optionally start timer
     * @param autoStart If true, timer starts immediately
     */
    explicit Timer(bool autoStart = false);

    /// (Re)start from now
    void Start();

    bool IsRunning() const { return running_; }

    /// Milliseconds since Start(), 0 if never started
    double ElapsedMs() const;

private:
    Clock::time_point startTime_;
    bool running_ = false;
};

/**
 * @brief RAII timer that prints "<name>: X.XXX ms" on destruction
 */
class QILANDSCAPE_API ScopedTimer {
public:
    explicit ScopedTimer(std::string name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    Timer timer_;
};

} // namespace Qi::Landscape::Platform

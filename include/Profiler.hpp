#ifndef PROFILER_HPP
#define PROFILER_HPP

// ============================================================================
// Profiling Configuration
// ============================================================================
// Disabled by default. Enable with cmake -DENABLE_PROFILING=ON, which defines
// ENABLE_PROFILING for every target.

#ifdef ENABLE_PROFILING

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// ============================================================================
// Profiler - named sections with call counts and accumulated wall time
// ============================================================================

class Profiler {
public:
    struct SectionStats {
        uint64_t callCount = 0;
        double totalTimeNs = 0.0;
    };

    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }

    // Searches are single-threaded, but independent searches may run side by
    // side, so recording takes the lock.
    void record(const char* section, double durationNs) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& stats = sections_[section];
        stats.callCount++;
        stats.totalTimeNs += durationNs;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_.clear();
    }

    void printReport() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::cout << "\n=== Profiler Report ===\n";
        if (sections_.empty()) {
            std::cout << "No profiling data collected.\n";
            return;
        }

        std::vector<std::pair<std::string, SectionStats>> sorted(sections_.begin(), sections_.end());
        std::sort(sorted.begin(), sorted.end(),
            [](const auto& a, const auto& b) {
                return a.second.totalTimeNs > b.second.totalTimeNs;
            });

        std::cout << std::left << std::setw(36) << "Section"
                  << std::right << std::setw(14) << "Total Time"
                  << std::setw(14) << "Calls"
                  << std::setw(14) << "Avg/Call"
                  << "\n";
        std::cout << std::string(78, '-') << "\n";

        for (const auto& [name, stats] : sorted) {
            double totalMs = stats.totalTimeNs / 1e6;
            double avgNs = stats.callCount > 0 ? stats.totalTimeNs / stats.callCount : 0.0;

            std::cout << std::left << std::setw(36) << name
                      << std::right << std::setw(11) << std::fixed << std::setprecision(2) << totalMs << " ms"
                      << std::setw(14) << stats.callCount
                      << std::setw(11) << std::fixed << std::setprecision(1) << avgNs << " ns"
                      << "\n";
        }
        std::cout << std::string(78, '-') << "\n\n";
    }

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SectionStats> sections_;
};

// ============================================================================
// ScopedTimer - records the enclosing scope on destruction
// ============================================================================

class ScopedTimer {
public:
    explicit ScopedTimer(const char* section)
        : section_(section)
        , start_(std::chrono::steady_clock::now()) {
    }

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        Profiler::instance().record(section_, std::chrono::duration<double, std::nano>(end - start_).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const char* section_;
    std::chrono::steady_clock::time_point start_;
};

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)
#define PROFILE_SCOPE(name) ScopedTimer PROFILE_CONCAT(_profiler_timer_, __LINE__)(name)

#else // ENABLE_PROFILING not defined

class Profiler {
public:
    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }
    void printReport() const {}
    void reset() {}
};

#define PROFILE_SCOPE(name) ((void)0)

#endif // ENABLE_PROFILING

#endif // PROFILER_HPP

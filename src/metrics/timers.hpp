#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace bprof {

struct WallTimer {
    using clock = std::chrono::steady_clock;
    clock::time_point t0, t1;
    void start() { t0 = clock::now(); }
    void stop()  { t1 = clock::now(); }
    double ms() const { return std::chrono::duration<double,std::milli>(t1 - t0).count(); }
};

struct RunStage {
    std::string name;
    double      ms = 0.0;
};

// ---------- StageTimer (one named pipeline stage) ----------
struct StageTimer {
    std::string name;
    WallTimer   wt{};

    explicit StageTimer(const char* n) : name(n ? n : "(stage)") {}
    void start() { wt.start(); }
    RunStage stop() { wt.stop(); return RunStage{name, wt.ms()}; }
};

inline double total_ms(const std::vector<RunStage>& stages) {
    double t = 0.0;
    for (const auto& s : stages) t += s.ms;
    return t;
}

}

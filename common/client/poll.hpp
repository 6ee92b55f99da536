#pragma once

#include "connection.hpp"
#include "../types/config.hpp"
#include "../types/mug.hpp"
#include <functional>
#include <vector>

namespace ember {

// One refresh pass over the mug's characteristics.
//
// Reads run sequentially: LED color, current temperature, target
// temperature, battery. The first failed read or decode ends the pass with
// success=false. Fields updated before the failure keep their new values;
// the pass is not atomic.
//
// After a complete pass the diagnostic sweep reads the unknown
// characteristics. Failures there are logged and skipped.
class PollCycle {
public:
    using DoneHandler = std::function<void(bool success)>;
    // False once the run that started a pass has been abandoned
    using Alive = std::function<bool()>;

    PollCycle(ConnectionManager& connection, const Config& config, MugState& state);

    PollCycle(const PollCycle&) = delete;
    PollCycle& operator=(const PollCycle&) = delete;

    // Connects first if the link is down. Once alive returns false the pass
    // stops before its next read and done is never called.
    void run(DoneHandler done, Alive alive = {});

    // Sweep only, independent of the main reads
    void run_diagnostics(std::function<void()> done, Alive alive = {});

    int cycles() const { return cycles_; }

private:
    struct Step {
        const char* name;
        const char* uuid;
        std::function<Status(const Bytes&)> apply;
    };

    void read_step(size_t index, DoneHandler done, Alive alive);
    void sweep_step(size_t index, std::function<void()> done, Alive alive);
    bool diagnostics_due() const;
    void log_summary() const;

    ConnectionManager& connection_;
    const Config& config_;
    MugState& state_;
    std::vector<Step> steps_;
    int cycles_ = 0;
};

} // namespace ember

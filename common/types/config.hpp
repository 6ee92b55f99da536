#pragma once

#include <chrono>
#include <string>

namespace ember {

struct Config {
    // Peripheral
    std::string address;
    bool use_metric = true;

    // Connect burst: attempts with a wait between failures, then a long backoff
    int connect_attempts = 10;
    std::chrono::milliseconds connect_retry_delay = std::chrono::seconds(30);
    std::chrono::milliseconds connect_backoff = std::chrono::minutes(5);

    // Dwell between poll cycles, split into short liveness checks
    int dwell_checks = 15;
    std::chrono::milliseconds dwell_check_interval = std::chrono::seconds(2);

    // Run the diagnostic sweep every N cycles (0 disables it)
    int diagnostic_every = 1;

    // Ceiling for the exponential restart backoff
    std::chrono::milliseconds restart_backoff_max = std::chrono::seconds(60);

    // BlueZ call timeouts
    std::chrono::milliseconds transport_timeout = std::chrono::seconds(20);
    std::chrono::milliseconds services_resolved_timeout = std::chrono::seconds(15);
};

} // namespace ember

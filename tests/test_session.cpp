#include <algorithm>
#include <cassert>
#include <cmath>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "fakes.hpp"

#include <client/connection.hpp>
#include <client/poll.hpp>
#include <client/session.hpp>
#include <protocol/uuids.hpp>

using namespace ember;

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

static Config make_config(const std::string& address) {
    Config config;
    config.address = address;
    return config;
}

// Poll cycle over a connection manager, no session
struct PollRig {
    ManualScheduler scheduler;
    FakeTransport transport{scheduler};
    Config config = make_config(transport.address());
    MugState state;
    ConnectionManager connection{transport, scheduler, config, state, {}};
    PollCycle poll{connection, config, state};

    PollRig() {
        state.address = transport.address();
        transport.load_mug_values();
    }

    bool run() {
        int result = -1;
        poll.run([&result](bool success) { result = success ? 1 : 0; });
        scheduler.run_ready();
        assert(result != -1);
        return result == 1;
    }
};

// Full session
struct SessionRig {
    ManualScheduler scheduler;
    FakeTransport transport{scheduler};
    int changed = 0;
    std::function<void()> hook;
    Session session;

    explicit SessionRig(Config config = Config{})
        : session(transport, scheduler, with_address(std::move(config)), [this]() {
              ++changed;
              if (hook) hook();
          }) {
        transport.load_mug_values();
    }

    Config with_address(Config config) {
        config.address = transport.address();
        return config;
    }
};

void test_poll_cycle() {
    std::cout << "Testing poll cycle...\n";

    {
        PollRig rig;
        assert(rig.run());
        assert(rig.transport.connect_calls == 1);
        assert((rig.state.led_color == LedColor{255, 0, 128}));
        assert(near(*rig.state.current_temperature, 49.64));
        assert(near(*rig.state.target_temperature, 55.00));
        assert(near(*rig.state.battery_percent, 87.0));
        assert(rig.state.diagnostic_readings.size() == uuids::UNKNOWN_READ.size());
        assert(rig.state.diagnostic_readings[uuids::UNKNOWN_READ[0]] == "0102");
        std::cout << "  ✓ Connects first, then reads everything\n";
    }
    {
        PollRig rig;
        rig.run();
        rig.transport.log.clear();
        assert(rig.run());

        std::vector<std::string> expected = {
            std::string("read ") + uuids::LED_COLOR,
            std::string("read ") + uuids::CURRENT_TEMP,
            std::string("read ") + uuids::TARGET_TEMP,
            std::string("read ") + uuids::BATTERY,
        };
        assert(rig.transport.log.size() == expected.size() + uuids::UNKNOWN_READ.size());
        assert(std::equal(expected.begin(), expected.end(), rig.transport.log.begin()));
        std::cout << "  ✓ Fixed read order\n";
    }
    {
        PollRig rig;
        rig.config.use_metric = false;
        assert(rig.run());
        assert(near(*rig.state.current_temperature, 121.35));
        assert(near(*rig.state.target_temperature, 131.00));
        std::cout << "  ✓ Imperial temperatures\n";
    }
}

void test_poll_partial_failure() {
    std::cout << "Testing poll partial failure...\n";

    {
        PollRig rig;
        rig.transport.read_failures.insert(uuids::TARGET_TEMP);
        assert(!rig.run());

        // Reads before the failure stay applied
        assert((rig.state.led_color == LedColor{255, 0, 128}));
        assert(near(*rig.state.current_temperature, 49.64));
        assert(!rig.state.target_temperature);
        assert(!rig.state.battery_percent);
        assert(rig.transport.reads_of(uuids::BATTERY) == 0);
        assert(rig.state.diagnostic_readings.empty());
        std::cout << "  ✓ Third read fails, first two updates kept\n";
    }
    {
        PollRig rig;
        rig.transport.values[uuids::CURRENT_TEMP] = {0x01, 0x02, 0x03};
        assert(!rig.run());
        assert((rig.state.led_color == LedColor{255, 0, 128}));
        assert(!rig.state.current_temperature);
        assert(rig.transport.reads_of(uuids::TARGET_TEMP) == 0);
        std::cout << "  ✓ Decode error aborts the cycle\n";
    }
}

void test_diagnostic_sweep() {
    std::cout << "Testing diagnostic sweep...\n";

    {
        PollRig rig;
        rig.transport.read_failures.insert(uuids::UNKNOWN_READ[2]);
        assert(rig.run());
        assert(rig.state.diagnostic_readings.size() == uuids::UNKNOWN_READ.size() - 1);
        assert(!rig.state.diagnostic_readings.count(uuids::UNKNOWN_READ[2]));
        assert(rig.state.diagnostic_readings.count(uuids::UNKNOWN_READ[3]));
        std::cout << "  ✓ Failed diagnostic read is skipped\n";
    }
    {
        PollRig rig;
        rig.config.diagnostic_every = 3;
        rig.run();
        rig.run();
        assert(rig.state.diagnostic_readings.empty());
        rig.run();
        assert(rig.state.diagnostic_readings.size() == uuids::UNKNOWN_READ.size());
        std::cout << "  ✓ Sweep cadence is configurable\n";
    }
    {
        PollRig rig;
        rig.config.diagnostic_every = 0;
        rig.run();
        assert(rig.transport.reads_of(uuids::UNKNOWN_READ[0]) == 0);
        std::cout << "  ✓ Sweep can be disabled\n";
    }
}

void test_poll_abandoned() {
    std::cout << "Testing abandoned poll...\n";

    PollRig rig;
    assert(rig.run());
    rig.transport.values[uuids::LED_COLOR] = {0x00, 0xFF, 0x00, 0x00};
    rig.transport.latency = 100ms;
    rig.transport.log.clear();

    bool alive = true;
    bool finished = false;
    rig.poll.run([&finished](bool) { finished = true; }, [&alive]() { return alive; });
    assert(rig.transport.log.size() == 1);

    alive = false;
    rig.scheduler.advance(10s);
    assert(rig.transport.log.size() == 1);
    assert(!finished);
    assert((rig.state.led_color == LedColor{255, 0, 128}));
    std::cout << "  ✓ Stops reading and leaves state alone once abandoned\n";
}

void test_session_loop() {
    std::cout << "Testing session loop...\n";

    {
        SessionRig rig;
        rig.session.start();
        rig.scheduler.run_ready();

        auto state = rig.session.snapshot();
        assert(state.available);
        assert(state.connection_status == ConnectionStatus::Subscribed);
        assert(state.address == rig.transport.address());
        assert(near(*state.current_temperature, 49.64));
        assert(rig.changed == 1);
        assert(rig.session.iterations() == 1);
        assert(rig.session.session_state() == SessionState::Running);
        std::cout << "  ✓ First iteration connects, polls and notifies\n";

        rig.scheduler.advance(28s);
        assert(rig.session.iterations() == 1);
        rig.scheduler.advance(2s);
        assert(rig.session.iterations() == 2);
        assert(rig.changed == 2);
        assert(rig.transport.connect_calls == 1);
        std::cout << "  ✓ Next iteration after a 30s dwell\n";
    }
    {
        SessionRig rig;
        rig.session.start();
        rig.scheduler.run_ready();

        rig.transport.push({7});
        assert(rig.session.snapshot().mug_status == 7);
        assert(rig.changed == 2);
        rig.transport.push({1});
        assert(rig.session.snapshot().mug_status == 7);
        assert(rig.changed == 2);
        std::cout << "  ✓ Status pushes notify between polls\n";
    }
    {
        SessionRig rig;
        rig.transport.read_failures.insert(uuids::BATTERY);
        rig.session.start();
        rig.scheduler.run_ready();

        assert(!rig.session.snapshot().available);
        assert(rig.changed == 1);
        assert(rig.session.restarts() == 0);
        rig.scheduler.advance(30s);
        assert(rig.session.iterations() == 2);
        std::cout << "  ✓ Failed poll keeps the loop going\n";
    }
}

void test_session_restart() {
    std::cout << "Testing session restart...\n";

    {
        SessionRig rig;
        int throws = 1;
        rig.hook = [&throws]() {
            if (throws-- > 0) throw std::runtime_error("sink failed");
        };
        rig.session.start();
        rig.scheduler.run_ready();

        assert(rig.session.restarts() == 1);
        assert(rig.session.iterations() == 2);
        assert(rig.session.session_state() == SessionState::Running);
        assert(rig.session.snapshot().available);

        rig.scheduler.advance(30s);
        assert(rig.session.iterations() == 3);
        std::cout << "  ✓ Exception restarts the loop instead of ending it\n";
    }
    {
        SessionRig rig;
        rig.hook = []() { throw std::runtime_error("always"); };
        rig.session.start();
        rig.scheduler.run_ready();

        // Immediate first restart, then 1s, 2s, ...
        assert(rig.session.restarts() == 2);
        rig.scheduler.advance(999ms);
        assert(rig.session.restarts() == 2);
        rig.scheduler.advance(1ms);
        assert(rig.session.restarts() == 3);
        rig.scheduler.advance(2s);
        assert(rig.session.restarts() == 4);
        rig.scheduler.advance(3999ms);
        assert(rig.session.restarts() == 4);
        rig.scheduler.advance(1ms);
        assert(rig.session.restarts() == 5);
        std::cout << "  ✓ Consecutive restarts back off\n";
    }
    {
        Config config;
        config.restart_backoff_max = 3s;
        SessionRig rig(config);
        rig.hook = []() { throw std::runtime_error("always"); };
        rig.session.start();
        rig.scheduler.run_ready();
        rig.scheduler.advance(1s + 2s);
        assert(rig.session.restarts() == 4);
        rig.scheduler.advance(3s);
        assert(rig.session.restarts() == 5);
        std::cout << "  ✓ Backoff is capped\n";
    }
}

void test_session_restart_mid_poll() {
    std::cout << "Testing restart during a poll...\n";

    SessionRig rig;
    rig.transport.latency = 100ms;
    rig.session.start();
    rig.scheduler.run_ready();
    rig.scheduler.advance(5s);
    assert(rig.session.iterations() == 1);
    rig.transport.log.clear();

    // Run until the second iteration has its first read on the wire
    for (int i = 0; i < 10000 && rig.transport.reads_of(uuids::LED_COLOR) == 0; ++i) {
        rig.scheduler.advance(10ms);
    }
    assert(rig.session.iterations() == 2);
    assert(rig.transport.log.size() == 1);

    bool armed = true;
    rig.hook = [&armed]() {
        if (armed) {
            armed = false;
            throw std::runtime_error("sink failed");
        }
    };
    rig.transport.push({5});
    assert(rig.session.restarts() == 1);

    rig.scheduler.advance(5s);
    assert(rig.session.restarts() == 1);
    assert(rig.session.iterations() == 3);
    assert(rig.session.snapshot().mug_status == 5);

    // The read already on the wire finishes, nothing after it from the old pass
    assert(rig.transport.reads_of(uuids::LED_COLOR) == 2);
    assert(rig.transport.reads_of(uuids::CURRENT_TEMP) == 1);
    assert(rig.transport.reads_of(uuids::TARGET_TEMP) == 1);
    assert(rig.transport.reads_of(uuids::BATTERY) == 1);
    assert(rig.transport.max_in_flight == 1);
    std::cout << "  ✓ Abandoned poll stops, only the new run reads\n";
}

void test_session_connect_waiters() {
    std::cout << "Testing restarts during a connect burst...\n";

    SessionRig rig;
    rig.transport.connect_failures = 1000;
    rig.hook = []() { throw std::runtime_error("always"); };
    rig.session.start();
    rig.scheduler.run_ready();

    rig.scheduler.advance(30min);
    assert(rig.session.restarts() >= 3);
    assert(rig.session.connection().connect_waiters() <= 1);
    std::cout << "  ✓ Restarts do not pile up connect waiters\n";

    rig.hook = {};
    rig.transport.connect_failures = 0;
    rig.scheduler.advance(10min);
    assert(rig.session.snapshot().available);
    assert(rig.session.connection().connect_waiters() == 0);
    assert(rig.transport.reads_of(uuids::CURRENT_TEMP) >= 1);
    std::cout << "  ✓ Loop resumes once the mug is reachable\n";
}

void test_session_liveness() {
    std::cout << "Testing session liveness...\n";

    SessionRig rig;
    std::vector<bool> availability;
    rig.hook = [&rig, &availability]() { availability.push_back(rig.session.snapshot().available); };

    rig.session.start();
    rig.scheduler.run_ready();
    rig.transport.drop_link();
    rig.scheduler.advance(2s);

    assert(rig.session.iterations() == 2);
    assert(rig.transport.connect_calls == 2);
    assert((availability == std::vector<bool>{true, false, true}));
    assert(rig.session.snapshot().connection_status == ConnectionStatus::Subscribed);
    std::cout << "  ✓ Lost link ends the dwell and reconnects\n";
}

void test_session_connect_failure() {
    std::cout << "Testing session connect failure...\n";

    SessionRig rig;
    rig.transport.connect_failures = 1000;
    rig.session.start();
    rig.scheduler.run_ready();
    rig.scheduler.advance(270s);

    assert(rig.changed == 1);
    assert(!rig.session.snapshot().available);
    assert(rig.session.snapshot().connection_status == ConnectionStatus::Disconnected);
    assert(rig.session.iterations() == 1);
    assert(rig.session.restarts() == 0);

    rig.transport.connect_failures = 0;
    rig.scheduler.advance(300s);
    assert(rig.session.snapshot().available);
    assert(rig.changed == 2);
    std::cout << "  ✓ Exhausted burst notifies, loop resumes after backoff\n";
}

void test_session_shutdown() {
    std::cout << "Testing session shutdown...\n";

    {
        SessionRig rig;
        rig.session.start();
        rig.scheduler.run_ready();

        bool done = false;
        rig.session.disconnect([&done]() { done = true; });
        rig.scheduler.run_ready();
        assert(done);
        assert(rig.session.session_state() == SessionState::Stopped);
        assert(rig.transport.disconnect_calls == 1);

        auto state = rig.session.snapshot();
        assert(!state.available);
        assert(state.connection_status == ConnectionStatus::Disconnected);

        rig.scheduler.advance(10min);
        assert(rig.session.iterations() == 1);
        assert(rig.transport.connect_calls == 1);
        std::cout << "  ✓ Loop exits at its next check\n";
    }
    {
        SessionRig rig;
        rig.transport.latency = 100ms;
        rig.session.start();
        rig.scheduler.run_ready();

        // connect, pair, subscribe done; LED color read in flight
        rig.scheduler.advance(350ms);
        assert(rig.transport.reads_of(uuids::LED_COLOR) == 1);

        rig.session.disconnect();
        rig.scheduler.advance(1s);
        assert(rig.session.snapshot().led_color == (LedColor{255, 0, 128}));
        assert(rig.transport.reads_of(uuids::CURRENT_TEMP) == 0);
        assert(rig.transport.log.back() == "disconnect");
        std::cout << "  ✓ In-flight read finishes, nothing starts after shutdown\n";
    }
}

void test_session_set_target() {
    std::cout << "Testing session set target temperature...\n";

    SessionRig rig;
    rig.session.start();
    rig.scheduler.run_ready();

    Status result = transport_error("unset", "");
    rig.session.set_target_temperature(58.0, [&result](const Status& status) { result = status; });
    rig.scheduler.run_ready();
    assert(!result);
    assert((rig.transport.writes.back().second == Bytes{0xA8, 0x16}));  // 5800
    std::cout << "  ✓ Write goes through the shared connection\n";
}

int main() {
    std::cout << "Running session tests...\n\n";

    test_poll_cycle();
    test_poll_partial_failure();
    test_diagnostic_sweep();
    test_poll_abandoned();
    test_session_loop();
    test_session_restart();
    test_session_restart_mid_poll();
    test_session_connect_waiters();
    test_session_liveness();
    test_session_connect_failure();
    test_session_shutdown();
    test_session_set_target();

    std::cout << "\n✓ All session tests passed!\n";
    return 0;
}

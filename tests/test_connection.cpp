#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "fakes.hpp"

#include <client/connection.hpp>
#include <protocol/uuids.hpp>

using namespace ember;

// Connection manager wired to fakes
struct Rig {
    ManualScheduler scheduler;
    FakeTransport transport{scheduler};
    Config config;
    MugState state;
    int changed = 0;
    int failed = 0;
    std::vector<std::string> faults;
    ConnectionManager connection{transport, scheduler, config, state,
                                 ConnectionManager::Callbacks{
                                     [this]() { ++changed; },
                                     [this]() { ++failed; },
                                     [this](const std::exception& e) { faults.push_back(e.what()); },
                                 }};

    Rig() {
        config.address = transport.address();
        state.address = transport.address();
        transport.load_mug_values();
    }

    void connect_now() {
        bool done = false;
        connection.connect([&done]() { done = true; });
        scheduler.run_ready();
        assert(done);
    }
};

void test_notification_filter() {
    std::cout << "Testing state notifications...\n";

    {
        Rig rig;
        rig.state.mug_status = 3;

        rig.connection.on_notification(uuids::STATE, {1});
        assert(rig.state.mug_status == 3);
        rig.connection.on_notification(uuids::STATE, {3});
        assert(rig.state.mug_status == 3);
        assert(rig.changed == 0);

        rig.connection.on_notification(uuids::STATE, {5, 0x00});
        assert(rig.state.mug_status == 5);
        assert(rig.changed == 1);
        std::cout << "  ✓ 1 and repeats ignored, new status applied\n";
    }
    {
        Rig rig;
        rig.connection.on_notification(uuids::STATE, {1});
        assert(!rig.state.mug_status);
        rig.connection.on_notification(uuids::STATE, {});
        assert(!rig.state.mug_status);
        rig.connection.on_notification(uuids::STATE, {2});
        assert(rig.state.mug_status == 2);
        std::cout << "  ✓ Unknown status only set by a real change\n";
    }
    {
        Rig rig;
        rig.connect_now();
        rig.transport.push({4});
        assert(rig.state.mug_status == 4);
        assert(rig.changed == 1);
        std::cout << "  ✓ Subscription delivers pushes to the handler\n";
    }
}

void test_connect_success() {
    std::cout << "Testing connect...\n";

    {
        Rig rig;
        rig.connect_now();
        assert(rig.transport.connect_calls == 1);
        assert(rig.transport.pair_calls == 1);
        assert(rig.transport.subscribe_calls == 1);
        assert(rig.state.connection_status == ConnectionStatus::Subscribed);
        assert(!rig.connection.is_connecting());
        std::cout << "  ✓ Connect, pair, subscribe\n";
    }
    {
        Rig rig;
        rig.transport.subscribe_fails = true;
        rig.connect_now();
        assert(rig.state.connection_status == ConnectionStatus::Connected);
        assert(rig.failed == 0);
        std::cout << "  ✓ Subscription failure is not fatal\n";
    }
    {
        Rig rig;
        rig.transport.pair_failures = 1;
        bool done = false;
        rig.connection.connect([&done]() { done = true; });
        rig.scheduler.run_ready();
        assert(!done);
        assert(rig.state.connection_status == ConnectionStatus::Connecting);

        rig.scheduler.advance(29s);
        assert(rig.transport.connect_calls == 1);
        rig.scheduler.advance(1s);
        assert(done);
        assert(rig.transport.connect_calls == 2);
        assert(rig.transport.pair_calls == 2);
        std::cout << "  ✓ Pairing failure retries after 30s\n";
    }
    {
        Rig rig;
        int done = 0;
        rig.connection.connect([&done]() { ++done; });
        rig.connection.connect([&done]() { ++done; });
        rig.scheduler.run_ready();
        assert(done == 2);
        assert(rig.transport.connect_calls == 1);
        std::cout << "  ✓ Concurrent connect requests share one burst\n";
    }
    {
        Rig rig;
        rig.transport.connect_failures = 1;
        int stale = 0;
        int fresh = 0;
        rig.connection.connect([&stale]() { ++stale; });
        rig.scheduler.run_ready();

        rig.connection.drop_connect_waiters();
        assert(rig.connection.connect_waiters() == 0);
        assert(rig.connection.is_connecting());
        rig.connection.connect([&fresh]() { ++fresh; });
        assert(rig.connection.connect_waiters() == 1);
        assert(rig.transport.connect_calls == 1);

        rig.scheduler.advance(30s);
        assert(fresh == 1);
        assert(stale == 0);
        assert(rig.transport.connect_calls == 2);
        assert(rig.connection.connect_waiters() == 0);
        std::cout << "  ✓ Dropped waiters are not resumed, the burst carries on\n";
    }
}

void test_connect_retry_burst() {
    std::cout << "Testing connect retry burst...\n";

    Rig rig;
    rig.transport.connect_failures = 1000;

    bool done = false;
    rig.connection.connect([&done]() { done = true; });
    rig.scheduler.run_ready();
    assert(rig.transport.connect_calls == 1);

    // Attempts 2..10 at 30s intervals
    rig.scheduler.advance(9 * 30s);
    assert(rig.transport.connect_calls == 10);
    assert(rig.connection.total_attempts() == 10);
    assert(rig.transport.pair_calls == 0);
    assert(rig.failed == 1);
    assert(rig.state.connection_status == ConnectionStatus::Disconnected);
    assert(!done);
    std::cout << "  ✓ Exactly 10 attempts, then failure is signalled\n";

    rig.scheduler.advance(299s);
    assert(rig.transport.connect_calls == 10);
    rig.scheduler.advance(1s);
    assert(rig.transport.connect_calls == 11);
    assert(rig.state.connection_status == ConnectionStatus::Connecting);
    std::cout << "  ✓ Next burst starts after 5 minutes\n";

    rig.transport.connect_failures = 0;
    rig.scheduler.advance(30s);
    assert(done);
    assert(rig.failed == 1);
    assert(rig.state.connection_status == ConnectionStatus::Subscribed);
    std::cout << "  ✓ Caller resumes once a later burst succeeds\n";
}

void test_serialized_operations() {
    std::cout << "Testing operation serialization...\n";

    Rig rig;
    rig.connect_now();
    rig.transport.latency = 100ms;
    rig.transport.log.clear();

    std::vector<std::string> order;
    rig.connection.read_characteristic(uuids::BATTERY, [&order](const Status& status, const Bytes&) {
        assert(!status);
        order.push_back("battery");
    });
    rig.connection.read_characteristic(uuids::LED_COLOR, [&order](const Status& status, const Bytes&) {
        assert(!status);
        order.push_back("color");
    });
    rig.connection.set_target_temperature(55.0, [&order](const Status& status) {
        assert(!status);
        order.push_back("write");
    });

    // Only the first operation has reached the transport
    assert(rig.transport.log.size() == 1);

    rig.scheduler.advance(1s);
    assert(rig.transport.max_in_flight == 1);
    assert((order == std::vector<std::string>{"battery", "color", "write"}));
    std::cout << "  ✓ One operation in flight, FIFO order\n";
}

void test_set_target_temperature() {
    std::cout << "Testing set target temperature...\n";

    {
        Rig rig;
        rig.connect_now();

        bool done = false;
        rig.connection.set_target_temperature(55.5, [&done](const Status& status) {
            assert(!status);
            done = true;
        });
        rig.scheduler.run_ready();
        assert(done);
        assert(rig.transport.writes.size() == 1);
        assert(rig.transport.writes[0].first == uuids::TARGET_TEMP);
        assert((rig.transport.writes[0].second == Bytes{0xAE, 0x15}));
        assert(rig.transport.log.back() == std::string("write command ") + uuids::TARGET_TEMP);
        std::cout << "  ✓ Writes encoded value without response\n";
    }
    {
        Rig rig;
        rig.connect_now();

        Status result;
        rig.connection.set_target_temperature(1000.0, [&result](const Status& status) { result = status; });
        rig.scheduler.run_ready();
        assert(result && result->kind == ErrorKind::Encode);
        assert(rig.transport.writes.empty());
        std::cout << "  ✓ Out of range value is an encode error\n";
    }
    {
        Rig rig;
        Status result;
        rig.connection.set_target_temperature(50.0, [&result](const Status& status) { result = status; });
        rig.scheduler.run_ready();
        assert(result && result->kind == ErrorKind::Transport);
        std::cout << "  ✓ Transport failure surfaces to the caller\n";
    }
}

void test_disconnect() {
    std::cout << "Testing disconnect...\n";

    {
        Rig rig;
        rig.connect_now();

        bool done = false;
        rig.connection.disconnect([&done]() { done = true; });
        assert(rig.state.connection_status == ConnectionStatus::ShuttingDown);
        rig.scheduler.run_ready();
        assert(done);
        assert(rig.transport.unsubscribe_calls == 1);
        assert(rig.transport.disconnect_calls == 1);
        assert(!rig.transport.connected);
        assert(rig.state.connection_status == ConnectionStatus::Disconnected);

        done = false;
        rig.connection.disconnect([&done]() { done = true; });
        rig.scheduler.run_ready();
        assert(done);
        assert(rig.transport.disconnect_calls == 1);
        std::cout << "  ✓ Unsubscribe then disconnect, second call is a no-op\n";
    }
    {
        Rig rig;
        rig.connect_now();
        rig.transport.unsubscribe_fails = true;
        rig.transport.disconnect_fails = true;

        bool done = false;
        rig.connection.disconnect([&done]() { done = true; });
        rig.scheduler.run_ready();
        assert(done);
        assert(rig.faults.empty());
        assert(rig.state.connection_status == ConnectionStatus::Disconnected);
        std::cout << "  ✓ Failures on the way down are swallowed\n";
    }
    {
        Rig rig;
        rig.transport.connect_failures = 1000;
        rig.connection.connect([]() { assert(false); });
        rig.scheduler.run_ready();

        bool done = false;
        rig.connection.disconnect([&done]() { done = true; });
        rig.scheduler.run_ready();
        assert(done);

        rig.scheduler.advance(1h);
        assert(rig.transport.connect_calls == 1);
        assert(!rig.connection.is_connecting());
        std::cout << "  ✓ Shutdown ends a pending retry burst\n";
    }
    {
        Rig rig;
        rig.connect_now();
        rig.transport.latency = 100ms;

        bool read_done = false;
        rig.connection.read_characteristic(uuids::BATTERY, [&read_done](const Status& status, const Bytes&) {
            assert(!status);
            read_done = true;
        });
        rig.connection.disconnect({});
        rig.scheduler.advance(1s);
        assert(read_done);
        assert(rig.transport.log[rig.transport.log.size() - 3] == std::string("read ") + uuids::BATTERY);
        assert(rig.transport.log.back() == "disconnect");
        std::cout << "  ✓ In-flight read completes before the link closes\n";
    }
}

void test_handler_fault() {
    std::cout << "Testing handler faults...\n";

    Rig rig;
    rig.connect_now();

    bool second = false;
    rig.connection.read_characteristic(uuids::BATTERY, [](const Status&, const Bytes&) {
        throw std::runtime_error("observer blew up");
    });
    rig.connection.read_characteristic(uuids::LED_COLOR, [&second](const Status& status, const Bytes&) {
        assert(!status);
        second = true;
    });
    rig.scheduler.run_ready();

    assert(rig.faults.size() == 1);
    assert(rig.faults[0] == "observer blew up");
    assert(second);
    std::cout << "  ✓ Throwing handler is reported and the queue keeps moving\n";
}

int main() {
    std::cout << "Running connection tests...\n\n";

    test_notification_filter();
    test_connect_success();
    test_connect_retry_burst();
    test_serialized_operations();
    test_set_target_temperature();
    test_disconnect();
    test_handler_fault();

    std::cout << "\n✓ All connection tests passed!\n";
    return 0;
}

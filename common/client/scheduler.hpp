#pragma once

#include <chrono>
#include <functional>

namespace ember {

// Single-threaded cooperative scheduler. Tasks never run concurrently;
// every wait in the client is a task scheduled here instead of a sleep.
class Scheduler {
public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    // Run task on a later turn of the loop
    virtual void post(Task task) = 0;

    // Run task once delay has elapsed
    virtual void call_later(std::chrono::milliseconds delay, Task task) = 0;
};

} // namespace ember

#pragma once

#include "../http.hpp"
#include "context.hpp"
#include "error.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace api {

// Reads a body to the end on a thread of its own. The thread is joined
// before the task is destroyed, so the body must outlive the task.
class ReadTask {
public:
    explicit ReadTask(Body& body);
    ~ReadTask();

    ReadTask(const ReadTask&) = delete;
    ReadTask& operator=(const ReadTask&) = delete;

    // Blocks until the read finishes or `ctx` is done. Returns true when the
    // read finished; a read that finished at the same time as the context
    // counts as finished.
    bool Wait(Context& ctx);

    void Join();

    // Bytes read so far and the error that stopped the read, if any. Only
    // valid after Join().
    std::string TakeBody();
    std::optional<Error> TakeError();

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        std::string body;
        std::optional<Error> error;
    };

    static void run(Body& body, State& state);

    std::shared_ptr<State> state;
    std::thread thread;
};

} // namespace api

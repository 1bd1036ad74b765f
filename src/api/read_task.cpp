#include "read_task.hpp"

namespace api {

ReadTask::ReadTask(Body& body) : state(std::make_shared<State>()) {
    thread = std::thread([&body, st = state] { run(body, *st); });
}

ReadTask::~ReadTask() {
    Join();
}

void ReadTask::run(Body& body, State& state) {
    std::string data;
    std::optional<Error> error;
    char buffer[16 * 1024];

    try {
        for (;;) {
            std::size_t n = body.Read(buffer, sizeof(buffer));
            if (n == 0) break;
            data.append(buffer, n);
        }
    } catch (const Error& e) {
        error = e;
    } catch (const std::exception& e) {
        error = Error(ErrorKind::Read, std::make_error_code(std::errc::io_error), e.what());
    }

    {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.body = std::move(data);
        state.error = std::move(error);
        state.done = true;
    }
    state.cv.notify_all();
}

bool ReadTask::Wait(Context& ctx) {
    auto st = state;
    std::size_t id = ctx.Subscribe([st] {
        std::lock_guard<std::mutex> lock(st->mutex);
        st->cv.notify_all();
    });

    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(st->mutex);
        auto ready = [&] { return st->done || ctx.Done(); };
        if (auto deadline = ctx.Deadline()) {
            st->cv.wait_until(lock, *deadline, ready);
        } else {
            st->cv.wait(lock, ready);
        }
        finished = st->done;
    }

    ctx.Unsubscribe(id);
    return finished;
}

void ReadTask::Join() {
    if (thread.joinable()) {
        thread.join();
    }
}

std::string ReadTask::TakeBody() {
    return std::move(state->body);
}

std::optional<Error> ReadTask::TakeError() {
    return std::move(state->error);
}

} // namespace api

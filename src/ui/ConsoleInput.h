#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace ui {

// Reads newline separated commands from a file descriptor on its own thread.
class ConsoleInputReader {
public:
    using LineHandler = std::function<void(std::string line)>;
    using EofHandler = std::function<void()>;

    explicit ConsoleInputReader(LineHandler onLine,
                                EofHandler onEof = {},
                                int fd = 0,
                                std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100));
    ~ConsoleInputReader();

    ConsoleInputReader(const ConsoleInputReader&) = delete;
    ConsoleInputReader& operator=(const ConsoleInputReader&) = delete;

    void start();
    // Returns within one poll interval.
    void stop();

    bool running() const { return running_.load(std::memory_order_acquire); }

private:
    void run_();
    void flushLines_(std::string& buffer);

    LineHandler onLine_;
    EofHandler onEof_;
    const int fd_;
    const std::chrono::milliseconds pollInterval_;

    std::atomic<bool> running_{false};
    std::thread worker_;
};

}  // namespace ui

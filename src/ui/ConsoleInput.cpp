#include "ui/ConsoleInput.h"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <utility>

#include "logging/Log.h"

namespace ui {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::UI;
constexpr std::size_t kReadChunk = 512;
constexpr std::size_t kMaxLineLength = 4096;

}  // namespace

ConsoleInputReader::ConsoleInputReader(LineHandler onLine,
                                       EofHandler onEof,
                                       int fd,
                                       std::chrono::milliseconds pollInterval)
    : onLine_(std::move(onLine)), onEof_(std::move(onEof)), fd_(fd), pollInterval_(pollInterval) {}

ConsoleInputReader::~ConsoleInputReader() {
    stop();
}

void ConsoleInputReader::start() {
    if (worker_.joinable()) {
        return;
    }
    LOG_GUARD(fd_ >= 0, kLogCategory, "console input disabled: invalid descriptor %d", fd_);
    running_.store(true, std::memory_order_release);
    worker_ = std::thread([this]() {
        try {
            run_();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(kLogCategory, "console input thread crashed: %s", ex.what());
        }
        running_.store(false, std::memory_order_release);
    });
}

void ConsoleInputReader::stop() {
    running_.store(false, std::memory_order_release);
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ConsoleInputReader::run_() {
    std::string buffer;
    char chunk[kReadChunk];
    while (running_.load(std::memory_order_acquire)) {
        pollfd descriptor{};
        descriptor.fd = fd_;
        descriptor.events = POLLIN;
        const int ready = ::poll(&descriptor, 1, static_cast<int>(pollInterval_.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(kLogCategory, "poll on console input failed: %s", std::strerror(errno));
            return;
        }
        if (ready == 0) {
            continue;
        }
        if ((descriptor.revents & (POLLIN | POLLHUP)) == 0) {
            LOG_WARN(kLogCategory, "console input closed (revents=%d)", static_cast<int>(descriptor.revents));
            break;
        }

        const ssize_t count = ::read(fd_, chunk, sizeof(chunk));
        if (count < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG_ERROR(kLogCategory, "read on console input failed: %s", std::strerror(errno));
            return;
        }
        if (count == 0) {
            break;
        }
        buffer.append(chunk, static_cast<std::size_t>(count));
        flushLines_(buffer);
        if (buffer.size() > kMaxLineLength) {
            LOG_WARN(kLogCategory, "discarding over-long console line (%zu bytes)", buffer.size());
            buffer.clear();
        }
    }

    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    if (!buffer.empty() && onLine_) {
        onLine_(std::move(buffer));
    }
    LOG_INFO(kLogCategory, "console input reached end of file");
    if (onEof_) {
        onEof_();
    }
}

void ConsoleInputReader::flushLines_(std::string& buffer) {
    std::size_t start = 0;
    for (auto newline = buffer.find('\n'); newline != std::string::npos; newline = buffer.find('\n', start)) {
        std::string line = buffer.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        start = newline + 1;
        if (onLine_) {
            onLine_(std::move(line));
        }
    }
    buffer.erase(0, start);
}

}  // namespace ui

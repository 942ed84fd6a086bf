#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "app/EventDispatcher.h"

using app::EventDispatcher;
using Source = EventDispatcher::Source;

namespace {
using namespace std::chrono_literals;

domain::ChangeNotification change(const std::string& symbol, domain::ChangeCategory category, std::uint64_t seq) {
    domain::ChangeNotification note;
    note.instrument = domain::InstrumentId(symbol);
    note.category = category;
    note.sequence = seq;
    return note;
}

struct Recorder {
    std::vector<std::string> inputs;
    std::vector<std::string> fatals;
    std::vector<std::vector<domain::ChangeNotification>> batches;
    int ticks{0};

    EventDispatcher::Handlers handlers() {
        EventDispatcher::Handlers h;
        h.onInput = [this](const std::string& line) { inputs.push_back(line); };
        h.onFatal = [this](const std::string& reason) { fatals.push_back(reason); };
        h.onData = [this](const std::vector<domain::ChangeNotification>& batch) { batches.push_back(batch); };
        h.onTick = [this](EventDispatcher::Clock::time_point) { ++ticks; };
        return h;
    }
};

bool expectSource(const std::optional<Source>& got, Source want, const char* step) {
    if (!got || *got != want) {
        std::cerr << step << ": expected " << app::dispatcher_source_label(want) << " but got "
                  << (got ? app::dispatcher_source_label(*got) : "nothing") << "\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    // Priority and coalescing.
    {
        Recorder recorder;
        EventDispatcher dispatcher(EventDispatcher::Config{256, std::chrono::hours(1)}, recorder.handlers());
        dispatcher.postData(change("700.HK", domain::ChangeCategory::Quote, 1));
        dispatcher.postData(change("AAPL.US", domain::ChangeCategory::Quote, 2));
        dispatcher.postData(change("700.HK", domain::ChangeCategory::Quote, 3));
        dispatcher.postData(change("700.HK", domain::ChangeCategory::Depth, 4));
        dispatcher.postFatal("stream lost");
        dispatcher.postInput("w");

        if (dispatcher.pendingData() != 3) {
            std::cerr << "Expected 3 coalesced notifications, got " << dispatcher.pendingData() << "\n";
            return 1;
        }
        if (!expectSource(dispatcher.runOnce(0ms), Source::UserInput, "step 1")
            || !expectSource(dispatcher.runOnce(0ms), Source::FatalSignal, "step 2")
            || !expectSource(dispatcher.runOnce(0ms), Source::DataUpdate, "step 3")
            || !expectSource(dispatcher.runOnce(0ms), Source::Tick, "step 4")) {
            return 1;
        }
        if (dispatcher.runOnce(10ms)) {
            std::cerr << "Nothing should be left to serve\n";
            return 1;
        }
        if (recorder.batches.size() != 1 || recorder.batches.front().size() != 3) {
            std::cerr << "Expected one batch of three notifications\n";
            return 1;
        }
        const auto& first = recorder.batches.front().front();
        if (first.instrument.str() != "700.HK" || first.category != domain::ChangeCategory::Quote
            || first.sequence != 3) {
            std::cerr << "Coalesced entry should keep its position and the newest sequence\n";
            return 1;
        }
        if (recorder.inputs != std::vector<std::string>{"w"} || recorder.fatals.size() != 1 || recorder.ticks != 1) {
            std::cerr << "Handlers were not called as expected\n";
            return 1;
        }
    }

    // A busy feed cannot starve the tick.
    {
        Recorder recorder;
        EventDispatcher dispatcher(EventDispatcher::Config{256, 1ms}, recorder.handlers());
        dispatcher.postData(change("700.HK", domain::ChangeCategory::Quote, 1));
        if (!expectSource(dispatcher.runOnce(0ms), Source::DataUpdate, "first batch")) {
            return 1;
        }
        std::this_thread::sleep_for(3ms);
        dispatcher.postData(change("700.HK", domain::ChangeCategory::Quote, 2));
        if (!expectSource(dispatcher.runOnce(0ms), Source::Tick, "due tick")
            || !expectSource(dispatcher.runOnce(0ms), Source::DataUpdate, "second batch")) {
            return 1;
        }
    }

    // Bounded input queue drops the oldest line.
    {
        Recorder recorder;
        EventDispatcher dispatcher(EventDispatcher::Config{2, std::chrono::hours(1)}, recorder.handlers());
        dispatcher.postInput("a");
        dispatcher.postInput("b");
        dispatcher.postInput("c");
        if (dispatcher.pendingInput() != 2 || dispatcher.droppedInput() != 1) {
            std::cerr << "Expected two queued lines and one dropped\n";
            return 1;
        }
        dispatcher.runOnce(0ms);
        dispatcher.runOnce(0ms);
        if (recorder.inputs != std::vector<std::string>{"b", "c"}) {
            std::cerr << "Expected the oldest line to be dropped\n";
            return 1;
        }
    }

    // stop() wakes a running loop promptly; a throwing handler does not end it.
    {
        std::atomic<int> ticks{0};
        EventDispatcher::Handlers handlers;
        handlers.onTick = [&](EventDispatcher::Clock::time_point) { ticks.fetch_add(1); };
        handlers.onInput = [](const std::string&) { throw std::runtime_error("bad command"); };
        EventDispatcher dispatcher(EventDispatcher::Config{256, 5ms}, handlers);
        std::thread loop([&]() { dispatcher.run(); });
        dispatcher.postInput("boom");
        std::this_thread::sleep_for(50ms);
        const auto stopAt = EventDispatcher::Clock::now();
        dispatcher.stop();
        loop.join();
        if (EventDispatcher::Clock::now() - stopAt > 200ms) {
            std::cerr << "stop() took too long to end the loop\n";
            return 1;
        }
        if (ticks.load() < 2) {
            std::cerr << "Expected the loop to keep ticking after a handler failure\n";
            return 1;
        }
        dispatcher.postInput("late");
        if (dispatcher.pendingInput() != 0) {
            std::cerr << "Input after stop must be ignored\n";
            return 1;
        }
    }

    return 0;
}

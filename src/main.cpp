#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>

#include "app/Application.h"
#include "config/ConfigProvider.h"
#include "logging/Log.h"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

void printVersion() {
#ifdef PROJECT_NAME
    std::cout << PROJECT_NAME;
#else
    std::cout << "tickwatch";
#endif
#ifdef PROJECT_VERSION
    std::cout << ' ' << PROJECT_VERSION;
#endif
    std::cout << '\n';
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([]() {
        std::cerr << "[tickwatch] terminate called";
        if (auto exception = std::current_exception()) {
            try {
                std::rethrow_exception(exception);
            }
            catch (const std::exception& ex) {
                std::cerr << ": " << ex.what();
            }
            catch (...) {
                std::cerr << ": unknown exception";
            }
        }
        std::cerr << std::endl;
        std::_Exit(1);
    });

    try {
        config::ConfigProvider provider(argc, argv);
        const config::Config& config = provider.get();

        if (config.showHelp) {
            std::cout << config::ConfigProvider::usage();
            return EXIT_SUCCESS;
        }
        if (config.showVersion) {
            printVersion();
            return EXIT_SUCCESS;
        }

        logging::Log::set_log_level(config.logLevel);
        logging::Log::set_log_directory(config.logDir);

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        app::Application application(config);
        const int code = application.run([]() { return gSignalStatus != 0; });
        if (gSignalStatus != 0) {
            LOG_INFO(logging::LogCategory::UI, "signal %d received, stopped", static_cast<int>(gSignalStatus));
        }
        logging::Log::flush();
        return code == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const std::exception& ex) {
        std::cerr << "[tickwatch] fatal: " << ex.what() << std::endl;
        logging::Log::flush();
        return EXIT_FAILURE;
    }
}

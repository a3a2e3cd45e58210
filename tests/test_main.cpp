#include <catch2/catch_session.hpp>
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <conduit/util/logger.hpp>
#include <cstdlib>
#include <string>

// Global test event listener to initialize logging
class LoggingInitializer : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(Catch::TestRunInfo const&) override {
        static bool initialized = false;
        if (!initialized) {
            // Enable the library's logging
            conduit::logging::enable();

            // Set log level based on environment variable or default to warn
            const char* log_level_env = std::getenv("CONDUIT_LOG_LEVEL");
            conduit::logging::set_log_level(std::string(log_level_env ? log_level_env : "warn"));

            initialized = true;

            LOG_INFO("Test logging initialized. Level: {}",
                     log_level_env ? log_level_env : "warn");
        }
    }
};

// Register the listener
CATCH_REGISTER_LISTENER(LoggingInitializer)

// Custom main
int main(int argc, char* argv[]) {
    return Catch::Session().run(argc, argv);
}

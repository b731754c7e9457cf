#include "log.hpp"

using namespace relaylog;

int main()
{
    log_dispatcher dispatcher;
    logger log(dispatcher);

    // Capture everything in memory alongside the console
    auto memory = make_memory_destination();
    log.add_destination(memory);

    // Test basic logging
    log.info("Integration test successful!");
    log.debug("Debug message");
    log.warn("Warning message");

    // Test structured logging
    log.info("User login", log_metadata{{"user_id", 12345}, {"ip", "192.168.1.1"}});

    // Ensure logs are flushed
    log.flush();

    return memory->size() >= 3 ? 0 : 1;
}

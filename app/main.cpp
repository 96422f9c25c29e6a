#include <hellod/app/application.hpp>
#include <hellod/config/server_config.hpp>
#include <hellod/util/logger.hpp>

int main() {
    // installed before reading the environment so invalid values are reported
    hellod::logging::enable();
    return hellod::app::run(hellod::config::server_config::from_environment());
}

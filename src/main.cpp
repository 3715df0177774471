#include "config.hpp"
#include "firewatch_app.hpp"
#include "logger.hpp"

#include <csignal>

namespace
{
FirewatchApp *g_app = nullptr;

void handle_signal(int)
{
    if (g_app)
    {
        g_app->requestStop();
    }
}
} // namespace

int main(int argc, char *argv[])
{
    AppConfig config;
    const int parsed = parse_args(argc, argv, config);
    if (parsed != 0)
    {
        return parsed > 0 ? 0 : 2;
    }

    logging::init_logger(config.logging.log_file, config.logging.log_level);

    FirewatchApp app(config);
    g_app = &app;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    const int code = app.run();
    g_app = nullptr;
    return code;
}

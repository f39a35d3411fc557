#include <csignal>
#include <cstdlib>

#include <homecontrol/web/GatewayServer.hpp>

#include "log/TaggedLogger.hpp"

namespace {
void handle_signal(int) {
    HC::Web::RequestGatewayStop();
}
} // namespace

int main(int argc, char** argv) {
    auto options_opt = HC::Web::ParseGatewayArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        HC::Web::PrintGatewayUsage();
        return EXIT_SUCCESS;
    }

#if !defined(HC_LOG_DISABLED)
    HC::set_logging_enabled(!options.quiet);
    HC::set_debug_logging(options.log_debug);
    HC::set_thread_name("Main");
#endif

    HC::Web::ResetGatewayStopFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    return HC::Web::RunGateway(options);
}

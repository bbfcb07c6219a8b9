#include <boost/asio/signal_set.hpp>

#include "args.h"
#include "common/errors.h"
#include "common/logging.h"
#include "control/control_api.h"
#include "control/http_service.h"
#include "coordinator.h"
#include "parser.h"

int main(int argc, char *argv[]) {
    Args args;
    if (!Parser::ParseArgs(argc, argv, args)) {
        return 1;
    }

    std::shared_ptr<Coordinator> coordinator;
    try {
        coordinator = Coordinator::Create(args);
    } catch (const ParameterError &e) {
        ERROR_PRINT("Invalid capture settings: %s", e.what());
        return 1;
    }

    if (args.start_preview) {
        try {
            coordinator->StartPreview();
        } catch (const CaptureError &e) {
            ERROR_PRINT("Cannot start preview: %s", e.what());
            return 1;
        }
    }

    std::shared_ptr<HttpService> http_service;
    try {
        http_service = HttpService::Create(args.http_port, ControlApi::Create(coordinator));
    } catch (const boost::system::system_error &e) {
        ERROR_PRINT("Cannot listen on port %d: %s", args.http_port, e.what());
        coordinator->Shutdown();
        return 1;
    }

    asio::signal_set signals(http_service->io_context(), SIGINT, SIGTERM);
    signals.async_wait([coordinator, http_service](const beast::error_code &ec, int signal) {
        if (ec) {
            return;
        }
        INFO_PRINT("Received signal %d, shutting down", signal);
        coordinator->Shutdown();
        http_service->Disconnect();
    });

    http_service->Connect();

    coordinator->Shutdown();
    INFO_PRINT("Bye");
    return 0;
}

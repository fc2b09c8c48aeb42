#include <exception>
#include <iostream>

#include "auxon/config.h"
#include "auxon/gateway.h"
#include "auxon/http_server.h"
#include "auxon/log.h"
#include "auxon/modem_adapter.h"
#include "auxon/version.h"

int main(int argc, char* argv[])
{
    int exitCode = 0;
    auto config = auxon::Config::parse(argc, argv, exitCode);
    if (!config) return exitCode;

    auxon::setLogLevel(config->logLevel);

    try {
        auxon::ModemAdapter adapter(config->modemOptions());

        auxon::GatewayOptions options;
        options.maxJsonBytes = config->maxJsonBytes;
        options.maxUploadBytes = config->maxUploadBytes;
        options.allowedOrigins = config->allowedOrigins;
        auxon::Gateway gateway(adapter, config->pipelineLimits(), options);

        auxon::HttpServer server(gateway, config->address, config->port, config->threads);
        auxon::logInfo("auxon-gateway {} listening on {}:{} ({} threads, {} modem instances, default band {})",
                       AUXON_VERSION, config->address, server.port(), config->threads,
                       config->modemInstances, auxon::bandName(config->defaultBand));
        server.run();
    } catch (const std::exception& ex) {
        auxon::logError("fatal: {}", ex.what());
        return 1;
    }
    return 0;
}

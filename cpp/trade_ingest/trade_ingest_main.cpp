#include "trade_ingest_service.hpp"
#include "../utils/logging/logger.hpp"

int main(int argc, char** argv) {
    int exit_code = 0;
    {
        trade_ingest::TradeIngestService service;

        if (!service.initialize(argc, argv)) {
            exit_code = service.help_requested() ? 0 : 1;
        } else {
            exit_code = service.start();
        }
    }

    // Flush queued lines after the service has logged its shutdown
    logging::cleanup_logging();
    return exit_code;
}

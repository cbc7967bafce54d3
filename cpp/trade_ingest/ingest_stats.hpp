#pragma once
#include <cstdint>
#include "../utils/metrics/metrics_collector.hpp"

namespace trade_ingest {

/**
 * Ingestion counters shared by every connection thread
 *
 * Owned by the service and injected into IngestClient and HealthService.
 */
struct IngestStats {
    metrics::Gauge active_connections{"active_connections"};
    metrics::Counter total_messages{"total_messages"};        // trades accepted
    metrics::Counter error_messages{"error_messages"};        // malformed frames
    metrics::Counter ignored_messages{"ignored_messages"};    // acks, non-trade events
    metrics::Counter connection_errors{"connection_errors"};  // failed connects and drops

    struct Snapshot {
        int64_t active_connections{0};
        int64_t total_messages{0};
        int64_t error_messages{0};
        int64_t ignored_messages{0};
        int64_t connection_errors{0};
    };

    Snapshot snapshot() const {
        Snapshot s;
        s.active_connections = active_connections.get();
        s.total_messages = total_messages.get();
        s.error_messages = error_messages.get();
        s.ignored_messages = ignored_messages.get();
        s.connection_errors = connection_errors.get();
        return s;
    }
};

} // namespace trade_ingest

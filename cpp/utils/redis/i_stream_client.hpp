#pragma once
#include <string>
#include <utility>
#include <vector>
#include "../error_handling.hpp"

namespace redis {

// Ordered field/value pairs of one stream entry
using StreamFields = std::vector<std::pair<std::string, std::string>>;

/**
 * Append-only capped stream log (Redis streams semantics)
 *
 * Implementations must be safe to call from many connection threads.
 */
class IStreamClient {
public:
    virtual ~IStreamClient() = default;
    
    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;
    
    // Liveness probe; false if the broker is unreachable
    virtual bool ping() = 0;
    
    // Appends an entry and trims the stream to max_length (approximate trim
    // lets the broker keep slightly more). Returns the new entry id.
    virtual error_handling::Result<std::string> xadd(const std::string& key,
                                                     const StreamFields& fields,
                                                     long long max_length,
                                                     bool approximate) = 0;
    
    virtual std::string describe() const = 0;
};

} // namespace redis

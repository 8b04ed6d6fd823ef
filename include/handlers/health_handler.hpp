#pragma once

#include "clock.hpp"
#include "metrics.hpp"
#include "handlers/response_builder.hpp"

namespace passgen {

class HealthHandler {
public:
    explicit HealthHandler(const Clock& clock) : clock_(clock) {}

    // {"status": "healthy", "timestamp": <epoch seconds>}
    Response handle_health(unsigned version);

    // Prometheus text exposition. Loopback access is enforced by the router.
    Response handle_metrics(unsigned version);

private:
    const Clock& clock_;
};

} // namespace passgen

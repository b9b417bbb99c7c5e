#ifndef AGENTDESK_LIVENESS_PROBE_HPP
#define AGENTDESK_LIVENESS_PROBE_HPP

#include "Config.hpp"

// True when something accepts a TCP connection on the endpoint. The
// connection is closed right away and nothing is sent over it.
[[nodiscard]] auto probe(const Endpoint &endpoint) -> bool;

#endif // AGENTDESK_LIVENESS_PROBE_HPP

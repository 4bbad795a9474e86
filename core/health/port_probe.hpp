#pragma once

#include <string>

namespace warden {
namespace health {

struct PortProbeResult {
    bool reachable = false;
    bool timed_out = false;
    std::string detail;  // "accepting connections", "connection refused", ...
};

// Interface for the reachability check to enable mocking
class IPortProbe {
public:
    virtual ~IPortProbe() = default;
    virtual PortProbeResult probe(const std::string &host, int port, int timeout_ms) = 0;
};

// Plain TCP connect, bounded by timeout_ms
class TcpPortProbe : public IPortProbe {
public:
    PortProbeResult probe(const std::string &host, int port, int timeout_ms) override;
};

}  // namespace health
}  // namespace warden

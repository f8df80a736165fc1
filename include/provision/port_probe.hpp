#pragma once

#include <chrono>
#include <string>

class PortProbe {
public:
    virtual ~PortProbe() = default;

    // True when a TCP connection to host:port completes within timeout.
    virtual bool isOpen(const std::string& host, int port, std::chrono::milliseconds timeout) = 0;
};

class TcpPortProbe : public PortProbe {
public:
    bool isOpen(const std::string& host, int port, std::chrono::milliseconds timeout) override;
};

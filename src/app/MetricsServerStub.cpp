#include "app/MetricsServer.hpp"
#include <cstdio>

namespace glustat::app {

MetricsServer::MetricsServer(const SnapshotBuffers& buffers, uint16_t port)
    : buffers_(buffers), port_(port) {}

MetricsServer::~MetricsServer() = default;

void MetricsServer::start() {
  std::fprintf(stderr, "glustat: MetricsServer: built without liburing, port %u not served\n",
               static_cast<unsigned>(port_));
}

void MetricsServer::stop() {}

} // namespace glustat::app

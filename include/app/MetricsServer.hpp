#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <thread>
#include "app/SnapshotBuffers.hpp"
#include "model/Snapshot.hpp"

namespace glustat::app {

// Serialize a CycleSnapshot into Prometheus text exposition format (version 0.0.4).
// Each measurement field becomes gauge "<measurement>_<field>" labelled by its tags.
[[nodiscard]] std::string snapshot_to_prometheus(const glustat::model::CycleSnapshot& snap);

// Prometheus metric name: [a-zA-Z_:][a-zA-Z0-9_:]*, other bytes become '_'.
[[nodiscard]] std::string sanitize_metric_name(std::string_view name);

// HTTP endpoint for GET /metrics (io_uring event loop).
class MetricsServer {
public:
  MetricsServer(const SnapshotBuffers& buffers, uint16_t port);
  ~MetricsServer();
  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  void start();
  void stop();

private:
  void run(std::stop_token st);
  void handle_client(int client_fd);

  const SnapshotBuffers& buffers_;
  uint16_t port_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::jthread thread_;
};

} // namespace glustat::app

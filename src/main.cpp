#include "app/Config.hpp"
#include "app/LineProtocol.hpp"
#include "app/LogWriter.hpp"
#include "app/MetricsServer.hpp"
#include "app/Producer.hpp"
#include "app/SnapshotBuffers.hpp"
#include "collectors/ProcessRunner.hpp"
#include "collectors/ProfileCollector.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

enum class OutputFormat { Prometheus, Influx };

static void print_usage() {
  std::cout << "Usage: glustat [--config PATH] [--once] [--format prom|influx] [--iterations N]\n"
               "               [--interval-ms MS] [--listen PORT] [--log-dir DIR] [--sample-config]\n";
  std::cout << "Notes: without --listen or --log-dir a single cycle is printed to stdout.\n";
}

static bool parse_int_arg(const char* flag, const char* s, int& out) {
  std::string_view sv(s);
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
    std::fprintf(stderr, "glustat: %s expects an integer, got '%s'\n", flag, s);
    return false;
  }
  return true;
}

static void print_snapshot(const glustat::model::CycleSnapshot& s, OutputFormat fmt) {
  if (fmt == OutputFormat::Influx) {
    int64_t ts_ns = s.finished_ms * 1'000'000;
    std::cout << glustat::app::measurements_to_line_protocol(s.measurements, ts_ns);
  } else {
    std::cout << glustat::app::snapshot_to_prometheus(s);
  }
  std::cout.flush();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  std::string config_path;
  bool once = false;
  OutputFormat fmt = OutputFormat::Prometheus;
  int iterations = 0;  // 0 => run until signalled
  int interval_ms = -1, listen_port = -1;
  std::string log_dir;
  bool have_log_dir = false;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--once") once = true;
    else if (a == "--format" && i + 1 < argc) {
      std::string f = argv[++i];
      if (f == "prom" || f == "prometheus") fmt = OutputFormat::Prometheus;
      else if (f == "influx" || f == "line") fmt = OutputFormat::Influx;
      else { std::fprintf(stderr, "glustat: unknown format '%s'\n", f.c_str()); return 2; }
    }
    else if (a == "--iterations" && i + 1 < argc) { if (!parse_int_arg("--iterations", argv[++i], iterations)) return 2; }
    else if (a == "--interval-ms" && i + 1 < argc) { if (!parse_int_arg("--interval-ms", argv[++i], interval_ms)) return 2; }
    else if (a == "--listen" && i + 1 < argc) { if (!parse_int_arg("--listen", argv[++i], listen_port)) return 2; }
    else if (a == "--log-dir" && i + 1 < argc) { log_dir = argv[++i]; have_log_dir = true; }
    else if (a == "--sample-config") { std::cout << glustat::app::sample_config(); return 0; }
    else if (a == "-h" || a == "--help") { print_usage(); return 0; }
    else {
      std::fprintf(stderr, "glustat: unknown argument '%s'\n", a.c_str());
      print_usage();
      return 2;
    }
  }

  auto cfg = glustat::app::load_agent_config(config_path);
  if (interval_ms >= 0) cfg.interval = std::chrono::milliseconds(std::max(interval_ms, 100));
  if (listen_port >= 0) cfg.listen_port = static_cast<uint16_t>(std::min(listen_port, 65535));
  if (have_log_dir) cfg.log_dir = log_dir;

  glustat::collectors::ProcessRunner runner;
  glustat::collectors::ProfileCollector collector(cfg.collector, runner);
  glustat::app::SnapshotBuffers buffers;

  bool continuous = !once && (cfg.listen_port != 0 || !cfg.log_dir.empty() || iterations > 0);
  if (!continuous) {
    glustat::model::CycleSnapshot snap;
    bool ok = glustat::app::collect_cycle(collector, snap);
    print_snapshot(snap, fmt);
    return ok ? 0 : 1;
  }

  std::unique_ptr<glustat::app::MetricsServer> server;
  if (cfg.listen_port != 0) {
    server = std::make_unique<glustat::app::MetricsServer>(buffers, cfg.listen_port);
    server->start();
  }

  std::unique_ptr<glustat::app::LogWriter> writer;
  if (!cfg.log_dir.empty()) {
    writer = std::make_unique<glustat::app::LogWriter>(buffers, cfg.log_dir);
    writer->start();
  }

  glustat::app::Producer producer(buffers, collector, cfg.interval);
  producer.start();

  // Print to stdout only when nothing else consumes the cycles
  const bool echo = cfg.listen_port == 0 && cfg.log_dir.empty();
  uint64_t last = 0;
  int cycles = 0;
  bool last_ok = true;
  while (!g_stop.load()) {
    std::this_thread::sleep_for(50ms);
    uint64_t seq = buffers.seq();
    if (seq == last) continue;
    last = seq;
    ++cycles;
    auto snap = buffers.front();
    last_ok = snap.ok;
    if (echo) print_snapshot(snap, fmt);
    if (iterations > 0 && cycles >= iterations) break;
  }

  producer.stop();
  if (writer) writer->stop();
  if (server) server->stop();
  return last_ok ? 0 : 1;
}

#include "app/Config.hpp"
#include "util/Text.hpp"
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace glustat::app {

static constexpr int kMinTimeoutMs = 1;
static constexpr int kMinIntervalMs = 100;

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("GLUSTAT_", 0) == 0) {
    alt = std::string("glustat_") + n.substr(8);
  } else if (n.rfind("glustat_", 0) == 0) {
    alt = std::string("GLUSTAT_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  std::string_view sv(v);
  int out = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
    std::fprintf(stderr, "glustat: config: ignoring non-integer %s=%s\n", name, v);
    return defv;
  }
  return out;
}

bool getenv_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::vector<std::string> split_list(std::string_view csv) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= csv.size()) {
    size_t end = csv.find(',', start);
    if (end == std::string_view::npos) end = csv.size();
    auto item = glustat::util::trim(csv.substr(start, end - start));
    if (!item.empty()) out.emplace_back(item);
    start = end + 1;
  }
  return out;
}

std::string config_file_path() {
  if (const char* p = getenv_compat("GLUSTAT_CONFIG")) return p;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/glustat/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/glustat/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const glustat::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const glustat::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return getenv_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const glustat::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    if (const char* v = getenv_compat(env_name)) return v;
  }
  return def;
}

AgentConfig resolve_agent_config(const glustat::util::TomlReader& toml, bool have_toml) {
  AgentConfig cfg{};
  auto& c = cfg.collector;

  if (have_toml && toml.has("glusterfs", "volumes")) {
    c.volumes = toml.get_string_list("glusterfs", "volumes", c.volumes);
  } else if (const char* v = getenv_compat("GLUSTAT_VOLUMES")) {
    c.volumes = split_list(v);
  }
  if (c.volumes.empty()) c.volumes = {"vol0"};

  c.binary = resolve_string(toml, have_toml, "glusterfs", "binary", "GLUSTAT_BINARY", c.binary);
  int timeout_ms = resolve_int(toml, have_toml, "glusterfs", "timeout", "GLUSTAT_TIMEOUT_MS",
                               static_cast<int>(c.timeout.count()));
  if (timeout_ms < kMinTimeoutMs) timeout_ms = kMinTimeoutMs;
  c.timeout = std::chrono::milliseconds(timeout_ms);
  c.use_sudo = resolve_bool(toml, have_toml, "glusterfs", "use_sudo", "GLUSTAT_USE_SUDO", c.use_sudo);

  int interval_ms = resolve_int(toml, have_toml, "agent", "interval_ms", "GLUSTAT_INTERVAL_MS",
                                static_cast<int>(cfg.interval.count()));
  if (interval_ms < kMinIntervalMs) interval_ms = kMinIntervalMs;
  cfg.interval = std::chrono::milliseconds(interval_ms);

  int port = resolve_int(toml, have_toml, "agent", "listen_port", "GLUSTAT_LISTEN_PORT", 0);
  if (port < 0) port = 0;
  if (port > 65535) port = 65535;
  cfg.listen_port = static_cast<uint16_t>(port);

  cfg.log_dir = resolve_string(toml, have_toml, "agent", "log_dir", "GLUSTAT_LOG_DIR", cfg.log_dir);
  return cfg;
}

AgentConfig load_agent_config(const std::string& path) {
  std::string p = path.empty() ? config_file_path() : path;
  glustat::util::TomlReader toml;
  bool have_toml = !p.empty() && toml.load(p);
  if (!have_toml && !path.empty()) {
    std::fprintf(stderr, "glustat: config: cannot read %s, using environment and defaults\n", path.c_str());
  }
  return resolve_agent_config(toml, have_toml);
}

const char* sample_config() {
  return R"(# glustat configuration
[glusterfs]
## Volumes to profile, in collection order.
volumes = ["vol0"]

## Location of the gluster CLI.
binary = "/usr/sbin/gluster"

## Command timeout in milliseconds.
timeout = 1000

## Prefix the command with sudo when running as a restricted user.
use_sudo = false

[agent]
## Collection interval in milliseconds (continuous mode).
interval_ms = 10000

## Serve Prometheus text on :<port>/metrics (0 disables).
listen_port = 0

## Append every cycle to hourly .prom files in this directory (empty disables).
log_dir = ""
)";
}

} // namespace glustat::app

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "collectors/ProfileCollector.hpp"
#include "util/TomlReader.hpp"

namespace glustat::app {

struct AgentConfig {
  glustat::collectors::CollectorConfig collector{};
  std::chrono::milliseconds interval{10000};
  uint16_t listen_port{0};     // 0 = no HTTP endpoint
  std::string log_dir;         // empty = no .prom log files
};

// Each setting resolves TOML -> environment -> compiled default.
// Out-of-range values are clamped; an empty volume list falls back to {"vol0"}.
[[nodiscard]] AgentConfig resolve_agent_config(const glustat::util::TomlReader& toml, bool have_toml);

// Load `path` (or config_file_path() when empty) and resolve. A missing file
// is not an error: environment and defaults still apply.
[[nodiscard]] AgentConfig load_agent_config(const std::string& path = {});

// $GLUSTAT_CONFIG, then $XDG_CONFIG_HOME/glustat/config.toml, then ~/.config/glustat/config.toml
[[nodiscard]] std::string config_file_path();

// Commented sample configuration with every default spelled out.
[[nodiscard]] const char* sample_config();

// Environment variable helpers (GLUSTAT_X falls back to glustat_X and back)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool getenv_flag(const char* name, bool defv);

// "a, b,,c" -> {"a","b","c"}
[[nodiscard]] std::vector<std::string> split_list(std::string_view csv);

} // namespace glustat::app

#pragma once

/**
 * @file ConfigLoader.hpp
 * @brief Loads Tether configuration from YAML
 *
 * Expected YAML structure (every key optional):
 * @code
 * session:
 *   executable: /tools/Xilinx/Vivado/2023.2/bin/vivado
 *   args: [-mode, tcl, -nojournal, -nolog]
 *   prompt: "Vivado%"
 *   startup_banner: "Start of session"
 *   startup_timeout: 120        # seconds
 *   command_timeout: 300
 *   timeout_mode: deadline      # or inactivity
 *   resync_timeout: 2
 *   exit_command: exit
 *   exit_grace: 5
 *   interrupt_on_timeout: false
 *   history_limit: 100
 *   error_markers:
 *     - pattern: "^ERROR:\\s*\\["
 *     - pattern: "^invalid command name"
 *       within_lines: 5
 * envelope:
 *   max_chars: 8000
 *   reports_dir: /tmp/tether
 *   report_cache_hours: 1
 * logging:
 *   console_level: info
 *   file: tether.log
 *   file_level: debug
 * @endcode
 */

#include <tether/core/Error.hpp>
#include <tether/session/SessionConfig.hpp>

#include <string>

namespace YAML {
class Node;
}

namespace tether::io {

class ConfigLoader {
  public:
    /**
     * @brief Load configuration from a YAML file
     * @throws ConfigError on unreadable files, malformed YAML or invalid values
     */
    static TetherConfig Load(const std::string &path);

    /**
     * @brief Parse configuration from a YAML string (for testing)
     */
    static TetherConfig Parse(const std::string &yaml_content);

    /// Parse a level name ("trace", "debug", "info", "event", "warning", "error", "fatal")
    static LogLevel ParseLogLevel(const std::string &name);

  private:
    static TetherConfig ParseRoot(const YAML::Node &root, const std::string &source);
    static void ParseSession(SessionConfig &cfg, const YAML::Node &node,
                             const std::string &source);
    static void ParseEnvelope(EnvelopeConfig &cfg, const YAML::Node &node,
                              const std::string &source);
    static void ParseLogging(LogConfig &cfg, const YAML::Node &node, const std::string &source);
};

} // namespace tether::io

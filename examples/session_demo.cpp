/**
 * @file session_demo.cpp
 * @brief Line-oriented tool console over a persistent engine session
 *
 * Each input line is a tool name followed by an optional JSON object of
 * arguments; each result is printed as JSON on stdout. Logs go to stderr.
 *
 *   start_session
 *   run_tcl {"command": "version"}
 *   get_timing_summary {"detail_level": "standard"}
 *   read_report_section {"report_id": "1a2b3c4d", "search_pattern": "VIOLATED"}
 *
 * Usage: ./tether_session_demo [config.yaml]
 *        Without a config, built-in defaults are used.
 */

#include <tether/tether.hpp>

#include <iostream>
#include <string>

using namespace tether;
using nlohmann::json;

int main(int argc, char *argv[]) {
    TetherConfig config;
    try {
        if (argc > 1) {
            config = io::ConfigLoader::Load(argv[1]);
        }
        ApplyLogConfig(GetLogService(), config.log);
    } catch (const Error &e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    Session session(config.session);
    SimulationController sim(session);
    ReportArchive archive(config.envelope);
    try {
        archive.Prepare();
    } catch (const Error &e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    ToolDispatcher tools(session, sim, archive);

    TETHER_LOG_INFO("Ready. Enter '<tool> [json args]', 'tools' or 'quit'.");

    std::string line;
    while (std::getline(std::cin, line)) {
        const auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos) {
            continue;
        }
        const auto name_end = line.find_first_of(" \t", start);
        const std::string name = line.substr(start, name_end - start);
        if (name == "quit" || name == "exit") {
            break;
        }
        if (name == "tools") {
            std::cout << json(tools.ToolNames()).dump(2) << std::endl;
            continue;
        }

        json args = json::object();
        if (name_end != std::string::npos) {
            const std::string rest = line.substr(name_end);
            if (rest.find_first_not_of(" \t") != std::string::npos) {
                args = json::parse(rest, nullptr, false);
                if (args.is_discarded() || !args.is_object()) {
                    std::cout << json{{"success", false},
                                      {"error", "arguments must be a JSON object"},
                                      {"category", "arguments"}}
                                     .dump(2)
                              << std::endl;
                    continue;
                }
            }
        }

        std::cout << tools.Call(name, args).dump(2) << std::endl;
    }

    try {
        session.Stop();
    } catch (const Error &e) {
        LogError(e);
        return 1;
    }
    return 0;
}

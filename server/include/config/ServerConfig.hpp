#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mergegrid::server {

struct ServerConfig {
    std::string host = "0.0.0.0";
    unsigned short port = 5000;
    unsigned threads = 10;        // workers running the io_context
    std::size_t defaultSize = 4;  // grid size for games created on demand
    std::size_t maxSize = 8;      // largest size a client may request
};

struct ConfigParseResult {
    ServerConfig config;
    bool showHelp = false;
    std::vector<std::string> errors; // unknown options and bad values, in order
};

using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

// Reads MERGEGRID_PORT / MERGEGRID_THREADS through `env`, then the command
// line (argv[0] included, skipped). "--opt value" and "--opt=value" both work.
ConfigParseResult parseServerConfig(const std::vector<std::string>& args, const EnvLookup& env);

// Same, with the process environment.
ConfigParseResult parseServerConfig(int argc, char** argv);

std::string usageText(const std::string& program);

} // namespace mergegrid::server

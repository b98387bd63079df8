#include "config/ServerConfig.hpp"
#include <cstdlib>
#include <stdexcept>
#include <sstream>

using namespace mergegrid::server;

namespace {

std::optional<unsigned long> parseNumber(const std::string& text) {
    if (text.empty()) return std::nullopt;
    for (char ch : text) {
        if (ch < '0' || ch > '9') return std::nullopt;
    }
    try {
        return std::stoul(text);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

void applyNumber(const std::string& name, const std::string& text, unsigned long lo, unsigned long hi,
                 std::vector<std::string>& errors, const std::function<void(unsigned long)>& set) {
    auto v = parseNumber(text);
    if (!v || *v < lo || *v > hi) {
        errors.push_back("invalid value for " + name + ": '" + text + "' (expected " + std::to_string(lo) +
                         ".." + std::to_string(hi) + ")");
        return;
    }
    set(*v);
}

} // namespace

ConfigParseResult mergegrid::server::parseServerConfig(const std::vector<std::string>& args, const EnvLookup& env) {
    ConfigParseResult out;
    ServerConfig& cfg = out.config;

    auto setPort = [&](unsigned long v) { cfg.port = static_cast<unsigned short>(v); };
    auto setThreads = [&](unsigned long v) { cfg.threads = static_cast<unsigned>(v); };

    if (env) {
        if (auto p = env("MERGEGRID_PORT")) applyNumber("MERGEGRID_PORT", *p, 0, 65535, out.errors, setPort);
        if (auto t = env("MERGEGRID_THREADS")) applyNumber("MERGEGRID_THREADS", *t, 1, 256, out.errors, setThreads);
    }

    for (std::size_t i = 1; i < args.size(); ++i) {
        std::string opt = args[i];
        std::optional<std::string> value;
        auto eq = opt.find('=');
        if (opt.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = opt.substr(eq + 1);
            opt = opt.substr(0, eq);
        }

        if (opt == "--help" || opt == "-h") {
            out.showHelp = true;
            continue;
        }

        const bool known = opt == "--host" || opt == "--port" || opt == "--threads" || opt == "--size" ||
                           opt == "--max-size";
        if (!known) {
            out.errors.push_back("unknown option: " + args[i]);
            continue;
        }
        if (!value) {
            if (i + 1 >= args.size()) {
                out.errors.push_back("missing value for " + opt);
                continue;
            }
            value = args[++i];
        }

        if (opt == "--host") {
            if (value->empty()) out.errors.push_back("invalid value for --host: ''");
            else cfg.host = *value;
        } else if (opt == "--port") {
            applyNumber(opt, *value, 0, 65535, out.errors, setPort);
        } else if (opt == "--threads") {
            applyNumber(opt, *value, 1, 256, out.errors, setThreads);
        } else if (opt == "--size") {
            applyNumber(opt, *value, 2, 127, out.errors, [&](unsigned long v) { cfg.defaultSize = v; });
        } else if (opt == "--max-size") {
            // 127x127 cells is the largest State payload that fits one frame
            applyNumber(opt, *value, 2, 127, out.errors, [&](unsigned long v) { cfg.maxSize = v; });
        }
    }

    if (cfg.defaultSize > cfg.maxSize) {
        out.errors.push_back("--size " + std::to_string(cfg.defaultSize) + " exceeds --max-size " +
                             std::to_string(cfg.maxSize));
    }
    return out;
}

ConfigParseResult mergegrid::server::parseServerConfig(int argc, char** argv) {
    std::vector<std::string> args(argv, argv + argc);
    return parseServerConfig(args, [](const char* name) -> std::optional<std::string> {
        const char* v = std::getenv(name);
        if (v && *v) return std::string(v);
        return std::nullopt;
    });
}

std::string mergegrid::server::usageText(const std::string& program) {
    std::ostringstream os;
    os << "usage: " << program << " [options]\n"
       << "  --host ADDR       address to listen on (default 0.0.0.0)\n"
       << "  --port N          TCP port, 0 picks a free one (default 5000, env MERGEGRID_PORT)\n"
       << "  --threads N       worker threads (default 10, env MERGEGRID_THREADS)\n"
       << "  --size N          grid size of new games (default 4)\n"
       << "  --max-size N      largest grid a client may request (default 8)\n"
       << "  --help            show this text\n";
    return os.str();
}

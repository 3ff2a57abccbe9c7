#include "app/CommandLine.hpp"

#include <cctype>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>

namespace game2048::app {

namespace {
    std::optional<unsigned long long> parseUnsigned(const std::string& s) {
        if (s.empty() || s.size() > 19) return std::nullopt;
        for (char c : s) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
        return std::stoull(s);
    }
}

CommandLine parseCommandLine(const std::vector<std::string>& args)
{
    CommandLine result;
    core::GameConfig& cfg = result.config;
    const CommandLine failed{ParseOutcome::Error, {}};

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& opt = args[i];

        if (opt == "--help" || opt == "-h") {
            result.outcome = ParseOutcome::ShowHelp;
            return result;
        }

        if (i + 1 >= args.size()) {
            std::cerr << "[app] missing value for " << opt << '\n';
            return failed;
        }
        const std::string& value = args[++i];

        if (opt == "--size") {
            const auto n = parseUnsigned(value);
            if (!n || *n < static_cast<unsigned long long>(core::kMinBoardSize)
                   || *n > static_cast<unsigned long long>(core::kMaxBoardSize)) {
                std::cerr << "[app] --size must be between " << core::kMinBoardSize
                          << " and " << core::kMaxBoardSize << '\n';
                return failed;
            }
            cfg.boardSize = static_cast<int>(*n);
        } else if (opt == "--target") {
            const auto t = parseUnsigned(value);
            if (!t || *t > std::numeric_limits<core::TileValue>::max()
                   || !core::isValidTarget(static_cast<core::TileValue>(*t))) {
                std::cerr << "[app] --target must be 2048, 4096 or 8192\n";
                return failed;
            }
            cfg.target = static_cast<core::TileValue>(*t);
        } else if (opt == "--best-file") {
            cfg.bestScorePath = value;
        } else if (opt == "--seed") {
            const auto s = parseUnsigned(value);
            if (!s || *s > std::numeric_limits<std::uint32_t>::max()) {
                std::cerr << "[app] --seed must be a 32-bit unsigned integer\n";
                return failed;
            }
            cfg.seed = static_cast<std::uint32_t>(*s);
        } else {
            std::cerr << "[app] unknown option " << opt << '\n';
            return failed;
        }
    }

    return result;
}

CommandLine parseCommandLine(int argc, char** argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseCommandLine(args);
}

std::string usage(const std::string& program)
{
    std::ostringstream os;
    os << "Usage: " << program << " [options]\n"
       << "  --size N          board dimension (2-8, default 4)\n"
       << "  --target T        winning tile: 2048, 4096 or 8192 (default 2048)\n"
       << "  --best-file PATH  where the best score is kept (default best_score.dat)\n"
       << "  --seed S          fixed random seed\n"
       << "  --help            show this message\n";
    return os.str();
}

} // namespace game2048::app

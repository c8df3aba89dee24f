#include "engine/MetaSimulator.hpp"
#include "engine/ScenarioFactory.hpp"
#include "utils/Logger.hpp"
#include <csignal>
#include <iostream>

using namespace tokensim;

static CancellationToken g_cancel;

void signalHandler(int signal) {
    (void)signal;
    g_cancel.cancel();
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string configPath = "scenario.json";
    std::optional<int> iterations;
    std::optional<int> repetitions;
    std::optional<uint64_t> seed;
    std::optional<size_t> threads;
    std::optional<std::string> logLevel;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            }
            else if (arg == "--iterations" && i + 1 < argc) {
                iterations = std::stoi(argv[++i]);
            }
            else if (arg == "--repetitions" && i + 1 < argc) {
                repetitions = std::stoi(argv[++i]);
            }
            else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
            }
            else if (arg == "--threads" && i + 1 < argc) {
                threads = static_cast<size_t>(std::stoul(argv[++i]));
            }
            else if (arg == "--log-level" && i + 1 < argc) {
                logLevel = argv[++i];
            }
            else if (arg == "--help") {
                std::cout << "Token Economy Monte-Carlo Simulator\n"
                    << "Usage: token_sim [options]\n"
                    << "Options:\n"
                    << "  --config <path>         Scenario JSON file (default: scenario.json)\n"
                    << "  --iterations <n>        Steps per repetition (overrides run.iterations)\n"
                    << "  --repetitions <n>       Repetitions per scenario (overrides run.repetitions)\n"
                    << "  --seed <s>              Base seed; repetition r uses s XOR r\n"
                    << "  --threads <n>           Worker threads, 0 = all cores (default: 1)\n"
                    << "  --log-level <level>     trace, debug, info, warn, error, off\n"
                    << "  --help                  Show this help\n";
                return 0;
            }
            else {
                std::cerr << "Unknown option: " << arg << " (see --help)\n";
                return 1;
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Invalid command line: " << e.what() << "\n";
        return 1;
    }

    try {
        auto doc = ScenarioFactory::load(configPath);

        RunConfig& run = doc.run;
        if (iterations) run.iterations = *iterations;
        if (repetitions) run.repetitions = *repetitions;
        if (seed) run.seed = *seed;
        if (threads) run.threads = *threads;
        if (logLevel) run.logging.level = *logLevel;

        Logger::init(run.logging.file, run.logging.level, run.logging.console);
        Logger::info("Token simulator starting with {}", configPath);

        TokenMetaSimulator simulator;
        for (auto& scenario : doc.scenarios) {
            simulator.addScenario(scenario.name, std::move(scenario.economy));
        }

        ExecuteOptions options;
        options.seed = run.seed;
        options.threads = run.threads;
        options.cancellation = &g_cancel;

        simulator.execute(run.iterations, run.repetitions, options);

        for (const auto& name : simulator.getScenarioNames()) {
            const auto& economy = simulator.getScenario(name);
            auto stats = simulator.getRunStats(name);
            if (stats.successful == 0) {
                Logger::warn("{}: no completed repetitions", name);
                continue;
            }

            auto summary = simulator.getSummary(economy.getKeys().price, name);
            Logger::info("{}: {} price per {} across {} repetitions",
                name, economy.getTokenId(), unitOfTimeToString(economy.getUnitOfTime()), stats.successful);
            for (size_t step = 0; step < summary.mean.size(); ++step) {
                Logger::info("  step {:>4}  mean {:.6f}  median {:.6f}  q10 {:.6f}  q90 {:.6f}",
                    step, summary.mean[step], summary.median[step], summary.q10[step], summary.q90[step]);
            }

            for (const auto& row : simulator.getReport(name)) {
                Logger::debug("  {:<28} mean {:.6g}  std {:.6g}  min {:.6g}  max {:.6g}",
                    row.variable, row.mean, row.stddev, row.min, row.max);
            }
        }

        if (g_cancel.isCancelled()) {
            Logger::warn("Run cancelled; results cover completed repetitions only");
        }
        spdlog::shutdown();
    }
    catch (const std::exception& e) {
        Logger::error("{}", e.what());
        return 1;
    }

    return 0;
}

#include "MetaSimulator.hpp"
#include "utils/Logger.hpp"
#include "utils/Random.hpp"
#include "utils/Statistics.hpp"
#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <limits>
#include <stdexcept>
#include <thread>

namespace tokensim {

    namespace {

        enum class RepetitionStatus {
            PENDING,
            SUCCEEDED,
            FAILED,
            CANCELLED
        };

        struct RepetitionOutcome {
            RepetitionStatus status = RepetitionStatus::PENDING;
            History history;
            size_t clamps = 0;
            std::string error;
        };

    } // namespace

    // ---- DataTable -------------------------------------------------------------

    bool DataTable::hasVariable(const std::string& name) const {
        return std::find(variables_.begin(), variables_.end(), name) != variables_.end();
    }

    const std::vector<double>& DataTable::column(const std::string& name) const {
        auto it = std::find(variables_.begin(), variables_.end(), name);
        if (it == variables_.end()) {
            throw KeyNotFoundError(name);
        }
        return values_[static_cast<size_t>(it - variables_.begin())];
    }

    // ---- Scenarios -------------------------------------------------------------

    TokenMetaSimulator::TokenMetaSimulator(std::unique_ptr<TokenEconomy> economy) {
        if (!economy) {
            throw ConfigurationError("Null token economy");
        }
        std::string name = economy->getName();
        addScenario(name, std::move(economy));
    }

    void TokenMetaSimulator::addScenario(const std::string& name, std::unique_ptr<TokenEconomy> economy) {
        if (!economy) {
            throw ConfigurationError("Null token economy for scenario " + name);
        }
        std::string label = name.empty() ? economy->getName() : name;
        for (const auto& s : scenarios_) {
            if (s.name == label) {
                throw ConfigurationError("Duplicate scenario name: " + label);
            }
        }

        Logger::info("Added scenario {} (token {}, {} pools, {} supply controllers)",
            label, economy->getTokenId(), economy->getAgentPoolCount(), economy->getSupplyControllerCount());
        scenarios_.push_back({ label, std::move(economy) });
    }

    std::vector<std::string> TokenMetaSimulator::getScenarioNames() const {
        std::vector<std::string> names;
        names.reserve(scenarios_.size());
        for (const auto& s : scenarios_) names.push_back(s.name);
        return names;
    }

    const TokenEconomy& TokenMetaSimulator::getScenario(const std::string& name) const {
        for (const auto& s : scenarios_) {
            if (s.name == name) return *s.economy;
        }
        throw KeyNotFoundError(name);
    }

    UnitOfTime TokenMetaSimulator::getUnitOfTime() const {
        if (scenarios_.empty()) {
            throw ConfigurationError("No scenarios added");
        }
        return scenarios_.front().economy->getUnitOfTime();
    }

    // ---- Execution -------------------------------------------------------------

    void TokenMetaSimulator::execute(int iterations, int repetitions) {
        execute(iterations, repetitions, ExecuteOptions());
    }

    void TokenMetaSimulator::execute(int iterations, int repetitions, const ExecuteOptions& options) {
        if (iterations <= 0 || repetitions <= 0) {
            throw InvalidParameterError("Iterations and repetitions must be positive (got "
                + std::to_string(iterations) + " and " + std::to_string(repetitions) + ")");
        }
        if (scenarios_.empty()) {
            throw ConfigurationError("No scenarios to execute");
        }

        for (auto& s : scenarios_) {
            s.economy->prepare(static_cast<size_t>(iterations));
        }

        uint64_t baseSeed = options.seed ? *options.seed : Random::entropySeed();
        Logger::info("Executing {} scenario(s): {} iterations x {} repetitions, seed {}",
            scenarios_.size(), iterations, repetitions, baseSeed);

        {
            std::lock_guard<std::mutex> lock(resultsMutex_);
            results_.clear();
            iterations_ = iterations;
        }

        // Every scenario runs before a fully failed one is reported
        const Scenario* firstFailed = nullptr;
        RunStats failedStats;

        for (const auto& s : scenarios_) {
            auto result = runScenario(s, static_cast<size_t>(iterations),
                static_cast<size_t>(repetitions), baseSeed, options);
            const RunStats stats = result.stats;

            {
                std::lock_guard<std::mutex> lock(resultsMutex_);
                results_[s.name] = std::move(result);
            }

            Logger::info("{}: {} successful, {} failed, {} cancelled, {} supply clamps",
                s.name, stats.successful, stats.failed, stats.cancelled, stats.clamps);

            if (stats.failed == static_cast<size_t>(repetitions) && !firstFailed) {
                firstFailed = &s;
                failedStats = stats;
            }
        }

        if (firstFailed) {
            throw AllRepetitionsFailedError(firstFailed->name, static_cast<int>(failedStats.failed),
                repetitions, failedStats.lastFailure);
        }
    }

    TokenMetaSimulator::ScenarioResults TokenMetaSimulator::runScenario(const Scenario& scenario,
        size_t iterations, size_t repetitions, uint64_t baseSeed, const ExecuteOptions& options) const {

        size_t workers = options.threads == 0
            ? std::max<size_t>(1, std::thread::hardware_concurrency())
            : options.threads;
        workers = std::min(workers, repetitions);

        // One independent economy per worker
        std::vector<std::unique_ptr<TokenEconomy>> economies;
        economies.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            economies.push_back(scenario.economy->clone());
        }

        std::vector<RepetitionOutcome> outcomes(repetitions);
        std::atomic<size_t> next{ 0 };
        std::atomic<bool> aborted{ false };
        std::exception_ptr fatal;
        std::mutex fatalMutex;

        auto work = [&](TokenEconomy& economy) {
            while (!aborted.load()) {
                const size_t r = next.fetch_add(1);
                if (r >= repetitions) break;

                auto& out = outcomes[r];
                if (options.cancellation && options.cancellation->isCancelled()) {
                    out.status = RepetitionStatus::CANCELLED;
                    continue;
                }

                const uint64_t seed = baseSeed ^ static_cast<uint64_t>(r);
                Logger::debug("{}: repetition {} started (seed {})", scenario.name, r, seed);

                try {
                    economy.reset(seed);
                    for (size_t i = 0; i < iterations; ++i) {
                        economy.step();
                    }
                    out.history = economy.getData();
                    out.clamps = economy.getClampCount();
                    out.status = RepetitionStatus::SUCCEEDED;
                    Logger::debug("{}: repetition {} finished", scenario.name, r);
                }
                catch (const NumericalError& e) {
                    out.status = RepetitionStatus::FAILED;
                    out.clamps = economy.getClampCount();
                    out.error = e.what();
                    Logger::warn("{}: repetition {} aborted: {}", scenario.name, r, e.what());
                }
                catch (const std::exception&) {
                    std::lock_guard<std::mutex> lock(fatalMutex);
                    if (!fatal) fatal = std::current_exception();
                    aborted.store(true);
                }
            }
        };

        if (workers == 1) {
            work(*economies.front());
        } else {
            std::vector<std::thread> threads;
            threads.reserve(workers);
            for (size_t w = 0; w < workers; ++w) {
                threads.emplace_back(work, std::ref(*economies[w]));
            }
            for (auto& th : threads) th.join();
        }

        if (fatal) {
            std::rethrow_exception(fatal);
        }

        // Merge in repetition order
        ScenarioResults res;
        res.stats.seed = baseSeed;
        for (size_t r = 0; r < repetitions; ++r) {
            auto& out = outcomes[r];
            res.stats.clamps += out.clamps;

            switch (out.status) {
            case RepetitionStatus::FAILED:
                res.stats.failed++;
                res.stats.lastFailure = out.error;
                continue;
            case RepetitionStatus::CANCELLED:
            case RepetitionStatus::PENDING:
                res.stats.cancelled++;
                continue;
            case RepetitionStatus::SUCCEEDED:
                break;
            }

            const auto& names = out.history.columnNames();
            if (res.stats.successful == 0) {
                res.variables = names;
            } else if (names != res.variables) {
                throw std::logic_error(scenario.name + ": repetition " + std::to_string(r)
                    + " recorded a different variable set");
            }
            if (out.history.rows() != iterations) {
                throw std::logic_error(scenario.name + ": repetition " + std::to_string(r)
                    + " recorded " + std::to_string(out.history.rows()) + " steps instead of "
                    + std::to_string(iterations));
            }

            for (const auto& name : names) {
                res.series[name].push_back(out.history.column(name));
            }
            res.repetitions.push_back(r);
            res.stats.successful++;
        }

        return res;
    }

    // ---- Queries ---------------------------------------------------------------

    const TokenMetaSimulator::ScenarioResults& TokenMetaSimulator::resultsFor(const std::string& scenario) const {
        std::string name = scenario;
        if (name.empty()) {
            if (scenarios_.empty()) {
                throw ConfigurationError("No scenarios added");
            }
            name = scenarios_.front().name;
        }

        auto it = results_.find(name);
        if (it == results_.end()) {
            bool known = std::any_of(scenarios_.begin(), scenarios_.end(),
                [&](const Scenario& s) { return s.name == name; });
            if (!known) {
                throw KeyNotFoundError(name);
            }
            throw ConfigurationError("No results for scenario " + name + "; execute() has not completed it");
        }
        return it->second;
    }

    std::vector<std::vector<double>> TokenMetaSimulator::getTimeseries(const std::string& variable,
        const std::string& scenario) const {
        std::lock_guard<std::mutex> lock(resultsMutex_);
        const auto& res = resultsFor(scenario);
        auto it = res.series.find(variable);
        if (it == res.series.end()) {
            throw KeyNotFoundError(variable);
        }
        return it->second;
    }

    std::vector<size_t> TokenMetaSimulator::getRepetitionIndices(const std::string& scenario) const {
        std::lock_guard<std::mutex> lock(resultsMutex_);
        return resultsFor(scenario).repetitions;
    }

    RunStats TokenMetaSimulator::getRunStats(const std::string& scenario) const {
        std::lock_guard<std::mutex> lock(resultsMutex_);
        return resultsFor(scenario).stats;
    }

    StepSummary TokenMetaSimulator::getSummary(const std::string& variable, const std::string& scenario) const {
        const auto series = getTimeseries(variable, scenario);

        StepSummary summary;
        if (series.empty()) return summary;

        size_t steps = series.front().size();
        std::vector<double> values(series.size());
        for (size_t step = 0; step < steps; ++step) {
            for (size_t r = 0; r < series.size(); ++r) {
                values[r] = series[r][step];
            }
            summary.mean.push_back(Statistics::mean(values));
            summary.median.push_back(Statistics::median(values));
            summary.stddev.push_back(Statistics::stddev(values));
            summary.q10.push_back(Statistics::quantile(values, 0.1));
            summary.q90.push_back(Statistics::quantile(values, 0.9));
        }
        return summary;
    }

    std::vector<VariableReport> TokenMetaSimulator::getReport(const std::string& scenario,
        const ReportSegment& segment) const {
        std::lock_guard<std::mutex> lock(resultsMutex_);
        const auto& res = resultsFor(scenario);

        const size_t steps = static_cast<size_t>(iterations_);
        const size_t first = segment.firstStep;
        const size_t last = segment.lastStep.value_or(steps);
        if (first >= last || last > steps) {
            throw InvalidParameterError("Report window [" + std::to_string(first) + ", "
                + std::to_string(last) + ") does not fit " + std::to_string(steps) + " steps");
        }

        // Rows of the series to include
        std::vector<size_t> rows;
        if (segment.repetition) {
            auto it = std::find(res.repetitions.begin(), res.repetitions.end(), *segment.repetition);
            if (it == res.repetitions.end()) {
                throw InvalidParameterError("Repetition " + std::to_string(*segment.repetition)
                    + " has no results");
            }
            rows.push_back(static_cast<size_t>(it - res.repetitions.begin()));
        } else if (segment.lastRepetition) {
            if (!res.repetitions.empty()) {
                rows.push_back(res.repetitions.size() - 1);
            }
        } else {
            for (size_t k = 0; k < res.repetitions.size(); ++k) rows.push_back(k);
        }

        std::vector<VariableReport> report;
        report.reserve(res.variables.size());
        for (const auto& name : res.variables) {
            const auto& series = res.series.at(name);

            std::vector<double> means;
            means.reserve(rows.size());
            for (size_t k : rows) {
                const auto& run = series[k];
                means.push_back(Statistics::mean(std::vector<double>(
                    run.begin() + static_cast<std::ptrdiff_t>(first),
                    run.begin() + static_cast<std::ptrdiff_t>(last))));
            }

            VariableReport row;
            row.variable = name;
            row.mean = Statistics::mean(means);
            row.stddev = Statistics::stddev(means);
            row.min = Statistics::min(means);
            row.max = Statistics::max(means);
            row.q10 = Statistics::quantile(means, 0.1);
            row.q90 = Statistics::quantile(means, 0.9);
            report.push_back(row);
        }
        return report;
    }

    DataTable TokenMetaSimulator::getData() const {
        std::lock_guard<std::mutex> lock(resultsMutex_);

        DataTable table;
        for (const auto& s : scenarios_) {
            auto it = results_.find(s.name);
            if (it == results_.end()) continue;
            for (const auto& name : it->second.variables) {
                if (!table.hasVariable(name)) table.variables_.push_back(name);
            }
        }
        table.values_.resize(table.variables_.size());

        const double missing = std::numeric_limits<double>::quiet_NaN();
        for (const auto& s : scenarios_) {
            auto it = results_.find(s.name);
            if (it == results_.end()) continue;
            const auto& res = it->second;

            for (size_t k = 0; k < res.repetitions.size(); ++k) {
                for (size_t step = 0; step < static_cast<size_t>(iterations_); ++step) {
                    table.scenario_.push_back(s.name);
                    table.repetition_.push_back(res.repetitions[k]);
                    table.step_.push_back(step);

                    for (size_t v = 0; v < table.variables_.size(); ++v) {
                        auto col = res.series.find(table.variables_[v]);
                        table.values_[v].push_back(col == res.series.end() ? missing : col->second[k][step]);
                    }
                }
            }
        }
        return table;
    }

} // namespace tokensim

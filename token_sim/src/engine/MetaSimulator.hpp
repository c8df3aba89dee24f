#pragma once

#include "TokenEconomy.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tokensim {

    // Cooperative stop flag, checked between repetitions only
    class CancellationToken {
    public:
        void cancel() { cancelled_.store(true); }
        void reset() { cancelled_.store(false); }
        bool isCancelled() const { return cancelled_.load(); }

    private:
        std::atomic<bool> cancelled_{ false };
    };

    struct ExecuteOptions {
        std::optional<uint64_t> seed;       // drawn from the OS when absent
        size_t threads = 1;                 // 0 = hardware concurrency
        const CancellationToken* cancellation = nullptr;
    };

    struct RunStats {
        size_t successful = 0;
        size_t failed = 0;
        size_t cancelled = 0;
        size_t clamps = 0;
        uint64_t seed = 0;
        std::string lastFailure;
    };

    // Per-step distribution of one variable across repetitions
    struct StepSummary {
        std::vector<double> mean;
        std::vector<double> median;
        std::vector<double> stddev;
        std::vector<double> q10;
        std::vector<double> q90;
    };

    // Distribution across repetitions of each repetition's mean
    struct VariableReport {
        std::string variable;
        double mean = 0.0;
        double stddev = 0.0;
        double min = 0.0;
        double max = 0.0;
        double q10 = 0.0;
        double q90 = 0.0;
    };

    // Restricts getReport to a step window [firstStep, lastStep) and
    // optionally to a single successful repetition
    struct ReportSegment {
        size_t firstStep = 0;
        std::optional<size_t> lastStep;
        std::optional<size_t> repetition;
        bool lastRepetition = false;

        static ReportSegment steps(size_t first, size_t last) {
            ReportSegment s;
            s.firstStep = first;
            s.lastStep = last;
            return s;
        }

        static ReportSegment only(size_t repetition) {
            ReportSegment s;
            s.repetition = repetition;
            return s;
        }

        static ReportSegment last() {
            ReportSegment s;
            s.lastRepetition = true;
            return s;
        }
    };

    // Long-format table: one row per (scenario, repetition, step).
    // Variables a scenario never produced hold NaN.
    class DataTable {
    public:
        size_t rows() const { return step_.size(); }

        const std::vector<std::string>& getScenarios() const { return scenario_; }
        const std::vector<size_t>& getRepetitions() const { return repetition_; }
        const std::vector<size_t>& getSteps() const { return step_; }

        const std::vector<std::string>& getVariables() const { return variables_; }
        bool hasVariable(const std::string& name) const;
        const std::vector<double>& column(const std::string& name) const;

    private:
        friend class TokenMetaSimulator;

        std::vector<std::string> scenario_;
        std::vector<size_t> repetition_;
        std::vector<size_t> step_;
        std::vector<std::string> variables_;
        std::vector<std::vector<double>> values_;
    };

    // Monte-Carlo driver: runs every scenario for a number of repetitions and
    // keeps the repetition x step series of every recorded variable.
    class TokenMetaSimulator {
    public:
        TokenMetaSimulator() = default;
        explicit TokenMetaSimulator(std::unique_ptr<TokenEconomy> economy);

        void addScenario(const std::string& name, std::unique_ptr<TokenEconomy> economy);

        void execute(int iterations, int repetitions);
        void execute(int iterations, int repetitions, const ExecuteOptions& options);

        // Queries; an empty scenario name means the first scenario.
        // Results are copies, so they stay valid across later execute() calls.
        std::vector<std::vector<double>> getTimeseries(const std::string& variable,
            const std::string& scenario = "") const;
        DataTable getData() const;
        StepSummary getSummary(const std::string& variable, const std::string& scenario = "") const;
        std::vector<VariableReport> getReport(const std::string& scenario = "",
            const ReportSegment& segment = ReportSegment()) const;
        RunStats getRunStats(const std::string& scenario = "") const;

        // Repetition index behind each row of getTimeseries
        std::vector<size_t> getRepetitionIndices(const std::string& scenario = "") const;

        UnitOfTime getUnitOfTime() const;
        std::vector<std::string> getScenarioNames() const;
        const TokenEconomy& getScenario(const std::string& name) const;
        int getIterations() const { return iterations_; }

    private:
        struct Scenario {
            std::string name;
            std::unique_ptr<TokenEconomy> economy;
        };

        struct ScenarioResults {
            std::vector<std::string> variables;
            std::map<std::string, std::vector<std::vector<double>>> series;
            std::vector<size_t> repetitions;
            RunStats stats;
        };

        std::vector<Scenario> scenarios_;
        std::map<std::string, ScenarioResults> results_;
        int iterations_ = 0;
        mutable std::mutex resultsMutex_;

        ScenarioResults runScenario(const Scenario& scenario, size_t iterations, size_t repetitions,
            uint64_t baseSeed, const ExecuteOptions& options) const;
        const ScenarioResults& resultsFor(const std::string& scenario) const;
    };

} // namespace tokensim

#pragma once

#include <stdexcept>
#include <string>

namespace tokensim {

    // Root of every error the simulator raises on purpose
    class SimulationError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Bad wiring: missing price function, schedule/iteration mismatch, unknown styles.
    // Fatal to construction or first use, never retried.
    class ConfigurationError : public SimulationError {
    public:
        using SimulationError::SimulationError;
    };

    // Non-finite price or supply mid-run. Fatal to the current repetition only.
    class NumericalError : public SimulationError {
    public:
        using SimulationError::SimulationError;
    };

    // Non-positive iterations or repetitions handed to execute()
    class InvalidParameterError : public SimulationError {
    public:
        using SimulationError::SimulationError;
    };

    // Every repetition of a scenario failed numerically. Raised by execute()
    // after all scenarios ran, so their results stay queryable.
    class AllRepetitionsFailedError : public SimulationError {
    public:
        AllRepetitionsFailedError(const std::string& scenario, int failures, int repetitions,
            const std::string& lastReason)
            : SimulationError("Scenario " + scenario + ": all " + std::to_string(repetitions)
                + " repetitions failed; last error: " + lastReason)
            , scenario_(scenario)
            , failures_(failures)
            , repetitions_(repetitions)
        {
        }

        const std::string& getScenario() const { return scenario_; }
        int getFailures() const { return failures_; }
        int getRepetitions() const { return repetitions_; }

    private:
        std::string scenario_;
        int failures_;
        int repetitions_;
    };

    class KeyNotFoundError : public SimulationError {
    public:
        explicit KeyNotFoundError(const std::string& key)
            : SimulationError("Unknown variable: " + key)
            , key_(key)
        {
        }

        const std::string& getKey() const { return key_; }

    private:
        std::string key_;
    };

} // namespace tokensim

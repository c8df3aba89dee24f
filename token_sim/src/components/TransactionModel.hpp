#pragma once

#include "AddOn.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tokensim {

    // Aggregate transaction volume of one cohort per step. ctx.users holds the
    // owning pool's users for the step. Negative volume means selling.
    class TransactionModel {
    public:
        virtual ~TransactionModel() = default;

        virtual double nextVolume(const StepContext& ctx) = 0;

        virtual void reset() = 0;

        virtual std::string getType() const = 0;

        virtual std::unique_ptr<TransactionModel> clone() const = 0;

        // Number of transactions behind the last volume
        double lastTransactionCount() const { return lastTransactionCount_; }

    protected:
        double lastTransactionCount_ = 0.0;
    };

    // users x valuePerUser
    class ConstantTransactions : public TransactionModel {
    public:
        explicit ConstantTransactions(double valuePerUser, AddOnChain noise = AddOnChain());

        double nextVolume(const StepContext& ctx) override;
        void reset() override;
        std::string getType() const override { return "ConstantTransactions"; }
        std::unique_ptr<TransactionModel> clone() const override { return std::make_unique<ConstantTransactions>(*this); }

    private:
        double valuePerUser_;
        AddOnChain noise_;
    };

    // Replays a volume series regardless of users
    class FromDataTransactions : public TransactionModel {
    public:
        explicit FromDataTransactions(std::vector<double> volumes);

        double nextVolume(const StepContext& ctx) override;
        void reset() override;
        std::string getType() const override { return "FromDataTransactions"; }
        std::unique_ptr<TransactionModel> clone() const override { return std::make_unique<FromDataTransactions>(*this); }

    private:
        std::vector<double> volumes_;
        size_t iteration_ = 0;
    };

    // Spaced per-user mean between initialMean and finalMean
    class TrendTransactions : public TransactionModel {
    public:
        TrendTransactions(double initialMean, double finalMean, size_t numSteps,
            SpaceFunction space = SpaceFunction::LINEAR,
            AddOnChain noise = AddOnChain());

        double nextVolume(const StepContext& ctx) override;
        void reset() override;
        std::string getType() const override { return "TrendTransactions"; }
        std::unique_ptr<TransactionModel> clone() const override { return std::make_unique<TrendTransactions>(*this); }

    private:
        std::vector<double> means_;
        AddOnChain noise_;
        size_t iteration_ = 0;
    };

    struct StochasticTransactionParams {
        // Per-step probability that a user is active; a single entry applies to every step
        std::vector<double> activityProbabilities{ 1.0 };

        // Fixed values override the distributions
        std::optional<double> transactionsPerUser;
        Distribution transactionsDistribution = Distribution::poisson(1.0);

        std::optional<double> valuePerTransaction;
        Distribution valueDistribution = Distribution::normal(1.0, 10.0);

        SignPolicy sign = SignPolicy::POSITIVE;
        size_t meanSamples = 1000;
    };

    // active users ~ Binomial(users, p); volume = active x transactions x value
    class StochasticTransactions : public TransactionModel {
    public:
        explicit StochasticTransactions(StochasticTransactionParams params = StochasticTransactionParams());

        double nextVolume(const StepContext& ctx) override;
        void reset() override;
        std::string getType() const override { return "StochasticTransactions"; }
        std::unique_ptr<TransactionModel> clone() const override { return std::make_unique<StochasticTransactions>(*this); }

        double getActiveUsers() const { return activeUsers_; }

    private:
        StochasticTransactionParams params_;
        double activeUsers_ = 0.0;
        size_t iteration_ = 0;
    };

    // A random fraction of market cap (price x supply) changes hands
    class MarketcapTransactions : public TransactionModel {
    public:
        explicit MarketcapTransactions(const Distribution& fraction = Distribution::normal(0.0, 0.25),
            SignPolicy sign = SignPolicy::ANY);

        double nextVolume(const StepContext& ctx) override;
        void reset() override { lastTransactionCount_ = 0.0; }
        std::string getType() const override { return "MarketcapTransactions"; }
        std::unique_ptr<TransactionModel> clone() const override { return std::make_unique<MarketcapTransactions>(*this); }

    private:
        Distribution fraction_;
        SignPolicy sign_;
    };

} // namespace tokensim

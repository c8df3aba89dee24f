#pragma once

#include "AddOn.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tokensim {

    // User-count dynamics of one agent pool. Called once per active step.
    class UserGrowth {
    public:
        virtual ~UserGrowth() = default;

        virtual double nextUsers(const StepContext& ctx) = 0;

        virtual void reset() = 0;

        virtual std::string getType() const = 0;

        virtual std::unique_ptr<UserGrowth> clone() const = 0;
    };

    class ConstantUserGrowth : public UserGrowth {
    public:
        explicit ConstantUserGrowth(double users);

        double nextUsers(const StepContext&) override { return users_; }
        void reset() override {}
        std::string getType() const override { return "ConstantUserGrowth"; }
        std::unique_ptr<UserGrowth> clone() const override { return std::make_unique<ConstantUserGrowth>(*this); }

    private:
        double users_;
    };

    // Replays a user series; the last value repeats once it is exhausted
    class FromDataUserGrowth : public UserGrowth {
    public:
        explicit FromDataUserGrowth(std::vector<double> users);

        double nextUsers(const StepContext& ctx) override;
        void reset() override { iteration_ = 0; }
        std::string getType() const override { return "FromDataUserGrowth"; }
        std::unique_ptr<UserGrowth> clone() const override { return std::make_unique<FromDataUserGrowth>(*this); }

    private:
        std::vector<double> users_;
        size_t iteration_ = 0;
    };

    // Users spaced between initial and max over a fixed number of steps.
    // Noise is drawn per step, so every repetition sees a fresh noisy schedule.
    class SpacedUserGrowth : public UserGrowth {
    public:
        SpacedUserGrowth(double initialUsers, double maxUsers, size_t numSteps,
            SpaceFunction space = SpaceFunction::LINEAR,
            bool useDifference = false,
            AddOnChain noise = AddOnChain());

        double nextUsers(const StepContext& ctx) override;
        void reset() override;
        std::string getType() const override { return "SpacedUserGrowth"; }
        std::unique_ptr<UserGrowth> clone() const override { return std::make_unique<SpacedUserGrowth>(*this); }

        const std::vector<double>& getSchedule() const { return schedule_; }

    private:
        std::vector<double> schedule_;
        AddOnChain noise_;
        size_t iteration_ = 0;
    };

    // Draws the user count (or its increment) from a distribution every step
    class StochasticUserGrowth : public UserGrowth {
    public:
        // One parameter set per step; the last one repeats when exhausted
        StochasticUserGrowth(DistributionKind kind,
            std::vector<DistributionParams> params,
            bool addToUserbase = false,
            double initialUsers = 0.0,
            AddOnChain noise = AddOnChain());

        explicit StochasticUserGrowth(const Distribution& dist = Distribution::poisson(1000.0),
            bool addToUserbase = false,
            double initialUsers = 0.0,
            AddOnChain noise = AddOnChain());

        double nextUsers(const StepContext& ctx) override;
        void reset() override;
        std::string getType() const override { return "StochasticUserGrowth"; }
        std::unique_ptr<UserGrowth> clone() const override { return std::make_unique<StochasticUserGrowth>(*this); }

    private:
        DistributionKind kind_;
        std::vector<DistributionParams> params_;
        bool addToUserbase_;
        double initialUsers_;
        AddOnChain noise_;

        double users_;
        size_t iteration_ = 0;
    };

} // namespace tokensim

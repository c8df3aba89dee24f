#include "UserGrowth.hpp"
#include "core/Sequences.hpp"
#include <algorithm>

namespace tokensim {

    ConstantUserGrowth::ConstantUserGrowth(double users)
        : users_(users)
    {
        if (users_ < 0.0) {
            throw ConfigurationError("Constant user count must be non-negative");
        }
    }

    // ---- FromData --------------------------------------------------------------

    FromDataUserGrowth::FromDataUserGrowth(std::vector<double> users)
        : users_(std::move(users))
    {
        if (users_.empty()) {
            throw ConfigurationError("User data series is empty");
        }
    }

    double FromDataUserGrowth::nextUsers(const StepContext&) {
        size_t idx = std::min(iteration_, users_.size() - 1);
        ++iteration_;
        return std::max(0.0, users_[idx]);
    }

    // ---- Spaced ----------------------------------------------------------------

    SpacedUserGrowth::SpacedUserGrowth(double initialUsers, double maxUsers, size_t numSteps,
        SpaceFunction space, bool useDifference, AddOnChain noise)
        : noise_(std::move(noise))
    {
        if (numSteps == 0) {
            throw ConfigurationError("Spaced user growth needs at least one step");
        }

        auto spaced = Sequences::rounded(Sequences::generate(space, initialUsers, maxUsers, numSteps));

        if (useDifference) {
            schedule_.reserve(spaced.size() + 1);
            schedule_.push_back(initialUsers);
            for (size_t i = 1; i < spaced.size(); ++i) {
                schedule_.push_back(spaced[i] - spaced[i - 1]);
            }
        } else {
            schedule_ = std::move(spaced);
        }
    }

    double SpacedUserGrowth::nextUsers(const StepContext& ctx) {
        size_t idx = std::min(iteration_, schedule_.size() - 1);
        ++iteration_;

        double users = noise_.apply(schedule_[idx], ctx);
        return std::max(0.0, users);
    }

    void SpacedUserGrowth::reset() {
        iteration_ = 0;
        noise_.reset();
    }

    // ---- Stochastic ------------------------------------------------------------

    StochasticUserGrowth::StochasticUserGrowth(DistributionKind kind,
        std::vector<DistributionParams> params,
        bool addToUserbase, double initialUsers, AddOnChain noise)
        : kind_(kind)
        , params_(std::move(params))
        , addToUserbase_(addToUserbase)
        , initialUsers_(initialUsers)
        , noise_(std::move(noise))
        , users_(initialUsers)
    {
        if (params_.empty()) {
            throw ConfigurationError("Stochastic user growth needs distribution parameters");
        }
        for (const auto& p : params_) {
            validateDistribution(kind_, p);
        }
    }

    StochasticUserGrowth::StochasticUserGrowth(const Distribution& dist,
        bool addToUserbase, double initialUsers, AddOnChain noise)
        : StochasticUserGrowth(dist.kind, std::vector<DistributionParams>{dist.params},
            addToUserbase, initialUsers, std::move(noise))
    {
    }

    double StochasticUserGrowth::nextUsers(const StepContext& ctx) {
        const auto& params = params_[std::min(iteration_, params_.size() - 1)];
        ++iteration_;

        double draw = ctx.sampler.sampleOne(kind_, params);
        users_ = addToUserbase_ ? users_ + draw : draw;
        users_ = std::max(0.0, noise_.apply(users_, ctx));
        return users_;
    }

    void StochasticUserGrowth::reset() {
        users_ = initialUsers_;
        iteration_ = 0;
        noise_.reset();
    }

} // namespace tokensim

#include "TransactionModel.hpp"
#include "core/Sequences.hpp"
#include <algorithm>
#include <cmath>

namespace tokensim {

    ConstantTransactions::ConstantTransactions(double valuePerUser, AddOnChain noise)
        : valuePerUser_(valuePerUser)
        , noise_(std::move(noise))
    {
    }

    double ConstantTransactions::nextVolume(const StepContext& ctx) {
        lastTransactionCount_ = ctx.users;
        return noise_.apply(ctx.users * valuePerUser_, ctx);
    }

    void ConstantTransactions::reset() {
        lastTransactionCount_ = 0.0;
        noise_.reset();
    }

    // ---- FromData --------------------------------------------------------------

    FromDataTransactions::FromDataTransactions(std::vector<double> volumes)
        : volumes_(std::move(volumes))
    {
        if (volumes_.empty()) {
            throw ConfigurationError("Transaction data series is empty");
        }
    }

    double FromDataTransactions::nextVolume(const StepContext&) {
        size_t idx = std::min(iteration_, volumes_.size() - 1);
        ++iteration_;
        lastTransactionCount_ = 1.0;
        return volumes_[idx];
    }

    void FromDataTransactions::reset() {
        iteration_ = 0;
        lastTransactionCount_ = 0.0;
    }

    // ---- Trend -----------------------------------------------------------------

    TrendTransactions::TrendTransactions(double initialMean, double finalMean, size_t numSteps,
        SpaceFunction space, AddOnChain noise)
        : means_(Sequences::generate(space, initialMean, finalMean, numSteps))
        , noise_(std::move(noise))
    {
        if (numSteps == 0) {
            throw ConfigurationError("Transaction trend needs at least one step");
        }
    }

    double TrendTransactions::nextVolume(const StepContext& ctx) {
        double mean = means_[std::min(iteration_, means_.size() - 1)];
        ++iteration_;

        double noisy = noise_.apply(mean, ctx);
        if (noisy < 0.0) {
            noisy = mean;
        }

        lastTransactionCount_ = ctx.users;
        return noisy * ctx.users;
    }

    void TrendTransactions::reset() {
        iteration_ = 0;
        lastTransactionCount_ = 0.0;
        noise_.reset();
    }

    // ---- Stochastic ------------------------------------------------------------

    StochasticTransactions::StochasticTransactions(StochasticTransactionParams params)
        : params_(std::move(params))
    {
        if (params_.activityProbabilities.empty()) {
            throw ConfigurationError("Activity probabilities are empty");
        }
        for (double p : params_.activityProbabilities) {
            if (p < 0.0 || p > 1.0) {
                throw ConfigurationError("Activity probability must lie in [0, 1]");
            }
        }
        if (!params_.transactionsPerUser) {
            validateDistribution(params_.transactionsDistribution);
        }
        if (!params_.valuePerTransaction) {
            validateDistribution(params_.valueDistribution);
        }
        if (params_.meanSamples == 0) {
            throw ConfigurationError("Mean sample count must be positive");
        }
    }

    double StochasticTransactions::nextVolume(const StepContext& ctx) {
        const auto& probs = params_.activityProbabilities;
        double p = probs[std::min(iteration_, probs.size() - 1)];
        ++iteration_;

        auto users = static_cast<int64_t>(std::max(0.0, ctx.users));
        activeUsers_ = ctx.sampler.sampleOne(Distribution::binomial(users, p));

        double trans = params_.transactionsPerUser
            ? *params_.transactionsPerUser
            : ctx.sampler.sampleMean(params_.transactionsDistribution, params_.meanSamples);

        double value = params_.valuePerTransaction
            ? *params_.valuePerTransaction
            : ctx.sampler.sampleMean(params_.valueDistribution, params_.meanSamples);

        lastTransactionCount_ = trans * activeUsers_;
        double total = trans * value * activeUsers_;

        if (total < 0.0 && params_.sign == SignPolicy::POSITIVE) {
            total = 0.0;
        } else if (total > 0.0 && params_.sign == SignPolicy::NEGATIVE) {
            total = 0.0;
        }
        return total;
    }

    void StochasticTransactions::reset() {
        iteration_ = 0;
        activeUsers_ = 0.0;
        lastTransactionCount_ = 0.0;
    }

    // ---- Marketcap -------------------------------------------------------------

    MarketcapTransactions::MarketcapTransactions(const Distribution& fraction, SignPolicy sign)
        : fraction_(fraction)
        , sign_(sign)
    {
        validateDistribution(fraction_);
    }

    double MarketcapTransactions::nextVolume(const StepContext& ctx) {
        double marketcap = ctx.price * ctx.supply;
        double volume = ctx.sampler.sampleOne(fraction_) * marketcap;

        switch (sign_) {
        case SignPolicy::ANY: break;
        case SignPolicy::POSITIVE: volume = std::abs(volume); break;
        case SignPolicy::NEGATIVE: volume = -std::abs(volume); break;
        }

        lastTransactionCount_ = 1.0;
        return volume;
    }

} // namespace tokensim

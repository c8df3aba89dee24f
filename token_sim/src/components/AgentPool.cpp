#include "AgentPool.hpp"
#include <cmath>

namespace tokensim {

    AgentPool::AgentPool(std::string name,
        std::string currency,
        std::unique_ptr<UserGrowth> users,
        std::unique_ptr<TransactionModel> transactions,
        StepIndex activationStep)
        : name_(std::move(name))
        , currency_(std::move(currency))
        , userGrowth_(std::move(users))
        , transactions_(std::move(transactions))
        , activationStep_(activationStep)
    {
        if (name_.empty()) {
            throw ConfigurationError("Agent pool needs a name");
        }
        if (currency_.empty()) {
            throw ConfigurationError("Agent pool " + name_ + " needs a currency");
        }
        if (!userGrowth_ || !transactions_) {
            throw ConfigurationError("Agent pool " + name_ + " needs user growth and transaction models");
        }
    }

    AgentPool::AgentPool(const AgentPool& other)
        : name_(other.name_)
        , currency_(other.currency_)
        , userGrowth_(other.userGrowth_->clone())
        , transactions_(other.transactions_->clone())
        , activationStep_(other.activationStep_)
        , dumper_(other.dumper_)
        , chainedTo_(other.chainedTo_)
        , fee_(other.fee_)
        , feeStyle_(other.feeStyle_)
        , users_(other.users_)
        , volume_(other.volume_)
        , transactionCount_(other.transactionCount_)
    {
    }

    void AgentPool::chainTo(std::string poolName) {
        if (poolName == name_) {
            throw ConfigurationError("Agent pool " + name_ + " cannot chain to itself");
        }
        chainedTo_ = std::move(poolName);
    }

    void AgentPool::setFee(double fee, SupplyStyle style) {
        if (!std::isfinite(fee) || fee < 0.0) {
            throw ConfigurationError("Agent pool " + name_ + " needs a finite non-negative fee");
        }
        fee_ = fee;
        feeStyle_ = style;
    }

    void AgentPool::step(const StepContext& ctx) {
        if (ctx.step < activationStep_) {
            users_ = 0.0;
            volume_ = 0.0;
            transactionCount_ = 0.0;
            return;
        }

        users_ = userGrowth_->nextUsers(ctx);
        trade(ctx);
    }

    void AgentPool::stepChained(const StepContext& ctx, double users) {
        if (ctx.step < activationStep_) {
            users_ = 0.0;
            volume_ = 0.0;
            transactionCount_ = 0.0;
            return;
        }

        users_ = users;
        trade(ctx);
    }

    void AgentPool::trade(const StepContext& ctx) {
        volume_ = transactions_->nextVolume(ctx.withUsers(users_));
        transactionCount_ = transactions_->lastTransactionCount();

        // Dumpers only ever sell
        if (dumper_) {
            volume_ = -std::abs(volume_);
        }
    }

    double AgentPool::feeAmount() const {
        if (fee_ <= 0.0) return 0.0;
        return feeStyle_ == SupplyStyle::PERCENTAGE
            ? std::abs(volume_) * fee_
            : transactionCount_ * fee_;
    }

    void AgentPool::reset() {
        userGrowth_->reset();
        transactions_->reset();
        users_ = 0.0;
        volume_ = 0.0;
        transactionCount_ = 0.0;
    }

} // namespace tokensim

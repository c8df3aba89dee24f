#pragma once

#include "UserGrowth.hpp"
#include "TransactionModel.hpp"
#include <memory>
#include <string>

namespace tokensim {

    // One cohort: a user-growth model plus the transaction model it drives.
    // Advances exactly once per economy step; reports nothing before its
    // activation step.
    class AgentPool {
    public:
        AgentPool(std::string name,
            std::string currency,
            std::unique_ptr<UserGrowth> users,
            std::unique_ptr<TransactionModel> transactions,
            StepIndex activationStep = 0);

        AgentPool(const AgentPool& other);
        AgentPool& operator=(const AgentPool&) = delete;
        virtual ~AgentPool() = default;

        void step(const StepContext& ctx);

        // Chained pools reuse another pool's user count instead of growing their own
        void stepChained(const StepContext& ctx, double users);

        void reset();

        virtual std::string getType() const { return "AgentPool"; }
        virtual std::unique_ptr<AgentPool> clone() const { return std::make_unique<AgentPool>(*this); }

        // Purchased tokens leave circulation instead of staying in the float
        virtual bool burnsPurchases() const { return false; }

        // Options
        void setDumper(bool dumper) { dumper_ = dumper; }
        void chainTo(std::string poolName);
        void setFee(double fee, SupplyStyle style = SupplyStyle::PERCENTAGE);

        const std::string& getName() const { return name_; }
        const std::string& getCurrency() const { return currency_; }
        StepIndex getActivationStep() const { return activationStep_; }
        bool isDumper() const { return dumper_; }
        bool isChained() const { return !chainedTo_.empty(); }
        const std::string& getChainedTo() const { return chainedTo_; }
        bool hasFee() const { return fee_ > 0.0; }
        double getFee() const { return fee_; }
        SupplyStyle getFeeStyle() const { return feeStyle_; }

        double getUsers() const { return users_; }
        double getVolume() const { return volume_; }
        double getTransactionCount() const { return transactionCount_; }

        // Fee owed to the treasury for the last step, in the pool's currency
        double feeAmount() const;

        const UserGrowth& getUserGrowth() const { return *userGrowth_; }
        const TransactionModel& getTransactionModel() const { return *transactions_; }

        std::string usersKey() const { return name_ + "_users"; }
        std::string transactionsKey() const { return name_ + "_transactions"; }

    private:
        std::string name_;
        std::string currency_;
        std::unique_ptr<UserGrowth> userGrowth_;
        std::unique_ptr<TransactionModel> transactions_;
        StepIndex activationStep_;

        bool dumper_ = false;
        std::string chainedTo_;
        double fee_ = 0.0;
        SupplyStyle feeStyle_ = SupplyStyle::PERCENTAGE;

        double users_ = 0.0;
        double volume_ = 0.0;
        double transactionCount_ = 0.0;

        void trade(const StepContext& ctx);
    };

    // Spends its volume buying tokens back; the economy burns whatever it buys
    // through a one-shot fixed burn in the same step.
    class BuyBackAgentPool : public AgentPool {
    public:
        using AgentPool::AgentPool;

        std::string getType() const override { return "BuyBackAgentPool"; }
        std::unique_ptr<AgentPool> clone() const override { return std::make_unique<BuyBackAgentPool>(*this); }
        bool burnsPurchases() const override { return true; }
    };

} // namespace tokensim

#pragma once

#include "core/Types.hpp"
#include "core/History.hpp"
#include "core/Sampler.hpp"
#include "components/AddOn.hpp"
#include "components/AgentPool.hpp"
#include "components/HoldingTimeModel.hpp"
#include "components/PriceFunction.hpp"
#include "components/SupplyController.hpp"
#include "components/Treasury.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tokensim {

    // Static description of one economy
    struct EconomyConfig {
        std::string tokenId;
        std::string fiat = "$";
        UnitOfTime unitOfTime = UnitOfTime::DAY;
        Price initialPrice = 0.0;
        Amount initialSupply = 0.0;

        // When non-empty, the baseline supply of step i is supplySchedule[i]
        // and its length must equal the planned iteration count
        std::vector<Amount> supplySchedule;

        // Treat the schedule as per-step additions to the carried supply
        bool scheduleIsAdded = false;

        // From step 1 on, cap the step's token volume at the carried supply
        bool safeguardSupply = false;

        // Burn the transacted token volume from the supply carried forward
        bool burnToken = false;

        // Scenario label; the token id when empty
        std::string name;
    };

    // Single-run state container and stepper. Wiring is added after
    // construction; reset() returns it to step 0 with the wiring intact.
    class TokenEconomy {
    public:
        explicit TokenEconomy(EconomyConfig config, std::unique_ptr<Sampler> sampler = nullptr);

        TokenEconomy(const TokenEconomy& other);
        TokenEconomy& operator=(const TokenEconomy&) = delete;

        // Wiring
        void addAgentPool(std::unique_ptr<AgentPool> pool);
        void addSupplyController(std::unique_ptr<SupplyController> controller);
        void setPriceFunction(std::unique_ptr<PriceFunction> priceFunction);
        void setHoldingTimeModel(std::unique_ptr<HoldingTimeModel> model);
        void addAddOn(const std::string& target, std::unique_ptr<AddOn> addOn);

        // Validates wiring and fixes the planned iteration count
        void prepare(size_t iterations);

        // Back to step 0: clears history, resets components, reseeds the sampler
        void reset(uint64_t seed);

        // Advances one step and appends one row to the history
        void step();

        // prepare + reset + step loop
        const History& run(size_t iterations, uint64_t seed);

        std::unique_ptr<TokenEconomy> clone() const { return std::make_unique<TokenEconomy>(*this); }

        // State
        const History& getData() const { return history_; }
        StepIndex getStep() const { return step_; }
        size_t getPlannedIterations() const { return planned_; }
        bool isPrepared() const { return prepared_; }
        Price getPrice() const { return price_; }
        Amount getSupply() const { return supply_; }
        double getHoldingTime() const { return holdingTime_; }
        size_t getClampCount() const { return clampCount_; }
        const Treasury& getTreasury() const { return treasury_; }

        // Configuration
        const EconomyConfig& getConfig() const { return config_; }
        const std::string& getName() const { return config_.name; }
        const std::string& getTokenId() const { return config_.tokenId; }
        UnitOfTime getUnitOfTime() const { return config_.unitOfTime; }
        const VariableKeys& getKeys() const { return keys_; }

        size_t getAgentPoolCount() const { return pools_.size(); }
        const AgentPool& getAgentPool(size_t index) const { return *pools_.at(index); }
        size_t getSupplyControllerCount() const { return controllers_.size(); }
        bool hasPriceFunction() const { return priceFunction_ != nullptr; }
        bool hasTreasury() const;

    private:
        struct TargetedAddOn {
            std::string target;
            std::unique_ptr<AddOn> addOn;
        };

        EconomyConfig config_;
        VariableKeys keys_;
        std::unique_ptr<Sampler> sampler_;

        std::vector<std::unique_ptr<AgentPool>> pools_;
        std::vector<std::unique_ptr<SupplyController>> controllers_;
        std::unique_ptr<PriceFunction> priceFunction_;
        std::unique_ptr<HoldingTimeModel> holdingModel_;
        std::vector<TargetedAddOn> addOns_;

        // Index of the pool each chained pool reads users from, -1 otherwise
        std::vector<int> chainSources_;
        Treasury treasury_;

        History history_;
        StepIndex step_ = 0;
        size_t planned_ = 0;
        bool prepared_ = false;

        Price price_;
        Amount supply_;
        double holdingTime_ = 0.0;
        size_t clampCount_ = 0;

        void advance();
        Amount baselineSupply() const;
        Amount applyDelta(Amount supply, double delta, const std::string& source);
        Amount checkSupply(Amount supply, const char* stage);
        Price checkPrice(Price price, const char* stage);
        std::vector<std::string> knownVariables() const;
    };

} // namespace tokensim

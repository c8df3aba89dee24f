#pragma once

#include "TokenEconomy.hpp"
#include "core/RunConfig.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace tokensim {

    struct NamedEconomy {
        std::string name;
        std::unique_ptr<TokenEconomy> economy;
    };

    // Everything one configuration file describes
    struct ScenarioDocument {
        RunConfig run;
        std::vector<NamedEconomy> scenarios;
    };

    // Builds fully wired economies from JSON. Every component object carries a
    // "type" string; unknown types and missing required keys raise
    // ConfigurationError.
    class ScenarioFactory {
    public:
        // One economy from one scenario object
        static std::unique_ptr<TokenEconomy> fromJson(const nlohmann::json& scenario);

        // A single scenario object or a {"run": ..., "scenarios": [...]} document
        static ScenarioDocument documentFromJson(const nlohmann::json& doc);

        static ScenarioDocument load(const std::string& path);

        // Component builders
        static Distribution distributionFromJson(const nlohmann::json& j);
        static DistributionParams paramsFromJson(const nlohmann::json& j, DistributionParams base = DistributionParams());
        static AddOnChain addOnsFromJson(const nlohmann::json& list);
        static std::unique_ptr<AddOn> addOnFromJson(const nlohmann::json& j);
        static std::unique_ptr<UserGrowth> userGrowthFromJson(const nlohmann::json& j);
        static std::unique_ptr<TransactionModel> transactionModelFromJson(const nlohmann::json& j);
        static std::unique_ptr<HoldingTimeModel> holdingTimeFromJson(const nlohmann::json& j);
        static std::unique_ptr<AgentPool> agentPoolFromJson(const nlohmann::json& j);
        static std::unique_ptr<SupplyController> supplyControllerFromJson(const nlohmann::json& j);
        static std::unique_ptr<PriceFunction> priceFunctionFromJson(const nlohmann::json& j);
        static PriceCurve curveFromJson(const nlohmann::json& j);
    };

} // namespace tokensim

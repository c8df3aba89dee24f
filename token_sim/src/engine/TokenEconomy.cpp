#include "TokenEconomy.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace tokensim {

    TokenEconomy::TokenEconomy(EconomyConfig config, std::unique_ptr<Sampler> sampler)
        : config_(std::move(config))
        , sampler_(std::move(sampler))
        , holdingModel_(std::make_unique<ConstantHoldingTime>(1.0))
    {
        if (config_.tokenId.empty()) {
            throw ConfigurationError("Token id is required");
        }
        if (config_.fiat.empty() || config_.fiat == config_.tokenId) {
            throw ConfigurationError("Fiat symbol must be non-empty and differ from the token id");
        }
        if (!std::isfinite(config_.initialPrice) || config_.initialPrice < 0.0) {
            throw ConfigurationError("Initial price must be finite and non-negative");
        }
        if (!std::isfinite(config_.initialSupply) || config_.initialSupply < 0.0) {
            throw ConfigurationError("Initial supply must be finite and non-negative");
        }
        for (Amount s : config_.supplySchedule) {
            if (!std::isfinite(s) || s < 0.0) {
                throw ConfigurationError("Supply schedule values must be finite and non-negative");
            }
        }
        if (config_.name.empty()) {
            config_.name = config_.tokenId;
        }
        if (!sampler_) {
            sampler_ = std::make_unique<RandomSampler>();
        }

        keys_ = VariableKeys::forEconomy(config_.tokenId, config_.fiat);
        price_ = config_.initialPrice;
        supply_ = baselineSupply();
    }

    TokenEconomy::TokenEconomy(const TokenEconomy& other)
        : config_(other.config_)
        , keys_(other.keys_)
        , sampler_(other.sampler_->clone())
        , priceFunction_(other.priceFunction_ ? other.priceFunction_->clone() : nullptr)
        , holdingModel_(other.holdingModel_->clone())
        , chainSources_(other.chainSources_)
        , treasury_(other.treasury_)
        , history_(other.history_)
        , step_(other.step_)
        , planned_(other.planned_)
        , prepared_(other.prepared_)
        , price_(other.price_)
        , supply_(other.supply_)
        , holdingTime_(other.holdingTime_)
        , clampCount_(other.clampCount_)
    {
        pools_.reserve(other.pools_.size());
        for (const auto& p : other.pools_) {
            pools_.push_back(p->clone());
        }
        controllers_.reserve(other.controllers_.size());
        for (const auto& c : other.controllers_) {
            controllers_.push_back(c->clone());
        }
        addOns_.reserve(other.addOns_.size());
        for (const auto& a : other.addOns_) {
            addOns_.push_back({ a.target, a.addOn->clone() });
        }
    }

    // ---- Wiring ----------------------------------------------------------------

    void TokenEconomy::addAgentPool(std::unique_ptr<AgentPool> pool) {
        if (!pool) {
            throw ConfigurationError("Null agent pool");
        }
        if (pool->getCurrency() != config_.fiat && pool->getCurrency() != config_.tokenId) {
            throw ConfigurationError("Agent pool " + pool->getName() + " trades " + pool->getCurrency()
                + " but the economy only knows " + config_.fiat + " and " + config_.tokenId);
        }
        for (const auto& existing : pools_) {
            if (existing->getName() == pool->getName()) {
                throw ConfigurationError("Duplicate agent pool name: " + pool->getName());
            }
        }

        auto reserved = knownVariables();
        if (std::find(reserved.begin(), reserved.end(), pool->usersKey()) != reserved.end()
            || std::find(reserved.begin(), reserved.end(), pool->transactionsKey()) != reserved.end()) {
            throw ConfigurationError("Agent pool name " + pool->getName() + " collides with a recorded variable");
        }

        Logger::debug("{}: added agent pool {} ({})", config_.name, pool->getName(), pool->getCurrency());
        pools_.push_back(std::move(pool));
        prepared_ = false;
    }

    void TokenEconomy::addSupplyController(std::unique_ptr<SupplyController> controller) {
        if (!controller) {
            throw ConfigurationError("Null supply controller");
        }
        Logger::debug("{}: added supply controller {} ({})", config_.name, controller->name(), controller->getType());
        controllers_.push_back(std::move(controller));
        prepared_ = false;
    }

    void TokenEconomy::setPriceFunction(std::unique_ptr<PriceFunction> priceFunction) {
        priceFunction_ = std::move(priceFunction);
        prepared_ = false;
    }

    void TokenEconomy::setHoldingTimeModel(std::unique_ptr<HoldingTimeModel> model) {
        if (!model) {
            throw ConfigurationError("Null holding time model");
        }
        holdingModel_ = std::move(model);
        prepared_ = false;
    }

    void TokenEconomy::addAddOn(const std::string& target, std::unique_ptr<AddOn> addOn) {
        if (!addOn) {
            throw ConfigurationError("Null add-on");
        }
        addOns_.push_back({ target, std::move(addOn) });
        prepared_ = false;
    }

    std::vector<std::string> TokenEconomy::knownVariables() const {
        std::vector<std::string> names = {
            keys_.holdingTime, keys_.users, keys_.fiatVolume, keys_.tokenVolume,
            keys_.supply, keys_.price, keys_.effectiveHoldingTime
        };
        for (const auto& p : pools_) {
            names.push_back(p->usersKey());
            names.push_back(p->transactionsKey());
        }
        if (hasTreasury()) {
            names.push_back(keys_.treasuryFiat);
            names.push_back(keys_.treasuryToken);
        }
        return names;
    }

    bool TokenEconomy::hasTreasury() const {
        return std::any_of(pools_.begin(), pools_.end(),
            [](const std::unique_ptr<AgentPool>& p) { return p->hasFee(); });
    }

    Amount TokenEconomy::baselineSupply() const {
        if (config_.supplySchedule.empty() || config_.scheduleIsAdded) {
            return config_.initialSupply;
        }
        return config_.supplySchedule.front();
    }

    // ---- Lifecycle -------------------------------------------------------------

    void TokenEconomy::prepare(size_t iterations) {
        if (iterations == 0) {
            throw InvalidParameterError("Iterations must be positive");
        }
        if (!priceFunction_) {
            throw ConfigurationError(config_.name + ": no price function attached");
        }
        if (!config_.supplySchedule.empty() && config_.supplySchedule.size() != iterations) {
            throw ConfigurationError(config_.name + ": supply schedule has "
                + std::to_string(config_.supplySchedule.size()) + " values but "
                + std::to_string(iterations) + " iterations were requested");
        }

        // Chained pools read users from a pool registered before them
        chainSources_.assign(pools_.size(), -1);
        for (size_t i = 0; i < pools_.size(); ++i) {
            if (!pools_[i]->isChained()) continue;
            const auto& source = pools_[i]->getChainedTo();
            for (size_t j = 0; j < i; ++j) {
                if (pools_[j]->getName() == source) {
                    chainSources_[i] = static_cast<int>(j);
                    break;
                }
            }
            if (chainSources_[i] < 0) {
                throw ConfigurationError(config_.name + ": agent pool " + pools_[i]->getName()
                    + " is chained to " + source + ", which is not registered before it");
            }
        }

        for (auto& c : controllers_) {
            c->prepare(iterations);
        }

        auto known = knownVariables();
        for (const auto& a : addOns_) {
            if (std::find(known.begin(), known.end(), a.target) == known.end()) {
                throw ConfigurationError(config_.name + ": add-on " + a.addOn->getType()
                    + " targets unknown variable " + a.target);
            }
        }

        planned_ = iterations;
        prepared_ = true;
    }

    void TokenEconomy::reset(uint64_t seed) {
        history_.clear();
        step_ = 0;
        clampCount_ = 0;
        price_ = config_.initialPrice;
        supply_ = baselineSupply();
        holdingTime_ = 0.0;
        treasury_.reset();

        sampler_->seed(seed);
        for (auto& p : pools_) p->reset();
        for (auto& c : controllers_) c->reset();
        for (auto& a : addOns_) a.addOn->reset();
        if (priceFunction_) priceFunction_->reset();
        holdingModel_->reset();
    }

    const History& TokenEconomy::run(size_t iterations, uint64_t seed) {
        prepare(iterations);
        reset(seed);
        for (size_t i = 0; i < iterations; ++i) {
            step();
        }
        return history_;
    }

    // ---- Stepping --------------------------------------------------------------

    void TokenEconomy::step() {
        if (!prepared_) {
            throw ConfigurationError(config_.name + ": prepare() must run before step()");
        }
        if (step_ >= planned_) {
            throw ConfigurationError(config_.name + ": step " + std::to_string(step_)
                + " exceeds the planned " + std::to_string(planned_) + " iterations");
        }

        history_.beginRow();
        try {
            advance();
        }
        catch (...) {
            history_.discardRow();
            throw;
        }
        history_.commitRow();
        ++step_;

        if (config_.burnToken && (config_.supplySchedule.empty() || config_.scheduleIsAdded)) {
            double tokens = history_.latest(keys_.tokenVolume);
            supply_ = applyDelta(supply_, -tokens, "token burn");
        }
    }

    void TokenEconomy::advance() {
        StepContext ctx{ step_, history_, keys_, *sampler_,
            price_, supply_, holdingTime_, 0.0, 0.0, 0.0 };

        // 1. holding time
        holdingTime_ = holdingModel_->nextHoldingTime(ctx);
        if (!std::isfinite(holdingTime_)) {
            throw NumericalError(config_.name + ": non-finite holding time at step " + std::to_string(step_));
        }
        ctx.holdingTime = holdingTime_;
        history_.record(keys_.holdingTime, holdingTime_);

        // 2. pools, then aggregates
        double users = 0.0;
        double sellPressure = 0.0;
        double tokenFees = 0.0;
        std::vector<std::pair<std::string, double>> buyBacks;

        for (size_t i = 0; i < pools_.size(); ++i) {
            auto& pool = pools_[i];
            if (chainSources_[i] >= 0) {
                pool->stepChained(ctx, pools_[static_cast<size_t>(chainSources_[i])]->getUsers());
            } else {
                pool->step(ctx);
            }

            double volume = pool->getVolume();
            if (!std::isfinite(volume)) {
                throw NumericalError(config_.name + ": non-finite volume from pool " + pool->getName());
            }

            double bought = 0.0;
            if (pool->getCurrency() == config_.fiat) {
                if (volume != 0.0 && !(price_ > 0.0)) {
                    throw NumericalError(config_.name + ": price reached " + std::to_string(price_)
                        + " at step " + std::to_string(step_) + "; pool " + pool->getName()
                        + " cannot convert " + std::to_string(volume) + " " + config_.fiat + " to tokens");
                }
                if (volume >= 0.0) {
                    ctx.fiatVolume += volume;
                    if (volume > 0.0) bought = volume / price_;
                    ctx.tokenVolume += bought;
                } else {
                    sellPressure += -volume / price_;
                }
            } else {
                if (volume >= 0.0) {
                    bought = volume;
                    ctx.tokenVolume += volume;
                    ctx.fiatVolume += volume * price_;
                } else {
                    sellPressure += -volume;
                }
            }

            if (pool->burnsPurchases() && bought > 0.0) {
                buyBacks.emplace_back(pool->getName(), bought);
            }
            if (pool->hasFee()) {
                double fee = pool->feeAmount();
                treasury_.deposit(pool->getCurrency(), fee);
                if (pool->getCurrency() == config_.tokenId) tokenFees += fee;
            }

            // Chained pools share their source's users
            if (!pool->isChained()) users += pool->getUsers();
            history_.record(pool->usersKey(), pool->getUsers());
            history_.record(pool->transactionsKey(), volume);
        }

        if (config_.safeguardSupply && step_ > 0 && ctx.tokenVolume > supply_) {
            Logger::debug("{}: token volume {:.4f} capped at supply {:.4f} at step {}",
                config_.name, ctx.tokenVolume, supply_, step_);
            ctx.tokenVolume = supply_;
            ctx.fiatVolume = supply_ * price_;
        }

        ctx.users = users;
        history_.record(keys_.users, users);
        history_.record(keys_.fiatVolume, ctx.fiatVolume);
        history_.record(keys_.tokenVolume, ctx.tokenVolume);
        if (hasTreasury()) {
            history_.record(keys_.treasuryFiat, treasury_.balance(config_.fiat));
            history_.record(keys_.treasuryToken, treasury_.balance(config_.tokenId));
        }

        // 3. supply: baseline, then controllers in registration order, then buybacks
        Amount supply = supply_;
        if (!config_.supplySchedule.empty()) {
            supply = config_.scheduleIsAdded
                ? supply_ + config_.supplySchedule[step_]
                : config_.supplySchedule[step_];
        }
        supply += sellPressure;
        if (tokenFees > 0.0) {
            supply = applyDelta(supply, -tokenFees, "treasury fees");
        }
        for (auto& controller : controllers_) {
            ctx.supply = supply;
            double delta = controller->computeDelta(ctx);
            if (!std::isfinite(delta)) {
                throw NumericalError(config_.name + ": supply controller " + controller->name()
                    + " produced a non-finite delta at step " + std::to_string(step_));
            }
            supply = applyDelta(supply, delta, controller->name());
        }
        for (const auto& buyBack : buyBacks) {
            RateSupplyController burn(SupplyDirection::BURN, buyBack.second, SupplyStyle::ABSOLUTE,
                true, buyBack.first + "_buyback");
            ctx.supply = supply;
            supply = applyDelta(supply, burn.computeDelta(ctx), burn.name());
        }

        // 4. record supply
        supply = checkSupply(supply, "supply update");
        ctx.supply = supply;
        history_.record(keys_.supply, supply);

        // 5. price
        Price price = checkPrice(priceFunction_->compute(ctx), "price function");
        history_.record(keys_.price, price);

        // 6. add-ons rewrite the recorded values
        if (!addOns_.empty()) {
            StepContext addOnCtx = ctx;
            addOnCtx.price = price;
            for (auto& a : addOns_) {
                double value = a.addOn->apply(history_.latest(a.target), addOnCtx);
                if (a.target == keys_.price) {
                    value = checkPrice(value, "add-on");
                    addOnCtx.price = value;
                } else if (a.target == keys_.supply) {
                    value = checkSupply(value, "add-on");
                    addOnCtx.supply = value;
                }
                history_.set(a.target, value);
            }
            price = history_.latest(keys_.price);
            supply = history_.latest(keys_.supply);
        }

        price_ = price;
        supply_ = supply;

        // 7. effective holding time from the final values
        double effective = price_ * supply_ / (ctx.fiatVolume + 1e-9);
        history_.record(keys_.effectiveHoldingTime, effective);
    }

    Amount TokenEconomy::applyDelta(Amount supply, double delta, const std::string& source) {
        double next = supply + delta;
        if (next < 0.0) {
            ++clampCount_;
            Logger::warn("{}: {} would take supply to {:.4f} at step {}; clamped to 0",
                config_.name, source, next, step_);
            return 0.0;
        }
        return next;
    }

    Amount TokenEconomy::checkSupply(Amount supply, const char* stage) {
        if (!std::isfinite(supply)) {
            throw NumericalError(config_.name + ": non-finite supply after " + stage
                + " at step " + std::to_string(step_));
        }
        if (supply < 0.0) {
            ++clampCount_;
            Logger::warn("{}: negative supply {:.4f} after {} at step {}; clamped to 0",
                config_.name, supply, stage, step_);
            return 0.0;
        }
        return supply;
    }

    Price TokenEconomy::checkPrice(Price price, const char* stage) {
        if (!std::isfinite(price)) {
            throw NumericalError(config_.name + ": non-finite price after " + stage
                + " at step " + std::to_string(step_));
        }
        if (price < 0.0) {
            Logger::warn("{}: negative price {:.6f} after {} at step {}; clamped to 0",
                config_.name, price, stage, step_);
            return 0.0;
        }
        return price;
    }

} // namespace tokensim

#pragma once

#include "Errors.hpp"
#include <string>
#include <cstdint>
#include <cstddef>

namespace tokensim {

    using Price = double;
    using Amount = double;
    using StepIndex = size_t;

    enum class UnitOfTime {
        DAY,
        WEEK,
        MONTH,
        QUARTER,
        YEAR
    };

    enum class DistributionKind {
        CONSTANT,
        NORMAL,
        LOGNORMAL,
        UNIFORM,
        EXPONENTIAL,
        POISSON,
        BINOMIAL,
        STUDENT_T
    };

    // Parameters for every DistributionKind; each kind reads the fields it needs.
    //   NORMAL       loc, scale
    //   LOGNORMAL    loc + scale * exp(N(0, shape))
    //   UNIFORM      [loc, loc + scale)
    //   EXPONENTIAL  loc + Exp(1 / scale)
    //   POISSON      mu
    //   BINOMIAL     n, p
    //   STUDENT_T    loc + scale * t(shape)
    //   CONSTANT     loc
    struct DistributionParams {
        double loc = 0.0;
        double scale = 1.0;
        double shape = 1.0;
        double mu = 1.0;
        int64_t n = 1;
        double p = 0.5;
    };

    struct Distribution {
        DistributionKind kind = DistributionKind::NORMAL;
        DistributionParams params;

        static Distribution constant(double value) {
            Distribution d;
            d.kind = DistributionKind::CONSTANT;
            d.params.loc = value;
            return d;
        }

        static Distribution normal(double loc, double scale) {
            Distribution d;
            d.kind = DistributionKind::NORMAL;
            d.params.loc = loc;
            d.params.scale = scale;
            return d;
        }

        static Distribution lognormal(double shape, double loc = 0.0, double scale = 1.0) {
            Distribution d;
            d.kind = DistributionKind::LOGNORMAL;
            d.params.shape = shape;
            d.params.loc = loc;
            d.params.scale = scale;
            return d;
        }

        static Distribution uniform(double loc, double scale) {
            Distribution d;
            d.kind = DistributionKind::UNIFORM;
            d.params.loc = loc;
            d.params.scale = scale;
            return d;
        }

        static Distribution poisson(double mu) {
            Distribution d;
            d.kind = DistributionKind::POISSON;
            d.params.mu = mu;
            return d;
        }

        static Distribution binomial(int64_t n, double p) {
            Distribution d;
            d.kind = DistributionKind::BINOMIAL;
            d.params.n = n;
            d.params.p = p;
            return d;
        }

        static Distribution studentT(double df, double loc = 0.0, double scale = 1.0) {
            Distribution d;
            d.kind = DistributionKind::STUDENT_T;
            d.params.shape = df;
            d.params.loc = loc;
            d.params.scale = scale;
            return d;
        }
    };

    // Schedule generators for spaced user growth, trends and dumping
    enum class SpaceFunction {
        LINEAR,
        GEOMETRIC,
        LOGARITHMIC,
        LOG_SATURATED,
        LOGISTIC
    };

    // How a supply controller interprets its parameter
    enum class SupplyStyle {
        PERCENTAGE,
        ABSOLUTE
    };

    enum class SupplyDirection {
        BURN,
        MINT
    };

    // Which sign of a sampled transaction volume survives
    enum class SignPolicy {
        ANY,
        POSITIVE,
        NEGATIVE
    };

    // ---- String conversions ---------------------------------------------------

    inline std::string unitOfTimeToString(UnitOfTime unit) {
        switch (unit) {
        case UnitOfTime::DAY: return "day";
        case UnitOfTime::WEEK: return "week";
        case UnitOfTime::MONTH: return "month";
        case UnitOfTime::QUARTER: return "quarter";
        case UnitOfTime::YEAR: return "year";
        }
        return "day";
    }

    inline UnitOfTime parseUnitOfTime(const std::string& str) {
        if (str == "day") return UnitOfTime::DAY;
        if (str == "week") return UnitOfTime::WEEK;
        if (str == "month") return UnitOfTime::MONTH;
        if (str == "quarter") return UnitOfTime::QUARTER;
        if (str == "year") return UnitOfTime::YEAR;
        throw ConfigurationError("Unknown unit of time: " + str);
    }

    inline DistributionKind parseDistributionKind(const std::string& str) {
        if (str == "constant") return DistributionKind::CONSTANT;
        if (str == "normal") return DistributionKind::NORMAL;
        if (str == "lognormal") return DistributionKind::LOGNORMAL;
        if (str == "uniform") return DistributionKind::UNIFORM;
        if (str == "exponential") return DistributionKind::EXPONENTIAL;
        if (str == "poisson") return DistributionKind::POISSON;
        if (str == "binomial") return DistributionKind::BINOMIAL;
        if (str == "student_t") return DistributionKind::STUDENT_T;
        throw ConfigurationError("Unknown distribution: " + str);
    }

    inline SpaceFunction parseSpaceFunction(const std::string& str) {
        if (str == "linear") return SpaceFunction::LINEAR;
        if (str == "geom") return SpaceFunction::GEOMETRIC;
        if (str == "log") return SpaceFunction::LOGARITHMIC;
        if (str == "log_saturated") return SpaceFunction::LOG_SATURATED;
        if (str == "logistic") return SpaceFunction::LOGISTIC;
        throw ConfigurationError("Unknown space function: " + str);
    }

    inline SupplyStyle parseSupplyStyle(const std::string& str) {
        if (str == "perc") return SupplyStyle::PERCENTAGE;
        if (str == "fixed") return SupplyStyle::ABSOLUTE;
        throw ConfigurationError("Supply controller style must be \"perc\" or \"fixed\", got: " + str);
    }

    inline SignPolicy parseSignPolicy(const std::string& str) {
        if (str == "any" || str == "mixed") return SignPolicy::ANY;
        if (str == "positive") return SignPolicy::POSITIVE;
        if (str == "negative") return SignPolicy::NEGATIVE;
        throw ConfigurationError("Unknown sign policy: " + str);
    }

    // Column names the economy writes for one token/fiat pair
    struct VariableKeys {
        std::string price;
        std::string supply;
        std::string fiatVolume;
        std::string tokenVolume;
        std::string users;
        std::string holdingTime;
        std::string effectiveHoldingTime;
        std::string treasuryFiat;
        std::string treasuryToken;

        static VariableKeys forEconomy(const std::string& token, const std::string& fiat) {
            VariableKeys keys;
            keys.price = token + "_price";
            keys.supply = token + "_supply";
            keys.fiatVolume = "transactions_" + fiat;
            keys.tokenVolume = "transactions_" + token;
            keys.users = "num_users";
            keys.holdingTime = "holding_time";
            keys.effectiveHoldingTime = "effective_holding_time";
            keys.treasuryFiat = "treasury_" + fiat;
            keys.treasuryToken = "treasury_" + token;
            return keys;
        }
    };

} // namespace tokensim

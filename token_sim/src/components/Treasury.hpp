#pragma once

#include "core/Errors.hpp"
#include <cmath>
#include <map>
#include <string>

namespace tokensim {

    // Per-currency balances collected from agent pool fees. Token deposits
    // leave circulation; the economy removes them from supply.
    class Treasury {
    public:
        void deposit(const std::string& currency, double amount) {
            if (!std::isfinite(amount) || amount < 0.0) {
                throw NumericalError("Treasury deposit of " + currency + " must be finite and non-negative");
            }
            balances_[currency] += amount;
        }

        double balance(const std::string& currency) const {
            auto it = balances_.find(currency);
            return it == balances_.end() ? 0.0 : it->second;
        }

        const std::map<std::string, double>& getBalances() const { return balances_; }

        void reset() { balances_.clear(); }

    private:
        std::map<std::string, double> balances_;
    };

} // namespace tokensim

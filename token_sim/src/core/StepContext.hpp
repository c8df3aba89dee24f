#pragma once

#include "Types.hpp"
#include "History.hpp"
#include "Sampler.hpp"

namespace tokensim {

    // Everything a component may read while the economy advances one step.
    // Scalars reflect the state at the moment of the call; history holds all
    // previously recorded values plus whatever the open row has so far.
    struct StepContext {
        StepIndex step;
        const History& history;
        const VariableKeys& keys;
        Sampler& sampler;

        Price price;            // price carried in from the previous step
        Amount supply;          // supply as of this call
        double holdingTime;
        Amount fiatVolume;      // accumulated so far this step
        Amount tokenVolume;
        double users;           // owning pool's users when called from a pool

        StepContext withUsers(double poolUsers) const {
            StepContext copy = *this;
            copy.users = poolUsers;
            return copy;
        }

        StepContext withSupply(Amount currentSupply) const {
            StepContext copy = *this;
            copy.supply = currentSupply;
            return copy;
        }
    };

} // namespace tokensim

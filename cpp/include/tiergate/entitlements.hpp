#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tiergate
{
    /**
     * Entitlements proven by a successful remote verification. Also rebuilt
     * from a trusted cache record; never invented from defaults.
     */
    struct VerifiedEntitlements
    {
        bool valid{false};
        int64_t exp{0}; // epoch seconds
        Tier tier{Tier::Community};
        std::vector<std::string> features;
        std::optional<std::string> customer_id;
        std::optional<std::string> organization;
        std::optional<int64_t> seats;
        std::optional<std::string> error;

        nlohmann::json to_json() const;
    };

} // namespace tiergate

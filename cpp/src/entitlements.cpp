#include "tiergate/entitlements.hpp"

namespace tiergate
{

    nlohmann::json VerifiedEntitlements::to_json() const
    {
        auto opt = [](const auto &v) -> nlohmann::json {
            if (v)
                return *v;
            return nullptr;
        };
        return nlohmann::json{{"valid", valid},
                              {"exp", exp},
                              {"tier", tier_to_string(tier)},
                              {"features", features},
                              {"customer_id", opt(customer_id)},
                              {"organization", opt(organization)},
                              {"seats", opt(seats)},
                              {"error", opt(error)}};
    }

} // namespace tiergate

#pragma once

#include "types.hpp"
#include "audit.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "entitlements.hpp"
#include "license_evaluator.hpp"
#include "remote_verifier.hpp"
#include "verification_cache.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tiergate
{
    inline constexpr std::string_view kPurchaseUrl = "https://tiergate.dev/pricing";

    enum class DecisionReason
    {
        RemoteVerified,
        CacheFresh,
        OfflineGrace,
        LicenseExpired,
        OfflineDenied
    };

    std::string_view decision_reason_name(DecisionReason reason);

    struct AuthorizationDecision
    {
        bool allowed{false};
        std::optional<VerifiedEntitlements> entitlements;
        DecisionReason reason{DecisionReason::OfflineDenied};

        nlohmann::json to_json() const;
    };

    /** Tier a caller should run at, plus an operator-facing warning. */
    struct TierResolution
    {
        Tier tier{Tier::Community};
        std::optional<std::string> warning;
    };

    struct AuthorizationOptions
    {
        std::chrono::seconds refresh_window{std::chrono::hours(24)};
        std::chrono::seconds offline_grace{std::chrono::hours(24)};
        std::optional<std::string> environment;
        bool tier_unification_override{false};
    };

    /**
     * Combines the local evaluator, remote verifier and verification cache
     * into allow/deny and effective-tier decisions. Fail-closed: without
     * proof the answer is community.
     *
     * Thread-safe; concurrent callers share the cache mirror and may each
     * block on the network for up to timeout * (retries + 1).
     */
    class AuthorizationEngine
    {
    public:
        /** `verifier` and `cache` are either both set (remote mode) or both null (local mode). */
        AuthorizationEngine(AuthorizationOptions options,
                            std::shared_ptr<LicenseEvaluator> evaluator,
                            std::shared_ptr<const RemoteVerifier> verifier,
                            std::shared_ptr<VerificationCache> cache,
                            std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>(),
                            std::shared_ptr<AuditLogger> audit = std::make_shared<AuditLogger>());

        /** Build every component from a loaded configuration. */
        static Result<std::unique_ptr<AuthorizationEngine>> from_config(const TiergateConfig &cfg);

        bool remote_configured() const { return verifier_ != nullptr; }

        /**
         * Decide whether `token` is currently authorized. Network and protocol
         * failures become offline_grace or offline_denied decisions; an error
         * is returned only for configuration problems.
         */
        Result<AuthorizationDecision> authorize_token(std::string_view token);

        /** Verify remotely regardless of cache age and persist the result. */
        Result<VerifiedEntitlements> refresh(std::string_view token);

        /** Currently licensed tier for hot-path checks. */
        Result<TierResolution> resolve_tier();

        /**
         * Effective tier for process startup. A paid tier that was requested
         * but cannot be substantiated is a StartupError; a revoked license
         * downgrades to community with a warning.
         */
        Result<TierResolution> compute_effective_tier_for_startup(const std::optional<std::string> &requested_tier);

        LicenseEvaluator &evaluator() { return *evaluator_; }

    private:
        struct LicensedTier
        {
            Tier tier{Tier::Community};
            bool revoked{false};
            std::optional<std::string> detail;
        };

        Result<LicensedTier> licensed_tier();
        LicensedTier licensed_tier_local();
        Result<LicensedTier> licensed_tier_remote();

        /**
         * Remote round trip. `bound_record` is the cached verification for this
         * same token, if any; it is the only source of offline grace.
         */
        Result<AuthorizationDecision> verify_and_decide(std::string_view token,
                                                        const std::string &hash,
                                                        double now,
                                                        const std::optional<CacheRecord> &bound_record);

        AuthorizationDecision decide_from_remote(const VerifiedEntitlements &ent, double now) const;
        void persist(const VerifiedEntitlements &ent, const std::string &hash);
        void audit_decision(const std::string &hash, const AuthorizationDecision &decision);

        AuthorizationOptions options_;
        std::shared_ptr<LicenseEvaluator> evaluator_;
        std::shared_ptr<const RemoteVerifier> verifier_;
        std::shared_ptr<VerificationCache> cache_;
        std::shared_ptr<const Clock> clock_;
        std::shared_ptr<AuditLogger> audit_;
    };

} // namespace tiergate

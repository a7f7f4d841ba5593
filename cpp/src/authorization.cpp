#include "tiergate/authorization.hpp"
#include "tiergate/crypto.hpp"
#include "tiergate/logging.hpp"
#include <algorithm>
#include <cctype>
#include <format>

namespace tiergate
{
    namespace
    {
        constexpr std::string_view kActor = "authorization-engine";

        bool mentions_revoked(const std::optional<std::string> &message)
        {
            if (!message)
                return false;
            std::string lower(*message);
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return lower.find("revoked") != std::string::npos;
        }

        double seconds(std::chrono::seconds s)
        {
            return static_cast<double>(s.count());
        }
    } // namespace

    std::string_view decision_reason_name(DecisionReason reason)
    {
        switch (reason)
        {
        case DecisionReason::RemoteVerified:
            return "remote_verified";
        case DecisionReason::CacheFresh:
            return "cache_fresh";
        case DecisionReason::OfflineGrace:
            return "offline_grace";
        case DecisionReason::LicenseExpired:
            return "license_expired";
        case DecisionReason::OfflineDenied:
            return "offline_denied";
        }
        return "offline_denied";
    }

    nlohmann::json AuthorizationDecision::to_json() const
    {
        nlohmann::json j;
        j["allowed"] = allowed;
        j["reason"] = decision_reason_name(reason);
        j["entitlements"] = entitlements ? entitlements->to_json() : nlohmann::json(nullptr);
        return j;
    }

    AuthorizationEngine::AuthorizationEngine(AuthorizationOptions options,
                                             std::shared_ptr<LicenseEvaluator> evaluator,
                                             std::shared_ptr<const RemoteVerifier> verifier,
                                             std::shared_ptr<VerificationCache> cache,
                                             std::shared_ptr<const Clock> clock,
                                             std::shared_ptr<AuditLogger> audit)
        : options_(std::move(options)),
          evaluator_(std::move(evaluator)),
          verifier_(std::move(verifier)),
          cache_(std::move(cache)),
          clock_(std::move(clock)),
          audit_(std::move(audit))
    {
    }

    Result<std::unique_ptr<AuthorizationEngine>> AuthorizationEngine::from_config(const TiergateConfig &cfg)
    {
        TokenValidatorConfig validator_cfg;
        if (!cfg.license.public_key.empty())
        {
            auto pk = crypto::Ed25519KeyPair::public_key_from_b64(cfg.license.public_key);
            if (!pk)
            {
                return std::unexpected(TiergateError::config(
                    std::format("Invalid license public key: {}", pk.error().what())));
            }
            validator_cfg.public_key = *pk;
        }
        validator_cfg.secret_key = cfg.license.secret_key;
        validator_cfg.allow_symmetric = cfg.license.allow_symmetric;
        validator_cfg.issuer = cfg.license.issuer;
        validator_cfg.audience = cfg.license.audience;

        LicenseEvaluatorConfig evaluator_cfg;
        evaluator_cfg.license_path = cfg.license.path;
        evaluator_cfg.inline_token = cfg.license.key;

        auto clock = std::make_shared<SystemClock>();
        auto evaluator = std::make_shared<LicenseEvaluator>(
            std::move(evaluator_cfg),
            std::make_shared<TokenValidator>(std::move(validator_cfg)),
            clock);

        std::shared_ptr<const RemoteVerifier> verifier;
        std::shared_ptr<VerificationCache> cache;
        if (cfg.verifier.base_url)
        {
            RemoteVerifierConfig remote_cfg;
            remote_cfg.base_url = *cfg.verifier.base_url;
            remote_cfg.timeout = cfg.verifier.timeout();
            remote_cfg.retries = cfg.verifier.retries;

            auto created = RemoteVerifier::create(std::move(remote_cfg));
            if (!created)
                return std::unexpected(created.error());
            verifier = *created;
            cache = std::make_shared<VerificationCache>(cfg.cache.path, clock);
        }

        AuthorizationOptions options;
        options.environment = cfg.verifier.environment;
        options.tier_unification_override = cfg.startup.tier_unification_override;

        return std::make_unique<AuthorizationEngine>(
            std::move(options), std::move(evaluator), std::move(verifier), std::move(cache), clock);
    }

    // ============================================================================
    // Token authorization
    // ============================================================================

    Result<AuthorizationDecision> AuthorizationEngine::authorize_token(std::string_view token)
    {
        if (!verifier_ || !cache_)
        {
            return std::unexpected(TiergateError::config("Remote verifier is not configured"));
        }

        const std::string hash = token_hash(token);
        const double now = clock_->epoch_seconds();
        const CacheRecord record = cache_->load();

        // A record for another token is never used, not even to deny.
        if (!record.has_verification() || *record.license_hash != hash)
        {
            if (record.has_verification())
            {
                logging::get()->info("Cached verification is bound to a different license (cached={}, presented={})",
                                     logging::hash_hint(*record.license_hash), logging::hash_hint(hash));
            }
            return verify_and_decide(token, hash, now, std::nullopt);
        }

        AuthorizationDecision decision;
        if (now >= static_cast<double>(*record.exp))
        {
            decision.allowed = false;
            decision.entitlements = record.to_entitlements(false, "License expired");
            decision.reason = DecisionReason::LicenseExpired;
            audit_decision(hash, decision);
            return decision;
        }

        const double age = now - *record.last_verified_at_epoch;
        if (age <= seconds(options_.refresh_window))
        {
            const bool valid = record.valid.value_or(false);
            decision.allowed = valid;
            decision.entitlements = record.to_entitlements(
                valid, valid ? std::nullopt : std::optional<std::string>(record.error.value_or("Cached verification is not valid")));
            decision.reason = DecisionReason::CacheFresh;
            audit_decision(hash, decision);
            return decision;
        }

        return verify_and_decide(token, hash, now, record);
    }

    Result<AuthorizationDecision> AuthorizationEngine::verify_and_decide(
        std::string_view token,
        const std::string &hash,
        double now,
        const std::optional<CacheRecord> &bound_record)
    {
        auto verified = verifier_->verify(token, options_.environment);
        if (verified)
        {
            persist(*verified, hash);
            auto decision = decide_from_remote(*verified, now);
            audit_decision(hash, decision);
            return decision;
        }

        bool grace_eligible = false;
        switch (verified.error().code)
        {
        case ErrorCode::NetworkError:
        case ErrorCode::ProtocolError:
            grace_eligible = true;
            break;
        case ErrorCode::UntrustedVerifier:
        case ErrorCode::ConfigError:
            return std::unexpected(verified.error());
        case ErrorCode::CryptoError:
        case ErrorCode::LicenseError:
        case ErrorCode::StorageError:
        case ErrorCode::StartupError:
        case ErrorCode::InvalidInput:
        case ErrorCode::NotFound:
        case ErrorCode::IOError:
        case ErrorCode::ParsingError:
            grace_eligible = false;
            break;
        }

        AuthorizationDecision decision;
        decision.reason = DecisionReason::OfflineDenied;

        if (bound_record)
        {
            const double age = now - bound_record->last_verified_at_epoch.value_or(0);
            const bool within_window = age <= seconds(options_.refresh_window) + seconds(options_.offline_grace);
            const bool unexpired = now < static_cast<double>(bound_record->exp.value_or(0));

            if (grace_eligible && within_window && unexpired && bound_record->valid.value_or(false))
            {
                logging::get()->warn("Verifier unreachable; using offline grace (hash={}, age={:.0f}s)",
                                     logging::hash_hint(hash), age);
                decision.allowed = true;
                decision.entitlements = bound_record->to_entitlements(true, std::nullopt);
                decision.reason = DecisionReason::OfflineGrace;
                audit_decision(hash, decision);
                return decision;
            }
            decision.entitlements = bound_record->to_entitlements(
                false, "Remote verification unavailable and grace expired");
        }

        logging::get()->warn("Verifier unreachable and no offline grace (hash={}, error={})",
                             logging::hash_hint(hash), error_code_name(verified.error().code));
        decision.allowed = false;
        audit_decision(hash, decision);
        return decision;
    }

    AuthorizationDecision AuthorizationEngine::decide_from_remote(const VerifiedEntitlements &ent, double now) const
    {
        AuthorizationDecision decision;
        decision.entitlements = ent;
        if (now >= static_cast<double>(ent.exp))
        {
            decision.allowed = false;
            decision.reason = DecisionReason::LicenseExpired;
            return decision;
        }
        decision.allowed = ent.valid;
        decision.reason = DecisionReason::RemoteVerified;
        return decision;
    }

    void AuthorizationEngine::persist(const VerifiedEntitlements &ent, const std::string &hash)
    {
        auto saved = cache_->save(ent, hash);
        if (!saved)
        {
            // The in-memory mirror still holds the result.
            logging::get()->warn("Verification cache not persisted: {}", saved.error().what());
        }
    }

    void AuthorizationEngine::audit_decision(const std::string &hash, const AuthorizationDecision &decision)
    {
        nlohmann::json details{{"allowed", decision.allowed}};
        if (decision.entitlements)
            details["tier"] = tier_to_string(decision.entitlements->tier);
        audit_->log(AuditEvent::at(clock_->now(), std::string(kActor), "authorize", logging::hash_hint(hash),
                                   std::string(decision_reason_name(decision.reason)), std::move(details)));
    }

    Result<VerifiedEntitlements> AuthorizationEngine::refresh(std::string_view token)
    {
        if (!verifier_ || !cache_)
        {
            return std::unexpected(TiergateError::config("Remote verifier is not configured"));
        }

        const std::string hash = token_hash(token);
        auto verified = verifier_->verify(token, options_.environment);
        if (!verified)
            return std::unexpected(verified.error());

        persist(*verified, hash);
        audit_->log(AuditEvent::at(clock_->now(), std::string(kActor), "refresh", logging::hash_hint(hash),
                                   verified->valid ? "valid" : "invalid",
                                   {{"tier", tier_to_string(verified->tier)}}));
        return verified;
    }

    // ============================================================================
    // Tier resolution
    // ============================================================================

    AuthorizationEngine::LicensedTier AuthorizationEngine::licensed_tier_local()
    {
        const auto result = evaluator_->validate();

        LicensedTier licensed;
        if (result.is_valid)
        {
            licensed.tier = result.tier;
            if (!result.claims)
                licensed.detail = "No license found";
            return licensed;
        }

        licensed.revoked = mentions_revoked(result.error_message);
        if (result.is_expired && result.is_in_grace_period)
        {
            licensed.detail = std::format("{} (grace period: renew to keep {} features)",
                                          result.error_message.value_or("License expired"),
                                          tier_to_string(result.tier));
        }
        else
        {
            licensed.detail = result.error_message.value_or("License is not valid");
        }
        return licensed;
    }

    Result<AuthorizationEngine::LicensedTier> AuthorizationEngine::licensed_tier_remote()
    {
        LicensedTier licensed;

        auto source = evaluator_->load_license_token();
        if (!source)
        {
            licensed.detail = source.error().what();
            return licensed;
        }
        if (!*source)
        {
            licensed.detail = "No license found";
            return licensed;
        }

        auto decision = authorize_token((*source)->token);
        if (!decision)
            return std::unexpected(decision.error());

        if (decision->allowed && decision->entitlements)
        {
            licensed.tier = decision->entitlements->tier;
            return licensed;
        }

        const auto &error = decision->entitlements ? decision->entitlements->error : std::nullopt;
        licensed.revoked = mentions_revoked(error);
        licensed.detail = error.value_or(std::format("License not authorized ({})",
                                                     decision_reason_name(decision->reason)));
        return licensed;
    }

    Result<AuthorizationEngine::LicensedTier> AuthorizationEngine::licensed_tier()
    {
        if (remote_configured())
            return licensed_tier_remote();
        return licensed_tier_local();
    }

    Result<TierResolution> AuthorizationEngine::resolve_tier()
    {
        auto licensed = licensed_tier();
        if (!licensed)
            return std::unexpected(licensed.error());

        TierResolution resolution{licensed->tier, std::nullopt};
        if (licensed->revoked)
            resolution.warning = "License revoked; running as community";
        else if (licensed->tier == Tier::Community && licensed->detail && licensed->detail != "No license found")
            resolution.warning = *licensed->detail;
        return resolution;
    }

    Result<TierResolution> AuthorizationEngine::compute_effective_tier_for_startup(
        const std::optional<std::string> &requested_tier)
    {
        if (options_.tier_unification_override)
        {
            const std::string warning = "Tier unification override is enabled: running as enterprise without license checks";
            logging::get()->warn("{}", warning);
            audit_->log(AuditEvent::at(clock_->now(), std::string(kActor), "startup", "-", "override",
                                       {{"tier", tier_to_string(Tier::Enterprise)}}));
            return TierResolution{Tier::Enterprise, warning};
        }

        std::optional<Tier> requested;
        if (requested_tier && requested_tier->find_first_not_of(" \t") != std::string::npos)
        {
            requested = parse_tier_alias(*requested_tier);
            if (!requested)
            {
                return std::unexpected(TiergateError::startup(std::format(
                    "Invalid tier requested: '{}' (expected community, pro or enterprise)", *requested_tier)));
            }
        }

        auto licensed = licensed_tier();
        if (!licensed)
            return std::unexpected(licensed.error());

        TierResolution resolution;
        if (licensed->revoked)
        {
            resolution.tier = Tier::Community;
            resolution.warning = "License revoked; running as community";
        }
        else if (!requested)
        {
            resolution.tier = licensed->tier;
            if (licensed->tier == Tier::Community && licensed->detail && licensed->detail != "No license found")
                resolution.warning = *licensed->detail;
        }
        else if (*requested != Tier::Community && licensed->tier == Tier::Community)
        {
            const std::string reason = licensed->detail.value_or("no valid license");
            logging::get()->error("Startup refused: {} tier requested but not licensed ({})",
                                  tier_to_string(*requested), reason);
            audit_->log(AuditEvent::at(clock_->now(), std::string(kActor), "startup", "-", "refused",
                                       {{"requested", tier_to_string(*requested)}, {"detail", reason}}));
            return std::unexpected(TiergateError::startup(std::format(
                "{} tier requested but not licensed: {}. Purchase a license at {}",
                tier_to_string(*requested), reason, kPurchaseUrl)));
        }
        else
        {
            resolution.tier = clamp_tier(*requested, licensed->tier);
            if (resolution.tier < *requested)
            {
                resolution.warning = std::format("Requested {} exceeds licensed {}; running as {}",
                                                 tier_to_string(*requested),
                                                 tier_to_string(licensed->tier),
                                                 tier_to_string(resolution.tier));
            }
        }

        if (resolution.warning)
            logging::get()->warn("{}", *resolution.warning);
        audit_->log(AuditEvent::at(clock_->now(), std::string(kActor), "startup", "-", tier_to_string(resolution.tier),
                                   {{"requested", requested ? nlohmann::json(tier_to_string(*requested))
                                                            : nlohmann::json(nullptr)}}));
        return resolution;
    }

} // namespace tiergate

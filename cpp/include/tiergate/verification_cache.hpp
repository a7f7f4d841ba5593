#pragma once

#include "types.hpp"
#include "clock.hpp"
#include "entitlements.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tiergate
{

    /**
     * Last known good verification, bound to the SHA-256 of the token that
     * produced it. Every field is optional because the file may be absent,
     * partial from an older version, or hand edited.
     */
    struct CacheRecord
    {
        std::optional<double> last_verified_at_epoch;
        std::optional<std::string> last_verified_at; // ISO 8601, informational
        std::optional<std::string> license_hash;
        std::optional<bool> valid;
        std::optional<int64_t> exp;
        std::optional<Tier> tier;
        std::vector<std::string> features;
        std::optional<std::string> customer_id;
        std::optional<std::string> organization;
        std::optional<int64_t> seats;
        std::optional<std::string> error; // verifier's reason for an invalid result

        /** True when the record holds a completed verification. */
        bool has_verification() const;

        /** Entitlements as recorded, with `valid` and `error` overridden by the caller. */
        VerifiedEntitlements to_entitlements(bool valid_override, std::optional<std::string> error) const;

        nlohmann::json to_json() const;

        /** Lenient parse: mistyped fields are dropped rather than failing the record. */
        static CacheRecord from_json(const nlohmann::json &j);
    };

    /**
     * Strategy for putting serialized cache bytes on disk.
     */
    class CacheWriter
    {
    public:
        virtual ~CacheWriter() = default;

        virtual Result<void> write(const std::filesystem::path &path, const std::string &content) = 0;

        virtual std::string_view name() const = 0;
    };

    /**
     * Temp file + rename. Renames that fail (some network-backed mounts report
     * a freshly written temp file as missing) are retried with linear backoff.
     */
    class AtomicRenameWriter : public CacheWriter
    {
    public:
        struct Options
        {
            int attempts{5};
            std::chrono::milliseconds backoff_step{20};
        };

        AtomicRenameWriter();
        explicit AtomicRenameWriter(const Options &options);

        Result<void> write(const std::filesystem::path &path, const std::string &content) override;

        std::string_view name() const override { return "atomic-rename"; }

    protected:
        virtual std::error_code rename_file(const std::filesystem::path &from, const std::filesystem::path &to);

    private:
        std::filesystem::path temp_path_for(const std::filesystem::path &path);

        Options options_;
        std::atomic<uint64_t> sequence_{0};
    };

    /** Non-atomic overwrite; last resort after the atomic strategy gives up. */
    class DirectWriter : public CacheWriter
    {
    public:
        Result<void> write(const std::filesystem::path &path, const std::string &content) override;

        std::string_view name() const override { return "direct"; }
    };

    /**
     * Persistent verification cache: one JSON file plus an in-memory mirror.
     * The mirror is populated from disk once per instance; file I/O never runs
     * under the mutex.
     */
    class VerificationCache
    {
    public:
        explicit VerificationCache(
            std::filesystem::path path,
            std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>(),
            std::unique_ptr<CacheWriter> primary = std::make_unique<AtomicRenameWriter>(),
            std::unique_ptr<CacheWriter> fallback = std::make_unique<DirectWriter>());

        /** Current record; empty when nothing has been verified yet. */
        CacheRecord load();

        /**
         * Persist a successful verification for `token_hash` and swap the
         * mirror. Returns the stored record; an error only when both writers
         * failed (the mirror is still updated).
         */
        Result<CacheRecord> save(const VerifiedEntitlements &entitlements, const std::string &token_hash);

        const std::filesystem::path &path() const { return path_; }

    private:
        std::optional<CacheRecord> read_from_disk() const;

        std::filesystem::path path_;
        std::shared_ptr<const Clock> clock_;
        std::unique_ptr<CacheWriter> primary_;
        std::unique_ptr<CacheWriter> fallback_;

        mutable std::mutex mutex_;
        std::optional<CacheRecord> mirror_;
    };

} // namespace tiergate

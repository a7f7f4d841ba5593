#include "tiergate/verification_cache.hpp"
#include "tiergate/audit.hpp"
#include "tiergate/logging.hpp"
#include <unistd.h>
#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>
#include <thread>

namespace tiergate
{

    namespace fs = std::filesystem;

    namespace
    {
        template <typename T>
        std::optional<T> optional_field(const nlohmann::json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return std::nullopt;
            try
            {
                return it->get<T>();
            }
            catch (const nlohmann::json::exception &)
            {
                return std::nullopt;
            }
        }

        template <typename T>
        nlohmann::json or_null(const std::optional<T> &v)
        {
            if (v)
                return *v;
            return nullptr;
        }

        Result<void> write_file(const fs::path &path, const std::string &content)
        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                return std::unexpected(TiergateError(ErrorCode::IOError,
                                                     std::format("Failed to open {} for writing", path.string())));
            }
            out << content;
            out.flush();
            if (!out)
            {
                return std::unexpected(TiergateError(ErrorCode::IOError,
                                                     std::format("Failed to write {}", path.string())));
            }
            return {};
        }

        Result<void> ensure_parent(const fs::path &path)
        {
            if (!path.has_parent_path())
                return {};
            std::error_code ec;
            fs::create_directories(path.parent_path(), ec);
            if (ec)
            {
                return std::unexpected(TiergateError::storage(
                    std::format("Failed to create {}: {}", path.parent_path().string(), ec.message())));
            }
            return {};
        }
    } // namespace

    // ============================================================================
    // CacheRecord
    // ============================================================================

    bool CacheRecord::has_verification() const
    {
        return last_verified_at_epoch.has_value() && *last_verified_at_epoch > 0 &&
               exp.has_value() && *exp > 0 &&
               license_hash.has_value() && !license_hash->empty();
    }

    VerifiedEntitlements CacheRecord::to_entitlements(bool valid_override, std::optional<std::string> error) const
    {
        VerifiedEntitlements ent;
        ent.valid = valid_override;
        ent.exp = exp.value_or(0);
        ent.tier = tier.value_or(Tier::Community);
        ent.features = features;
        ent.customer_id = customer_id;
        ent.organization = organization;
        ent.seats = seats;
        ent.error = std::move(error);
        return ent;
    }

    nlohmann::json CacheRecord::to_json() const
    {
        nlohmann::json j;
        j["last_verified_at"] = or_null(last_verified_at);
        j["last_verified_at_epoch"] = or_null(last_verified_at_epoch);
        j["license_hash"] = or_null(license_hash);
        j["valid"] = or_null(valid);
        j["exp"] = or_null(exp);
        j["tier"] = tier ? nlohmann::json(tier_to_string(*tier)) : nlohmann::json(nullptr);
        j["features"] = features;
        j["customer_id"] = or_null(customer_id);
        j["organization"] = or_null(organization);
        j["seats"] = or_null(seats);
        if (error)
            j["error"] = *error;
        return j;
    }

    CacheRecord CacheRecord::from_json(const nlohmann::json &j)
    {
        CacheRecord rec;
        if (!j.is_object())
            return rec;

        rec.last_verified_at_epoch = optional_field<double>(j, "last_verified_at_epoch");
        rec.last_verified_at = optional_field<std::string>(j, "last_verified_at");
        rec.license_hash = optional_field<std::string>(j, "license_hash");
        rec.valid = optional_field<bool>(j, "valid");
        if (auto exp_f = optional_field<double>(j, "exp"))
            rec.exp = checked_int64(std::floor(*exp_f));
        if (auto tier = optional_field<std::string>(j, "tier"))
            rec.tier = normalize_tier(*tier);
        if (auto it = j.find("features"); it != j.end() && it->is_array())
        {
            for (const auto &f : *it)
            {
                if (f.is_string())
                    rec.features.push_back(f.get<std::string>());
            }
        }
        rec.customer_id = optional_field<std::string>(j, "customer_id");
        rec.organization = optional_field<std::string>(j, "organization");
        if (auto seats = optional_field<double>(j, "seats"))
            rec.seats = checked_int64(*seats);
        rec.error = optional_field<std::string>(j, "error");
        return rec;
    }

    // ============================================================================
    // Writers
    // ============================================================================

    AtomicRenameWriter::AtomicRenameWriter() : options_{} {}

    AtomicRenameWriter::AtomicRenameWriter(const Options &options) : options_(options) {}

    fs::path AtomicRenameWriter::temp_path_for(const fs::path &path)
    {
        auto seq = sequence_.fetch_add(1);
        fs::path tmp = path;
        tmp += std::format(".{}.{}.tmp", static_cast<long>(::getpid()), seq);
        return tmp;
    }

    std::error_code AtomicRenameWriter::rename_file(const fs::path &from, const fs::path &to)
    {
        std::error_code ec;
        fs::rename(from, to, ec);
        return ec;
    }

    Result<void> AtomicRenameWriter::write(const fs::path &path, const std::string &content)
    {
        if (auto dir = ensure_parent(path); !dir)
            return dir;

        auto tmp = temp_path_for(path);
        if (auto res = write_file(tmp, content); !res)
            return res;

        std::error_code last;
        const int attempts = std::max(1, options_.attempts);
        for (int attempt = 0; attempt < attempts; ++attempt)
        {
            last = rename_file(tmp, path);
            if (!last)
                return {};
            if (attempt + 1 < attempts)
                std::this_thread::sleep_for(options_.backoff_step * (attempt + 1));
        }

        std::error_code ignored;
        fs::remove(tmp, ignored);
        return std::unexpected(TiergateError::storage(
            std::format("Atomic rename of {} failed after {} attempts: {}", path.string(), attempts, last.message())));
    }

    Result<void> DirectWriter::write(const fs::path &path, const std::string &content)
    {
        if (auto dir = ensure_parent(path); !dir)
            return dir;
        return write_file(path, content);
    }

    // ============================================================================
    // VerificationCache
    // ============================================================================

    VerificationCache::VerificationCache(
        fs::path path,
        std::shared_ptr<const Clock> clock,
        std::unique_ptr<CacheWriter> primary,
        std::unique_ptr<CacheWriter> fallback)
        : path_(std::move(path)),
          clock_(std::move(clock)),
          primary_(std::move(primary)),
          fallback_(std::move(fallback))
    {
    }

    std::optional<CacheRecord> VerificationCache::read_from_disk() const
    {
        std::error_code ec;
        if (!fs::exists(path_, ec))
            return std::nullopt;

        std::ifstream file(path_);
        if (!file.is_open())
        {
            logging::get()->warn("License cache {} could not be opened; treating as empty", path_.string());
            return std::nullopt;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        auto content = buffer.str();
        if (content.find_first_not_of(" \t\r\n") == std::string::npos)
            return std::nullopt;

        try
        {
            return CacheRecord::from_json(nlohmann::json::parse(content));
        }
        catch (const nlohmann::json::exception &e)
        {
            logging::get()->warn("License cache {} is not valid JSON ({}); treating as empty", path_.string(), e.id);
            return std::nullopt;
        }
    }

    CacheRecord VerificationCache::load()
    {
        {
            std::lock_guard lock(mutex_);
            if (mirror_)
                return *mirror_;
        }

        auto from_disk = read_from_disk().value_or(CacheRecord{});

        std::lock_guard lock(mutex_);
        // A concurrent save() may have populated the mirror while we read.
        if (!mirror_)
            mirror_ = std::move(from_disk);
        return *mirror_;
    }

    Result<CacheRecord> VerificationCache::save(const VerifiedEntitlements &entitlements, const std::string &token_hash)
    {
        auto now = clock_->now();

        CacheRecord rec;
        rec.last_verified_at_epoch = std::chrono::duration<double>(now.time_since_epoch()).count();
        rec.last_verified_at = to_iso8601(now);
        rec.license_hash = token_hash;
        rec.valid = entitlements.valid;
        rec.exp = entitlements.exp;
        rec.tier = entitlements.tier;
        rec.features = entitlements.features;
        rec.customer_id = entitlements.customer_id;
        rec.organization = entitlements.organization;
        rec.seats = entitlements.seats;
        rec.error = entitlements.error;

        const std::string serialized = rec.to_json().dump();

        std::optional<TiergateError> failure;
        auto written = primary_->write(path_, serialized);
        if (!written)
        {
            logging::get()->warn("License cache {} write failed ({}); falling back to {} write",
                                 primary_->name(), written.error().what(), fallback_->name());
            auto direct = fallback_->write(path_, serialized);
            if (!direct)
            {
                logging::get()->error("License cache could not be persisted: {}", direct.error().what());
                failure = direct.error();
            }
        }

        {
            std::lock_guard lock(mutex_);
            mirror_ = rec;
        }

        if (failure)
            return std::unexpected(*failure);
        return rec;
    }

} // namespace tiergate

#include <catch2/catch_test_macros.hpp>
#include "tiergate/verification_cache.hpp"
#include "fixtures.hpp"
#include <thread>

using namespace tiergate;
using namespace tiergate::testing;

namespace
{
    /** Rename that fails a fixed number of times, like some network-backed mounts. */
    class FlakyRenameWriter : public AtomicRenameWriter
    {
    public:
        FlakyRenameWriter(int failures, std::shared_ptr<std::atomic<int>> attempts)
            : AtomicRenameWriter(Options{5, std::chrono::milliseconds(1)}),
              failures_(failures),
              attempts_(std::move(attempts))
        {
        }

    protected:
        std::error_code rename_file(const std::filesystem::path &from, const std::filesystem::path &to) override
        {
            if (attempts_->fetch_add(1) < failures_)
                return std::make_error_code(std::errc::no_such_file_or_directory);
            return AtomicRenameWriter::rename_file(from, to);
        }

    private:
        int failures_;
        std::shared_ptr<std::atomic<int>> attempts_;
    };

    class FailingWriter : public CacheWriter
    {
    public:
        Result<void> write(const std::filesystem::path &, const std::string &) override
        {
            return std::unexpected(TiergateError::storage("disk full"));
        }

        std::string_view name() const override { return "failing"; }
    };

    class CountingDirectWriter : public DirectWriter
    {
    public:
        explicit CountingDirectWriter(std::shared_ptr<std::atomic<int>> writes) : writes_(std::move(writes)) {}

        Result<void> write(const std::filesystem::path &path, const std::string &content) override
        {
            writes_->fetch_add(1);
            return DirectWriter::write(path, content);
        }

    private:
        std::shared_ptr<std::atomic<int>> writes_;
    };

    VerifiedEntitlements pro_entitlements(int64_t exp)
    {
        VerifiedEntitlements ent;
        ent.valid = true;
        ent.exp = exp;
        ent.tier = Tier::Pro;
        ent.features = {"advanced_graph"};
        ent.customer_id = "cust-42";
        ent.organization = "Acme Corp";
        ent.seats = 25;
        return ent;
    }

    std::size_t count_files(const std::filesystem::path &dir)
    {
        std::size_t n = 0;
        for ([[maybe_unused]] const auto &entry : std::filesystem::directory_iterator(dir))
            ++n;
        return n;
    }
}

TEST_CASE("Missing cache file loads as empty", "[cache]")
{
    TempDir dir;
    VerificationCache cache(dir / "nested" / "license_cache.json");

    auto record = cache.load();
    REQUIRE_FALSE(record.has_verification());
    REQUIRE_FALSE(record.valid.has_value());
}

TEST_CASE("Saved verification persists in the documented format", "[cache]")
{
    TempDir dir;
    auto clock = std::make_shared<ManualClock>();
    auto path = dir / "cfg" / "license_cache.json";
    const std::string hash(64, 'a');

    VerificationCache cache(path, clock);
    auto saved = cache.save(pro_entitlements(clock->epoch() + kDay), hash);
    REQUIRE(saved.has_value());

    auto on_disk = nlohmann::json::parse(read_text(path));
    REQUIRE(on_disk["license_hash"] == hash);
    REQUIRE(on_disk["valid"] == true);
    REQUIRE(on_disk["exp"] == clock->epoch() + kDay);
    REQUIRE(on_disk["tier"] == "pro");
    REQUIRE(on_disk["features"] == nlohmann::json::array({"advanced_graph"}));
    REQUIRE(on_disk["customer_id"] == "cust-42");
    REQUIRE(on_disk["organization"] == "Acme Corp");
    REQUIRE(on_disk["seats"] == 25);
    REQUIRE(on_disk["last_verified_at_epoch"].get<double>() == static_cast<double>(clock->epoch()));
    REQUIRE(on_disk["last_verified_at"].get<std::string>().ends_with("Z"));

    // A fresh instance (new process) reads the same record back.
    VerificationCache reopened(path, clock);
    auto record = reopened.load();
    REQUIRE(record.has_verification());
    REQUIRE(record.license_hash == std::optional<std::string>(hash));
    REQUIRE(record.tier == std::optional<Tier>(Tier::Pro));
    REQUIRE(record.seats == std::optional<int64_t>(25));

    // Only the cache file remains; no temp files left behind.
    REQUIRE(count_files(path.parent_path()) == 1);
}

TEST_CASE("Corrupt or partial cache files degrade to empty", "[cache]")
{
    TempDir dir;
    auto path = dir / "license_cache.json";

    SECTION("not JSON")
    {
        write_text(path, "{truncated");
        REQUIRE_FALSE(VerificationCache(path).load().has_verification());
    }

    SECTION("empty file")
    {
        write_text(path, "");
        REQUIRE_FALSE(VerificationCache(path).load().has_verification());
    }

    SECTION("mistyped fields are dropped")
    {
        write_text(path, R"({"license_hash": 12, "valid": "yes", "exp": 1900000000, "last_verified_at_epoch": 1800000000.5})");
        auto record = VerificationCache(path).load();
        REQUIRE_FALSE(record.license_hash.has_value());
        REQUIRE_FALSE(record.valid.has_value());
        REQUIRE(record.exp == std::optional<int64_t>(1'900'000'000));
        REQUIRE_FALSE(record.has_verification());
    }

    SECTION("numbers outside int64 are dropped")
    {
        write_text(path, R"({"license_hash": "abc", "valid": true, "exp": 1e30, "seats": 1e300,
                             "last_verified_at_epoch": 1800000000})");
        auto record = VerificationCache(path).load();
        REQUIRE_FALSE(record.exp.has_value());
        REQUIRE_FALSE(record.seats.has_value());
    }
}

TEST_CASE("Mirror is populated from disk once", "[cache]")
{
    TempDir dir;
    auto clock = std::make_shared<ManualClock>();
    auto path = dir / "license_cache.json";

    VerificationCache writer(path, clock);
    REQUIRE(writer.save(pro_entitlements(clock->epoch() + kDay), std::string(64, 'b')).has_value());

    VerificationCache cache(path, clock);
    REQUIRE(cache.load().has_verification());

    std::filesystem::remove(path);
    REQUIRE(cache.load().has_verification());
}

TEST_CASE("Transient rename failures are retried", "[cache]")
{
    TempDir dir;
    auto path = dir / "license_cache.json";
    auto attempts = std::make_shared<std::atomic<int>>(0);
    auto direct_writes = std::make_shared<std::atomic<int>>(0);

    VerificationCache cache(path,
                            std::make_shared<ManualClock>(),
                            std::make_unique<FlakyRenameWriter>(3, attempts),
                            std::make_unique<CountingDirectWriter>(direct_writes));

    REQUIRE(cache.save(pro_entitlements(2'000'000'000), std::string(64, 'c')).has_value());
    REQUIRE(attempts->load() == 4);
    REQUIRE(direct_writes->load() == 0);
    REQUIRE(nlohmann::json::parse(read_text(path))["tier"] == "pro");
}

TEST_CASE("Exhausted renames fall back to a direct write", "[cache]")
{
    TempDir dir;
    auto path = dir / "license_cache.json";
    auto attempts = std::make_shared<std::atomic<int>>(0);
    auto direct_writes = std::make_shared<std::atomic<int>>(0);

    VerificationCache cache(path,
                            std::make_shared<ManualClock>(),
                            std::make_unique<FlakyRenameWriter>(100, attempts),
                            std::make_unique<CountingDirectWriter>(direct_writes));

    REQUIRE(cache.save(pro_entitlements(2'000'000'000), std::string(64, 'd')).has_value());
    REQUIRE(attempts->load() == 5);
    REQUIRE(direct_writes->load() == 1);
    REQUIRE(nlohmann::json::parse(read_text(path))["license_hash"] == std::string(64, 'd'));
    REQUIRE(count_files(dir.path()) == 1);
}

TEST_CASE("Unwritable cache still updates the in-memory mirror", "[cache]")
{
    TempDir dir;
    VerificationCache cache(dir / "license_cache.json",
                            std::make_shared<ManualClock>(),
                            std::make_unique<FailingWriter>(),
                            std::make_unique<FailingWriter>());

    auto saved = cache.save(pro_entitlements(2'000'000'000), std::string(64, 'e'));
    REQUIRE_FALSE(saved.has_value());
    REQUIRE(saved.error().code == ErrorCode::StorageError);

    auto record = cache.load();
    REQUIRE(record.has_verification());
    REQUIRE(record.license_hash == std::optional<std::string>(std::string(64, 'e')));
}

TEST_CASE("Concurrent saves and loads leave a whole record", "[cache][concurrency]")
{
    TempDir dir;
    auto path = dir / "license_cache.json";
    auto clock = std::make_shared<ManualClock>();
    VerificationCache cache(path, clock);

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t)
    {
        workers.emplace_back([&cache, t] {
            for (int i = 0; i < 20; ++i)
            {
                if (i % 2 == 0)
                    (void)cache.save(pro_entitlements(2'000'000'000 + t), std::string(64, static_cast<char>('a' + t)));
                else
                    (void)cache.load();
            }
        });
    }
    for (auto &w : workers)
        w.join();

    auto on_disk = VerificationCache(path, clock).load();
    REQUIRE(on_disk.has_verification());
    REQUIRE(on_disk.license_hash->size() == 64);
    REQUIRE(count_files(dir.path()) == 1);
}

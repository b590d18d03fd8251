#include "rus/upload/registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using rus::ErrorKind;
using rus::upload::Clock;
using rus::upload::Metadata;
using rus::upload::UploadRegistry;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("rus_registry_test_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

/**
 * @brief Registry options with a clock the test moves by hand
 */
struct ManualClock {
    std::shared_ptr<Clock::time_point> current =
        std::make_shared<Clock::time_point>(Clock::time_point{std::chrono::hours{1000}});

    std::function<Clock::time_point()> fn() const {
        auto tp = current;
        return [tp] { return *tp; };
    }

    void advance(std::chrono::seconds by) { *current += by; }
};

UploadRegistry::Options options_with(const ManualClock& clock, std::chrono::seconds expiry = 60s) {
    UploadRegistry::Options options;
    options.expiry = expiry;
    options.now = clock.fn();
    return options;
}

} // namespace

TEST(UploadRegistryTest, CreateAssignsUniqueHexIds) {
    UploadRegistry registry;

    auto first = registry.create({}, 100, false);
    auto second = registry.create({}, 100, false);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_TRUE(rus::upload::is_valid_upload_id(first.value().id));
    EXPECT_NE(first.value().id, second.value().id);
    EXPECT_EQ(first.value().offset, 0u);
    EXPECT_EQ(registry.size(), 2u);
}

TEST(UploadRegistryTest, GetReturnsStoredRecord) {
    UploadRegistry registry;
    Metadata metadata{{"filename", "Zm9vLnR4dA=="}, {"is_confidential", ""}};

    auto created = registry.create(metadata, std::nullopt, true);
    ASSERT_TRUE(created.is_ok());

    auto fetched = registry.get(created.value().id);
    ASSERT_TRUE(fetched.is_ok());
    EXPECT_TRUE(fetched.value().length_deferred());
    EXPECT_TRUE(fetched.value().is_partial);
    EXPECT_EQ(fetched.value().metadata, metadata);

    auto missing = registry.get("00000000000000000000000000000000");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

TEST(UploadRegistryTest, OffsetOnlyMovesForwardWithinLength) {
    UploadRegistry registry;
    const auto id = registry.create({}, 100, false).value().id;

    ASSERT_TRUE(registry.advance_offset(id, 40).is_ok());

    auto backwards = registry.advance_offset(id, 30);
    ASSERT_TRUE(backwards.is_error());
    EXPECT_EQ(backwards.error().kind, ErrorKind::InvalidOffset);
    EXPECT_EQ(backwards.error().offset, 40u);

    auto beyond = registry.advance_offset(id, 101);
    ASSERT_TRUE(beyond.is_error());
    EXPECT_EQ(beyond.error().kind, ErrorKind::InvalidOffset);

    auto done = registry.advance_offset(id, 100);
    ASSERT_TRUE(done.is_ok());
    EXPECT_TRUE(done.value().is_complete());
    EXPECT_EQ(registry.get(id).value().offset, 100u);
}

TEST(UploadRegistryTest, DeferredLengthMustBeDeclaredBeforeOffsetMoves) {
    UploadRegistry registry;
    const auto id = registry.create({}, std::nullopt, false).value().id;

    auto moved = registry.advance_offset(id, 10);
    ASSERT_TRUE(moved.is_error());
    EXPECT_EQ(moved.error().kind, ErrorKind::InvalidOffset);

    ASSERT_TRUE(registry.declare_length(id, 50).is_ok());
    ASSERT_TRUE(registry.advance_offset(id, 10).is_ok());
}

TEST(UploadRegistryTest, DeclaredLengthIsImmutable) {
    UploadRegistry registry;
    const auto id = registry.create({}, std::nullopt, false).value().id;

    ASSERT_TRUE(registry.declare_length(id, 50).is_ok());
    EXPECT_TRUE(registry.declare_length(id, 50).is_ok());

    auto changed = registry.declare_length(id, 60);
    ASSERT_TRUE(changed.is_error());
    EXPECT_EQ(changed.error().kind, ErrorKind::LengthImmutable);
    EXPECT_EQ(registry.get(id).value().total_length, 50u);
}

TEST(UploadRegistryTest, MarkFinalRequiresEmptyNonPartialUpload) {
    UploadRegistry registry;
    const auto plain = registry.create({}, 0, false).value().id;
    const auto partial = registry.create({}, 10, true).value().id;

    ASSERT_TRUE(registry.mark_final(plain, {"a", "b"}).is_ok());
    auto fetched = registry.get(plain).value();
    EXPECT_TRUE(fetched.is_final);
    EXPECT_EQ(fetched.parent_ids.size(), 2u);

    auto rejected = registry.mark_final(partial, {"a"});
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().kind, ErrorKind::InvalidConcatenation);
}

TEST(UploadRegistryTest, CreateFinalStartsAtZeroWithFixedLength) {
    UploadRegistry registry;
    auto created = registry.create_final({"p1", "p2"}, {}, 30);
    ASSERT_TRUE(created.is_ok());
    EXPECT_TRUE(created.value().is_final);
    EXPECT_EQ(created.value().offset, 0u);
    EXPECT_EQ(created.value().total_length, 30u);
}

TEST(UploadRegistryTest, RemoveTombstonesId) {
    UploadRegistry registry;
    const auto id = registry.create({}, 10, false).value().id;

    EXPECT_TRUE(registry.remove(id));
    EXPECT_FALSE(registry.remove(id));
    EXPECT_TRUE(registry.is_tombstoned(id));

    auto fetched = registry.get(id);
    ASSERT_TRUE(fetched.is_error());
    EXPECT_EQ(fetched.error().kind, ErrorKind::NotFound);
}

TEST(UploadRegistryTest, ExpiredUploadsLookAbsent) {
    ManualClock clock;
    UploadRegistry registry(options_with(clock, 60s));
    const auto id = registry.create({}, 10, false).value().id;

    ASSERT_TRUE(registry.get(id).value().expires_at.has_value());

    clock.advance(61s);
    auto fetched = registry.get(id);
    ASSERT_TRUE(fetched.is_error());
    EXPECT_EQ(fetched.error().kind, ErrorKind::NotFound);

    auto swept = registry.sweep_expired(registry.now());
    ASSERT_EQ(swept.size(), 1u);
    EXPECT_EQ(swept[0], id);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(UploadRegistryTest, AppendingSlidesExpiry) {
    ManualClock clock;
    UploadRegistry registry(options_with(clock, 60s));
    const auto id = registry.create({}, 10, false).value().id;

    clock.advance(50s);
    ASSERT_TRUE(registry.advance_offset(id, 5).is_ok());

    clock.advance(50s);
    EXPECT_TRUE(registry.get(id).is_ok());
    EXPECT_TRUE(registry.sweep_expired(registry.now()).empty());
}

TEST(UploadRegistryTest, ZeroExpiryNeverExpires) {
    ManualClock clock;
    UploadRegistry registry(options_with(clock, 0s));
    const auto id = registry.create({}, 10, false).value().id;

    EXPECT_FALSE(registry.get(id).value().expires_at.has_value());
    clock.advance(std::chrono::hours{24 * 365});
    EXPECT_TRUE(registry.get(id).is_ok());
}

TEST(UploadRegistryTest, HugeExpirySaturatesInsteadOfOverflowing) {
    ManualClock clock;
    UploadRegistry registry(options_with(clock, std::chrono::seconds(1000000000000LL)));

    auto created = registry.create({}, 10, false);
    ASSERT_TRUE(created.is_ok());
    ASSERT_TRUE(created.value().expires_at.has_value());
    EXPECT_EQ(*created.value().expires_at, Clock::time_point::max());
    EXPECT_GT(*created.value().expires_at, created.value().created_at);

    clock.advance(std::chrono::hours(24 * 365));
    EXPECT_TRUE(registry.get(created.value().id).is_ok());
}

TEST(UploadRegistryTest, PersistedStateSurvivesRestart) {
    const auto dir = create_temp_dir();
    std::string id;

    {
        UploadRegistry::Options options;
        options.persist_dir = dir;
        UploadRegistry registry(options);

        id = registry.create({{"filename", "YS5iaW4="}}, std::nullopt, false).value().id;
        ASSERT_TRUE(registry.declare_length(id, 20).is_ok());
        ASSERT_TRUE(registry.advance_offset(id, 12).is_ok());
        EXPECT_TRUE(fs::exists(dir / (id + ".info")));
    }

    UploadRegistry::Options options;
    options.persist_dir = dir;
    UploadRegistry reloaded(options);

    auto fetched = reloaded.get(id);
    ASSERT_TRUE(fetched.is_ok());
    EXPECT_EQ(fetched.value().offset, 12u);
    EXPECT_EQ(fetched.value().total_length, 20u);
    ASSERT_EQ(fetched.value().metadata.size(), 1u);
    EXPECT_EQ(fetched.value().metadata[0].first, "filename");
}

TEST(UploadRegistryTest, RemovedUploadDoesNotComeBack) {
    const auto dir = create_temp_dir();
    std::string id;

    {
        UploadRegistry::Options options;
        options.persist_dir = dir;
        UploadRegistry registry(options);
        id = registry.create({}, 5, false).value().id;
        ASSERT_TRUE(registry.remove(id));
    }

    UploadRegistry::Options options;
    options.persist_dir = dir;
    UploadRegistry reloaded(options);
    EXPECT_EQ(reloaded.size(), 0u);
    EXPECT_TRUE(reloaded.get(id).is_error());
}

TEST(UploadRegistryTest, UnreadableStateIsReportedAsCorrupted) {
    const auto dir = create_temp_dir();
    const std::string id = "0123456789abcdef0123456789abcdef";
    {
        std::ofstream out(dir / (id + ".info"));
        out << "{ not json";
    }

    UploadRegistry::Options options;
    options.persist_dir = dir;
    UploadRegistry registry(options);

    EXPECT_TRUE(registry.is_corrupted(id));
    auto fetched = registry.get(id);
    ASSERT_TRUE(fetched.is_error());
    EXPECT_EQ(fetched.error().kind, ErrorKind::Corrupted);

    auto advanced = registry.advance_offset(id, 1);
    ASSERT_TRUE(advanced.is_error());
    EXPECT_EQ(advanced.error().kind, ErrorKind::Corrupted);
}

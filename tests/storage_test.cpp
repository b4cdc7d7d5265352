/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file storage_test.cpp
 * @brief Unit tests for tier backends, the draft record format and the draft store.
 *
 * @details
 * Filesystem tests run inside `ScratchDir` clean rooms so that a failed run
 * never leaks `.lyd` files into the next one.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "lyra/infra/hash.hpp"
#include "lyra/storage/draft.hpp"
#include "lyra/storage/draft_store.hpp"
#include "lyra/storage/file_tier.hpp"
#include "lyra/storage/memory_tier.hpp"
#include "lyra/storage/tiered_store.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using lyra::infra::ErrorCode;
using lyra::infra::Status;
using namespace lyra::storage;

namespace {

const std::string kSong = "{title: Wonderwall}\n{key: F#m}\n\n"
                          "[Em7]Today is [G]gonna be the day\n"
                          "That they're [Dsus4]gonna throw it back to [A7sus4]you\n";

} // namespace

/**
 * @brief Replacing a key only charges the size difference against the quota.
 */
void test_memory_tier_quota()
{
    MemoryTier tier(10);

    ASSERT_TRUE(tier.set("a", "123456").ok());
    ASSERT_TRUE(tier.set("a", "1234567890").ok());
    ASSERT_EQ(tier.usage().used, static_cast<size_t>(10));

    Status st = tier.set("b", "x");
    ASSERT_TRUE(st.code == ErrorCode::QUOTA_EXCEEDED);
    ASSERT_FALSE(tier.get("b").has_value());

    ASSERT_TRUE(tier.remove("a").ok());
    ASSERT_EQ(tier.usage().used, static_cast<size_t>(0));
    ASSERT_TRUE(tier.remove("a").code == ErrorCode::NOT_FOUND);
}

void test_file_tier_key_escaping()
{
    ASSERT_EQ(FileTier::escape_key("draft:song/1"), std::string("draft.3asong.2f1"));

    std::string key;
    ASSERT_TRUE(FileTier::unescape_key("draft.3asong.2f1", key));
    ASSERT_EQ(key, std::string("draft:song/1"));
    ASSERT_FALSE(FileTier::unescape_key("draft.3", key));
}

/**
 * @brief Values survive a fresh `FileTier` over the same directory.
 */
void test_file_tier_persistence()
{
    lyra::test::ScratchDir dir("./test_lyra_file_tier");

    {
        FileTier tier(dir.path(), 1 << 20);
        tier.init();
        ASSERT_TRUE(tier.set("draft:song-1", kSong).ok());
        ASSERT_TRUE(tier.set("draft:song-2", "second").ok());
        ASSERT_TRUE(tier.set("draft:song-2", "replaced").ok());
    }

    FileTier reopened(dir.path(), 1 << 20);
    reopened.init();

    auto value = reopened.get("draft:song-1");
    ASSERT_TRUE(value.has_value());
    ASSERT_EQ(*value, kSong);
    ASSERT_EQ(*reopened.get("draft:song-2"), std::string("replaced"));

    // Stray files in the data directory are not keys.
    std::ofstream(dir.path() + "/notes.txt") << "ignore me";
    auto keys = reopened.keys();
    std::sort(keys.begin(), keys.end());
    ASSERT_EQ(keys.size(), static_cast<size_t>(2));
    ASSERT_EQ(keys[0], std::string("draft:song-1"));

    ASSERT_EQ(reopened.usage().used, kSong.size() + std::string("replaced").size());
    ASSERT_TRUE(reopened.remove("draft:song-1").ok());
    ASSERT_FALSE(reopened.get("draft:song-1").has_value());
    ASSERT_TRUE(reopened.remove("draft:song-1").code == ErrorCode::NOT_FOUND);
}

void test_file_tier_quota()
{
    lyra::test::ScratchDir dir("./test_lyra_file_quota");
    FileTier tier(dir.path(), 16);
    tier.init();

    ASSERT_TRUE(tier.set("k", "0123456789").ok());
    ASSERT_TRUE(tier.set("j", "0123456789").code == ErrorCode::QUOTA_EXCEEDED);
    ASSERT_FALSE(fs::exists(dir.path() + "/j.lyd"));
}

void test_draft_key_parsing()
{
    ASSERT_EQ(TieredStore::draft_key("abc"), std::string("draft:abc"));

    std::string id;
    ASSERT_TRUE(TieredStore::parse_draft_key("draft:abc", id));
    ASSERT_EQ(id, std::string("abc"));
    ASSERT_FALSE(TieredStore::parse_draft_key("config:abc", id));
}

/**
 * @brief Damaged record bytes decode to CORRUPTED_DRAFT rather than garbage.
 */
void test_record_rejects_corruption()
{
    Draft draft;
    draft.document_id = "song";
    draft.compressed_content = "payload";
    draft.content_hash = lyra::infra::content_hash("payload");
    draft.content_length = 7;
    draft.saved_at = 42;
    draft.tier = Tier::DURABLE;

    std::string bytes = encode_record(draft);

    Draft decoded;
    ASSERT_TRUE(decode_record(bytes, decoded).ok());
    ASSERT_EQ(decoded.document_id, std::string("song"));
    ASSERT_EQ(decoded.saved_at, static_cast<std::int64_t>(42));
    ASSERT_TRUE(decoded.tier == Tier::DURABLE);

    ASSERT_TRUE(decode_record("XXXX", decoded).code == ErrorCode::CORRUPTED_DRAFT);
    ASSERT_TRUE(decode_record(bytes.substr(0, bytes.size() - 3), decoded).code ==
                ErrorCode::CORRUPTED_DRAFT);

    std::string garbled = bytes;
    garbled[9] = '#';
    ASSERT_TRUE(decode_record(garbled, decoded).code == ErrorCode::CORRUPTED_DRAFT);
}

void test_draft_store_round_trip()
{
    lyra::test::Rig rig;

    Draft written;
    ASSERT_TRUE(rig.store->write_draft(Tier::DURABLE, "song-1", kSong, &written).ok());
    ASSERT_EQ(written.content_hash, lyra::infra::content_hash(kSong));
    ASSERT_EQ(written.saved_at, rig.clock.wall_ms());
    ASSERT_TRUE(rig.store->has_draft(Tier::DURABLE, "song-1"));
    ASSERT_FALSE(rig.store->has_draft(Tier::VOLATILE, "song-1"));

    Draft draft;
    std::string content;
    ASSERT_TRUE(rig.store->read_draft(Tier::DURABLE, "song-1", draft, content).ok());
    ASSERT_EQ(content, kSong);
    ASSERT_EQ(draft.content_length, kSong.size());

    Status missing = rig.store->read_draft(Tier::VOLATILE, "song-1", draft, content);
    ASSERT_TRUE(missing.code == ErrorCode::NOT_FOUND);

    ASSERT_TRUE(rig.store->remove_draft(Tier::DURABLE, "song-1").ok());
    ASSERT_FALSE(rig.store->has_draft(Tier::DURABLE, "song-1"));
}

void test_draft_store_rejects_oversized()
{
    DraftStoreOptions options;
    options.max_draft_size = 64;
    lyra::test::Rig rig(1 << 20, 1 << 20, options);

    Status st = rig.store->write_draft(Tier::VOLATILE, "big", std::string(65, 'a'));
    ASSERT_TRUE(st.code == ErrorCode::DRAFT_TOO_LARGE);
    ASSERT_FALSE(rig.store->has_draft(Tier::VOLATILE, "big"));
    ASSERT_EQ(rig.volatile_tier->sets, 0);

    ASSERT_TRUE(rig.store->write_draft(Tier::VOLATILE, "fits", std::string(64, 'a')).ok());
}

/**
 * @brief A restarted store rebuilds its index from the records on disk.
 */
void test_draft_store_rebuilds_index()
{
    lyra::test::ScratchDir dir("./test_lyra_draft_store");
    lyra::infra::ManualClock clock;

    auto make_tiers = [&dir]() {
        auto durable = std::make_unique<FileTier>(dir.path(), 1 << 20);
        durable->init();
        return std::make_unique<TieredStore>(std::make_unique<MemoryTier>(1 << 20),
                                             std::move(durable));
    };

    {
        auto tiers = make_tiers();
        DraftStore store(*tiers, clock);
        ASSERT_TRUE(store.write_draft(Tier::DURABLE, "song-1", kSong).ok());
        clock.advance(1000);
        ASSERT_TRUE(store.write_draft(Tier::DURABLE, "song-2", "[C]short").ok());
        ASSERT_TRUE(store.write_draft(Tier::VOLATILE, "song-3", "gone after restart").ok());
    }

    auto tiers = make_tiers();
    DraftStore store(*tiers, clock);

    ASSERT_TRUE(store.has_draft(Tier::DURABLE, "song-1"));
    ASSERT_TRUE(store.has_draft(Tier::DURABLE, "song-2"));
    ASSERT_FALSE(store.has_draft(Tier::VOLATILE, "song-3"));

    auto drafts = store.list_drafts(Tier::DURABLE);
    ASSERT_EQ(drafts.size(), static_cast<size_t>(2));
    ASSERT_EQ(drafts[0].document_id, std::string("song-1"));
    ASSERT_EQ(drafts[1].saved_at - drafts[0].saved_at, static_cast<std::int64_t>(1000));

    Draft draft;
    std::string content;
    ASSERT_TRUE(store.read_draft(Tier::DURABLE, "song-1", draft, content).ok());
    ASSERT_EQ(content, kSong);

    auto stats = store.storage_stats();
    ASSERT_EQ(stats.durable_tier.drafts, static_cast<size_t>(2));
    ASSERT_EQ(stats.volatile_tier.drafts, static_cast<size_t>(0));
}

void test_purge_expired_skips_open_documents()
{
    lyra::test::Rig rig;
    ASSERT_TRUE(rig.store->write_draft(Tier::VOLATILE, "open", "a").ok());
    ASSERT_TRUE(rig.store->write_draft(Tier::VOLATILE, "stale", "b").ok());
    ASSERT_TRUE(rig.store->write_draft(Tier::DURABLE, "stale", "b").ok());
    rig.store->open_document("open");

    rig.clock.advance(5000);
    ASSERT_TRUE(rig.store->write_draft(Tier::DURABLE, "fresh", "c").ok());

    ASSERT_EQ(rig.store->purge_expired(1000), static_cast<size_t>(2));
    ASSERT_TRUE(rig.store->has_draft(Tier::VOLATILE, "open"));
    ASSERT_TRUE(rig.store->has_draft(Tier::DURABLE, "fresh"));
    ASSERT_FALSE(rig.store->has_draft(Tier::VOLATILE, "stale"));
    ASSERT_FALSE(rig.store->has_draft(Tier::DURABLE, "stale"));

    // Closing the last reference exposes the draft to purging again.
    rig.store->open_document("open");
    rig.store->close_document("open");
    ASSERT_EQ(rig.store->purge_expired(1000), static_cast<size_t>(0));
    rig.store->close_document("open");
    ASSERT_EQ(rig.store->purge_expired(1000), static_cast<size_t>(1));
}

void test_clear_all()
{
    lyra::test::Rig rig;
    ASSERT_TRUE(rig.store->write_draft(Tier::VOLATILE, "a", "1").ok());
    ASSERT_TRUE(rig.store->write_draft(Tier::DURABLE, "b", "2").ok());
    rig.store->open_document("a");

    ASSERT_TRUE(rig.store->clear_all().ok());
    ASSERT_FALSE(rig.store->has_draft(Tier::VOLATILE, "a"));
    ASSERT_FALSE(rig.store->has_draft(Tier::DURABLE, "b"));
    ASSERT_EQ(rig.store->storage_stats().durable_tier.used, static_cast<size_t>(0));
}

#include <gtest/gtest.h>
#include <primus/memory/partition_store.hpp>
#include <primus/memory/store.hpp>
#include <primus/sandbox/cipher.hpp>
#include <primus/core/utils.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

using namespace primus;

class PartitionStoreTest : public ::testing::Test {
protected:
    PartitionStoreTest() : store(tokens), global("primus", PartitionClass::GLOBAL) {}

    void SetUp() override {
        ASSERT_TRUE(store.create(global));
    }

    TokenAuthority tokens;
    PartitionStore store;
    PartitionId global;
};

TEST_F(PartitionStoreTest, TokensAreSingleUse) {
    AccessToken w = tokens.issue("primus", global, TokenOp::WRITE);
    EXPECT_EQ(store.write(global, w, "hello"), StoreStatus::OK);
    EXPECT_EQ(store.write(global, w, "again"), StoreStatus::TOKEN_INVALID);

    AccessToken r = tokens.issue("primus", global, TokenOp::READ);
    std::string out;
    EXPECT_EQ(store.read(global, r, out), StoreStatus::OK);
    EXPECT_EQ(out, "hello");
    EXPECT_EQ(store.read(global, r, out), StoreStatus::TOKEN_INVALID);
    EXPECT_EQ(tokens.outstanding(), 0u);
}

TEST_F(PartitionStoreTest, TokenBoundToPartitionAndOperation) {
    PartitionId other("coder", PartitionClass::AGENT_PRIVATE);
    ASSERT_TRUE(store.create(other));

    AccessToken read = tokens.issue("primus", global, TokenOp::READ);
    EXPECT_EQ(store.write(global, read, "x"), StoreStatus::TOKEN_INVALID);

    AccessToken write = tokens.issue("primus", global, TokenOp::WRITE);
    EXPECT_EQ(store.write(other, write, "x"), StoreStatus::TOKEN_INVALID);

    AccessToken forged;
    forged.value = "00112233445566778899aabbccddeeff";
    EXPECT_EQ(store.append(global, forged, "x"), StoreStatus::TOKEN_INVALID);
    EXPECT_EQ(store.append(global, AccessToken(), "x"), StoreStatus::TOKEN_INVALID);
}

TEST_F(PartitionStoreTest, UnknownPartition) {
    PartitionId missing("ghost", PartitionClass::SUBCHAT);
    AccessToken t = tokens.issue("ghost", missing, TokenOp::READ);
    std::string out;
    EXPECT_EQ(store.read(missing, t, out), StoreStatus::PARTITION_NOT_FOUND);
    EXPECT_FALSE(store.exists(missing));
}

TEST_F(PartitionStoreTest, RevokedTokensStopWorking) {
    AccessToken t = tokens.issue("sc1", global, TokenOp::WRITE);
    EXPECT_EQ(tokens.revoke_actor("sc1"), 1u);
    EXPECT_EQ(store.write(global, t, "x"), StoreStatus::TOKEN_INVALID);
}

TEST_F(PartitionStoreTest, UnusedTokensExpire) {
    TokenAuthority short_lived(20);
    PartitionStore timed(short_lived);
    ASSERT_TRUE(timed.create(global));

    AccessToken fresh = short_lived.issue("primus", global, TokenOp::WRITE);
    EXPECT_EQ(timed.write(global, fresh, "in time"), StoreStatus::OK);

    AccessToken stale = short_lived.issue("primus", global, TokenOp::READ);
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    std::string out;
    EXPECT_EQ(timed.read(global, stale, out), StoreStatus::TOKEN_INVALID);
    EXPECT_TRUE(out.empty());

    short_lived.issue("primus", global, TokenOp::READ);
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    short_lived.issue("primus", global, TokenOp::READ);
    EXPECT_EQ(short_lived.outstanding(), 1u);
}

TEST_F(PartitionStoreTest, RevokeAllDropsEveryToken) {
    AccessToken a = tokens.issue("primus", global, TokenOp::READ);
    tokens.issue("sc1", global, TokenOp::WRITE);
    EXPECT_EQ(tokens.revoke_all(), 2u);
    EXPECT_EQ(tokens.outstanding(), 0u);
    std::string out;
    EXPECT_EQ(store.read(global, a, out), StoreStatus::TOKEN_INVALID);
    EXPECT_FALSE(tokens.revoke(a));
}

TEST_F(PartitionStoreTest, ConcurrentAppendsToSamePartition) {
    const int writers = 8;
    const int per_writer = 50;
    std::vector<std::thread> threads;

    for (int w = 0; w < writers; ++w) {
        threads.push_back(std::thread([this]() {
            for (int i = 0; i < per_writer; ++i) {
                AccessToken t = tokens.issue("primus", global, TokenOp::WRITE);
                EXPECT_EQ(store.append(global, t, "x"), StoreStatus::OK);
            }
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) threads[i].join();

    AccessToken r = tokens.issue("primus", global, TokenOp::READ);
    std::string out;
    ASSERT_EQ(store.read(global, r, out), StoreStatus::OK);
    EXPECT_EQ(out.size(), static_cast<size_t>(writers * per_writer));
    EXPECT_EQ(store.version(global), static_cast<uint64_t>(writers * per_writer));
}

class PersistentStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / ("primus_store_" + generate_uuid());
        std::filesystem::create_directories(dir);
        db_path = (dir / "memory.db").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    std::filesystem::path dir;
    std::string db_path;
};

TEST_F(PersistentStoreTest, ContentSurvivesReopen) {
    PartitionId global("primus", PartitionClass::GLOBAL);
    {
        MemoryStore db;
        ASSERT_TRUE(db.open(db_path));
        TokenAuthority tokens;
        PartitionStore store(tokens);
        store.attach_backend(&db);
        ASSERT_TRUE(store.create(global));
        EXPECT_EQ(store.write(global, tokens.issue("primus", global, TokenOp::WRITE), "kept"), StoreStatus::OK);
    }

    MemoryStore db;
    ASSERT_TRUE(db.open(db_path));
    TokenAuthority tokens;
    PartitionStore store(tokens);
    store.attach_backend(&db);
    ASSERT_TRUE(store.create(global));

    std::string out;
    EXPECT_EQ(store.read(global, tokens.issue("primus", global, TokenOp::READ), out), StoreStatus::OK);
    EXPECT_EQ(out, "kept");
}

TEST_F(PersistentStoreTest, SandboxPrivateIsSealedAtRest) {
    PartitionId sealed("sandbox", PartitionClass::SANDBOX_PRIVATE);
    std::shared_ptr<const Cipher> key = std::make_shared<AesGcmCipher>(random_bytes(AesGcmCipher::KEY_SIZE));
    std::shared_ptr<const Cipher> wrong = std::make_shared<AesGcmCipher>(random_bytes(AesGcmCipher::KEY_SIZE));

    MemoryStore db;
    ASSERT_TRUE(db.open(db_path));
    {
        TokenAuthority tokens;
        PartitionStore store(tokens);
        store.attach_backend(&db);
        store.set_sealing_cipher(key);
        ASSERT_TRUE(store.create(sealed));
        EXPECT_EQ(store.write(sealed, tokens.issue("sandbox", sealed, TokenOp::WRITE), "secret notes"),
                  StoreStatus::OK);
    }

    std::string raw;
    ASSERT_TRUE(db.get_partition(sealed, raw));
    EXPECT_EQ(raw.find("secret notes"), std::string::npos);

    {
        TokenAuthority tokens;
        PartitionStore store(tokens);
        store.attach_backend(&db);
        ASSERT_TRUE(store.create(sealed));
        store.set_sealing_cipher(key);
        std::string out;
        EXPECT_EQ(store.read(sealed, tokens.issue("sandbox", sealed, TokenOp::READ), out), StoreStatus::OK);
        EXPECT_EQ(out, "secret notes");
    }

    TokenAuthority tokens;
    PartitionStore store(tokens);
    store.attach_backend(&db);
    ASSERT_TRUE(store.create(sealed));
    store.set_sealing_cipher(wrong);
    std::string out;
    EXPECT_EQ(store.read(sealed, tokens.issue("sandbox", sealed, TokenOp::READ), out), StoreStatus::CORRUPTED);
}

TEST_F(PersistentStoreTest, AuditTableRoundTrip) {
    MemoryStore db;
    ASSERT_TRUE(db.open(db_path));

    AuditRecord r;
    r.seq = 7;
    r.timestamp = 1700000000000LL;
    r.actor_id = "coder";
    r.action = ActionKind::INTERNET_CALL;
    r.decision = DecisionKind::REQUIRE_APPROVAL;
    r.reason = "internet call needs user approval";
    ASSERT_TRUE(db.append_audit(r));

    std::vector<AuditRecord> loaded = db.load_audit(10);
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].seq, 7);
    EXPECT_EQ(loaded[0].action, ActionKind::INTERNET_CALL);
    EXPECT_EQ(loaded[0].decision, DecisionKind::REQUIRE_APPROVAL);
    EXPECT_EQ(db.max_audit_seq(), 7);
}

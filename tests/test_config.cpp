#include <gtest/gtest.h>
#include <primus/core/config.hpp>
#include <primus/core/logger.hpp>
#include <cstdio>
#include <fstream>
#include <string>

using namespace primus;

TEST(ConfigTest, DottedKeys) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(
        "{\"memory\": {\"db_path\": \"/tmp/primus.db\"},"
        " \"sandbox\": {\"kdf_iterations\": 5000, \"enabled\": \"yes\"},"
        " \"audit\": {\"persist\": false}}"));

    EXPECT_EQ(cfg.get_string("memory.db_path"), "/tmp/primus.db");
    EXPECT_EQ(cfg.get_int("sandbox.kdf_iterations"), 5000);
    EXPECT_TRUE(cfg.get_bool("sandbox.enabled"));
    EXPECT_FALSE(cfg.get_bool("audit.persist", true));
    EXPECT_TRUE(cfg.has("memory"));
    EXPECT_FALSE(cfg.has("memory.nothing"));
}

TEST(ConfigTest, DefaultsForMissingOrMistyped) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string("{\"primus\": {\"id\": 42}, \"limit\": \"many\"}"));

    EXPECT_EQ(cfg.get_string("primus.id", "primus"), "primus");
    EXPECT_EQ(cfg.get_int("limit", 7), 7);
    EXPECT_EQ(cfg.get_int("absent", 3), 3);
    EXPECT_TRUE(cfg.get_json("absent").is_null());
}

TEST(ConfigTest, InvalidDocumentKeepsPrevious) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string("{\"primus\": {\"id\": \"ada\"}}"));
    EXPECT_FALSE(cfg.load_string("{not json"));
    EXPECT_FALSE(cfg.load_string("[1, 2]"));
    EXPECT_FALSE(cfg.last_error().empty());
    EXPECT_EQ(cfg.get_string("primus.id"), "ada");
}

TEST(ConfigTest, SetCreatesNestedObjects) {
    Config cfg;
    cfg.set_string("sandbox.journal_path", "/tmp/journal.enc");
    cfg.set_bool("audit.persist", false);
    EXPECT_EQ(cfg.get_string("sandbox.journal_path"), "/tmp/journal.enc");
    EXPECT_FALSE(cfg.get_bool("audit.persist", true));
    EXPECT_TRUE(cfg.get_json("sandbox").is_object());
}

TEST(ConfigTest, LoadFromFile) {
    Logger::instance().set_quiet(true);
    const std::string path = ::testing::TempDir() + "primus_config_test.json";
    {
        std::ofstream out(path.c_str());
        out << "{\"policy\": {\"grants\": {\"coder\": {\"internet_access\": \"off\"}}}}";
    }

    Config cfg;
    ASSERT_TRUE(cfg.load(path));
    EXPECT_EQ(cfg.path(), path);
    Json grants = cfg.get_json("policy.grants");
    ASSERT_TRUE(grants.is_object());
    EXPECT_EQ(grants["coder"]["internet_access"], "off");

    EXPECT_FALSE(cfg.load(path + ".missing"));
    EXPECT_EQ(cfg.path(), path);
    std::remove(path.c_str());
    Logger::instance().set_quiet(false);
}

#include <gtest/gtest.h>
#include "Config.h"
#include "TestFiles.h"

using namespace FileCourier;
using FileCourier::testing_util::TempDir;

class ConfigTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(ConfigTest, BasicOperations) {
    Config config;
    config.set("key1", "value1");
    EXPECT_EQ(config.get("key1"), "value1");
    EXPECT_TRUE(config.hasKey("key1"));
    EXPECT_FALSE(config.hasKey("key2"));
    EXPECT_EQ(config.get("key2", "fallback"), "fallback");
}

TEST_F(ConfigTest, LoadsFileWithCommentsAndWhitespace) {
    auto path = dir_.writeFile("courier.conf",
        "# transfer client\n"
        "  port = 2055  \n"
        "\n"
        "tls_cert_file=/etc/courier/client.pem\n"
        "not a setting\n"
        "tls_verify_peer = yes\n");

    Config config;
    ASSERT_TRUE(config.loadFromFile(path));
    EXPECT_EQ(config.getInt("port"), 2055);
    EXPECT_EQ(config.get("tls_cert_file"), "/etc/courier/client.pem");
    EXPECT_TRUE(config.getBool("tls_verify_peer"));
    EXPECT_FALSE(config.hasKey("not a setting"));
}

TEST_F(ConfigTest, MissingFileIsReported) {
    Config config;
    EXPECT_FALSE(config.loadFromFile((dir_.path() / "absent.conf").string()));
}

TEST_F(ConfigTest, LayeredLoadingOverrides) {
    auto base = dir_.writeFile("base.conf", "port=1055\nchunk_size=4096\n");
    auto local = dir_.writeFile("local.conf", "port=3000\n");

    Config config;
    ASSERT_TRUE(config.loadLayered({base, (dir_.path() / "missing.conf").string(), local}));
    EXPECT_EQ(config.getInt("port"), 3000);
    EXPECT_EQ(config.getSize("chunk_size"), 4096u);

    Config keepFirst;
    ASSERT_TRUE(keepFirst.loadLayered({base, local}, false));
    EXPECT_EQ(keepFirst.getInt("port"), 1055);
}

TEST_F(ConfigTest, TypedGettersRejectGarbage) {
    Config config;
    config.set("port", "80x");
    config.set("size", "-5");
    config.set("flag", "maybe");
    config.set("huge", "99999999999999999999999");

    EXPECT_EQ(config.getInt("port", 7), 7);
    EXPECT_EQ(config.getSize("size", 9), 9u);
    EXPECT_TRUE(config.getBool("flag", true));
    EXPECT_EQ(config.getInt("huge", 3), 3);
}

TEST_F(ConfigTest, ValidationNamesFailingKey) {
    Config config;
    config.set("port", "70000");
    config.set("host", "localhost");

    std::unordered_map<std::string, Config::Validator> schema;
    schema["port"] = [](const std::string&, const std::string& v) {
        return v.size() <= 5 && std::stoi(v) > 0 && std::stoi(v) < 65536;
    };
    schema["absent"] = [](const std::string&, const std::string&) { return false; };

    std::string failed;
    EXPECT_FALSE(config.validate(schema, &failed));
    EXPECT_EQ(failed, "port");

    config.set("port", "8080");
    EXPECT_TRUE(config.validate(schema));
}

TEST_F(ConfigTest, CopyIsIndependent) {
    Config original;
    original.set("a", "1");
    Config copy = original;
    copy.set("a", "2");
    EXPECT_EQ(original.get("a"), "1");
    EXPECT_EQ(copy.get("a"), "2");
}

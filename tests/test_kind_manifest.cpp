#include <gtest/gtest.h>
#include "tagid/kind_manifest.hpp"
#include "tagid/log.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace tagid;

class KindManifestTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "tagid_kind_manifest_test";
        std::filesystem::create_directories(tempDir);
        savedLevel = logLevel();
        setLogStreams(&out, &err);
    }

    void TearDown() override {
        setLogStreams(nullptr, nullptr);
        setLogLevel(savedLevel);
        std::filesystem::remove_all(tempDir);
    }

    std::filesystem::path tempDir;
    TypeRegistry registry;
    LogLevel savedLevel = LogLevel::Warning;
    std::ostringstream out;
    std::ostringstream err;
};

TEST_F(KindManifestTest, DeclaresKinds) {
    ConfigFile config;
    config.loadFromString(
        "# Identifier kinds\n"
        "kind.user: User\n"
        "kind.order: Order\n"
        "unrelated: value\n");

    EXPECT_EQ(applyKindManifest(config, registry), 2);
    ASSERT_NE(registry.find("user"), nullptr);
    EXPECT_EQ(registry.find("user")->displayName(), "User");
    EXPECT_EQ(registry.find("order")->typeName(), "OrderId");
    EXPECT_EQ(registry.size(), 2u);
}

TEST_F(KindManifestTest, TagsAreNormalized) {
    ConfigFile config;
    config.loadFromString("kind.USER: User\n");
    EXPECT_EQ(applyKindManifest(config, registry), 1);
    EXPECT_TRUE(registry.isRegistered("user"));
    EXPECT_EQ(registry.listTags(), std::vector<std::string>{"user"});
}

TEST_F(KindManifestTest, InvalidTagRegistersNothing) {
    ConfigFile config;
    config.loadFromString(
        "kind.user: User\n"
        "kind.toolongtag: Broken\n");

    EXPECT_EQ(applyKindManifest(config, registry), -1);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_NE(err.str().find("[KindManifest] ERROR: "), std::string::npos);
    EXPECT_NE(err.str().find("kind.toolongtag"), std::string::npos);
}

TEST_F(KindManifestTest, MissingDisplayNameRejected) {
    ConfigFile config;
    config.loadFromString("kind.user:\n");
    EXPECT_EQ(applyKindManifest(config, registry), -1);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(KindManifestTest, AppliesLogLevel) {
    ConfigFile config;
    config.loadFromString("log.level: error\nkind.user: User\n");
    EXPECT_EQ(applyKindManifest(config, registry), 1);
    EXPECT_EQ(logLevel(), LogLevel::Error);
}

TEST_F(KindManifestTest, UnknownLogLevelKeepsCurrent) {
    setLogLevel(LogLevel::Warning);
    ConfigFile config;
    config.loadFromString("log.level: loud\n");
    EXPECT_EQ(applyKindManifest(config, registry), 0);
    EXPECT_EQ(logLevel(), LogLevel::Warning);
    EXPECT_NE(err.str().find("WARNING: Unknown log level 'loud'"), std::string::npos);
}

TEST_F(KindManifestTest, LoadFromFile) {
    auto path = tempDir / "kinds.conf";
    {
        std::ofstream file(path);
        file << "kind.usr: User\n";
        file << "kind.ord: Order\n";
    }

    EXPECT_EQ(loadKindManifest(path, registry), 2);
    EXPECT_TRUE(registry.isRegistered("usr"));
    EXPECT_TRUE(registry.isRegistered("ord"));
}

TEST_F(KindManifestTest, MissingFileFails) {
    EXPECT_EQ(loadKindManifest(tempDir / "missing.conf", registry), -1);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_NE(err.str().find("Failed to read manifest"), std::string::npos);
}

TEST_F(KindManifestTest, ExistingKindKept) {
    const IdKind& user = registry.registerOrGet("Person", "user");
    ConfigFile config;
    config.loadFromString("kind.user: User\n");
    EXPECT_EQ(applyKindManifest(config, registry), 1);
    EXPECT_EQ(registry.find("user"), &user);
    EXPECT_EQ(user.displayName(), "Person");
}

TEST_F(KindManifestTest, DeclareCreatesManifest) {
    auto path = tempDir / "new" / "kinds.conf";
    EXPECT_TRUE(declareKind(path, "User", "USER"));
    EXPECT_TRUE(declareKind(path, "Order", "order"));

    EXPECT_EQ(loadKindManifest(path, registry), 2);
    ASSERT_NE(registry.find("user"), nullptr);
    EXPECT_EQ(registry.find("user")->displayName(), "User");
    EXPECT_EQ(registry.find("order")->displayName(), "Order");

    std::ifstream file(path);
    std::string first;
    std::getline(file, first);
    EXPECT_EQ(first, "# tagid kind manifest");
}

TEST_F(KindManifestTest, DeclareUpdatesInPlace) {
    auto path = tempDir / "kinds.conf";
    {
        std::ofstream file(path);
        file << "# Service kinds\n";
        file << "kind.user: Person\n";
        file << "log.level: info\n";
    }

    EXPECT_TRUE(declareKind(path, "User", "user"));

    std::ifstream file(path);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_EQ(content.str(), "# Service kinds\nkind.user: User\nlog.level: info\n");
}

TEST_F(KindManifestTest, DeclareRejectsBadInput) {
    auto path = tempDir / "kinds.conf";
    EXPECT_FALSE(declareKind(path, "User", "user-id"));
    EXPECT_FALSE(declareKind(path, "", "user"));
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_NE(err.str().find("Cannot declare 'user-id'"), std::string::npos);
}

TEST_F(KindManifestTest, UndeclareCommentsOut) {
    auto path = tempDir / "kinds.conf";
    ASSERT_TRUE(declareKind(path, "User", "user"));
    ASSERT_TRUE(declareKind(path, "Order", "order"));

    EXPECT_TRUE(undeclareKind(path, "USER"));
    EXPECT_EQ(loadKindManifest(path, registry), 1);
    EXPECT_FALSE(registry.isRegistered("user"));
    EXPECT_TRUE(registry.isRegistered("order"));
}

TEST_F(KindManifestTest, UndeclareMissing) {
    EXPECT_FALSE(undeclareKind(tempDir / "missing.conf", "user"));

    auto path = tempDir / "kinds.conf";
    ASSERT_TRUE(declareKind(path, "User", "user"));
    EXPECT_FALSE(undeclareKind(path, "order"));
    EXPECT_NE(err.str().find("No declaration for 'kind.order'"), std::string::npos);
}

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "mcpgate/auth/token_store.h"

namespace mcpgate {
namespace auth {
namespace {

class TokenStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    char dir_template[] = "/tmp/mcpgate_token_XXXXXX";
    ASSERT_NE(mkdtemp(dir_template), nullptr);
    dir_ = dir_template;
    path_ = dir_ + "/whoop_token.json";
  }

  void TearDown() override {
    std::remove(path_.c_str());
    std::remove((path_ + ".tmp").c_str());
    rmdir(dir_.c_str());
  }

  void writeRaw(const std::string& content) {
    std::ofstream out(path_);
    out << content;
  }

  std::string dir_;
  std::string path_;
};

TEST_F(TokenStoreTest, MissingFileMeansNotAuthenticated) {
  TokenStore store(path_);

  EXPECT_FALSE(store.load().has_value());
  EXPECT_FALSE(store.accessToken().has_value());
  EXPECT_EQ(store.status(), nlohmann::json({{"authenticated", false}}));
}

TEST_F(TokenStoreTest, SaveThenLoad) {
  TokenStore store(path_);
  nlohmann::json token = {{"access_token", "abc123"},
                          {"token_type", "bearer"},
                          {"expires_in", 3600},
                          {"refresh_token", "r1"}};

  ASSERT_TRUE(store.save(token));

  auto loaded = store.load();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, token);
  EXPECT_EQ(store.accessToken().value(), "abc123");
}

TEST_F(TokenStoreTest, FileIsOwnerOnly) {
  TokenStore store(path_);
  ASSERT_TRUE(store.save({{"access_token", "abc"}}));

  struct stat info;
  ASSERT_EQ(stat(path_.c_str(), &info), 0);
  EXPECT_EQ(info.st_mode & 0777, 0600u);
  EXPECT_NE(access((path_ + ".tmp").c_str(), F_OK), 0);
}

TEST_F(TokenStoreTest, SaveReplacesPreviousToken) {
  TokenStore store(path_);
  ASSERT_TRUE(store.save({{"access_token", "first"}}));
  ASSERT_TRUE(store.save({{"access_token", "second"}}));

  EXPECT_EQ(store.accessToken().value(), "second");
}

TEST_F(TokenStoreTest, StatusReportsTypeAndExpiry) {
  TokenStore store(path_);
  ASSERT_TRUE(store.save(
      {{"access_token", "abc"}, {"token_type", "bearer"}, {"expires_in", 3600}}));

  auto status = store.status();
  EXPECT_EQ(status["authenticated"], true);
  EXPECT_EQ(status["token_type"], "bearer");
  EXPECT_EQ(status["expires_in"], 3600);
}

TEST_F(TokenStoreTest, StatusFillsUnknownFields) {
  TokenStore store(path_);
  ASSERT_TRUE(store.save({{"access_token", "abc"}}));

  auto status = store.status();
  EXPECT_EQ(status["authenticated"], true);
  EXPECT_EQ(status["token_type"], "unknown");
  EXPECT_EQ(status["expires_in"], "unknown");
}

TEST_F(TokenStoreTest, CorruptFileIsIgnored) {
  writeRaw("{not json");
  TokenStore store(path_);

  EXPECT_FALSE(store.load().has_value());
  EXPECT_EQ(store.status()["authenticated"], false);
}

TEST_F(TokenStoreTest, NonObjectJsonIsIgnored) {
  writeRaw("[1, 2, 3]");
  TokenStore store(path_);

  EXPECT_FALSE(store.load().has_value());
}

TEST_F(TokenStoreTest, EmptyAccessTokenIsAbsent) {
  TokenStore store(path_);
  ASSERT_TRUE(store.save({{"access_token", ""}}));

  EXPECT_FALSE(store.accessToken().has_value());
}

TEST_F(TokenStoreTest, SaveFailsInMissingDirectory) {
  TokenStore store(dir_ + "/missing/token.json");

  EXPECT_FALSE(store.save({{"access_token", "abc"}}));
}

}  // namespace
}  // namespace auth
}  // namespace mcpgate

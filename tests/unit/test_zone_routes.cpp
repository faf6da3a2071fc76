#include "api/routes/ZoneRoutes.hpp"

#include "common/IdGenerator.hpp"
#include "core/ConfigStore.hpp"
#include "dal/ConfigRepository.hpp"
#include "model/Entities.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>

using ddns::api::routes::ZoneRoutes;
using ddns::core::ConfigStore;
using ddns::dal::ConfigRepository;

namespace fs = std::filesystem;

namespace {

const std::string kZoneBody = R"({
  "zone_id": "0123456789abcdef0123456789abcdef",
  "domain": "example.com",
  "subdomains": [{"name": "www"}, {"name": "@", "proxied": true, "ttl": 3600}]
})";

}  // namespace

class ZoneRoutesTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _pathDir = fs::temp_directory_path() /
               ("ddns-zr-" + ddns::common::IdGenerator::generate());
    fs::create_directories(_pathDir);
    _upRepo = std::make_unique<ConfigRepository>(_pathDir / "config.json");
    _upStore = std::make_unique<ConfigStore>(*_upRepo);
    _upStore->init();
    _upRoutes = std::make_unique<ZoneRoutes>(*_upStore);

    ddns::model::CloudflareAccount acct;
    acct.authentication.oApiToken = "tok1";
    _sAccountId = _upStore->createAccount(acct).sId;
  }

  void TearDown() override {
    _upRoutes.reset();
    _upStore.reset();
    _upRepo.reset();
    std::error_code ec;
    fs::remove_all(_pathDir, ec);
  }

  static nlohmann::json body(const crow::response& resp) {
    return nlohmann::json::parse(resp.body);
  }

  fs::path _pathDir;
  std::unique_ptr<ConfigRepository> _upRepo;
  std::unique_ptr<ConfigStore> _upStore;
  std::unique_ptr<ZoneRoutes> _upRoutes;
  std::string _sAccountId;
};

TEST_F(ZoneRoutesTest, CreateAssignsIdsAndDefaults) {
  auto resp = _upRoutes->create(_sAccountId, kZoneBody);
  ASSERT_EQ(resp.code, 200);

  auto j = body(resp);
  EXPECT_EQ(j["message"], "Zone created successfully");
  auto jZone = j["data"]["zone"];
  EXPECT_FALSE(jZone["id"].get<std::string>().empty());
  ASSERT_EQ(jZone["subdomains"].size(), 2u);
  EXPECT_FALSE(jZone["subdomains"][0]["id"].get<std::string>().empty());
  EXPECT_EQ(jZone["subdomains"][0]["proxied"], false);
  EXPECT_EQ(jZone["subdomains"][0]["ttl"], 300);
  EXPECT_EQ(jZone["subdomains"][1]["ttl"], 3600);
}

TEST_F(ZoneRoutesTest, CreateRejectsClientIds) {
  auto resp = _upRoutes->create(
      _sAccountId, R"({"id": "mine", "zone_id": "0123456789abcdef0123456789abcdef",
                       "domain": "example.com"})");
  EXPECT_EQ(resp.code, 422);
}

TEST_F(ZoneRoutesTest, ConflictsAre400) {
  ASSERT_EQ(_upRoutes->create(_sAccountId, kZoneBody).code, 200);

  auto respDup = _upRoutes->create(_sAccountId, kZoneBody);
  ASSERT_EQ(respDup.code, 400);
  EXPECT_NE(body(respDup)["data"]["detail"].get<std::string>().find("already exists"),
            std::string::npos);

  auto respSub = _upRoutes->create(_sAccountId, R"({
    "zone_id": "fedcba9876543210fedcba9876543210", "domain": "example.org",
    "subdomains": [{"name": "www"}, {"name": "www"}]
  })");
  ASSERT_EQ(respSub.code, 400);
  EXPECT_EQ(body(respSub)["data"]["detail"], "Duplicate subdomain name: www");
  EXPECT_EQ(body(_upRoutes->list(_sAccountId))["data"]["zones"].size(), 1u);
}

TEST_F(ZoneRoutesTest, InvalidZoneIdIs422) {
  auto resp = _upRoutes->create(_sAccountId, R"({"zone_id": "abc", "domain": "example.com"})");
  EXPECT_EQ(resp.code, 422);
}

TEST_F(ZoneRoutesTest, ListGetUpdateDelete) {
  auto sZoneId = body(_upRoutes->create(_sAccountId, kZoneBody))["data"]["zone"]["id"]
                     .get<std::string>();

  auto jList = body(_upRoutes->list(_sAccountId));
  EXPECT_EQ(jList["message"], "Zones retrieved successfully");
  ASSERT_EQ(jList["data"]["zones"].size(), 1u);

  auto respGet = _upRoutes->get(_sAccountId, sZoneId);
  ASSERT_EQ(respGet.code, 200);
  EXPECT_EQ(body(respGet)["data"]["zone"]["domain"], "example.com");

  auto respUpdate = _upRoutes->update(_sAccountId, sZoneId, R"({
    "zone_id": "0123456789abcdef0123456789abcdef",
    "domain": "example.net",
    "subdomains": [{"name": "home", "ttl": 60}]
  })");
  ASSERT_EQ(respUpdate.code, 200);
  auto jZone = body(respUpdate)["data"]["zone"];
  EXPECT_EQ(jZone["id"], sZoneId);
  EXPECT_EQ(jZone["domain"], "example.net");
  ASSERT_EQ(jZone["subdomains"].size(), 1u);
  EXPECT_FALSE(jZone["subdomains"][0]["id"].get<std::string>().empty());

  auto respDelete = _upRoutes->remove(_sAccountId, sZoneId);
  ASSERT_EQ(respDelete.code, 200);
  EXPECT_TRUE(body(respDelete)["data"].is_null());
  EXPECT_EQ(body(respDelete)["message"], "Zone deleted successfully");
  EXPECT_EQ(_upRoutes->get(_sAccountId, sZoneId).code, 404);
}

TEST_F(ZoneRoutesTest, NotFoundDistinguishesAccountAndZone) {
  auto respAccount = _upRoutes->get("no-account", "no-zone");
  ASSERT_EQ(respAccount.code, 404);
  EXPECT_NE(body(respAccount)["data"]["detail"].get<std::string>().find("Account"),
            std::string::npos);

  auto respZone = _upRoutes->get(_sAccountId, "no-zone");
  ASSERT_EQ(respZone.code, 404);
  EXPECT_NE(body(respZone)["data"]["detail"].get<std::string>().find("Zone"),
            std::string::npos);

  EXPECT_EQ(_upRoutes->list("no-account").code, 404);
  EXPECT_EQ(_upRoutes->create("no-account", kZoneBody).code, 404);
  EXPECT_EQ(_upRoutes->remove(_sAccountId, "no-zone").code, 404);
  EXPECT_EQ(_upRoutes->update(_sAccountId, "no-zone", kZoneBody).code, 404);
}

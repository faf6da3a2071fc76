#include "dal/ConfigRepository.hpp"

#include "common/Errors.hpp"
#include "common/IdGenerator.hpp"
#include "model/JsonCodec.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using ddns::common::InternalError;
using ddns::dal::ConfigRepository;
using namespace ddns::model;

namespace fs = std::filesystem;

class ConfigRepositoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _pathDir = fs::temp_directory_path() / ("ddns-repo-" + ddns::common::IdGenerator::generate());
    fs::create_directories(_pathDir);
    _pathFile = _pathDir / "config.json";
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(_pathDir, ec);
  }

  void writeFile(const std::string& sContent) {
    std::ofstream ofs(_pathFile);
    ofs << sContent;
  }

  std::string readFile() {
    std::ifstream ifs(_pathFile);
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
  }

  static DdnsConfig sampleConfig() {
    DdnsConfig dc;
    dc.bAaaa = false;
    dc.iTtl = 120;

    CloudflareAccount acct;
    acct.sId = "acct-1";
    acct.authentication.oApiToken = "tok1";
    Zone zn;
    zn.sId = "zone-1";
    zn.sZoneId = "0123456789abcdef0123456789abcdef";
    zn.sDomain = "example.com";
    zn.vSubdomains.push_back(SubDomain{"sd-1", "www", true, 600});
    zn.vSubdomains.push_back(SubDomain{"sd-2", "@", false, 300});
    acct.vZones.push_back(zn);
    dc.vCloudflare.push_back(acct);
    return dc;
  }

  fs::path _pathDir;
  fs::path _pathFile;
};

TEST_F(ConfigRepositoryTest, MissingFileYieldsDefaults) {
  ConfigRepository crRepo(_pathFile);
  auto dc = crRepo.load();

  EXPECT_TRUE(dc.vCloudflare.empty());
  EXPECT_TRUE(dc.bA);
  EXPECT_TRUE(dc.bAaaa);
  EXPECT_FALSE(dc.bPurgeUnknownRecords);
  EXPECT_EQ(dc.iTtl, 300);
  EXPECT_FALSE(fs::exists(_pathFile));
}

TEST_F(ConfigRepositoryTest, SaveThenLoadReturnsSameTree) {
  ConfigRepository crRepo(_pathFile);
  auto dc = sampleConfig();
  crRepo.save(dc);

  EXPECT_EQ(crRepo.load(), dc);
  EXPECT_FALSE(fs::exists(_pathFile.string() + ".tmp"));
}

TEST_F(ConfigRepositoryTest, SavedFileIsIndentedJson) {
  ConfigRepository crRepo(_pathFile);
  crRepo.save(sampleConfig());

  auto sContent = readFile();
  EXPECT_NE(sContent.find("\n  \"cloudflare\": ["), std::string::npos);
  EXPECT_EQ(sContent.back(), '\n');

  auto j = nlohmann::json::parse(sContent);
  EXPECT_EQ(j["cloudflare"][0]["authentication"]["api_token"], "tok1");
  EXPECT_TRUE(j["cloudflare"][0]["authentication"]["api_key"].is_null());
  EXPECT_EQ(j["purgeUnknownRecords"], false);
}

TEST_F(ConfigRepositoryTest, StaleTempFileIsTruncatedBeforeWrite) {
  // Leftover from an interrupted save, longer than the next document
  {
    std::ofstream ofs(_pathFile.string() + ".tmp");
    ofs << std::string(64 * 1024, 'x');
  }

  ConfigRepository crRepo(_pathFile);
  crRepo.save(DdnsConfig{});

  const std::string sExpected = ddns::model::JsonCodec::toJson(DdnsConfig{}).dump(2) + "\n";
  EXPECT_EQ(readFile(), sExpected);
  EXPECT_EQ(fs::file_size(_pathFile), sExpected.size());
  EXPECT_FALSE(fs::exists(_pathFile.string() + ".tmp"));
}

TEST_F(ConfigRepositoryTest, SaveInWorkingDirectoryWithBareFileName) {
  auto pathPrev = fs::current_path();
  fs::current_path(_pathDir);

  ConfigRepository crRepo("bare.json");
  EXPECT_NO_THROW(crRepo.save(sampleConfig()));
  EXPECT_EQ(crRepo.load(), sampleConfig());

  fs::current_path(pathPrev);
}

TEST_F(ConfigRepositoryTest, SaveOverwritesPreviousDocument) {
  ConfigRepository crRepo(_pathFile);
  crRepo.save(sampleConfig());
  crRepo.save(DdnsConfig{});

  EXPECT_TRUE(crRepo.load().vCloudflare.empty());
}

TEST_F(ConfigRepositoryTest, BackfillsMissingIdsAtEveryLevel) {
  writeFile(R"({
    "cloudflare": [{
      "authentication": {"api_token": "tok1", "api_key": null},
      "zones": [{
        "zone_id": "0123456789abcdef0123456789abcdef",
        "domain": "example.com",
        "subdomains": [{"name": "www"}, {"id": "keep-me", "name": "vpn"}]
      }]
    }]
  })");

  ConfigRepository crRepo(_pathFile);
  auto dc = crRepo.load();

  ASSERT_EQ(dc.vCloudflare.size(), 1u);
  const auto& acct = dc.vCloudflare[0];
  EXPECT_FALSE(acct.sId.empty());
  ASSERT_EQ(acct.vZones.size(), 1u);
  EXPECT_FALSE(acct.vZones[0].sId.empty());
  ASSERT_EQ(acct.vZones[0].vSubdomains.size(), 2u);
  EXPECT_FALSE(acct.vZones[0].vSubdomains[0].sId.empty());
  EXPECT_EQ(acct.vZones[0].vSubdomains[1].sId, "keep-me");
}

TEST_F(ConfigRepositoryTest, BackfilledIdsSurviveResave) {
  writeFile(R"({"cloudflare": [{"authentication": {"api_token": "tok1"}}]})");

  ConfigRepository crRepo(_pathFile);
  auto dcFirst = crRepo.load();
  crRepo.save(dcFirst);
  auto dcSecond = crRepo.load();

  ASSERT_EQ(dcSecond.vCloudflare.size(), 1u);
  EXPECT_EQ(dcSecond.vCloudflare[0].sId, dcFirst.vCloudflare[0].sId);
}

TEST_F(ConfigRepositoryTest, InvalidJsonFailsToLoad) {
  writeFile("{ not json");
  ConfigRepository crRepo(_pathFile);

  try {
    crRepo.load();
    FAIL() << "expected InternalError";
  } catch (const InternalError& e) {
    EXPECT_EQ(e._sErrorCode, "load_failed");
  }
}

TEST_F(ConfigRepositoryTest, SchemaViolationsFailToLoad) {
  ConfigRepository crRepo(_pathFile);

  writeFile(R"({"cloudflare": [], "ttl": "300"})");
  EXPECT_THROW(crRepo.load(), InternalError);

  writeFile(R"({"cloudflare": [], "ttl": 5})");
  EXPECT_THROW(crRepo.load(), InternalError);

  writeFile(R"({
    "cloudflare": [{
      "id": "a", "authentication": {"api_token": "t"},
      "zones": [{"id": "z", "zone_id": "0123456789abcdef0123456789abcdef", "domain": "d",
                 "subdomains": [{"id": "1", "name": "www"}, {"id": "2", "name": "www"}]}]
    }]
  })");
  EXPECT_THROW(crRepo.load(), InternalError);

  // Corrupt file must be left untouched for the operator
  EXPECT_NE(readFile().find("\"www\""), std::string::npos);
}

TEST_F(ConfigRepositoryTest, SaveIntoMissingDirectoryFails) {
  ConfigRepository crRepo(_pathDir / "absent" / "config.json");

  try {
    crRepo.save(sampleConfig());
    FAIL() << "expected InternalError";
  } catch (const InternalError& e) {
    EXPECT_EQ(e._sErrorCode, "persist_failed");
    EXPECT_EQ(e._iHttpStatus, 500);
  }
}

TEST_F(ConfigRepositoryTest, FailedRenameKeepsPreviousFile) {
  ConfigRepository crRepo(_pathFile);
  crRepo.save(sampleConfig());

  // A directory in place of the target makes the rename fail
  auto pathBlocked = _pathDir / "blocked.json";
  fs::create_directories(pathBlocked / "inner");
  ConfigRepository crBlocked(pathBlocked);

  EXPECT_THROW(crBlocked.save(sampleConfig()), InternalError);
  EXPECT_FALSE(fs::exists(pathBlocked.string() + ".tmp"));
  EXPECT_EQ(crRepo.load(), sampleConfig());
}

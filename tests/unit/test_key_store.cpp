#include <catch2/catch.hpp>

#include "policy/key_store.h"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace modelgate;

namespace {

std::filesystem::path TempPath(const std::string& name) {
  auto path = std::filesystem::temp_directory_path() / "modelgate_key_store_test" / name;
  std::filesystem::remove(path);
  return path;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

ApiKeyRecord Record(const std::string& id) {
  ApiKeyRecord record;
  record.id = id;
  record.digest = std::string(64, 'a');
  record.owner = "billing-service";
  record.description = "line one\nline two";
  record.capabilities = {Capability::kEmbed, Capability::kBusiness};
  record.rate_limit = {120, 30};
  record.created_at = 1700000000;
  record.expires_at = 1800000000;
  record.last_used_at = 1700000500;
  record.authentications = 7;
  record.authorizations = 5;
  record.denials = 2;
  record.priority = 3;
  record.requests = 4;
  record.endpoints = {"/business/classify", "/embeddings"};
  record.first_request_at = 1700000100;
  record.last_request_at = 1700000400;
  return record;
}

}  // namespace

TEST_CASE("FileKeyStore treats a missing file as empty", "[key_store]") {
  auto path = TempPath("missing.keys");
  FileKeyStore store(path.string());
  REQUIRE(store.Load());
  REQUIRE(store.Records().empty());
  REQUIRE(store.Name() == "file");
}

TEST_CASE("FileKeyStore round-trips records through the file", "[key_store]") {
  auto path = TempPath("plain.keys");
  {
    FileKeyStore store(path.string());
    store.Upsert(Record("mg_aaaaaaaaa"));
    auto revoked = Record("mg_bbbbbbbbb");
    revoked.status = KeyStatus::kRevoked;
    store.Upsert(revoked);
    REQUIRE(store.Save());
  }

  auto contents = ReadFile(path);
  REQUIRE(contents.find("[key mg_aaaaaaaaa]") != std::string::npos);
  REQUIRE(contents.find("capabilities=embed,business") != std::string::npos);
  REQUIRE(contents.find("rate_limit=120/30") != std::string::npos);
  REQUIRE(contents.find("line one line two") != std::string::npos);

  FileKeyStore reloaded(path.string());
  REQUIRE(reloaded.Load());
  auto records = reloaded.Records();
  REQUIRE(records.size() == 2);
  const auto& a = records[0];
  REQUIRE(a.id == "mg_aaaaaaaaa");
  REQUIRE(a.digest == std::string(64, 'a'));
  REQUIRE(a.owner == "billing-service");
  REQUIRE(a.capabilities == std::set<Capability>{Capability::kEmbed, Capability::kBusiness});
  REQUIRE(a.rate_limit.max_requests == 120);
  REQUIRE(a.rate_limit.window_seconds == 30);
  REQUIRE(a.Active());
  REQUIRE(a.created_at == 1700000000);
  REQUIRE(a.expires_at == 1800000000);
  REQUIRE(a.authentications == 7);
  REQUIRE(a.authorizations == 5);
  REQUIRE(a.denials == 2);
  REQUIRE(a.priority == 3);
  REQUIRE(a.requests == 4);
  REQUIRE(a.endpoints == std::set<std::string>{"/business/classify", "/embeddings"});
  REQUIRE(a.first_request_at == 1700000100);
  REQUIRE(a.last_request_at == 1700000400);
  REQUIRE(records[1].status == KeyStatus::kRevoked);
}

TEST_CASE("FileKeyStore drops removed records on save", "[key_store]") {
  auto path = TempPath("remove.keys");
  FileKeyStore store(path.string());
  store.Upsert(Record("mg_aaaaaaaaa"));
  store.Upsert(Record("mg_bbbbbbbbb"));
  store.Remove("mg_aaaaaaaaa");
  store.Remove("mg_unknown00");
  REQUIRE(store.Save());

  FileKeyStore reloaded(path.string());
  REQUIRE(reloaded.Load());
  auto records = reloaded.Records();
  REQUIRE(records.size() == 1);
  REQUIRE(records[0].id == "mg_bbbbbbbbb");
}

TEST_CASE("FileKeyStore never stores static keys", "[key_store]") {
  auto path = TempPath("static.keys");
  FileKeyStore store(path.string());
  auto record = Record("static-key-0");
  record.is_static = true;
  store.Upsert(record);
  REQUIRE(store.Records().empty());
}

TEST_CASE("FileKeyStore overwrites on upsert", "[key_store]") {
  auto path = TempPath("upsert.keys");
  FileKeyStore store(path.string());
  store.Upsert(Record("mg_aaaaaaaaa"));
  auto changed = Record("mg_aaaaaaaaa");
  changed.authentications = 99;
  store.Upsert(changed);
  auto records = store.Records();
  REQUIRE(records.size() == 1);
  REQUIRE(records[0].authentications == 99);
}

TEST_CASE("FileKeyStore skips sections without digest and unknown capabilities",
          "[key_store]") {
  auto path = TempPath("handwritten.keys");
  std::filesystem::create_directories(path.parent_path());
  {
    std::ofstream out(path);
    out << "# comment\n"
        << "[key mg_nodigest]\n"
        << "owner=nobody\n"
        << "[key mg_ccccccccc]\n"
        << "digest=" << std::string(64, 'c') << "\n"
        << "capabilities=embed,teleport\n"
        << "[other section]\n"
        << "digest=ignored\n";
  }
  FileKeyStore store(path.string());
  REQUIRE(store.Load());
  auto records = store.Records();
  REQUIRE(records.size() == 1);
  REQUIRE(records[0].id == "mg_ccccccccc");
  REQUIRE(records[0].capabilities == std::set<Capability>{Capability::kEmbed});
}

TEST_CASE("FileKeyStore seals the file with a passphrase", "[key_store]") {
  auto path = TempPath("sealed.keys");
  {
    FileKeyStore store(path.string(), "correct horse");
    REQUIRE(store.Encrypted());
    store.Upsert(Record("mg_aaaaaaaaa"));
    REQUIRE(store.Save());
  }

  auto contents = ReadFile(path);
  REQUIRE(contents.rfind("ENC\n", 0) == 0);
  REQUIRE(contents.find("billing-service") == std::string::npos);

  FileKeyStore reopened(path.string(), "correct horse");
  REQUIRE(reopened.Load());
  REQUIRE(reopened.Records().size() == 1);
  REQUIRE(reopened.Records()[0].owner == "billing-service");

  FileKeyStore wrong(path.string(), "battery staple");
  REQUIRE_FALSE(wrong.Load());

  FileKeyStore no_passphrase(path.string());
  REQUIRE_FALSE(no_passphrase.Load());
}

TEST_CASE("FileKeyStore rejects a tampered sealed file", "[key_store]") {
  auto path = TempPath("tampered.keys");
  {
    FileKeyStore store(path.string(), "secret");
    store.Upsert(Record("mg_aaaaaaaaa"));
    REQUIRE(store.Save());
  }
  auto contents = ReadFile(path);
  auto data = contents.find("data=");
  REQUIRE(data != std::string::npos);
  auto& digit = contents[data + 5];
  digit = digit == '0' ? '1' : '0';
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
  }
  FileKeyStore store(path.string(), "secret");
  REQUIRE_FALSE(store.Load());
}

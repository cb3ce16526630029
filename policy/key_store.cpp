#include "policy/key_store.h"

#include "server/logging/logger.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <cctype>

namespace modelgate {

namespace {
constexpr const char* kSectionPrefix = "key ";

std::string Trim(const std::string& input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos || end == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

std::string HexEncode(const unsigned char* data, std::size_t len) {
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[2 * i] = hex[(data[i] >> 4) & 0xF];
    out[2 * i + 1] = hex[data[i] & 0xF];
  }
  return out;
}

bool HexDecode(const std::string& hex, std::vector<unsigned char>* out) {
  out->clear();
  if (hex.size() % 2 != 0) {
    return false;
  }
  auto decode = [](char c) -> int {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
  };
  out->reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    int high = decode(hex[i]);
    int low = decode(hex[i + 1]);
    if (high < 0 || low < 0) {
      out->clear();
      return false;
    }
    out->push_back(static_cast<unsigned char>((high << 4) | low));
  }
  return true;
}

std::vector<std::string> SplitCSV(const std::string& line) {
  std::vector<std::string> values;
  std::stringstream ss(line);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto trimmed = Trim(item);
    if (!trimmed.empty()) {
      values.push_back(trimmed);
    }
  }
  return values;
}

std::string JoinCSV(const std::vector<std::string>& values) {
  std::ostringstream out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << values[i];
  }
  return out.str();
}

// Single-line values only; the description is free text.
std::string OneLine(std::string value) {
  for (auto& c : value) {
    if (c == '\n' || c == '\r') {
      c = ' ';
    }
  }
  return value;
}

int64_t ToInt64(const std::string& value) {
  try {
    return std::stoll(value);
  } catch (const std::exception&) {
    return 0;
  }
}

void ApplyField(ApiKeyRecord* record, const std::string& key, const std::string& value) {
  if (key == "digest") {
    record->digest = value;
  } else if (key == "owner") {
    record->owner = value;
  } else if (key == "description") {
    record->description = value;
  } else if (key == "capabilities") {
    record->capabilities.clear();
    for (const auto& name : SplitCSV(value)) {
      Capability cap;
      if (ParseCapability(name, &cap)) {
        record->capabilities.insert(cap);
      } else {
        log::Warn("key_store", "ignoring unknown capability '" + name + "'",
                  "key=" + record->id);
      }
    }
  } else if (key == "rate_limit") {
    auto slash = value.find('/');
    record->rate_limit.max_requests = static_cast<int>(ToInt64(value.substr(0, slash)));
    if (slash != std::string::npos) {
      record->rate_limit.window_seconds = static_cast<int>(ToInt64(value.substr(slash + 1)));
    }
  } else if (key == "priority") {
    record->priority = static_cast<int>(ToInt64(value));
  } else if (key == "status") {
    record->status = value == "revoked" ? KeyStatus::kRevoked : KeyStatus::kActive;
  } else if (key == "created_at") {
    record->created_at = ToInt64(value);
  } else if (key == "expires_at") {
    record->expires_at = ToInt64(value);
  } else if (key == "last_used_at") {
    record->last_used_at = ToInt64(value);
  } else if (key == "authentications") {
    record->authentications = static_cast<uint64_t>(ToInt64(value));
  } else if (key == "authorizations") {
    record->authorizations = static_cast<uint64_t>(ToInt64(value));
  } else if (key == "denials") {
    record->denials = static_cast<uint64_t>(ToInt64(value));
  } else if (key == "requests") {
    record->requests = static_cast<uint64_t>(ToInt64(value));
  } else if (key == "endpoints") {
    auto endpoints = SplitCSV(value);
    record->endpoints = std::set<std::string>(endpoints.begin(), endpoints.end());
  } else if (key == "first_request_at") {
    record->first_request_at = ToInt64(value);
  } else if (key == "last_request_at") {
    record->last_request_at = ToInt64(value);
  }
}
}  // namespace

FileKeyStore::FileKeyStore(std::string path, std::string passphrase)
    : path_(std::move(path)), encryption_enabled_(!passphrase.empty()) {
  if (encryption_enabled_) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(passphrase.data()), passphrase.size(), hash);
    std::copy(hash, hash + key_.size(), key_.begin());
  }
}

void FileKeyStore::EnsureParentDir() const {
  auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
}

bool FileKeyStore::Load() {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    // First run: nothing persisted yet.
    return !ec;
  }
  std::ifstream input(path_, std::ios::binary);
  if (!input.good()) {
    return false;
  }
  std::string raw((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  std::string plaintext = raw;
  if (raw.rfind("ENC", 0) == 0) {
    if (!encryption_enabled_) {
      log::Error("key_store", "key file is encrypted but no passphrase is configured",
                 "path=" + path_);
      return false;
    }
    if (!Decrypt(raw, &plaintext)) {
      log::Error("key_store", "failed to decrypt key file", "path=" + path_);
      return false;
    }
  }
  Parse(plaintext);
  return true;
}

void FileKeyStore::Parse(const std::string& plaintext) {
  std::istringstream buffer(plaintext);
  std::string line;
  ApiKeyRecord* current = nullptr;
  while (std::getline(buffer, line)) {
    line = Trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    if (line.front() == '[' && line.back() == ']') {
      auto section = line.substr(1, line.size() - 2);
      current = nullptr;
      if (section.rfind(kSectionPrefix, 0) == 0) {
        auto id = Trim(section.substr(std::char_traits<char>::length(kSectionPrefix)));
        if (!id.empty()) {
          current = &records_[id];
          current->id = id;
        }
      }
      continue;
    }
    auto eq = line.find('=');
    if (eq == std::string::npos || current == nullptr) {
      continue;
    }
    ApplyField(current, Trim(line.substr(0, eq)), Trim(line.substr(eq + 1)));
  }
  for (auto it = records_.begin(); it != records_.end();) {
    if (it->second.digest.empty()) {
      log::Warn("key_store", "dropping key section without digest", "key=" + it->first);
      it = records_.erase(it);
    } else {
      ++it;
    }
  }
}

std::string FileKeyStore::Serialize() const {
  std::ostringstream out;
  out << "# modelgate key store\n";
  for (const auto& [id, record] : records_) {
    out << "\n[" << kSectionPrefix << id << "]\n";
    out << "digest=" << record.digest << "\n";
    out << "owner=" << OneLine(record.owner) << "\n";
    out << "description=" << OneLine(record.description) << "\n";
    out << "capabilities=" << JoinCSV(CapabilityNames(record.capabilities)) << "\n";
    out << "rate_limit=" << record.rate_limit.max_requests << "/"
        << record.rate_limit.window_seconds << "\n";
    out << "priority=" << record.priority << "\n";
    out << "status=" << (record.Active() ? "active" : "revoked") << "\n";
    out << "created_at=" << record.created_at << "\n";
    out << "expires_at=" << record.expires_at << "\n";
    out << "last_used_at=" << record.last_used_at << "\n";
    out << "authentications=" << record.authentications << "\n";
    out << "authorizations=" << record.authorizations << "\n";
    out << "denials=" << record.denials << "\n";
    out << "requests=" << record.requests << "\n";
    out << "endpoints="
        << JoinCSV(std::vector<std::string>(record.endpoints.begin(), record.endpoints.end()))
        << "\n";
    out << "first_request_at=" << record.first_request_at << "\n";
    out << "last_request_at=" << record.last_request_at << "\n";
  }
  return out.str();
}

bool FileKeyStore::Save() const {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureParentDir();
  std::string serialized = Serialize();
  if (encryption_enabled_) {
    std::string encrypted;
    if (!Encrypt(serialized, &encrypted)) {
      log::Error("key_store", "failed to encrypt key file", "path=" + path_);
      return false;
    }
    serialized = std::move(encrypted);
  }

  // Write-then-rename so a crash never leaves a truncated key file.
  std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream output(tmp_path, std::ios::trunc | std::ios::binary);
    if (!output.good()) {
      log::Error("key_store", "cannot open key file for writing", "path=" + tmp_path);
      return false;
    }
    output << serialized;
    if (!output.good()) {
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    log::Error("key_store", "cannot replace key file: " + ec.message(), "path=" + path_);
    return false;
  }
  return true;
}

std::vector<ApiKeyRecord> FileKeyStore::Records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ApiKeyRecord> out;
  out.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    out.push_back(record);
  }
  return out;
}

void FileKeyStore::Upsert(const ApiKeyRecord& record) {
  if (record.is_static) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  records_[record.id] = record;
}

void FileKeyStore::Remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.erase(id);
}

bool FileKeyStore::Encrypt(const std::string& plaintext, std::string* output) const {
  std::array<unsigned char, 12> nonce{};
  if (RAND_bytes(nonce.data(), nonce.size()) != 1) {
    return false;
  }
  std::vector<unsigned char> ciphertext(plaintext.size() + 16);
  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  if (!ctx) {
    return false;
  }
  bool ok = false;
  do {
    if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, nonce.size(), nullptr) != 1) break;
    if (EVP_EncryptInit_ex(ctx, nullptr, nullptr, key_.data(), nonce.data()) != 1) break;
    int out_len = 0;
    if (EVP_EncryptUpdate(ctx,
                          ciphertext.data(),
                          &out_len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
      break;
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx, ciphertext.data() + out_len, &final_len) != 1) break;
    ciphertext.resize(static_cast<std::size_t>(out_len + final_len));
    std::array<unsigned char, 16> tag{};
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, tag.size(), tag.data()) != 1) break;
    std::ostringstream result;
    result << "ENC\n";
    result << "nonce=" << HexEncode(nonce.data(), nonce.size()) << "\n";
    result << "tag=" << HexEncode(tag.data(), tag.size()) << "\n";
    result << "data=" << HexEncode(ciphertext.data(), ciphertext.size()) << "\n";
    *output = result.str();
    ok = true;
  } while (false);
  EVP_CIPHER_CTX_free(ctx);
  return ok;
}

bool FileKeyStore::Decrypt(const std::string& encrypted, std::string* plaintext) const {
  std::istringstream buffer(encrypted);
  std::string header;
  if (!std::getline(buffer, header) || Trim(header) != "ENC") {
    return false;
  }
  auto read_field = [&](const std::string& expected, std::vector<unsigned char>* out) -> bool {
    std::string line;
    if (!std::getline(buffer, line)) {
      return false;
    }
    auto eq = line.find('=');
    if (eq == std::string::npos || Trim(line.substr(0, eq)) != expected) {
      return false;
    }
    return HexDecode(Trim(line.substr(eq + 1)), out);
  };
  std::vector<unsigned char> nonce;
  std::vector<unsigned char> tag;
  std::vector<unsigned char> data;
  if (!read_field("nonce", &nonce) || nonce.empty()) return false;
  if (!read_field("tag", &tag) || tag.size() != 16) return false;
  if (!read_field("data", &data)) return false;

  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  if (!ctx) {
    return false;
  }
  bool ok = false;
  do {
    if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, nonce.size(), nullptr) != 1) break;
    if (EVP_DecryptInit_ex(ctx, nullptr, nullptr, key_.data(), nonce.data()) != 1) break;
    std::vector<unsigned char> plain(data.size() + 16);
    int out_len = 0;
    if (EVP_DecryptUpdate(ctx, plain.data(), &out_len, data.data(),
                          static_cast<int>(data.size())) != 1) {
      break;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, tag.size(), tag.data()) != 1) break;
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx, plain.data() + out_len, &final_len) != 1) break;
    plain.resize(static_cast<std::size_t>(out_len + final_len));
    plaintext->assign(reinterpret_cast<char*>(plain.data()), plain.size());
    ok = true;
  } while (false);
  EVP_CIPHER_CTX_free(ctx);
  return ok;
}

}  // namespace modelgate

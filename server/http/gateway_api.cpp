#include "server/http/gateway_api.h"

#include "runtime/backends/builtin/text_analysis.h"
#include "server/logging/audit_logger.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace modelgate {

using json = nlohmann::json;

namespace {

constexpr std::size_t kMaxAudioBytes = 25 * 1024 * 1024;
constexpr std::size_t kMaxImageBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxEmbeddingTexts = 100;
constexpr std::size_t kMaxOcrBatch = 10;
constexpr int64_t kMaxExpiryDays = 3650;
constexpr int64_t kMaxPriority = 100;

const std::set<std::string> kAudioTypes = {
    "audio/mpeg", "audio/wav", "audio/x-wav", "audio/mp4",
    "audio/x-m4a", "audio/ogg", "audio/webm", "audio/flac"};
const std::set<std::string> kImageTypes = {"image/jpeg", "image/png",
                                           "image/bmp", "image/tiff",
                                           "image/webp"};
const std::map<std::string, std::string> kSpeechLanguages = {
    {"ar", "Arabic"},   {"de", "German"},   {"en", "English"},
    {"es", "Spanish"},  {"fr", "French"},   {"hi", "Hindi"},
    {"it", "Italian"},  {"ja", "Japanese"}, {"ko", "Korean"},
    {"nl", "Dutch"},    {"pl", "Polish"},   {"pt", "Portuguese"},
    {"ru", "Russian"},  {"tr", "Turkish"},  {"uk", "Ukrainian"},
    {"zh", "Chinese"}};
const std::vector<std::string> kOcrLanguages = {
    "ar", "bg", "bn", "ca", "cs", "da", "de", "el", "en", "es", "et", "fa",
    "fi", "fr", "he", "hi", "hr", "hu", "id", "it", "ja", "ko", "lt", "lv",
    "ms", "nl", "no", "pl", "pt", "ro", "ru", "sk", "sl", "sr", "sv", "ta",
    "te", "th", "tl", "tr", "uk", "ur", "vi", "zh"};
const std::set<std::string> kChatRoles = {"user", "assistant", "system"};
const std::vector<std::string> kBusinessTasks = {"classify", "sentiment",
                                                 "entities", "summarize",
                                                 "translate"};

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// "audio/wav; codecs=1" -> "audio/wav"
std::string MediaType(const HttpRequest& request) {
  auto value = request.Header("content-type");
  auto semi = value.find(';');
  if (semi != std::string::npos) {
    value = value.substr(0, semi);
  }
  value.erase(std::remove_if(value.begin(), value.end(),
                             [](unsigned char c) { return std::isspace(c); }),
              value.end());
  return Lower(value);
}

std::string IsoTime(int64_t unix_seconds) {
  std::time_t t = static_cast<std::time_t>(unix_seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

json OptionalTime(int64_t unix_seconds) {
  if (unix_seconds <= 0) {
    return nullptr;
  }
  return IsoTime(unix_seconds);
}

std::string Base64Encode(const std::string& data) {
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  if (out.empty()) {
    return out;
  }
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                reinterpret_cast<const unsigned char*>(data.data()),
                                static_cast<int>(data.size()));
  out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
  return out;
}

// Decoded size of a base64 string, or false when it is not base64.
bool Base64DecodedSize(const std::string& encoded, std::size_t* size) {
  if (encoded.empty() || encoded.size() % 4 != 0) {
    return false;
  }
  std::size_t padding = 0;
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(encoded[i]);
    if (c == '=') {
      if (i < encoded.size() - 2) {
        return false;
      }
      ++padding;
    } else if (!std::isalnum(c) && c != '+' && c != '/') {
      return false;
    } else if (padding > 0) {
      return false;
    }
  }
  *size = encoded.size() / 4 * 3 - padding;
  return true;
}

std::size_t WordCount(const std::string& text) {
  std::istringstream in(text);
  std::size_t count = 0;
  std::string word;
  while (in >> word) {
    ++count;
  }
  return count;
}

double Round(double value, int digits) {
  double scale = std::pow(10.0, digits);
  return std::round(value * scale) / scale;
}

// ── Payload accessors ──────────────────────────────────────────────────────
// Each returns a Validation error naming the offending field. Optional
// accessors leave *out untouched when the field is absent or null.

GatewayError ParseJsonBody(const HttpRequest& request, json* out) {
  if (request.body.empty()) {
    *out = json::object();
    return GatewayError::Ok();
  }
  try {
    *out = json::parse(request.body);
  } catch (const json::parse_error&) {
    return GatewayError::Validation("request body is not valid JSON");
  }
  if (!out->is_object()) {
    return GatewayError::Validation("request body must be a JSON object");
  }
  return GatewayError::Ok();
}

bool Present(const json& body, const char* field) {
  return body.contains(field) && !body.at(field).is_null();
}

GatewayError RequireString(const json& body, const char* field, std::string* out,
                           std::size_t min_len = 1,
                           std::size_t max_len = std::string::npos) {
  if (!Present(body, field)) {
    return GatewayError::Validation(std::string("'") + field + "' is required");
  }
  if (!body.at(field).is_string()) {
    return GatewayError::Validation(std::string("'") + field + "' must be a string");
  }
  auto value = body.at(field).get<std::string>();
  if (value.size() < min_len) {
    return GatewayError::Validation(std::string("'") + field + "' must be at least " +
                                    std::to_string(min_len) + " characters");
  }
  if (max_len != std::string::npos && value.size() > max_len) {
    return GatewayError::Validation(std::string("'") + field + "' must be at most " +
                                    std::to_string(max_len) + " characters");
  }
  *out = std::move(value);
  return GatewayError::Ok();
}

GatewayError OptionalString(const json& body, const char* field, std::string* out,
                            std::size_t max_len = std::string::npos) {
  if (!Present(body, field)) {
    return GatewayError::Ok();
  }
  return RequireString(body, field, out, 0, max_len);
}

GatewayError OptionalInt(const json& body, const char* field, int64_t lo, int64_t hi,
                         int64_t* out) {
  if (!Present(body, field)) {
    return GatewayError::Ok();
  }
  const auto& value = body.at(field);
  if (!value.is_number_integer()) {
    return GatewayError::Validation(std::string("'") + field + "' must be an integer");
  }
  auto parsed = value.get<int64_t>();
  if (parsed < lo || parsed > hi) {
    return GatewayError::Validation(std::string("'") + field + "' must be between " +
                                    std::to_string(lo) + " and " + std::to_string(hi));
  }
  *out = parsed;
  return GatewayError::Ok();
}

GatewayError OptionalNumber(const json& body, const char* field, double lo, double hi,
                            double* out) {
  if (!Present(body, field)) {
    return GatewayError::Ok();
  }
  const auto& value = body.at(field);
  if (!value.is_number()) {
    return GatewayError::Validation(std::string("'") + field + "' must be a number");
  }
  auto parsed = value.get<double>();
  if (parsed < lo || parsed > hi) {
    std::ostringstream msg;
    msg << "'" << field << "' must be between " << lo << " and " << hi;
    return GatewayError::Validation(msg.str());
  }
  *out = parsed;
  return GatewayError::Ok();
}

GatewayError OptionalBool(const json& body, const char* field, bool* out) {
  if (!Present(body, field)) {
    return GatewayError::Ok();
  }
  if (!body.at(field).is_boolean()) {
    return GatewayError::Validation(std::string("'") + field + "' must be a boolean");
  }
  *out = body.at(field).get<bool>();
  return GatewayError::Ok();
}

GatewayError OptionalStringArray(const json& body, const char* field,
                                 std::vector<std::string>* out,
                                 bool* present = nullptr) {
  if (present) {
    *present = false;
  }
  if (!Present(body, field)) {
    return GatewayError::Ok();
  }
  const auto& value = body.at(field);
  if (!value.is_array()) {
    return GatewayError::Validation(std::string("'") + field + "' must be an array");
  }
  std::vector<std::string> items;
  for (const auto& item : value) {
    if (!item.is_string()) {
      return GatewayError::Validation(std::string("'") + field +
                                      "' must contain only strings");
    }
    items.push_back(item.get<std::string>());
  }
  *out = std::move(items);
  if (present) {
    *present = true;
  }
  return GatewayError::Ok();
}

GatewayError RequireText(const json& body, std::string* text) {
  if (auto err = RequireString(body, "text", text)) {
    return err;
  }
  if (WordCount(*text) == 0) {
    return GatewayError::Validation("'text' must not be blank");
  }
  return GatewayError::Ok();
}

bool QueryFlag(const HttpRequest& request, const std::string& name, bool fallback) {
  auto value = Lower(request.Query(name));
  if (value.empty()) {
    return fallback;
  }
  return value == "true" || value == "1" || value == "yes";
}

double Cosine(const json& a, const json& b) {
  if (!a.is_array() || !b.is_array() || a.size() != b.size() || a.empty()) {
    throw std::runtime_error("embedding vectors are missing or differ in size");
  }
  double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    double x = a[i].get<double>();
    double y = b[i].get<double>();
    dot += x * y;
    norm_a += x * x;
    norm_b += y * y;
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

// {"entities": [{type, text, start, end, score}]} -> grouped by type.
json GroupEntities(const json& raw) {
  json grouped = json::object();
  json counts = json::object();
  std::size_t total = 0;
  if (raw.contains("entities") && raw.at("entities").is_array()) {
    for (const auto& entity : raw.at("entities")) {
      auto type = entity.value("type", std::string("MISC"));
      json item = entity;
      item.erase("type");
      grouped[type].push_back(std::move(item));
      counts[type] = counts.value(type, 0) + 1;
      ++total;
    }
  }
  json types = json::array();
  for (auto it = grouped.begin(); it != grouped.end(); ++it) {
    types.push_back(it.key());
  }
  return {{"entities", grouped},
          {"counts", counts},
          {"total_entities", total},
          {"entity_types_found", types}};
}

json TextStatistics(const std::string& body) {
  auto words = text::RawTokens(body);
  std::size_t sentences = 0;
  {
    std::size_t start = 0;
    while (start <= body.size()) {
      auto dot = body.find('.', start);
      auto piece = body.substr(start, dot == std::string::npos ? std::string::npos
                                                               : dot - start);
      if (WordCount(piece) > 0) {
        ++sentences;
      }
      if (dot == std::string::npos) {
        break;
      }
      start = dot + 1;
    }
  }
  std::size_t paragraphs = 0;
  {
    std::size_t start = 0;
    while (start <= body.size()) {
      auto gap = body.find("\n\n", start);
      auto piece = body.substr(start, gap == std::string::npos ? std::string::npos
                                                               : gap - start);
      if (WordCount(piece) > 0) {
        ++paragraphs;
      }
      if (gap == std::string::npos) {
        break;
      }
      start = gap + 2;
    }
  }
  std::size_t letters = 0;
  for (const auto& w : words) {
    letters += w.size();
  }
  const double word_count = static_cast<double>(words.size());
  const double per_sentence = word_count / static_cast<double>(std::max<std::size_t>(sentences, 1));
  const char* complexity = per_sentence > 20 ? "high" : per_sentence > 10 ? "medium" : "low";
  return {{"words", words.size()},
          {"characters", body.size()},
          {"sentences", sentences},
          {"paragraphs", paragraphs},
          {"average_word_length",
           Round(static_cast<double>(letters) / std::max(word_count, 1.0), 2)},
          {"average_words_per_sentence", Round(per_sentence, 1)},
          {"reading_time_minutes", Round(word_count / 200.0, 1)},
          {"complexity", complexity}};
}

// Image from a raw image/* body (languages and model in the query) or from a
// JSON {"image": base64, "languages": [...], "model"?} body.
GatewayError ReadOcrInput(const HttpRequest& request, json* input) {
  const auto media = MediaType(request);
  std::vector<std::string> languages = {"es", "en"};

  if (media.compare(0, 6, "image/") == 0) {
    if (kImageTypes.count(media) == 0) {
      return GatewayError::Validation("unsupported image type '" + media + "'");
    }
    if (request.body.empty()) {
      return GatewayError::Validation("image body is empty");
    }
    if (request.body.size() > kMaxImageBytes) {
      return GatewayError::Validation("image exceeds 5 MB");
    }
    *input = {{"image", Base64Encode(request.body)}, {"content_type", media}};
    auto query_languages = request.Query("languages");
    if (!query_languages.empty()) {
      languages.clear();
      std::stringstream ss(query_languages);
      std::string item;
      while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
          languages.push_back(item);
        }
      }
    }
    auto requested = request.Query("model");
    if (!requested.empty()) {
      (*input)["model"] = requested;
    }
  } else {
    json body;
    if (auto err = ParseJsonBody(request, &body)) {
      return err;
    }
    std::string image;
    if (auto err = RequireString(body, "image", &image)) return err;
    if (auto err = OptionalStringArray(body, "languages", &languages)) return err;
    std::size_t decoded = 0;
    if (!Base64DecodedSize(image, &decoded)) {
      return GatewayError::Validation("'image' must be base64 encoded");
    }
    if (decoded > kMaxImageBytes) {
      return GatewayError::Validation("image exceeds 5 MB");
    }
    *input = {{"image", image}};
    if (body.contains("model")) {
      (*input)["model"] = body.at("model");
    }
  }
  if (languages.empty()) {
    return GatewayError::Validation("'languages' must not be empty");
  }
  (*input)["languages"] = languages;
  return GatewayError::Ok();
}

// Top edge and height of a [[x,y] x4] box; false without a usable box.
bool BoxRow(const json& cell, double* top, double* height) {
  if (!cell.contains("bbox") || !cell.at("bbox").is_array() || cell.at("bbox").empty()) {
    return false;
  }
  double min_y = 0.0, max_y = 0.0;
  bool first = true;
  for (const auto& point : cell.at("bbox")) {
    if (!point.is_array() || point.size() < 2 || !point[0].is_number() ||
        !point[1].is_number()) {
      return false;
    }
    double y = point[1].get<double>();
    min_y = first ? y : std::min(min_y, y);
    max_y = first ? y : std::max(max_y, y);
    first = false;
  }
  *top = min_y;
  *height = max_y - min_y;
  return true;
}

double BoxLeft(const json& cell) {
  double left = 0.0;
  bool first = true;
  for (const auto& point : cell.at("bbox")) {
    double x = point[0].get<double>();
    left = first ? x : std::min(left, x);
    first = false;
  }
  return left;
}

// Groups recognized cells into rows of text: cells whose top edges lie within
// half a cell height share a row, ordered left to right. Cells without a box
// each form their own row, ahead of the boxed rows.
json GroupRows(const json& cells) {
  struct Placed {
    double top;
    double height;
    double left;
    std::string text;
  };
  std::vector<Placed> placed;
  json rows = json::array();
  for (const auto& cell : cells) {
    double top = 0.0, height = 0.0;
    auto text = cell.value("text", std::string());
    if (BoxRow(cell, &top, &height)) {
      placed.push_back({top, height, BoxLeft(cell), text});
    } else {
      rows.push_back(json::array({text}));
    }
  }
  std::sort(placed.begin(), placed.end(),
            [](const Placed& a, const Placed& b) { return a.top < b.top; });
  std::vector<std::vector<Placed>> grouped;
  for (const auto& cell : placed) {
    if (!grouped.empty()) {
      const auto& anchor = grouped.back().front();
      if (cell.top - anchor.top <= std::max(anchor.height, cell.height) / 2.0) {
        grouped.back().push_back(cell);
        continue;
      }
    }
    grouped.push_back({cell});
  }
  for (auto& row : grouped) {
    std::sort(row.begin(), row.end(),
              [](const Placed& a, const Placed& b) { return a.left < b.left; });
    json texts = json::array();
    for (const auto& cell : row) {
      texts.push_back(cell.text);
    }
    rows.push_back(std::move(texts));
  }
  return rows;
}

json StepError(const GatewayError& err) {
  return {{"status", "error"}, {"error", ErrorKindName(err.kind)}, {"message", err.message}};
}

}  // namespace

GatewayApi::GatewayApi(RequestDispatcher& dispatcher,
                       KeyRegistry& keys,
                       ModelSlotManager& slots,
                       AdmissionController& admission,
                       MetricsRegistry* metrics,
                       AuditLogger* audit,
                       RateLimitPolicy default_rate_limit)
    : dispatcher_(dispatcher),
      keys_(keys),
      slots_(slots),
      admission_(admission),
      metrics_(metrics),
      audit_(audit),
      default_rate_limit_(default_rate_limit) {}

const std::vector<GatewayApi::Route>& GatewayApi::Routes() {
  static const std::vector<Route> kRoutes = {
      {"POST", "/generate/chat", Capability::kGenerate, Quota::kConsume, &GatewayApi::HandleChat, false},
      {"POST", "/generate/completion", Capability::kGenerate, Quota::kConsume, &GatewayApi::HandleCompletion, false},
      {"GET", "/generate/model-info", Capability::kGenerate, Quota::kConsume, &GatewayApi::HandleGenerateInfo, false},
      {"POST", "/transcribe", Capability::kTranscribe, Quota::kConsume, &GatewayApi::HandleTranscribe, false},
      {"POST", "/transcribe/translate", Capability::kTranscribe, Quota::kConsume, &GatewayApi::HandleTranscribeTranslate, false},
      {"GET", "/transcribe/supported-formats", Capability::kTranscribe, Quota::kConsume, &GatewayApi::HandleSpeechFormats, false},
      {"GET", "/transcribe/supported-languages", Capability::kTranscribe, Quota::kConsume, &GatewayApi::HandleSpeechLanguages, false},
      {"POST", "/embeddings", Capability::kEmbed, Quota::kConsume, &GatewayApi::HandleEmbeddings, false},
      {"POST", "/embeddings/similarity", Capability::kEmbed, Quota::kConsume, &GatewayApi::HandleSimilarity, false},
      {"GET", "/embeddings/model-info", Capability::kEmbed, Quota::kConsume, &GatewayApi::HandleEmbeddingInfo, false},
      {"POST", "/ocr/recognize", Capability::kOcr, Quota::kConsume, &GatewayApi::HandleOcr, false},
      {"POST", "/ocr/batch", Capability::kOcr, Quota::kConsume, &GatewayApi::HandleOcrBatch, false},
      {"POST", "/ocr/detect-languages", Capability::kOcr, Quota::kConsume, &GatewayApi::HandleOcrDetectLanguages, false},
      {"GET", "/ocr/supported-languages", Capability::kOcr, Quota::kConsume, &GatewayApi::HandleOcrLanguages, false},
      {"POST", "/ocr/extract-tables", Capability::kOcr, Quota::kConsume, &GatewayApi::HandleOcrTables, false},
      {"GET", "/ocr/health", Capability::kOcr, Quota::kFree, &GatewayApi::HandleOcrHealth, false},
      {"POST", "/business/classify", Capability::kBusiness, Quota::kConsume, &GatewayApi::HandleClassify, false},
      {"POST", "/business/sentiment", Capability::kBusiness, Quota::kConsume, &GatewayApi::HandleSentiment, false},
      {"POST", "/business/entities", Capability::kBusiness, Quota::kConsume, &GatewayApi::HandleEntities, false},
      {"POST", "/business/summarize", Capability::kBusiness, Quota::kConsume, &GatewayApi::HandleSummarize, false},
      {"POST", "/business/translate", Capability::kBusiness, Quota::kConsume, &GatewayApi::HandleTranslate, false},
      {"POST", "/business/analyze/comprehensive", Capability::kBusiness, Quota::kConsume, &GatewayApi::HandleComprehensive, false},
      {"GET", "/business/health", Capability::kBusiness, Quota::kFree, &GatewayApi::HandleBusinessHealth, false},
      {"POST", "/admin/keys/create", Capability::kAdmin, Quota::kConsume, &GatewayApi::HandleCreateKey, false},
      {"POST", "/admin/keys", Capability::kAdmin, Quota::kConsume, &GatewayApi::HandleCreateKey, false},
      {"GET", "/admin/keys/list", Capability::kAdmin, Quota::kConsume, &GatewayApi::HandleListKeys, false},
      {"POST", "/admin/keys/revoke", Capability::kAdmin, Quota::kConsume, &GatewayApi::HandleRevokeKey, false},
      {"POST", "/admin/keys/activate", Capability::kAdmin, Quota::kConsume, &GatewayApi::HandleActivateKey, false},
      {"POST", "/admin/keys/update", Capability::kAdmin, Quota::kConsume, &GatewayApi::HandleUpdateKey, false},
      {"GET", "/admin/keys/stats", Capability::kAdmin, Quota::kConsume, &GatewayApi::HandleKeyStats, false},
      {"GET", "/admin/keys/info", Capability::kAdmin, Quota::kConsume, &GatewayApi::HandleKeyInfo, true},
      {"GET", "/admin/models", Capability::kAdmin, Quota::kConsume, &GatewayApi::HandleListModels, false},
      {"POST", "/admin/models/load", Capability::kAdmin, Quota::kConsume, &GatewayApi::HandleLoadModel, false},
      {"POST", "/admin/models/unload", Capability::kAdmin, Quota::kConsume, &GatewayApi::HandleUnloadModel, false},
      {"GET", "/metrics", Capability::kAdmin, Quota::kFree, &GatewayApi::HandleMetrics, false},
  };
  return kRoutes;
}

std::string GatewayApi::NormalizePath(const std::string& path) {
  std::string out = path.empty() ? "/" : path;
  while (out.size() > 1 && out.back() == '/') {
    out.pop_back();
  }
  return out;
}

const GatewayApi::Route* GatewayApi::FindRoute(const std::string& method,
                                               const std::string& path,
                                               std::string* param) {
  const auto normalized = NormalizePath(path);
  for (const auto& route : Routes()) {
    if (method != route.method) {
      continue;
    }
    if (!route.prefix) {
      if (normalized == route.path) {
        return &route;
      }
      continue;
    }
    const std::string base = std::string(route.path) + "/";
    if (normalized.size() > base.size() && normalized.compare(0, base.size(), base) == 0) {
      auto rest = normalized.substr(base.size());
      if (rest.find('/') == std::string::npos) {
        *param = rest;  // the server already decoded the path
        return &route;
      }
    }
  }
  return nullptr;
}

std::string GatewayApi::ExtractKey(const HttpRequest& request) {
  auto key = request.Header("x-api-key");
  if (!key.empty()) {
    return key;
  }
  auto auth = request.Header("authorization");
  const std::string bearer = "bearer ";
  if (auth.size() > bearer.size() && Lower(auth.substr(0, bearer.size())) == bearer) {
    auto token = auth.substr(bearer.size());
    auto start = token.find_first_not_of(' ');
    return start == std::string::npos ? std::string() : token.substr(start);
  }
  return {};
}

HttpReply GatewayApi::ErrorReply(const GatewayError& err) {
  json error = {{"type", ErrorKindName(err.kind)},
                {"code", err.code},
                {"message", err.message},
                {"retryable", IsRetryable(err.kind)}};
  HttpReply reply;
  reply.status = HttpStatusFor(err.kind);
  if (err.kind == ErrorKind::kRateLimited) {
    error["retry_after"] = err.retry_after.count();
    reply.headers.emplace_back("Retry-After", std::to_string(err.retry_after.count()));
  }
  if (err.kind == ErrorKind::kAuth) {
    reply.headers.emplace_back("WWW-Authenticate", "ApiKey");
  }
  reply.body = json({{"error", error}}).dump();
  return reply;
}

json GatewayApi::KeyToJson(const ApiKeyRecord& record, int64_t now) {
  return {{"key_prefix", record.id},
          {"name", record.owner},
          {"description", record.description},
          {"capabilities", CapabilityNames(record.capabilities)},
          {"is_admin", record.Has(Capability::kAdmin)},
          {"rate_limit", record.rate_limit.max_requests},
          {"rate_window_seconds", record.rate_limit.window_seconds},
          {"priority", record.priority},
          {"is_active", record.Active()},
          {"is_expired", record.Expired(now)},
          {"is_static", record.is_static},
          {"created_at", OptionalTime(record.created_at)},
          {"expires_at", OptionalTime(record.expires_at)},
          {"last_used_at", OptionalTime(record.last_used_at)},
          {"usage_count", record.authentications},
          {"authorizations", record.authorizations},
          {"denials", record.denials}};
}

HttpReply GatewayApi::Handle(const HttpRequest& request) {
  const auto started = std::chrono::steady_clock::now();

  if (request.method == "OPTIONS") {
    HttpReply reply;
    reply.status = 204;
    reply.content_type.clear();
    reply.headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    reply.headers.emplace_back("Access-Control-Allow-Headers",
                               "Content-Type, Authorization, X-API-Key");
    reply.headers.emplace_back("Access-Control-Max-Age", "600");
    return reply;
  }

  const auto path = NormalizePath(request.path);
  if (request.method == "GET" && (path == "/healthz" || path == "/livez")) {
    HttpReply reply;
    reply.body = json({{"status", "ok"}}).dump();
    return reply;
  }

  Context ctx{request};
  const Route* route = FindRoute(request.method, request.path, &ctx.param);
  const auto raw_key = ExtractKey(request);

  // Authentication comes before routing so unknown paths reveal nothing.
  if (!route) {
    auto err = dispatcher_.Authenticate(raw_key, &ctx.key);
    if (!err) {
      err = GatewayError::NotFound("no route for " + request.method + " " + path);
    }
    return Finish(&ctx, route, err, started);
  }

  auto err = route->quota == Quota::kConsume
                 ? dispatcher_.AdmitRequest(raw_key, route->capability, &ctx.key)
                 : dispatcher_.AuthorizeOnly(raw_key, route->capability, &ctx.key);
  if (!err) {
    err = (this->*(route->handler))(ctx);
  }
  return Finish(&ctx, route, err, started);
}

HttpReply GatewayApi::Finish(Context* ctx, const Route* route, const GatewayError& err,
                             std::chrono::steady_clock::time_point started) {
  HttpReply reply;
  if (err) {
    reply = ErrorReply(err);
  } else {
    reply.status = ctx->status;
    if (!ctx->text_body.empty()) {
      reply.content_type = "text/plain; version=0.0.4";
      reply.body = std::move(ctx->text_body);
    } else {
      reply.body = ctx->body.dump();
    }
  }

  const double latency_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
          .count();
  std::string label = "unmatched";
  if (route) {
    label = route->path;
    if (route->prefix) {
      label += "/{key_prefix}";
    }
  }
  if (metrics_) {
    metrics_->RecordRequest(label, reply.status, latency_ms);
  }
  if (!ctx->key.id.empty()) {
    keys_.RecordRequest(ctx->key.id, label);
  }
  if (err && err.kind == ErrorKind::kBackend) {
    log::Warn("api", "request failed", "route=" + label + " code=" + err.code);
  }
  if (audit_ && audit_->Enabled()) {
    RequestAuditEntry entry;
    entry.key_id = ctx->key.id;
    entry.method = ctx->request.method;
    entry.path = ctx->request.path;
    entry.status = reply.status;
    entry.latency_ms = latency_ms;
    entry.client_ip = ctx->request.client_ip;
    entry.model = ctx->model;
    entry.error_code = err ? err.code : "";
    audit_->LogRequest(entry);
  }
  return reply;
}

GatewayError GatewayApi::Run(Context& ctx, const std::string& task,
                             const std::string& operation, const json& input,
                             json* output) {
  std::string requested;
  if (input.is_object() && input.contains("model")) {
    if (!input.at("model").is_string()) {
      return GatewayError::Validation("'model' must be a string");
    }
    requested = input.at("model").get<std::string>();
  }
  std::string model_id;
  if (auto err = dispatcher_.ResolveModel(task, requested, &model_id)) {
    return err;
  }
  ctx.model = model_id;
  if (auto err = dispatcher_.Execute(model_id, operation, input, output, ctx.key.priority)) {
    return err;
  }
  if (output->is_object()) {
    (*output)["model"] = model_id;
  }
  return GatewayError::Ok();
}

// ── Generation ─────────────────────────────────────────────────────────────

GatewayError GatewayApi::HandleChat(Context& ctx) { return HandleGenerate(ctx, "chat"); }

GatewayError GatewayApi::HandleCompletion(Context& ctx) {
  return HandleGenerate(ctx, "completion");
}

GatewayError GatewayApi::HandleGenerate(Context& ctx, const std::string& task) {
  json body;
  if (auto err = ParseJsonBody(ctx.request, &body)) {
    return err;
  }

  json messages = json::array();
  if (task == "completion" && Present(body, "prompt")) {
    std::string prompt;
    if (auto err = RequireString(body, "prompt", &prompt)) {
      return err;
    }
    messages.push_back({{"role", "user"}, {"content", prompt}});
  } else {
    if (!Present(body, "messages") || !body.at("messages").is_array() ||
        body.at("messages").empty()) {
      return GatewayError::Validation("'messages' must be a non-empty array");
    }
    for (const auto& message : body.at("messages")) {
      if (!message.is_object()) {
        return GatewayError::Validation("each message must be an object");
      }
      std::string role;
      std::string content;
      if (auto err = RequireString(message, "role", &role)) {
        return err;
      }
      if (kChatRoles.count(role) == 0) {
        return GatewayError::Validation("message role must be user, assistant or system");
      }
      if (auto err = RequireString(message, "content", &content, 0)) {
        return err;
      }
      messages.push_back({{"role", role}, {"content", content}});
    }
  }

  int64_t max_tokens = 512;
  double temperature = 0.7;
  double top_p = 0.9;
  std::vector<std::string> stop;
  if (auto err = OptionalInt(body, "max_tokens", 1, 2048, &max_tokens)) return err;
  if (auto err = OptionalNumber(body, "temperature", 0.0, 2.0, &temperature)) return err;
  if (auto err = OptionalNumber(body, "top_p", 0.0, 1.0, &top_p)) return err;
  if (auto err = OptionalStringArray(body, "stop", &stop)) return err;

  json input = {{"messages", messages},
                {"max_tokens", max_tokens},
                {"temperature", temperature},
                {"top_p", top_p},
                {"stop", stop}};
  if (body.contains("model")) {
    input["model"] = body.at("model");
  }
  return Run(ctx, task, task, input, &ctx.body);
}

GatewayError GatewayApi::HandleGenerateInfo(Context& ctx) {
  json input = json::object();
  auto requested = ctx.request.Query("model");
  if (!requested.empty()) {
    input["model"] = requested;
  }
  return Run(ctx, "chat", "info", input, &ctx.body);
}

// ── Media ──────────────────────────────────────────────────────────────────

GatewayError GatewayApi::HandleTranscribe(Context& ctx) {
  return HandleSpeech(ctx, "transcribe");
}

GatewayError GatewayApi::HandleTranscribeTranslate(Context& ctx) {
  return HandleSpeech(ctx, "translate");
}

// task "translate" transcribes and translates into target_language.
GatewayError GatewayApi::HandleSpeech(Context& ctx, const std::string& task) {
  const bool translate = task == "translate";
  const char* language_field = translate ? "target_language" : "language";
  const auto media = MediaType(ctx.request);
  json input;
  std::string language = translate ? "en" : "es";

  if (media.compare(0, 6, "audio/") == 0) {
    if (kAudioTypes.count(media) == 0) {
      return GatewayError::Validation("unsupported audio type '" + media + "'");
    }
    if (ctx.request.body.empty()) {
      return GatewayError::Validation("audio body is empty");
    }
    if (ctx.request.body.size() > kMaxAudioBytes) {
      return GatewayError::Validation("audio exceeds 25 MB");
    }
    input = {{"audio", Base64Encode(ctx.request.body)}, {"content_type", media}};
    auto requested = ctx.request.Query("model");
    if (!requested.empty()) {
      input["model"] = requested;
    }
  } else {
    json body;
    if (auto err = ParseJsonBody(ctx.request, &body)) {
      return err;
    }
    std::string audio;
    std::string content_type = "audio/wav";
    if (auto err = RequireString(body, "audio", &audio)) return err;
    if (auto err = OptionalString(body, "content_type", &content_type)) return err;
    if (auto err = OptionalString(body, language_field, &language)) return err;
    content_type = Lower(content_type);
    if (kAudioTypes.count(content_type) == 0) {
      return GatewayError::Validation("unsupported audio type '" + content_type + "'");
    }
    std::size_t decoded = 0;
    if (!Base64DecodedSize(audio, &decoded)) {
      return GatewayError::Validation("'audio' must be base64 encoded");
    }
    if (decoded > kMaxAudioBytes) {
      return GatewayError::Validation("audio exceeds 25 MB");
    }
    input = {{"audio", audio}, {"content_type", content_type}};
    if (body.contains("model")) {
      input["model"] = body.at("model");
    }
  }

  auto query_language = ctx.request.Query(language_field);
  if (!query_language.empty()) {
    language = query_language;
  }
  if (kSpeechLanguages.count(language) == 0) {
    return GatewayError::Validation("unsupported language '" + language + "'");
  }
  input["language"] = language;
  input["task"] = task;
  input["timestamps"] = QueryFlag(ctx.request, "timestamps", false);
  if (auto err = Run(ctx, "transcribe", "transcribe", input, &ctx.body)) {
    return err;
  }
  if (translate && ctx.body.is_object()) {
    ctx.body["language"] = language;
    ctx.body["task"] = task;
  }
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleSpeechFormats(Context& ctx) {
  std::set<std::string> formats;
  for (const auto& type : kAudioTypes) {
    auto subtype = type.substr(type.find('/') + 1);
    if (subtype.compare(0, 2, "x-") == 0) {
      subtype = subtype.substr(2);
    }
    formats.insert(subtype == "mpeg" ? "mp3" : subtype);
  }
  ctx.body = {{"supported_formats", formats},
              {"content_types", kAudioTypes},
              {"max_size_mb", kMaxAudioBytes / (1024 * 1024)}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleSpeechLanguages(Context& ctx) {
  json languages = json::array();
  for (const auto& [code, name] : kSpeechLanguages) {
    languages.push_back({{"code", code}, {"name", name}});
  }
  ctx.body = {{"languages", languages},
              {"total", languages.size()},
              {"default", "es"},
              {"translation_default", "en"}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleOcr(Context& ctx) {
  json input;
  if (auto err = ReadOcrInput(ctx.request, &input)) {
    return err;
  }
  return Run(ctx, "ocr", "recognize", input, &ctx.body);
}

GatewayError GatewayApi::HandleOcrBatch(Context& ctx) {
  json body;
  if (auto err = ParseJsonBody(ctx.request, &body)) {
    return err;
  }
  std::vector<std::string> images;
  std::vector<std::string> languages = {"es", "en"};
  bool present = false;
  if (auto err = OptionalStringArray(body, "images", &images, &present)) return err;
  if (auto err = OptionalStringArray(body, "languages", &languages)) return err;
  if (!present || images.empty()) {
    return GatewayError::Validation("'images' must contain at least one image");
  }
  if (images.size() > kMaxOcrBatch) {
    return GatewayError::Validation("'images' accepts at most 10 images");
  }
  if (languages.empty()) {
    return GatewayError::Validation("'languages' must not be empty");
  }
  for (std::size_t i = 0; i < images.size(); ++i) {
    std::size_t decoded = 0;
    if (!Base64DecodedSize(images[i], &decoded)) {
      return GatewayError::Validation("images[" + std::to_string(i) + "] must be base64 encoded");
    }
    if (decoded > kMaxImageBytes) {
      return GatewayError::Validation("images[" + std::to_string(i) + "] exceeds 5 MB");
    }
  }

  // One admission for the batch; a failed image yields an empty result.
  json results = json::array();
  GatewayError first_error;
  std::size_t failed = 0;
  for (std::size_t i = 0; i < images.size(); ++i) {
    json input = {{"image", images[i]}, {"languages", languages}};
    if (body.contains("model")) {
      input["model"] = body.at("model");
    }
    json output;
    if (auto err = Run(ctx, "ocr", "recognize", input, &output)) {
      if (!first_error) {
        first_error = err;
      }
      ++failed;
      output = {{"texts", json::array()}, {"error", ErrorKindName(err.kind)},
                {"message", err.message}};
    }
    output["page"] = i;
    results.push_back(std::move(output));
  }
  if (failed == images.size()) {
    return first_error;
  }
  ctx.body = {{"results", results},
              {"total", images.size()},
              {"failed", failed},
              {"languages", languages}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleOcrDetectLanguages(Context& ctx) {
  json input;
  if (auto err = ReadOcrInput(ctx.request, &input)) {
    return err;
  }
  const auto candidates = input.at("languages");
  json output;
  if (auto err = Run(ctx, "ocr", "recognize", input, &output)) {
    return err;
  }
  // Engines that report a language per text are counted; otherwise every
  // candidate language is reported with the mean text confidence.
  std::map<std::string, std::pair<double, std::size_t>> seen;
  double confidence_sum = 0.0;
  std::size_t texts = 0;
  if (output.contains("texts") && output.at("texts").is_array()) {
    for (const auto& item : output.at("texts")) {
      double confidence = item.value("confidence", 0.0);
      confidence_sum += confidence;
      ++texts;
      auto language = item.value("language", std::string());
      if (!language.empty()) {
        seen[language].first += confidence;
        seen[language].second++;
      }
    }
  }
  json detected = json::array();
  json confidences = json::array();
  if (!seen.empty()) {
    for (const auto& [language, stat] : seen) {
      detected.push_back(language);
      confidences.push_back(Round(stat.first / static_cast<double>(stat.second), 3));
    }
  } else if (texts > 0) {
    const double mean = Round(confidence_sum / static_cast<double>(texts), 3);
    for (const auto& language : candidates) {
      detected.push_back(language);
      confidences.push_back(mean);
    }
  }
  ctx.body = {{"detected_languages", detected},
              {"confidence", confidences},
              {"text_regions", texts},
              {"model", ctx.model}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleOcrLanguages(Context& ctx) {
  ctx.body = {{"supported_languages", kOcrLanguages},
              {"default_languages", json::array({"es", "en"})},
              {"total_supported", kOcrLanguages.size()}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleOcrTables(Context& ctx) {
  json input;
  if (auto err = ReadOcrInput(ctx.request, &input)) {
    return err;
  }
  json output;
  if (auto err = Run(ctx, "ocr", "recognize", input, &output)) {
    return err;
  }
  json cells = json::array();
  if (output.contains("texts") && output.at("texts").is_array()) {
    cells = output.at("texts");
  }
  json tables = json::array();
  if (!cells.empty()) {
    auto rows = GroupRows(cells);
    tables.push_back({{"rows", rows},
                      {"row_count", rows.size()},
                      {"cells", cells}});
  }
  ctx.body = {{"tables", tables}, {"total_tables", tables.size()}, {"model", ctx.model}};
  return GatewayError::Ok();
}

json GatewayApi::ServiceHealth(const std::string& task) const {
  json health = {{"task", task},
                 {"enabled", false},
                 {"status", "disabled"},
                 {"model", nullptr},
                 {"model_loaded", false},
                 {"languages_loaded", json::array()}};
  std::string model_id;
  if (dispatcher_.ResolveModel(task, "", &model_id)) {
    return health;
  }
  health["enabled"] = true;
  health["model"] = model_id;
  health["status"] = SlotStateName(SlotState::kUnloaded);
  for (const auto& slot : slots_.Snapshot()) {
    if (slot.id == model_id) {
      health["status"] = SlotStateName(slot.state);
      health["model_loaded"] = slot.state == SlotState::kReady;
      break;
    }
  }
  if (const auto* spec = dispatcher_.Catalog().Find(model_id)) {
    std::stringstream ss(spec->Option("languages", "es,en"));
    std::string item;
    while (std::getline(ss, item, ',')) {
      if (!item.empty()) {
        health["languages_loaded"].push_back(item);
      }
    }
  }
  return health;
}

GatewayError GatewayApi::HandleOcrHealth(Context& ctx) {
  ctx.body = ServiceHealth("ocr");
  return GatewayError::Ok();
}

// ── Embeddings ─────────────────────────────────────────────────────────────

GatewayError GatewayApi::HandleEmbeddings(Context& ctx) {
  json body;
  if (auto err = ParseJsonBody(ctx.request, &body)) {
    return err;
  }
  std::vector<std::string> texts;
  bool present = false;
  if (auto err = OptionalStringArray(body, "texts", &texts, &present)) {
    return err;
  }
  if (!present || texts.empty()) {
    return GatewayError::Validation("'texts' must contain at least one string");
  }
  if (texts.size() > kMaxEmbeddingTexts) {
    return GatewayError::Validation("'texts' accepts at most 100 strings");
  }
  bool normalize = true;
  if (auto err = OptionalBool(body, "normalize", &normalize)) {
    return err;
  }
  json input = {{"texts", texts}, {"normalize", normalize}};
  if (body.contains("model")) {
    input["model"] = body.at("model");
  }
  return Run(ctx, "embed", "embed", input, &ctx.body);
}

GatewayError GatewayApi::HandleSimilarity(Context& ctx) {
  json body;
  if (auto err = ParseJsonBody(ctx.request, &body)) {
    return err;
  }
  std::vector<std::string> texts;
  if (Present(body, "texts")) {
    if (auto err = OptionalStringArray(body, "texts", &texts)) return err;
    if (texts.size() != 2) {
      return GatewayError::Validation("'texts' must contain exactly two strings");
    }
  } else {
    std::string first, second;
    if (auto err = RequireString(body, "text1", &first)) return err;
    if (auto err = RequireString(body, "text2", &second)) return err;
    texts = {first, second};
  }

  json input = {{"texts", texts}, {"normalize", true}};
  if (body.contains("model")) {
    input["model"] = body.at("model");
  }
  json output;
  if (auto err = Run(ctx, "embed", "embed", input, &output)) {
    return err;
  }
  double similarity = 0.0;
  try {
    const auto& vectors = output.at("embeddings");
    similarity = Cosine(vectors.at(0), vectors.at(1));
  } catch (const std::exception& ex) {
    log::Error("api", "malformed embedding output", "model=" + ctx.model + " error=" + ex.what());
    return GatewayError::Backend("model '" + ctx.model + "' returned malformed embeddings");
  }
  ctx.body = {{"similarity", Round(similarity, 4)},
              {"similarity_percentage", Round(similarity * 100.0, 2)},
              {"model", ctx.model}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleEmbeddingInfo(Context& ctx) {
  json input = json::object();
  auto requested = ctx.request.Query("model");
  if (!requested.empty()) {
    input["model"] = requested;
  }
  return Run(ctx, "embed", "info", input, &ctx.body);
}

// ── Business analytics ─────────────────────────────────────────────────────

GatewayError GatewayApi::HandleClassify(Context& ctx) {
  json body;
  if (auto err = ParseJsonBody(ctx.request, &body)) {
    return err;
  }
  std::string text_value;
  std::vector<std::string> categories;
  bool present = false;
  bool multi_label = false;
  if (auto err = RequireText(body, &text_value)) return err;
  if (auto err = OptionalStringArray(body, "categories", &categories, &present)) return err;
  if (!present || categories.empty()) {
    return GatewayError::Validation("'categories' must contain at least one category");
  }
  if (auto err = OptionalBool(body, "multi_label", &multi_label)) return err;

  json input = {{"text", text_value}, {"categories", categories}, {"multi_label", multi_label}};
  if (body.contains("model")) {
    input["model"] = body.at("model");
  }
  return Run(ctx, "classify", "classify", input, &ctx.body);
}

GatewayError GatewayApi::HandleSentiment(Context& ctx) {
  json body;
  if (auto err = ParseJsonBody(ctx.request, &body)) {
    return err;
  }
  std::string text_value;
  std::string language = "auto";
  if (auto err = RequireText(body, &text_value)) return err;
  if (auto err = OptionalString(body, "language", &language)) return err;

  json input = {{"text", text_value}, {"language", language}};
  if (body.contains("model")) {
    input["model"] = body.at("model");
  }
  return Run(ctx, "sentiment", "sentiment", input, &ctx.body);
}

GatewayError GatewayApi::HandleEntities(Context& ctx) {
  json body;
  if (auto err = ParseJsonBody(ctx.request, &body)) {
    return err;
  }
  std::string text_value;
  std::vector<std::string> types;
  bool present = false;
  if (auto err = RequireText(body, &text_value)) return err;
  if (auto err = OptionalStringArray(body, "entity_types", &types, &present)) return err;

  json input = {{"text", text_value}};
  if (present) {
    input["entity_types"] = types;
  }
  if (body.contains("model")) {
    input["model"] = body.at("model");
  }
  json raw;
  if (auto err = Run(ctx, "entities", "entities", input, &raw)) {
    return err;
  }
  ctx.body = GroupEntities(raw);
  ctx.body["model"] = ctx.model;
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleSummarize(Context& ctx) {
  json body;
  if (auto err = ParseJsonBody(ctx.request, &body)) {
    return err;
  }
  std::string text_value;
  int64_t max_length = 150;
  int64_t min_length = 30;
  std::string type = "extractive";
  if (auto err = RequireText(body, &text_value)) return err;
  if (WordCount(text_value) < 10) {
    return GatewayError::Validation("'text' must contain at least 10 words");
  }
  if (auto err = OptionalInt(body, "max_length", 30, 500, &max_length)) return err;
  if (auto err = OptionalInt(body, "min_length", 1, 500, &min_length)) return err;
  if (auto err = OptionalString(body, "type", &type)) return err;
  if (min_length > max_length) {
    return GatewayError::Validation("'min_length' must not exceed 'max_length'");
  }
  if (type != "extractive" && type != "abstractive") {
    return GatewayError::Validation("'type' must be extractive or abstractive");
  }

  json input = {{"text", text_value},
                {"max_length", max_length},
                {"min_length", min_length},
                {"type", type}};
  if (body.contains("model")) {
    input["model"] = body.at("model");
  }
  if (auto err = Run(ctx, "summarize", "summarize", input, &ctx.body)) {
    return err;
  }
  const auto summary = ctx.body.value("summary", std::string());
  ctx.body["original_length"] = text_value.size();
  ctx.body["summary_length"] = summary.size();
  ctx.body["compression_ratio"] =
      Round(static_cast<double>(summary.size()) / static_cast<double>(text_value.size()), 3);
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleTranslate(Context& ctx) {
  json body;
  if (auto err = ParseJsonBody(ctx.request, &body)) {
    return err;
  }
  std::string text_value;
  std::string source = "es";
  std::string target = "en";
  if (auto err = RequireText(body, &text_value)) return err;
  if (auto err = OptionalString(body, "source_lang", &source)) return err;
  if (auto err = OptionalString(body, "target_lang", &target)) return err;
  source = Lower(source);
  target = Lower(target);
  if (!((source == "es" && target == "en") || (source == "en" && target == "es"))) {
    return GatewayError::Validation("unsupported language pair; supported: es<->en");
  }

  json input = {{"text", text_value}, {"source_lang", source}, {"target_lang", target}};
  if (body.contains("model")) {
    input["model"] = body.at("model");
  }
  json output;
  if (auto err = Run(ctx, "translate", "translate", input, &output)) {
    return err;
  }
  const auto translated = output.value("translation", std::string());
  ctx.body = {{"original",
               {{"text", text_value},
                {"language", source},
                {"character_count", text_value.size()}}},
              {"translation",
               {{"text", translated},
                {"language", target},
                {"character_count", translated.size()}}},
              {"pair", source + "->" + target},
              {"model", ctx.model}};
  if (output.contains("coverage")) {
    ctx.body["coverage"] = output.at("coverage");
  }
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleComprehensive(Context& ctx) {
  json body;
  if (auto err = ParseJsonBody(ctx.request, &body)) {
    return err;
  }
  std::string text_value;
  bool include_sentiment = true;
  bool include_entities = true;
  bool include_summary = true;
  int64_t summary_length = 100;
  if (auto err = RequireText(body, &text_value)) return err;
  if (auto err = OptionalBool(body, "include_sentiment", &include_sentiment)) return err;
  if (auto err = OptionalBool(body, "include_entities", &include_entities)) return err;
  if (auto err = OptionalBool(body, "include_summary", &include_summary)) return err;
  if (auto err = OptionalInt(body, "summary_length", 50, 300, &summary_length)) return err;

  // Admitted once by Handle(); each step only needs a model.
  std::vector<std::string> models;
  auto step = [&](const std::string& task, const json& input) -> json {
    std::string model_id;
    json output;
    auto err = dispatcher_.ResolveModel(task, "", &model_id);
    if (!err) {
      models.push_back(model_id);
      err = dispatcher_.Execute(model_id, task, input, &output, ctx.key.priority);
    }
    if (err) {
      log::Debug("api", "analysis step failed", "task=" + task + " code=" + err.code);
      return StepError(err);
    }
    if (task == "entities") {
      output = GroupEntities(output);
    }
    output["status"] = "success";
    output["model"] = model_id;
    return output;
  };

  json analysis = json::object();
  if (include_sentiment) {
    analysis["sentiment"] = step("sentiment", {{"text", text_value}});
  }
  if (include_entities) {
    analysis["entities"] = step("entities", {{"text", text_value}});
  }
  if (include_summary) {
    analysis["summary"] = step("summarize", {{"text", text_value}, {"max_length", summary_length}});
  }

  std::size_t succeeded = 0;
  for (const auto& result : analysis) {
    if (result.value("status", std::string()) != "error") {
      ++succeeded;
    }
  }
  const std::size_t total = analysis.size();
  const long percent =
      total == 0 ? 0 : std::lround(100.0 * static_cast<double>(succeeded) / static_cast<double>(total));

  std::string joined;
  for (const auto& m : models) {
    joined += (joined.empty() ? "" : ",") + m;
  }
  ctx.model = joined;
  ctx.body = {{"metadata",
               {{"key_prefix", ctx.key.id},
                {"text_length", text_value.size()},
                {"word_count", WordCount(text_value)},
                {"success_rate", std::to_string(percent) + "%"}}},
              {"analysis", analysis},
              {"statistics", TextStatistics(text_value)}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleBusinessHealth(Context& ctx) {
  const auto slots = slots_.Snapshot();
  const auto& routes = dispatcher_.Catalog().Routes();
  json services = json::object();
  std::size_t ready = 0;
  for (const auto& task : kBusinessTasks) {
    json service = {{"enabled", false}, {"status", "disabled"}, {"model", nullptr}};
    auto route = routes.find(task);
    if (route != routes.end()) {
      service["enabled"] = true;
      service["model"] = route->second;
      for (const auto& slot : slots) {
        if (slot.id == route->second) {
          service["status"] = SlotStateName(slot.state);
          if (slot.state == SlotState::kReady) {
            ++ready;
          }
          break;
        }
      }
    }
    services[task] = std::move(service);
  }
  ctx.body = {{"timestamp", IsoTime(keys_.Now())},
              {"services", services},
              {"ready", ready},
              {"total", kBusinessTasks.size()}};
  return GatewayError::Ok();
}

// ── Administration ─────────────────────────────────────────────────────────

void GatewayApi::Audit(const Context& ctx, const std::string& action,
                       const std::string& target, const GatewayError& err) {
  if (err) {
    log::Warn("admin", action + " failed", "actor=" + ctx.key.id + " target=" + target +
                                               " code=" + err.code);
  } else {
    log::Info("admin", action, "actor=" + ctx.key.id + " target=" + target);
  }
  if (audit_ && audit_->Enabled()) {
    audit_->LogAdmin(ctx.key.id, action, target, err ? err.code : "ok");
  }
}

GatewayError GatewayApi::HandleCreateKey(Context& ctx) {
  json body;
  if (auto err = ParseJsonBody(ctx.request, &body)) {
    return err;
  }
  KeyCreateRequest request;
  std::vector<std::string> capability_names;
  bool has_capabilities = false;
  bool is_admin = false;
  int64_t rate_limit = default_rate_limit_.max_requests;
  int64_t window = default_rate_limit_.window_seconds;
  int64_t expires_in_days = 0;
  if (auto err = RequireString(body, "name", &request.owner, 3, 100)) return err;
  if (auto err = OptionalString(body, "description", &request.description, 500)) return err;
  if (auto err = OptionalStringArray(body, "capabilities", &capability_names, &has_capabilities))
    return err;
  if (auto err = OptionalBool(body, "is_admin", &is_admin)) return err;
  if (auto err = OptionalInt(body, "rate_limit", 1, 1000, &rate_limit)) return err;
  if (auto err = OptionalInt(body, "rate_window_seconds", 1, 86400, &window)) return err;
  if (auto err = OptionalInt(body, "expires_in_days", 1, kMaxExpiryDays, &expires_in_days))
    return err;
  int64_t priority = 0;
  if (auto err = OptionalInt(body, "priority", -kMaxPriority, kMaxPriority, &priority))
    return err;
  request.priority = static_cast<int>(priority);

  if (has_capabilities) {
    std::string unknown;
    if (!ParseCapabilities(capability_names, &request.capabilities, &unknown)) {
      return GatewayError::Validation("unknown capability '" + unknown + "'");
    }
  } else {
    for (auto capability : AllCapabilities()) {
      if (capability != Capability::kAdmin) {
        request.capabilities.insert(capability);
      }
    }
  }
  if (is_admin) {
    request.capabilities.insert(Capability::kAdmin);
  }
  request.rate_limit.max_requests = static_cast<int>(rate_limit);
  request.rate_limit.window_seconds = static_cast<int>(window);
  if (expires_in_days > 0) {
    request.expires_at = keys_.Now() + expires_in_days * 86400;
  }

  ApiKeyRecord record;
  std::string raw_key;
  auto err = keys_.Create(request, &record, &raw_key);
  Audit(ctx, "key.create", err ? request.owner : record.id, err);
  if (err) {
    return err;
  }
  ctx.status = 201;
  ctx.body = {{"success", true},
              {"message", "API key created; it will not be shown again"},
              {"api_key", raw_key},
              {"key_prefix", record.id},
              {"expires_at", OptionalTime(record.expires_at)},
              {"key", KeyToJson(record, keys_.Now())}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleListKeys(Context& ctx) {
  const bool active_only = QueryFlag(ctx.request, "active_only", false);
  json keys = json::array();
  for (const auto& record : keys_.List(active_only)) {
    keys.push_back(KeyToJson(record, keys_.Now()));
  }
  ctx.body = {{"success", true}, {"total", keys.size()}, {"keys", keys}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleRevokeKey(Context& ctx) {
  json body;
  std::string prefix;
  if (auto err = ParseJsonBody(ctx.request, &body)) return err;
  if (auto err = RequireString(body, "key_prefix", &prefix)) return err;
  auto err = keys_.Revoke(prefix);
  Audit(ctx, "key.revoke", prefix, err);
  if (err) {
    return err;
  }
  ctx.body = {{"success", true}, {"message", "API key " + prefix + " revoked"}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleActivateKey(Context& ctx) {
  json body;
  std::string prefix;
  if (auto err = ParseJsonBody(ctx.request, &body)) return err;
  if (auto err = RequireString(body, "key_prefix", &prefix)) return err;
  auto err = keys_.Activate(prefix);
  Audit(ctx, "key.activate", prefix, err);
  if (err) {
    return err;
  }
  ctx.body = {{"success", true}, {"message", "API key " + prefix + " activated"}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleUpdateKey(Context& ctx) {
  json body;
  std::string prefix;
  if (auto err = ParseJsonBody(ctx.request, &body)) return err;
  if (auto err = RequireString(body, "key_prefix", &prefix)) return err;

  ApiKeyRecord current;
  if (auto err = keys_.Get(prefix, &current)) {
    return err;
  }

  KeyUpdateRequest update;
  std::vector<std::string> capability_names;
  bool has_capabilities = false;
  if (auto err = OptionalStringArray(body, "capabilities", &capability_names, &has_capabilities))
    return err;
  if (has_capabilities) {
    std::set<Capability> parsed;
    std::string unknown;
    if (!ParseCapabilities(capability_names, &parsed, &unknown)) {
      return GatewayError::Validation("unknown capability '" + unknown + "'");
    }
    update.capabilities = parsed;
  }

  int64_t rate_limit = current.rate_limit.max_requests;
  int64_t window = current.rate_limit.window_seconds;
  if (auto err = OptionalInt(body, "rate_limit", 1, 1000, &rate_limit)) return err;
  if (auto err = OptionalInt(body, "rate_window_seconds", 1, 86400, &window)) return err;
  if (Present(body, "rate_limit") || Present(body, "rate_window_seconds")) {
    update.rate_limit = RateLimitPolicy{static_cast<int>(rate_limit), static_cast<int>(window)};
  }
  if (Present(body, "description")) {
    std::string description;
    if (auto err = OptionalString(body, "description", &description, 500)) return err;
    update.description = description;
  }
  if (Present(body, "priority")) {
    int64_t priority = 0;
    if (auto err = OptionalInt(body, "priority", -kMaxPriority, kMaxPriority, &priority))
      return err;
    update.priority = static_cast<int>(priority);
  }
  if (!update.capabilities && !update.rate_limit && !update.description && !update.priority) {
    return GatewayError::Validation("nothing to update");
  }

  ApiKeyRecord record;
  auto err = keys_.Update(prefix, update, &record);
  Audit(ctx, "key.update", prefix, err);
  if (err) {
    return err;
  }
  ctx.body = {{"success", true}, {"key", KeyToJson(record, keys_.Now())}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleKeyStats(Context& ctx) {
  auto prefix = ctx.request.Query("key_prefix");
  if (!prefix.empty()) {
    ApiKeyRecord record;
    if (auto err = keys_.Get(prefix, &record)) {
      return err;
    }
    auto data = KeyToJson(record, keys_.Now());
    data["total_requests"] = record.requests;
    data["unique_endpoints"] = record.endpoints.size();
    data["endpoints"] = record.endpoints;
    data["first_request"] = OptionalTime(record.first_request_at);
    data["last_request"] = OptionalTime(record.last_request_at);
    ctx.body = {{"success", true}, {"data", data}};
    return GatewayError::Ok();
  }
  const auto stats = keys_.Stats();
  ctx.body = {{"success", true},
              {"data",
               {{"total_keys", stats.total},
                {"active_keys", stats.active},
                {"revoked_keys", stats.revoked},
                {"expired_keys", stats.expired},
                {"total_authentications", stats.authentications},
                {"total_authorizations", stats.authorizations},
                {"total_denials", stats.denials},
                {"persistent", keys_.Persistent()}}}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleKeyInfo(Context& ctx) {
  ApiKeyRecord record;
  if (auto err = keys_.Get(ctx.param, &record)) {
    return err;
  }
  ctx.body = {{"success", true}, {"key", KeyToJson(record, keys_.Now())}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleListModels(Context& ctx) {
  const auto admission = admission_.AllStats();
  json models = json::array();
  for (const auto& slot : slots_.Snapshot()) {
    json entry = {{"id", slot.id},
                  {"kind", slot.kind},
                  {"provider", slot.provider},
                  {"state", SlotStateName(slot.state)},
                  {"refcount", slot.refcount},
                  {"footprint_mb", slot.footprint_mb},
                  {"pinned", slot.pinned},
                  {"preload", slot.preload},
                  {"loads", slot.loads},
                  {"load_failures", slot.load_failures},
                  {"evictions", slot.evictions},
                  {"idle_seconds", slot.idle_seconds >= 0 ? json(Round(slot.idle_seconds, 1))
                                                          : json(nullptr)}};
    if (!slot.last_error.empty()) {
      entry["last_error"] = slot.last_error;
    }
    auto stats = admission.find(slot.id);
    if (stats != admission.end()) {
      entry["admission"] = {{"max_concurrency", stats->second.max_concurrency},
                            {"max_queue", stats->second.max_queue},
                            {"in_flight", stats->second.in_flight},
                            {"queued", stats->second.queued},
                            {"admitted", stats->second.admitted},
                            {"timed_out", stats->second.timed_out},
                            {"rejected", stats->second.rejected}};
    }
    models.push_back(std::move(entry));
  }
  ctx.body = {{"budget_mb", slots_.BudgetMb()},
              {"reserved_mb", slots_.ReservedMb()},
              {"models", models},
              {"routes", dispatcher_.Catalog().Routes()}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleLoadModel(Context& ctx) {
  json body;
  std::string model_id;
  if (auto err = ParseJsonBody(ctx.request, &body)) return err;
  if (auto err = RequireString(body, "model", &model_id)) return err;
  if (!dispatcher_.Catalog().Find(model_id)) {
    return GatewayError::NotFound("model '" + model_id + "' is not in the catalog");
  }
  ctx.model = model_id;
  auto err = slots_.Load(model_id);
  Audit(ctx, "model.load", model_id, err);
  if (err) {
    return err;
  }
  ctx.body = {{"success", true}, {"model", model_id}, {"state", "ready"}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleUnloadModel(Context& ctx) {
  json body;
  std::string model_id;
  if (auto err = ParseJsonBody(ctx.request, &body)) return err;
  if (auto err = RequireString(body, "model", &model_id)) return err;
  ctx.model = model_id;
  auto err = slots_.Unload(model_id);
  Audit(ctx, "model.unload", model_id, err);
  if (err) {
    return err;
  }
  ctx.body = {{"success", true}, {"model", model_id}, {"state", "unloaded"}};
  return GatewayError::Ok();
}

GatewayError GatewayApi::HandleMetrics(Context& ctx) {
  ctx.text_body = (metrics_ ? *metrics_ : GlobalMetrics()).RenderPrometheus();
  return GatewayError::Ok();
}

}  // namespace modelgate

#include "net/http_client.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

std::string Trim(const std::string &input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos || end == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

std::vector<std::string> SplitCsv(const std::string &csv) {
  std::vector<std::string> out;
  std::stringstream ss(csv);
  std::string token;
  while (std::getline(ss, token, ',')) {
    auto trimmed = Trim(token);
    if (!trimmed.empty())
      out.push_back(trimmed);
  }
  return out;
}

struct ChatMessage {
  std::string role;
  std::string content;
};

struct Options {
  std::string host{"127.0.0.1"};
  int port{8000};
  bool tls{false};
  std::string api_key;
  std::string model;
  std::string prompt;
  std::string text;
  std::vector<std::string> texts;
  std::vector<ChatMessage> messages;
  int max_tokens{256};
  // keys
  std::string name;
  std::string description;
  std::string capabilities;
  bool capabilities_set{false};
  bool is_admin{false};
  int rate_limit{0};
  int rate_window{0};
  int expires_in_days{0};
  bool active_only{false};
  std::string language;
  std::vector<std::string> positional;
};

std::string BuildUrl(const Options &opts, const std::string &path) {
  return std::string(opts.tls ? "https://" : "http://") + opts.host + ":" +
         std::to_string(opts.port) + path;
}

std::map<std::string, std::string> AuthHeaders(const std::string &api_key) {
  std::map<std::string, std::string> headers;
  headers["Content-Type"] = "application/json";
  if (!api_key.empty()) {
    headers["X-API-Key"] = api_key;
  }
  return headers;
}

void PrintUsage() {
  std::cout
      << "Usage:\n"
      << "  gatectl status\n"
      << "  gatectl keys create --name NAME [--description TEXT] "
         "[--capabilities embed,business] [--admin]\n"
         "                     [--rate-limit N] [--rate-window SECONDS] "
         "[--expires-in-days N]\n"
      << "  gatectl keys list [--active-only]\n"
      << "  gatectl keys revoke|activate|info KEY_PREFIX\n"
      << "  gatectl keys update KEY_PREFIX [--capabilities ...] [--rate-limit N] "
         "[--rate-window S] [--description TEXT]\n"
      << "  gatectl keys stats [KEY_PREFIX]\n"
      << "  gatectl models list\n"
      << "  gatectl models load|unload MODEL_ID\n"
      << "  gatectl metrics\n"
      << "  gatectl embed --text 'a' [--text 'b'] [--model ID]\n"
      << "  gatectl chat --message 'user:Hello' [--message 'assistant:Hi'] "
         "[--prompt TEXT] [--max-tokens N] [--model ID]\n"
      << "  gatectl sentiment --text TEXT [--language es|en]\n"
      << "Common flags: [--host 127.0.0.1] [--port 8000] [--tls] [--api-key KEY]\n"
      << "The API key may also be set with GATECTL_API_KEY.\n";
}

// Prints the body and maps the HTTP status to the exit code.
int Report(const modelgate::HttpResponse &resp) {
  if (resp.Ok()) {
    std::cout << resp.body << std::endl;
    return 0;
  }
  std::cerr << "HTTP " << resp.status << ": " << resp.body << std::endl;
  return 1;
}

bool ParseFlags(int argc, char **argv, int first, Options *opts) {
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&]() -> std::string { return argv[++i]; };
    bool has_value = i + 1 < argc;
    if ((arg == "--host" || arg == "-H") && has_value) {
      opts->host = next();
    } else if ((arg == "--port" || arg == "-p") && has_value) {
      opts->port = std::stoi(next());
    } else if (arg == "--tls") {
      opts->tls = true;
    } else if (arg == "--api-key" && has_value) {
      opts->api_key = next();
    } else if (arg == "--model" && has_value) {
      opts->model = next();
    } else if (arg == "--prompt" && has_value) {
      opts->prompt = next();
    } else if (arg == "--text" && has_value) {
      opts->text = next();
      opts->texts.push_back(opts->text);
    } else if ((arg == "--max-tokens" || arg == "--max_tokens") && has_value) {
      opts->max_tokens = std::stoi(next());
    } else if (arg == "--name" && has_value) {
      opts->name = next();
    } else if (arg == "--description" && has_value) {
      opts->description = next();
    } else if (arg == "--capabilities" && has_value) {
      opts->capabilities = next();
      opts->capabilities_set = true;
    } else if (arg == "--admin") {
      opts->is_admin = true;
    } else if (arg == "--rate-limit" && has_value) {
      opts->rate_limit = std::stoi(next());
    } else if (arg == "--rate-window" && has_value) {
      opts->rate_window = std::stoi(next());
    } else if (arg == "--expires-in-days" && has_value) {
      opts->expires_in_days = std::stoi(next());
    } else if (arg == "--active-only") {
      opts->active_only = true;
    } else if (arg == "--language" && has_value) {
      opts->language = next();
    } else if ((arg == "--message" || arg == "-m") && has_value) {
      std::string raw = next();
      auto colon = raw.find(':');
      ChatMessage msg;
      if (colon == std::string::npos) {
        msg.role = "user";
        msg.content = raw;
      } else {
        msg.role = raw.substr(0, colon);
        msg.content = raw.substr(colon + 1);
        if (msg.role.empty()) {
          msg.role = "user";
        }
      }
      opts->messages.push_back(std::move(msg));
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "unknown or incomplete flag: " << arg << std::endl;
      return false;
    } else {
      opts->positional.push_back(arg);
    }
  }
  return true;
}

int CmdKeys(const modelgate::HttpClient &client, const Options &opts) {
  auto headers = AuthHeaders(opts.api_key);
  if (opts.positional.empty()) {
    PrintUsage();
    return 1;
  }
  const std::string &action = opts.positional[0];
  const std::string prefix = opts.positional.size() > 1 ? opts.positional[1] : "";

  if (action == "create") {
    if (opts.name.empty()) {
      std::cerr << "--name is required" << std::endl;
      return 1;
    }
    json payload = {{"name", opts.name}, {"is_admin", opts.is_admin}};
    if (!opts.description.empty())
      payload["description"] = opts.description;
    if (opts.capabilities_set)
      payload["capabilities"] = SplitCsv(opts.capabilities);
    if (opts.rate_limit > 0)
      payload["rate_limit"] = opts.rate_limit;
    if (opts.rate_window > 0)
      payload["rate_window_seconds"] = opts.rate_window;
    if (opts.expires_in_days > 0)
      payload["expires_in_days"] = opts.expires_in_days;
    return Report(client.Post(BuildUrl(opts, "/admin/keys/create"),
                              payload.dump(), headers));
  }
  if (action == "list") {
    std::string path = "/admin/keys/list";
    if (opts.active_only)
      path += "?active_only=true";
    return Report(client.Get(BuildUrl(opts, path), headers));
  }
  if (action == "stats") {
    std::string path = "/admin/keys/stats";
    if (!prefix.empty())
      path += "?key_prefix=" + prefix;
    return Report(client.Get(BuildUrl(opts, path), headers));
  }
  if (prefix.empty()) {
    std::cerr << "keys " << action << " needs a KEY_PREFIX" << std::endl;
    return 1;
  }
  if (action == "revoke" || action == "activate") {
    return Report(client.Post(BuildUrl(opts, "/admin/keys/" + action),
                              json({{"key_prefix", prefix}}).dump(), headers));
  }
  if (action == "info") {
    return Report(client.Get(BuildUrl(opts, "/admin/keys/info/" + prefix), headers));
  }
  if (action == "update") {
    json payload = {{"key_prefix", prefix}};
    if (opts.capabilities_set)
      payload["capabilities"] = SplitCsv(opts.capabilities);
    if (opts.rate_limit > 0)
      payload["rate_limit"] = opts.rate_limit;
    if (opts.rate_window > 0)
      payload["rate_window_seconds"] = opts.rate_window;
    if (!opts.description.empty())
      payload["description"] = opts.description;
    return Report(client.Post(BuildUrl(opts, "/admin/keys/update"),
                              payload.dump(), headers));
  }
  PrintUsage();
  return 1;
}

int CmdModels(const modelgate::HttpClient &client, const Options &opts) {
  auto headers = AuthHeaders(opts.api_key);
  const std::string action = opts.positional.empty() ? "list" : opts.positional[0];
  if (action == "list") {
    return Report(client.Get(BuildUrl(opts, "/admin/models"), headers));
  }
  if (action == "load" || action == "unload") {
    std::string id = opts.positional.size() > 1 ? opts.positional[1] : opts.model;
    if (id.empty()) {
      std::cerr << "models " << action << " needs a MODEL_ID" << std::endl;
      return 1;
    }
    return Report(client.Post(BuildUrl(opts, "/admin/models/" + action),
                              json({{"model", id}}).dump(), headers));
  }
  PrintUsage();
  return 1;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    PrintUsage();
    return 1;
  }
  std::string command = argv[1];
  if (command == "--help" || command == "-h" || command == "help") {
    PrintUsage();
    return 0;
  }

  Options opts;
  if (const char *env_key = std::getenv("GATECTL_API_KEY")) {
    opts.api_key = env_key;
  }
  try {
    if (!ParseFlags(argc, argv, 2, &opts)) {
      PrintUsage();
      return 1;
    }
  } catch (const std::exception &ex) {
    std::cerr << "gatectl: invalid number: " << ex.what() << std::endl;
    return 1;
  }

  try {
    modelgate::HttpClient client;
    auto headers = AuthHeaders(opts.api_key);

    if (command == "status") {
      return Report(client.Get(BuildUrl(opts, "/healthz"), headers));
    }

    if (opts.api_key.empty()) {
      std::cerr << "--api-key (or GATECTL_API_KEY) is required" << std::endl;
      return 1;
    }

    if (command == "keys") {
      return CmdKeys(client, opts);
    }
    if (command == "models") {
      return CmdModels(client, opts);
    }
    if (command == "metrics") {
      return Report(client.Get(BuildUrl(opts, "/metrics"), headers));
    }
    if (command == "embed") {
      if (opts.texts.empty()) {
        std::cerr << "at least one --text is required" << std::endl;
        return 1;
      }
      json payload = {{"texts", opts.texts}};
      if (!opts.model.empty())
        payload["model"] = opts.model;
      return Report(client.Post(BuildUrl(opts, "/embeddings/"), payload.dump(), headers));
    }
    if (command == "chat") {
      auto messages = opts.messages;
      if (messages.empty()) {
        if (opts.prompt.empty()) {
          std::cerr << "Provide at least one --message role:text or --prompt"
                    << std::endl;
          return 1;
        }
        messages.push_back(ChatMessage{"user", opts.prompt});
      }
      json payload;
      payload["max_tokens"] = opts.max_tokens;
      payload["messages"] = json::array();
      for (const auto &msg : messages) {
        payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
      }
      if (!opts.model.empty())
        payload["model"] = opts.model;
      return Report(client.Post(BuildUrl(opts, "/generate/chat"), payload.dump(), headers));
    }
    if (command == "sentiment") {
      if (opts.text.empty()) {
        std::cerr << "--text is required" << std::endl;
        return 1;
      }
      json payload = {{"text", opts.text}};
      if (!opts.language.empty())
        payload["language"] = opts.language;
      if (!opts.model.empty())
        payload["model"] = opts.model;
      return Report(client.Post(BuildUrl(opts, "/business/sentiment"), payload.dump(),
                                headers));
    }
  } catch (const std::exception &ex) {
    std::cerr << "gatectl error: " << ex.what() << std::endl;
    return 1;
  }

  PrintUsage();
  return 1;
}

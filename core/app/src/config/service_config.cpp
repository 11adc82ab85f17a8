#include "qless/config/service_config.hpp"

#include <fstream>
#include <stdexcept>

namespace qless {

namespace {

// Copies j[key] into out if present. A type mismatch surfaces as
// nlohmann::json::type_error, rethrown by the caller as runtime_error.
template <typename T>
void overlay(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

MenuSeedItem parseMenuItem(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("ref")) {
    throw std::runtime_error("menu entry must be an object with \"ref\"");
  }
  MenuSeedItem item;
  item.ref = j.at("ref").get<std::string>();
  item.name = item.ref;
  overlay(j, "name", item.name);
  overlay(j, "price", item.price);
  overlay(j, "available", item.available);
  return item;
}

}  // namespace

ServiceConfig parseServiceConfig(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("service config must be a JSON object");
  }

  ServiceConfig config;
  try {
    overlay(j, "command_endpoint", config.command_endpoint);
    overlay(j, "publish_endpoint", config.publish_endpoint);
    overlay(j, "publish_queue_capacity", config.publish_queue_capacity);
    overlay(j, "max_transition_retries", config.max_transition_retries);
    overlay(j, "history_limit", config.history_limit);
    overlay(j, "owner_history_limit", config.owner_history_limit);

    auto menu = j.find("menu");
    if (menu != j.end() && !menu->is_null()) {
      if (!menu->is_array()) {
        throw std::runtime_error("\"menu\" must be an array");
      }
      for (const auto& entry : *menu) {
        config.menu.push_back(parseMenuItem(entry));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("invalid service config: ") +
                             e.what());
  }

  if (config.max_transition_retries < 0) {
    throw std::runtime_error("max_transition_retries must be >= 0");
  }
  return config;
}

ServiceConfig loadServiceConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open config file: " + path);
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("malformed config file " + path + ": " +
                             e.what());
  }

  try {
    return parseServiceConfig(j);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

}  // namespace qless

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace qless {

// One "menu" entry from the configuration file, used to seed the catalog.
struct MenuSeedItem {
  std::string ref;
  std::string name;
  double price{0.0};
  bool available{true};
};

// -----------------------------------------------------------------------------
// ServiceConfig — process-wide settings
// -----------------------------------------------------------------------------
//
// @brief  Immutable value struct read once at startup.
//
// @details
// Every field has a working default, so the binary runs without a file.
// A JSON file overrides any subset:
//
//   {
//     "command_endpoint": "tcp://127.0.0.1:5556",
//     "publish_endpoint": "tcp://127.0.0.1:5557",
//     "publish_queue_capacity": 4096,
//     "max_transition_retries": 3,
//     "history_limit": 200,
//     "owner_history_limit": 50,
//     "menu": [ {"ref":"m1","name":"Burger","price":50,"available":true} ]
//   }
//
// Unknown keys are ignored. A key present with the wrong type is an error.
// -----------------------------------------------------------------------------
struct ServiceConfig {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string publish_endpoint{"tcp://127.0.0.1:5557"};
  std::size_t publish_queue_capacity{4096};
  int max_transition_retries{3};
  std::size_t history_limit{200};
  std::size_t owner_history_limit{50};
  std::vector<MenuSeedItem> menu;
};

// -------------------------------------------------------------------------
// parseServiceConfig(j)
// -------------------------------------------------------------------------
// @brief  Overlays j onto the defaults.
// @throws std::runtime_error if j is not an object, a known key has the
//         wrong type, or a menu entry lacks "ref".
// -------------------------------------------------------------------------
ServiceConfig parseServiceConfig(const nlohmann::json& j);

// -------------------------------------------------------------------------
// loadServiceConfig(path)
// -------------------------------------------------------------------------
// @brief  Reads and parses a JSON config file.
// @throws std::runtime_error naming path if the file cannot be opened or
//         does not parse.
// -------------------------------------------------------------------------
ServiceConfig loadServiceConfig(const std::string& path);

}  // namespace qless

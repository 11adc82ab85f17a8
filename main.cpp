// -----------------------------------------------------------------------------
// qless — single executable entry point.
//
//   1) Load the ServiceConfig (defaults, or the JSON file named by argv[1]).
//   2) Build the in-memory collaborators: order repository, catalog seeded
//      from the config's "menu", cart store.
//   3) Create the RealtimeServer (PUB channels + REP commands) and the
//      OrderService that broadcasts through it.
//   4) Bind the CommandHandler to the server and start everything.
//   5) Idle on the main thread until Ctrl-C, then shut down in reverse.
//
// Thread layout:
//   main thread        → waits for SIGINT
//   realtime thread    → RealtimeServer (command dispatch + channel sends)
//   notify thread      → QueueBroadcaster snapshot cycles
//
// Everything is stack-local in main(); the server outlives the service
// because the service's broadcaster publishes through it.
// -----------------------------------------------------------------------------

#include "qless/cart/in_memory_cart_store.hpp"
#include "qless/catalog/in_memory_catalog.hpp"
#include "qless/config/service_config.hpp"
#include "qless/engine/command_handler.hpp"
#include "qless/engine/order_service.hpp"
#include "qless/network/realtime_server.hpp"
#include "qless/repository/in_memory_order_repository.hpp"
#include "qless/time/live_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Set by the SIGINT handler, polled by main(). sig_atomic_t is the only type
// a handler may portably write.
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_stop_requested = 0;

static void sigint_handler(int /*signum*/) { g_stop_requested = 1; }

int main(int argc, char* argv[]) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  qless::ServiceConfig config;
  if (argc > 1) {
    try {
      config = qless::loadServiceConfig(argv[1]);
    } catch (const std::exception& e) {
      std::cerr << "[main] ERROR: " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] Loaded config from " << argv[1] << "\n";
  }

  // -------------------------------------------------------------------------
  // 2) Collaborators.
  // -------------------------------------------------------------------------
  qless::LiveTimeProvider clock;
  qless::InMemoryOrderRepository repository;
  qless::InMemoryCatalog catalog;
  qless::InMemoryCartStore carts;

  for (const auto& item : config.menu) {
    catalog.upsert(item.ref,
                   qless::CatalogItem{item.name, item.price, item.available});
  }
  std::cout << "[main] Menu seeded with " << config.menu.size()
            << " item(s).\n";

  // -------------------------------------------------------------------------
  // 3) Transport and service.
  // -------------------------------------------------------------------------
  qless::RealtimeServer server(config.command_endpoint,
                               config.publish_endpoint,
                               config.publish_queue_capacity);

  qless::OrderService::Options options;
  options.max_transition_retries = config.max_transition_retries;
  options.history_limit = config.history_limit;
  options.owner_history_limit = config.owner_history_limit;

  qless::OrderService service(repository, catalog, carts, server, clock,
                              options);
  qless::CommandHandler commands(service);

  server.setCommandHandler(
      [&commands](const std::string& request) {
        return commands.handle(request);
      });

  // -------------------------------------------------------------------------
  // 4) Start: notification loop first so no event waits on a dead thread.
  // -------------------------------------------------------------------------
  service.start();
  try {
    server.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] ERROR: could not start realtime server: " << e.what()
              << "\n";
    service.stop();
    return 1;
  }

  std::signal(SIGINT, sigint_handler);
  std::signal(SIGTERM, sigint_handler);

  std::cout << "[main] Commands on " << config.command_endpoint
            << ", channels on " << config.publish_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 5) Idle until signalled.
  // -------------------------------------------------------------------------
  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested. Stopping...\n";

  // Commands first so nothing new arrives, then drain notifications.
  server.stop();
  service.stop();

  return 0;
}

// -----------------------------------------------------------------------------
// escrow_engine_app: single executable entry point.
//
// Simulation mode:
//   1) Load the EngineConfig from the path in argv[1], or use the built-in
//      demo configuration when no path is given.
//   2) Create the LiveTimeProvider and an AssetBook whose operator is the
//      custody principal, then mint and approve the configured seed balances.
//   3) Create the SwapEngine and subscribe a logging callback that prints
//      every committed notification.
//   4) Start the IpcServer: JSON commands on the REP socket go through the
//      CommandRouter; every notification is forwarded to the PUB socket.
//   5) Idle on the main thread until Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread  → setup, then sleeps until SIGINT
//   ipc thread   → IpcServer::run(): CommandRouter → SwapEngine calls,
//                  notification publishing
//
// No global state apart from the shutdown flag read by the signal handler.
// -----------------------------------------------------------------------------

#include "escrow/assets/asset_book.hpp"
#include "escrow/config/engine_config.hpp"
#include "escrow/domain/engine_error.hpp"
#include "escrow/engine/command_router.hpp"
#include "escrow/engine/swap_engine.hpp"
#include "escrow/network/ipc_server.hpp"
#include "escrow/network/json_format.hpp"
#include "escrow/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <limits>
#include <memory>
#include <thread>

// Set by the SIGINT handler, polled by main().
static std::atomic<bool> g_shutdown_requested{false};

// -----------------------------------------------------------------------------
// sigint_handler
// -----------------------------------------------------------------------------
// Only stores to a lock-free atomic. main() notices the flag within one
// polling interval and runs the shutdown sequence.
// -----------------------------------------------------------------------------
static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

// Demo configuration: three tradeable assets, two traders with balances.
static escrow::EngineConfig defaultConfig() {
  escrow::EngineConfig config;
  config.owner = "owner";
  config.custody = "escrow";
  config.fee = escrow::domain::FeeSnapshot{"FEE", 1};
  config.allowed_assets = {"ALPHA", "BETA", "FEE"};
  for (const char* trader : {"alice", "bob"}) {
    for (const char* asset : {"ALPHA", "BETA", "FEE"}) {
      config.seed_balances.push_back(
          escrow::SeedBalance{asset, trader, 1'000'000, true});
    }
  }
  return config;
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  escrow::EngineConfig config;
  try {
    config = argc > 1 ? escrow::loadEngineConfig(argv[1]) : defaultConfig();
    config.validate();
  } catch (const escrow::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Clock and asset backend.
  // -------------------------------------------------------------------------
  escrow::LiveTimeProvider clock;
  escrow::AssetBook assets(config.custody);
  for (const auto& seed : config.seed_balances) {
    assets.mint(seed.asset, seed.principal, seed.amount);
    if (seed.approve_custody) {
      assets.approve(seed.asset, seed.principal, config.custody,
                     std::numeric_limits<escrow::domain::Amount>::max());
    }
  }
  std::cout << "[main] AssetBook seeded with " << config.seed_balances.size()
            << " balance(s).\n";

  // -------------------------------------------------------------------------
  // 3) Engine and logging subscriber.
  // -------------------------------------------------------------------------
  std::unique_ptr<escrow::SwapEngine> engine_owner;
  try {
    engine_owner = std::make_unique<escrow::SwapEngine>(config, assets, clock);
  } catch (const escrow::EngineError& e) {
    std::cerr << "[main] Engine construction failed: " << e.what() << "\n";
    return 1;
  }
  escrow::SwapEngine& engine = *engine_owner;

  engine.notificationBus().subscribe(
      [](const escrow::Notification& notification) {
        std::cout << "[Notification] "
                  << escrow::notificationToJson(notification).dump() << "\n";
      });

  // -------------------------------------------------------------------------
  // 4) IPC: commands in, notifications out.
  // -------------------------------------------------------------------------
  escrow::CommandRouter router(engine);
  escrow::IpcServer ipc(
      [&router](const std::string& request) { return router.handle(request); },
      config.command_endpoint, config.telemetry_endpoint);

  auto telemetry = engine.notificationBus().subscribe(
      [&ipc](const escrow::Notification& notification) {
        ipc.pushTelemetry(notification);
      });

  ipc.start();

  // -------------------------------------------------------------------------
  // 5) Wait for Ctrl-C.
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] Escrow engine running. Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 6) Clean shutdown: stop the IPC thread before the engine goes away.
  // -------------------------------------------------------------------------
  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  ipc.stop();
  engine.notificationBus().unsubscribe(telemetry);

  return 0;
}

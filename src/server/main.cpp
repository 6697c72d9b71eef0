#include "server/fixed_precision_service.hpp"
#include "storage/storage.hpp"
#include "utils/logging.hpp"

#include <grpcpp/grpcpp.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true, std::memory_order_relaxed); }

static void usage(const char* prog) {
  std::cerr << "Usage: " << prog << " [--addr HOST:PORT] [--db PATH] [--log-level VRB|DBG|INF|WRN|ERR|CRT|FTL]\n"
               "  defaults: --addr 0.0.0.0:50051 --db db/fixed_precision.db --log-level INF\n";
}

int main(int argc, char** argv) {
  std::string addr = "0.0.0.0:50051"; // 0.0.0.0 listens on all local interfaces
  std::filesystem::path db_file = std::filesystem::path("db") / "fixed_precision.db";

  // Parse command line and flags
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--addr" && i + 1 < argc)    addr = argv[++i];
    else if (a == "--db" && i + 1 < argc) db_file = argv[++i];
    else if (a == "--log-level" && i + 1 < argc) {
      try {
        set_log_level(parse_log_level(argv[++i]));
      } catch (const std::invalid_argument& e) {
        std::cerr << "[SERVER] " << e.what() << "\n";
        usage(argv[0]);
        return 1;
      }
    }
    else if (a == "--help" || a == "-h")  { usage(argv[0]); return 0; }
    else { std::cerr << "[SERVER] unknown argument: " << a << "\n"; usage(argv[0]); return 1; }
  }

  try {
    if (db_file.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(db_file.parent_path(), ec); // ok if already exists
      if (ec) {
        log_stream(LogLevel::Error) << "[SERVER] ERROR: cannot create " << db_file.parent_path() << ": " << ec.message() << "\n";
        return 1;
      }
    }

    FixedPrecisionServiceImpl service(db_file.string());

    grpc::ServerBuilder builder;
    int selected_port = 0;
    builder.AddListeningPort(addr, grpc::InsecureServerCredentials(), &selected_port);
    builder.RegisterService(&service);
    std::unique_ptr<grpc::Server> server = builder.BuildAndStart();

    if (!server) {
      log_stream(LogLevel::Error) << "[SERVER] ERROR: BuildAndStart() returned null\n";
      return 1;
    }
    if (selected_port == 0) {
      log_stream(LogLevel::Error) << "[SERVER] ERROR: failed to bind " << addr << " (in use or permission issue)\n";
      return 1;
    }

    log_stream(LogLevel::Info) << "[SERVER] listening on " << addr << " ; db=" << db_file.string()
                               << " ; log_level=" << to_string(log_level()) << "\n";

    std::signal(SIGINT,  on_signal);
    std::signal(SIGTERM, on_signal);

    std::thread stopper([&]{
      while (!g_stop.load(std::memory_order_relaxed)) std::this_thread::sleep_for(50ms);
      server->Shutdown(std::chrono::system_clock::now() + 2s);
    });

    server->Wait();
    stopper.join();
    return 0;

  } catch (const SQLite::Exception& e) {
    log_stream(LogLevel::Fatal) << "[SERVER] SQLite error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    log_stream(LogLevel::Fatal) << "[SERVER] Fatal error: " << e.what() << "\n";
    return 3;
  }
}

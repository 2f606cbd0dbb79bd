#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"

using namespace offline::v1;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  offline-sync --config <config.yaml> stats\n"
            << "  offline-sync --config <config.yaml> pending [owner]\n"
            << "  offline-sync --config <config.yaml> failed [owner]\n"
            << "  offline-sync --config <config.yaml> quota\n"
            << "  offline-sync --config <config.yaml> cleanup\n"
            << "  offline-sync --config <config.yaml> cache-get <key>\n"
            << "  offline-sync --config <config.yaml> cache-set <key> <json> [priority=high|medium|low] [ttl_ms]\n"
            << "  offline-sync --config <config.yaml> cache-delete <key>\n"
            << "  offline-sync --config <config.yaml> enqueue <kind=create|update|delete> <entity> <id> <json> <owner>\n"
            << "  offline-sync --config <config.yaml> conflicts\n"
            << "  offline-sync --config <config.yaml> resolve <conflict_id> <local_wins|remote_wins|merge>\n"
            << "  offline-sync --config <config.yaml> run\n";
}

static void Print(const google::protobuf::Message& message) {
  std::string                             json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "print failed: " << status.message() << "\n";
    return;
  }
  std::cout << json;
}

static std::optional<CachePriority> ParsePriority(const std::string& value) {
  if (value == "high") return CACHE_PRIORITY_HIGH;
  if (value == "medium") return CACHE_PRIORITY_MEDIUM;
  if (value == "low") return CACHE_PRIORITY_LOW;
  return std::nullopt;
}

static std::optional<OperationKind> ParseKind(const std::string& value) {
  if (value == "create") return OPERATION_KIND_CREATE;
  if (value == "update") return OPERATION_KIND_UPDATE;
  if (value == "delete") return OPERATION_KIND_DELETE;
  return std::nullopt;
}

static std::optional<Resolution> ParseResolution(const std::string& value) {
  if (value == "local_wins") return RESOLUTION_LOCAL_WINS;
  if (value == "remote_wins") return RESOLUTION_REMOTE_WINS;
  if (value == "merge") return RESOLUTION_MERGE;
  return std::nullopt;
}

static void PrintOperations(const std::vector<Operation>& operations) {
  for (const auto& op : operations) {
    Print(op);
  }
  std::cout << operations.size() << " operation(s)\n";
}

static int Run(offline::factory::Runtime& runtime, const std::string& cmd, int argc, char** argv) {
  // arguments after the command
  auto arg = [&](int i) -> std::optional<std::string> {
    if (3 + i < argc) return std::string(argv[3 + i]);
    return std::nullopt;
  };

  if (cmd == "stats") {
    Print(runtime.queue->Stats());
    Print(runtime.cache->Stats());
    if (runtime.orchestrator) Print(runtime.orchestrator->Status());
    return 0;
  }

  if (cmd == "pending") {
    PrintOperations(runtime.queue->Pending(arg(1)));
    return 0;
  }

  if (cmd == "failed") {
    PrintOperations(runtime.queue->Failed(arg(1)));
    return 0;
  }

  if (cmd == "quota") {
    Print(runtime.cache->Quota());
    return 0;
  }

  if (cmd == "cleanup") {
    Print(runtime.queue->ClearOld());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cache-get") {
    if (!arg(1)) return 1;

    auto value = runtime.cache->Get(*arg(1));
    if (!value) {
      std::cout << "miss\n";
      return 3;
    }
    std::cout << offline::util::ToJson(*value) << "\n";
    return 0;
  }

  if (cmd == "cache-set") {
    if (!arg(2)) return 1;

    CachePriority priority = CACHE_PRIORITY_MEDIUM;
    if (arg(3)) {
      auto parsed = ParsePriority(*arg(3));
      if (!parsed) {
        std::cerr << "unsupported priority: " << *arg(3) << "\n";
        return 1;
      }
      priority = *parsed;
    }

    std::optional<std::chrono::milliseconds> ttl;
    if (arg(4)) ttl = std::chrono::milliseconds(std::stoll(*arg(4)));

    runtime.cache->Set(*arg(1), offline::util::FromJson(*arg(2)), priority, ttl);
    std::cout << "stored\n";
    return 0;
  }

  if (cmd == "cache-delete") {
    if (!arg(1)) return 1;

    runtime.cache->Delete(*arg(1));
    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "enqueue") {
    if (!arg(5)) return 1;

    auto kind = ParseKind(*arg(1));
    if (!kind) {
      std::cerr << "unsupported kind: " << *arg(1) << "\n";
      return 1;
    }

    auto id = runtime.queue->Enqueue(*kind, *arg(2), *arg(3), offline::util::FromJson(*arg(4)), std::nullopt, *arg(5));
    std::cout << id << "\n";
    return 0;
  }

  if (cmd == "conflicts") {
    auto conflicts = runtime.resolver->ListConflicts();
    for (const auto& conflict : conflicts) {
      Print(conflict);
    }
    std::cout << conflicts.size() << " conflict(s)\n";
    return 0;
  }

  if (cmd == "resolve") {
    if (!arg(2)) return 1;

    auto resolution = ParseResolution(*arg(2));
    if (!resolution) {
      std::cerr << "unsupported resolution: " << *arg(2) << "\n";
      return 1;
    }

    Print(runtime.resolver->ResolveManually(*arg(1), *resolution, "cli"));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "run") {
    if (!runtime.background) {
      std::cerr << "no remote available: set sync.remote.endpoint in a gRPC-enabled build\n";
      return 2;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    runtime.background->Start();
    OFFLINE_LOG_INFO("Offline sync running");

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    OFFLINE_LOG_INFO("Shutting down offline sync");
    runtime.background->Stop();
    return 0;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  int rc = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = offline::config::ConfigLoader::LoadFromYaml(config_path);
    offline::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto runtime = offline::factory::Build(config);

    rc = Run(runtime, cmd, argc, argv);
    if (rc == 1) Usage();
  } catch (const std::exception& e) {
    OFFLINE_LOG_ERROR("Fatal error", {offline::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    rc = 2;
  }

  offline::observability::ShutdownLogging();
  return rc;
}

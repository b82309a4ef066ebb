#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

using skycache::factory::CacheSystem;
using skycache::model::DownloadProgress;

static volatile std::sig_atomic_t g_interrupted = 0;

void HandleSignal(int) {
  g_interrupted = 1;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  skycachectl [--config <file>] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  layers                          list offline layers\n"
            << "  status [layer_id]               cache status of one or all layers\n"
            << "  download <layer_id>... | all    download layers\n"
            << "  repair <layer_id>               fetch missing files of a layer\n"
            << "  clear <layer_id> | all          drop cached layers\n"
            << "  surveys                         list HiPS surveys\n"
            << "  hips-status <survey_id>         cached tiles of a survey\n"
            << "  hips-download <survey_id> <max_order>\n"
            << "  hips-clear <survey_id> | all\n"
            << "  fetch <url> [cache-first|network-first|cache-only|network-only|\n"
            << "               stale-while-revalidate]\n"
            << "  prefetch <url>...               warm the unified cache\n"
            << "  cleanup                         drop expired unified entries\n"
            << "  stats                           aggregated cache statistics\n"
            << "  version                         stored and current schema version\n"
            << "  migrate                         run pending migrations\n"
            << "  reset                           drop every cache partition\n";
}

static void PrintProgress(const DownloadProgress& p) {
  std::cout << "\r" << p.target_id << ": " << p.completed_units << "/" << p.total_units;
  if (p.failed_units > 0) std::cout << " (" << p.failed_units << " failed)";
  std::cout << " " << skycache::stats::FormatBytes(p.completed_bytes_estimate) << std::flush;
  if (skycache::model::IsTerminal(p.status)) std::cout << "\n";
}

static void PrintLayerStatus(const skycache::model::CacheEntryStatus& s) {
  std::cout << s.layer_id << "\t" << s.cached_file_count << "/" << s.total_file_count << "\t"
            << skycache::stats::FormatBytes(s.cached_bytes_estimate) << "/" << skycache::stats::FormatBytes(s.total_bytes) << "\t"
            << (s.is_complete ? "complete" : "incomplete") << "\n";
  for (const auto& file : s.missing_files) {
    std::cout << "  missing: " << file << "\n";
  }
}

static int RunCommand(CacheSystem& sys, const std::string& cmd, const std::vector<std::string>& args) {
  // ------------------------------------------------------------

  if (cmd == "layers") {
    for (const auto& layer : sys.layer_registry->SortedByPriority()) {
      std::cout << layer.id << "\t" << layer.display_name << "\t" << skycache::stats::FormatBytes(layer.estimated_size_bytes) << "\t"
                << layer.description << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (args.empty()) {
      for (const auto& s : sys.layer_manager->GetAllLayerStatus()) PrintLayerStatus(s);
    } else {
      PrintLayerStatus(sys.layer_manager->GetLayerStatus(args[0]));
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "download") {
    if (args.empty()) return 1;

    auto results = (args.size() == 1 && args[0] == "all") ? sys.layer_manager->DownloadAllLayers(PrintProgress)
                                                          : sys.layer_manager->DownloadLayers(args, PrintProgress);
    bool all_ok = true;
    for (const auto& [id, ok] : results) {
      std::cout << id << ": " << (ok ? "ok" : "failed") << "\n";
      all_ok = all_ok && ok;
    }
    return all_ok ? 0 : 2;
  }

  // ------------------------------------------------------------

  if (cmd == "repair") {
    if (args.size() != 1) return 1;

    auto result = sys.layer_manager->VerifyAndRepairLayer(args[0], PrintProgress);
    std::cout << "verified=" << (result.verified ? "true" : "false") << " repaired=" << result.repaired << " failed=" << result.failed
              << (result.cancelled ? " cancelled" : "") << "\n";
    return result.verified ? 0 : 2;
  }

  // ------------------------------------------------------------

  if (cmd == "clear") {
    if (args.size() != 1) return 1;

    bool ok = args[0] == "all" ? sys.layer_manager->ClearAllCache() : sys.layer_manager->ClearLayer(args[0]);
    std::cout << (ok ? "cleared" : "clear failed") << "\n";
    return ok ? 0 : 2;
  }

  // ------------------------------------------------------------

  if (cmd == "surveys") {
    for (const auto& survey : sys.surveys->All()) {
      std::cout << survey.id << "\t" << survey.name << "\tmax_order=" << survey.max_order << "\t" << survey.category << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "hips-status") {
    if (args.size() != 1) return 1;

    auto status = sys.hips_manager->GetHiPSCacheStatus(sys.surveys->Get(args[0]));
    std::cout << status.survey_id << "\ttiles=" << status.cached_tile_count << "/" << status.total_tiles_through_max_order;
    if (status.max_cached_order) std::cout << "\tmax_cached_order=" << *status.max_cached_order;
    std::cout << "\testimate=" << skycache::stats::FormatBytes(status.cached_bytes_estimate)
              << "\tstored=" << skycache::stats::FormatBytes(status.stored_bytes) << "\n";
    return 0;
  }

  if (cmd == "hips-download") {
    if (args.size() != 2) return 1;

    bool ok = sys.hips_manager->DownloadHiPSSurvey(sys.surveys->Get(args[0]), std::stoi(args[1]), PrintProgress);
    return ok ? 0 : 2;
  }

  if (cmd == "hips-clear") {
    if (args.size() != 1) return 1;

    bool ok = args[0] == "all" ? sys.hips_manager->ClearAllHiPSCaches() : sys.hips_manager->ClearHiPSCache(args[0]);
    std::cout << (ok ? "cleared" : "clear failed") << "\n";
    return ok ? 0 : 2;
  }

  // ------------------------------------------------------------

  if (cmd == "fetch") {
    if (args.empty() || args.size() > 2) return 1;

    auto strategy = skycache::unified::CacheStrategy::kCacheFirst;
    if (args.size() == 2) {
      auto parsed = skycache::unified::ParseCacheStrategy(args[1]);
      if (!parsed) {
        std::cerr << "unsupported strategy: " << args[1] << "\n";
        return 1;
      }
      strategy = *parsed;
    }

    auto response = sys.unified_cache->Fetch(args[0], strategy);
    if (!response.ok) {
      std::cerr << "fetch failed: " << (response.error.empty() ? "http " + std::to_string(response.http_status) : response.error) << "\n";
      return 2;
    }
    std::cerr << (response.from_cache ? "cache" : "network") << " " << response.content_type << " "
              << skycache::storage::common::BufferSize(response.body) << " bytes\n";
    std::cout << skycache::storage::common::ToString(response.body);
    return 0;
  }

  if (cmd == "prefetch") {
    if (args.empty()) return 1;

    auto summary = sys.unified_cache->PrefetchAll(args);
    for (const auto& [url, ok] : summary.results) {
      std::cout << (ok ? "ok     " : "failed ") << url << "\n";
    }
    std::cout << summary.succeeded << " succeeded, " << summary.failed << " failed\n";
    return summary.failed == 0 ? 0 : 2;
  }

  if (cmd == "cleanup") {
    std::cout << "removed " << sys.unified_cache->CleanupExpired() << " expired entries\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    std::cout << skycache::stats::FormatCacheStats(sys.reporter->CollectCacheStats());
    return 0;
  }

  if (cmd == "version") {
    auto stored = sys.migrator->GetCacheVersion();
    std::cout << "stored=" << (stored ? std::to_string(stored->version()) : "none") << " current=" << sys.migrator->CurrentVersion()
              << " state=" << skycache::migration::ToString(sys.migrator->State()) << "\n";
    return 0;
  }

  if (cmd == "migrate") {
    auto result = sys.migrator->RunMigrations();
    std::cout << "from=" << result.from_version << " to=" << result.to_version << " migrated=" << result.migrated_items
              << " deleted=" << result.deleted_items << "\n";
    for (const auto& error : result.errors) {
      std::cerr << "error: " << error << "\n";
    }
    return result.success ? 0 : 2;
  }

  if (cmd == "reset") {
    bool ok = sys.migrator->ResetAllCaches();
    std::cout << (ok ? "reset" : "reset failed") << "\n";
    return ok ? 0 : 2;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  std::string config_path;
  int         first = 1;
  if (argc >= 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    first       = 3;
  }
  if (first >= argc) {
    Usage();
    return 1;
  }

  std::string              cmd = argv[first];
  std::vector<std::string> args(argv + first + 1, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? skycache::config::ConfigLoader::LoadFromYamlString("")
                                      : skycache::config::ConfigLoader::LoadFromYaml(config_path);

    skycache::observability::InitializeLogging(config);

    auto sys = skycache::factory::Build(config);

    // Ctrl-C cancels running downloads; stored files stay cached.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::atomic<bool> done{false};
    std::thread       watcher([&] {
      while (!done.load()) {
        if (g_interrupted) {
          SKYCACHE_LOG_WARN("Interrupted, cancelling downloads");
          sys.layer_manager->CancelAllDownloads();
          sys.hips_manager->CancelAllHiPSDownloads();
          g_interrupted = 0;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });

    int rc = 1;
    try {
      rc = RunCommand(sys, cmd, args);
    } catch (const skycache::util::NotFound& e) {
      std::cerr << e.what() << "\n";
      rc = 1;
    } catch (const std::logic_error& e) {
      // bad ids, orders out of range, unparsable numbers
      std::cerr << e.what() << "\n";
      rc = 1;
    } catch (const std::exception& e) {
      SKYCACHE_LOG_ERROR("Command failed", {skycache::observability::StringField("command", cmd), skycache::observability::StringField("error", e.what())});
      rc = 2;
    }

    done = true;
    watcher.join();

    skycache::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    SKYCACHE_LOG_ERROR("Fatal error", {skycache::observability::StringField("error", e.what())});
    skycache::observability::ShutdownLogging();
    return 2;
  }
}

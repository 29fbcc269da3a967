#include "priceopt/common.hpp"
#include "priceopt/logger.hpp"
#include "priceopt/optimization_service.hpp"
#include "priceopt/report.hpp"
#include "priceopt/sample_feed.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace priceopt;

static void printUsage() {
  std::cout << R"(
priceopt: profit-maximizing price from market samples

Usage: priceopt [--input FILE | --url URL] [--product NAME]... [OPTIONS]

Sources:
  --input <FILE>        JSON sample document (optionally a "catalog" by name)
  --url <URL>           HTTP endpoint returning a sample document for ?q=NAME

Options:
  --product <NAME>      Product to optimize (repeatable; default: every
                        catalog entry of --input)
  --cost <C>            Unit cost (default: 70% of the cheapest price)
  --max-demand <D>      Theoretical demand at price 0 (default: max(100, n/10))
  --tolerance <T>       Golden-section bracket tolerance (default: 1e-3)
  --max-iters <N>       Golden-section iteration cap (default: 100)
  --workers <N>         Worker threads (default: 2)
  --timeout <SEC>       HTTP timeout in seconds (default: 10)
  --log-dir <DIR>       Run ledger directory (default: logs)
  --verbose, -v         Debug logging
  --help, -h            Show this help

Environment:
  PRICEOPT_SOURCE_URL   Default for --url
  PRICEOPT_LOG_DIR      Default for --log-dir
)";
}

static std::string requireValue(int &i, int argc, char *argv[]) {
  if (i + 1 >= argc)
    throw std::invalid_argument(std::string(argv[i]) + " needs a value");
  return argv[++i];
}

// ── Parse CLI args ──────────────────────────────────────────────────
static Config parseArgs(int argc, char *argv[]) {
  Config cfg;

  // Load from environment
  if (auto *v = std::getenv("PRICEOPT_SOURCE_URL"))
    cfg.source_url = v;
  if (auto *v = std::getenv("PRICEOPT_LOG_DIR"))
    cfg.log_dir = v;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "--input")
      cfg.input_path = requireValue(i, argc, argv);
    else if (arg == "--url")
      cfg.source_url = requireValue(i, argc, argv);
    else if (arg == "--product")
      cfg.products.push_back(requireValue(i, argc, argv));
    else if (arg == "--cost")
      cfg.cost = std::stod(requireValue(i, argc, argv));
    else if (arg == "--max-demand")
      cfg.max_demand = std::stod(requireValue(i, argc, argv));
    else if (arg == "--tolerance")
      cfg.gs_tolerance = std::stod(requireValue(i, argc, argv));
    else if (arg == "--max-iters")
      cfg.gs_max_iters = std::stoi(requireValue(i, argc, argv));
    else if (arg == "--workers")
      cfg.worker_threads = std::stoi(requireValue(i, argc, argv));
    else if (arg == "--timeout")
      cfg.http_timeout_s = std::stoi(requireValue(i, argc, argv));
    else if (arg == "--log-dir")
      cfg.log_dir = requireValue(i, argc, argv);
    else if (arg == "--verbose" || arg == "-v")
      cfg.verbose = true;
    else if (arg == "--help" || arg == "-h") {
      printUsage();
      std::exit(0);
    } else
      throw std::invalid_argument("unknown option " + arg);
  }
  return cfg;
}

// ── Main pipeline ────────────────────────────────────────────────────
int main(int argc, char *argv[]) {
  // Logs go to stderr so stdout carries only the JSON report
  auto console = spdlog::stderr_color_mt("priceopt");
  spdlog::set_default_logger(console);
  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  Config cfg;
  try {
    cfg = parseArgs(argc, argv);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    printUsage();
    return 2;
  }
  if (cfg.verbose)
    spdlog::set_level(spdlog::level::debug);

  if (cfg.input_path.empty() && cfg.source_url.empty()) {
    spdlog::error("No sample source: pass --input or --url "
                  "(or set PRICEOPT_SOURCE_URL).");
    return 2;
  }
  if (cfg.products.empty() && cfg.input_path.empty()) {
    spdlog::error("Please give at least one --product.");
    return 2;
  }

  spdlog::info("Source: {}",
               cfg.input_path.empty() ? cfg.source_url : cfg.input_path);
  spdlog::info("Workers: {}", cfg.worker_threads);
  spdlog::info("GSS tolerance: {:g}, max iters: {}", cfg.gs_tolerance,
               cfg.gs_max_iters);

  // ── Initialize components ────────────────────────────────────────
  std::unique_ptr<SampleSource> source;
  if (!cfg.input_path.empty()) {
    auto file_source = std::make_unique<JsonFileSampleSource>(cfg.input_path);
    if (cfg.products.empty()) {
      // Every catalog entry, or the file stem for a single-product file
      cfg.products = file_source->catalogProducts();
      if (cfg.products.empty())
        cfg.products.push_back(
            std::filesystem::path(cfg.input_path).stem().string());
    }
    source = std::move(file_source);
  } else {
    source = std::make_unique<HttpSampleSource>(cfg);
  }
  spdlog::info("Products: {}", cfg.products.size());

  std::unique_ptr<RunLogger> ledger;
  try {
    ledger = std::make_unique<RunLogger>(cfg.log_dir);
  } catch (const std::exception &e) {
    spdlog::warn("Run ledger disabled ({}): {}", cfg.log_dir, e.what());
  }

  auto start = std::chrono::steady_clock::now();
  nlohmann::json report = nlohmann::json::array();
  int completed = 0, failed = 0;
  {
    OptimizationService service(cfg, *source, ledger.get());

    std::vector<std::string> ids;
    for (const auto &product : cfg.products)
      ids.push_back(service.submit(product, cfg.cost, cfg.max_demand));

    service.shutdown(); // drains the queue

    for (const auto &id : ids) {
      auto rec = service.status(id);
      if (!rec)
        continue;
      if (rec->status == TaskStatus::COMPLETED)
        completed++;
      else
        failed++;
      report.push_back(toJson(*rec));
    }
  }

  if (ledger)
    ledger->logSummary(completed, failed, elapsed_ms(start));

  std::cout << report.dump(2) << std::endl;
  return failed > 0 ? 1 : 0;
}

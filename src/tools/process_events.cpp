#include <CLI/CLI.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

#include "events/pipeline.h"
#include "log.h"

using namespace stopevents;

namespace {

std::atomic<bool> g_cancel{false};

void HandleSignal(int) { g_cancel.store(true); }

}  // namespace

int main(int argc, char* argv[]) {
  CLI::App app{"Reconstruct and enrich stop events from raw movement data"};

  std::string config_path;
  std::string input;
  std::string output_dir;
  unsigned workers = 0;
  bool no_compress = false;

  app.add_option("config_path", config_path, "Path to pipeline TOML config")
      ->required()
      ->check(CLI::ExistingFile);
  app.add_option("--input", input, "Raw source file, replaces the config's");
  app.add_option("--output-dir", output_dir, "Directory to write partitions to");
  app.add_option("--workers", workers, "Partition worker threads")
      ->check(CLI::PositiveNumber);
  app.add_flag("--no-compress", no_compress, "Write historic output as plain CSV");

  CLI11_PARSE(app, argc, argv);

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  try {
    PipelineConfig config = PipelineConfigLoad(config_path);
    if (!input.empty()) {
      config.inputs = {input};
    }
    if (!output_dir.empty()) {
      config.output_dir = output_dir;
    }
    if (workers > 0) {
      config.options.workers = workers;
    }
    if (no_compress) {
      config.options.compress = false;
    }

    std::cerr << "Processing " << ToString(config.source_kind) << " for "
              << FormatServiceDate(config.service_date) << " into "
              << config.output_dir << "\n";

    DirectorySink sink(config.output_dir);
    PipelineResult result =
        RunPipeline(config, sink, g_cancel, OstreamLogger(std::cerr));

    nlohmann::json summary = result.summary;
    summary["partitions"] = result.partitions.size();
    summary["completed"] = result.completed;
    std::cout << summary.dump(2) << "\n";
    return result.completed ? 0 : 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

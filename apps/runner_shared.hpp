#pragma once

#include "station_impute/config/configuration.hpp"
#include "station_impute/core/events.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <ostream>
#include <streambuf>
#include <string>

namespace station_impute::runner {

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

// Shared state handed to every phase of one invocation.
struct RunContext {
  const config::Config &cfg;
  std::string run_id;
  core::EventEmitter &emitter;
  std::ostream &log;
};

// Loads, resolves and validates the run configuration. Relative paths are
// taken against project_root when given, else the config file directory.
config::Config load_run_config(const std::string &config_path,
                               const std::string &project_root);

// Writes `doc` pretty-printed and announces it as an artifact_written event.
void write_json_artifact(const RunContext &ctx, const std::filesystem::path &path,
                         const nlohmann::json &doc);

} // namespace station_impute::runner

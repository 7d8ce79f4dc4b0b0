#include "runner_shared.hpp"

#include "station_impute/core/utils.hpp"

#include <cstdio>

namespace station_impute::runner {

namespace fs = std::filesystem;

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

config::Config load_run_config(const std::string &config_path,
                               const std::string &project_root) {
  const fs::path cfg_path(config_path);
  config::Config cfg = config::Config::load(cfg_path);

  fs::path base = project_root.empty() ? fs::absolute(cfg_path).parent_path()
                                       : fs::absolute(fs::path(project_root));
  cfg.resolve_paths(base);
  cfg.validate();
  return cfg;
}

void write_json_artifact(const RunContext &ctx, const fs::path &path,
                         const nlohmann::json &doc) {
  core::write_text(path, doc.dump(2) + "\n");
  core::emit_event("artifact_written", ctx.run_id,
                   {{"path", path.string()}}, ctx.log);
}

} // namespace station_impute::runner

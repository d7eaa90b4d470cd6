#pragma once

#include <boost/program_options.hpp>

#include <stdexcept>
#include <string>

namespace tally::cli {

/// Bad command line or configuration. Reported on stderr with exit code 1.
class usage_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct settings final {
  std::string journal_path;
  std::string fixtures_dir;
  std::string config_path;
  bool dry_run{false};
  bool yes{false};
  bool verbose{false};
};

/// Every option the binary understands, global and per command.
boost::program_options::options_description make_options();

/// Parse argv, then the TALLY_* environment, then the config file. Earlier
/// sources win. Throws usage_error or boost::program_options::error.
boost::program_options::variables_map parse(
    int argc,
    const char** argv,
    const boost::program_options::options_description& options);

/// Resolve paths and flags, filling in defaults under $HOME/.config/tally.
settings make_settings(const boost::program_options::variables_map& vm);

std::string default_config_dir();

}  // namespace tally::cli

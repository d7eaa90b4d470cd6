#pragma once

#include <tally/cli/config.hpp>
#include <tally/schema/mutation_request.hpp>

#include <boost/program_options.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace tally::cli {

struct terminal final {
  std::ostream& out;
  std::ostream& err;
  std::istream& in;
  // Whether a human can answer the confirmation prompt.
  bool interactive{false};
};

/// Build the mutation for `transactions|categories|tags|recurrings` commands.
/// `args` holds the subcommand followed by ids. Throws usage_error.
tally::schema::mutation_request build_request(
    const std::string& command,
    const std::vector<std::string>& args,
    const boost::program_options::variables_map& vm);

/// Dispatch a parsed command line and return the process exit code.
int run(const boost::program_options::variables_map& vm,
        const settings& config,
        terminal& term);

}  // namespace tally::cli

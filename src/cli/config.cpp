#include <tally/cli/config.hpp>


#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

namespace tally::cli {

namespace po = boost::program_options;

namespace {

// Options that may also come from the environment or the config file.
po::options_description make_persistent_options() {
  auto options = po::options_description{"Configuration"};
  options.add_options()("journal", po::value<std::string>(),
                        "journal database path")(
      "fixtures-dir", po::value<std::string>(),
      "fixture service database path")("config", po::value<std::string>(),
                                       "config file path");
  return options;
}

std::string map_environment(const std::string& name) {
  if (name == "TALLY_JOURNAL") {
    return "journal";
  }
  if (name == "TALLY_FIXTURES_DIR") {
    return "fixtures-dir";
  }
  if (name == "TALLY_CONFIG") {
    return "config";
  }
  return {};
}

std::string default_config_path() {
  return (std::filesystem::path{default_config_dir()} / "config").string();
}

}  // namespace

std::string default_config_dir() {
  const auto* home = std::getenv("HOME");
  auto base = std::filesystem::path{home != nullptr ? home : "."};
  return (base / ".config" / "tally").string();
}

po::options_description make_options() {
  auto general = po::options_description{"tally options"};
  general.add_options()("help,h", "show help")(
      "command", po::value<std::string>(),
      "transactions|categories|tags|recurrings|undo|history|fixtures")(
      "args", po::value<std::vector<std::string>>()->multitoken(),
      "subcommand and ids")("dry-run", "show planned changes without writing")(
      "yes,y", "skip the confirmation prompt")("verbose,v",
                                               "enable debug logging");

  auto edits = po::options_description{"Edit options"};
  edits.add_options()("category-id", po::value<std::string>(),
                      "category id")(
      "notes", po::value<std::string>(), "transaction notes")(
      "clear", "clear the field instead of setting it")(
      "mode", po::value<std::string>()->default_value("set"),
      "set|add|remove")("tag-id",
                        po::value<std::vector<std::string>>()->multitoken(),
                        "tag ids")("recurring-id", po::value<std::string>(),
                                   "recurring id")(
      "type", po::value<std::string>(), "REGULAR|INTERNAL_TRANSFER")(
      "name", po::value<std::string>(), "name")(
      "emoji", po::value<std::string>(), "category emoji")(
      "color-name", po::value<std::string>(), "color name")(
      "excluded", po::value<std::string>(), "true|false")(
      "name-contains", po::value<std::string>(), "recurring match text")(
      "min-amount", po::value<std::string>(), "minimum amount in cents")(
      "max-amount", po::value<std::string>(), "maximum amount in cents")(
      "frequency", po::value<std::string>(),
      "DAILY|WEEKLY|BIWEEKLY|MONTHLY|QUARTERLY|ANNUALLY");

  auto journal = po::options_description{"Journal options"};
  journal.add_options()("sequence", po::value<uint64_t>(),
                        "journal sequence number")(
      "kind", po::value<std::string>(),
      "transaction|category|tag|recurring")("id", po::value<std::string>(),
                                            "entity id")(
      "limit", po::value<std::size_t>()->default_value(20),
      "maximum entries, 0 for all")(
      "field", po::value<std::vector<std::string>>()->multitoken(),
      "fixture field as name=value");

  auto options = po::options_description{};
  options.add(general).add(make_persistent_options()).add(edits).add(journal);
  return options;
}

po::variables_map parse(const int argc,
                        const char** argv,
                        const po::options_description& options) {
  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  positional.add("args", -1);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);

  const auto persistent = make_persistent_options();
  po::store(po::parse_environment(persistent, map_environment), vm);

  auto config_path = vm.contains("config") ? vm["config"].as<std::string>()
                                           : default_config_path();
  auto error = std::error_code{};
  if (std::filesystem::exists(config_path, error)) {
    auto file = std::ifstream{config_path};
    if (!file) {
      throw usage_error{"cannot read config file " + config_path};
    }
    po::store(po::parse_config_file(file, persistent, true), vm);
  } else if (vm.contains("config")) {
    throw usage_error{"config file " + config_path + " does not exist"};
  }
  po::notify(vm);
  return vm;
}

settings make_settings(const po::variables_map& vm) {
  auto out = settings{};
  const auto base = std::filesystem::path{default_config_dir()};
  out.journal_path = vm.contains("journal") ? vm["journal"].as<std::string>()
                                            : (base / "journal").string();
  out.fixtures_dir = vm.contains("fixtures-dir")
                         ? vm["fixtures-dir"].as<std::string>()
                         : (base / "fixtures").string();
  out.config_path = vm.contains("config") ? vm["config"].as<std::string>()
                                          : default_config_path();
  out.dry_run = vm.contains("dry-run");
  out.yes = vm.contains("yes");
  out.verbose = vm.contains("verbose");
  return out;
}

}  // namespace tally::cli

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tally/cli/commands.hpp>
#include <tally/cli/config.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace {

void print_help(const boost::program_options::options_description& options) {
  std::cout << "Usage:\n"
            << "  tally transactions review|unreview IDS... [options]\n"
            << "  tally transactions set-category IDS... --category-id C\n"
            << "  tally transactions set-notes IDS... (--notes T | --clear)\n"
            << "  tally transactions set-tags IDS... [--mode set|add|remove] "
               "--tag-id T...\n"
            << "  tally transactions assign-recurring IDS... "
               "(--recurring-id R | --clear)\n"
            << "  tally transactions set-type IDS... --type T\n"
            << "  tally categories|tags|recurrings edit ID [field options]\n"
            << "  tally undo [--sequence N]\n"
            << "  tally history [--kind K --id ID] [--limit N]\n"
            << "  tally fixtures set|show --kind K --id ID "
               "[--field name=value...]\n\n";
  std::cout << options << '\n';
}

void configure_logging(const tally::cli::settings& config) {
  spdlog::init_thread_pool(8192, 1);

  // Log lines go to stderr so stdout stays a clean table.
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  auto log_dir = std::filesystem::path{config.journal_path}.parent_path();
  auto error = std::error_code{};
  if (!log_dir.empty()) {
    std::filesystem::create_directories(log_dir, error);
  }
  if (!error) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          (log_dir / "tally.log").string(), false));
    } catch (const spdlog::spdlog_ex& ex) {
      std::cerr << "warning: file logging disabled: " << ex.what() << '\n';
    }
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "tally", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(config.verbose ? spdlog::level::debug
                                   : spdlog::level::warn);
}

}  // namespace

int main(int argc, const char** argv) {
  namespace po = boost::program_options;

  const auto options = tally::cli::make_options();
  auto vm = po::variables_map{};
  auto config = tally::cli::settings{};
  try {
    vm = tally::cli::parse(argc, argv, options);
    if (vm.contains("help") || !vm.contains("command")) {
      print_help(options);
      return vm.contains("help") ? 0 : 1;
    }
    config = tally::cli::make_settings(vm);
  } catch (const po::error& ex) {
    std::cerr << "error: " << ex.what() << '\n';
    return 1;
  } catch (const tally::cli::usage_error& ex) {
    std::cerr << "error: " << ex.what() << '\n';
    return 1;
  }

  configure_logging(config);

  auto term = tally::cli::terminal{.out = std::cout,
                                   .err = std::cerr,
                                   .in = std::cin,
                                   .interactive = ::isatty(STDIN_FILENO) != 0};
  auto code = 0;
  try {
    code = tally::cli::run(vm, config, term);
  } catch (const tally::cli::usage_error& ex) {
    std::cerr << "error: " << ex.what() << '\n';
    code = 1;
  } catch (const po::error& ex) {
    std::cerr << "error: " << ex.what() << '\n';
    code = 1;
  }

  spdlog::shutdown();
  return code;
}

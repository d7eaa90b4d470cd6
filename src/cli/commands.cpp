#include <tally/cli/commands.hpp>
#include <tally/cli/render.hpp>
#include <tally/execution/engine.hpp>
#include <tally/journal/journal_store.hpp>
#include <tally/remote/fixture_service.hpp>

#include <spdlog/spdlog.h>

#include <istream>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace tally::cli {

namespace po = boost::program_options;

namespace {

using tally::schema::entity_kind_t;
using tally::schema::field_t;

constexpr auto kRefusal =
    std::string_view{"refusing to write in non-interactive mode without --yes"};

std::vector<std::string> positional_args(const po::variables_map& vm) {
  if (!vm.contains("args")) {
    return {};
  }
  return vm["args"].as<std::vector<std::string>>();
}

std::vector<std::string> ids_after_subcommand(
    const std::vector<std::string>& args) {
  auto ids = std::vector<std::string>{std::next(std::begin(args)),
                                      std::end(args)};
  if (ids.empty()) {
    throw usage_error{"at least one id is required"};
  }
  return ids;
}

std::string single_id(const std::vector<std::string>& args) {
  auto ids = ids_after_subcommand(args);
  if (ids.size() != 1) {
    throw usage_error{"exactly one id is required"};
  }
  return ids.front();
}

std::string required_string(const po::variables_map& vm,
                            const std::string& name) {
  if (!vm.contains(name)) {
    throw usage_error{"--" + name + " is required"};
  }
  return vm[name].as<std::string>();
}

tally::schema::optional_field_value_t text_or_clear(
    const po::variables_map& vm,
    const std::string& name) {
  const auto clear = vm.contains("clear");
  if (clear == vm.contains(name)) {
    throw usage_error{"pass exactly one of --" + name + " or --clear"};
  }
  if (clear) {
    return std::nullopt;
  }
  return tally::schema::field_value_t{vm[name].as<std::string>()};
}

/// Value of an optional edit flag parsed with the field's value syntax.
void add_optional_field(tally::schema::mutation_request& request,
                        const po::variables_map& vm,
                        const std::string& option,
                        const field_t field) {
  if (!vm.contains(option)) {
    return;
  }
  const auto* spec = tally::execution::find_field(request.kind, field);
  if (spec == nullptr) {
    throw usage_error{"--" + option + " does not apply here"};
  }
  const auto text = vm[option].as<std::string>();
  auto value = tally::schema::parse_field_value(text, spec->type);
  if (!value.has_value()) {
    throw usage_error{"--" + option + " expects " +
                      std::string{tally::schema::to_string(spec->type)} +
                      ", got '" + text + "'"};
  }
  request.updates.push_back(tally::schema::set_field(field, std::move(*value)));
}

tally::schema::mutation_request build_transactions(
    const std::vector<std::string>& args,
    const po::variables_map& vm) {
  const auto& subcommand = args.front();
  auto request = tally::schema::mutation_request{};
  request.kind = entity_kind_t::transaction;
  request.ids = ids_after_subcommand(args);

  if (subcommand == "review" || subcommand == "unreview") {
    request.updates.push_back(tally::schema::set_field(
        field_t::reviewed, tally::schema::field_value_t{subcommand == "review"}));
  } else if (subcommand == "set-category") {
    request.updates.push_back(tally::schema::set_field(
        field_t::category_id,
        tally::schema::field_value_t{required_string(vm, "category-id")}));
  } else if (subcommand == "set-notes") {
    request.updates.push_back(
        tally::schema::set_field(field_t::notes, text_or_clear(vm, "notes")));
  } else if (subcommand == "set-tags") {
    const auto mode_name = vm["mode"].as<std::string>();
    const auto mode =
        tally::schema::try_from_string<tally::schema::update_mode_t>(mode_name);
    if (!mode.has_value()) {
      throw usage_error{"--mode must be one of " +
                        tally::schema::join_names(
                            tally::schema::kUpdateModeMappings)};
    }
    auto tags = vm.contains("tag-id")
                    ? vm["tag-id"].as<std::vector<std::string>>()
                    : std::vector<std::string>{};
    if (*mode != tally::schema::update_mode_t::set && tags.empty()) {
      throw usage_error{"--tag-id is required with --mode " + mode_name};
    }
    request.updates.push_back(tally::schema::field_update{
        .field = field_t::tags,
        .mode = *mode,
        .value = tally::schema::field_value_t{
            tally::schema::make_id_set(std::move(tags))}});
  } else if (subcommand == "assign-recurring") {
    request.updates.push_back(tally::schema::set_field(
        field_t::recurring_id, text_or_clear(vm, "recurring-id")));
  } else if (subcommand == "set-type") {
    request.updates.push_back(tally::schema::set_field(
        field_t::transaction_type,
        tally::schema::field_value_t{required_string(vm, "type")}));
  } else {
    throw usage_error{"unknown transactions subcommand '" + subcommand + "'"};
  }
  return request;
}

tally::schema::mutation_request build_edit(const entity_kind_t kind,
                                           const std::vector<std::string>& args,
                                           const po::variables_map& vm) {
  if (args.front() != "edit") {
    throw usage_error{"unknown " + std::string{tally::schema::to_string(kind)} +
                      " subcommand '" + args.front() + "'"};
  }
  auto request = tally::schema::mutation_request{};
  request.kind = kind;
  request.ids.push_back(single_id(args));
  switch (kind) {
    case entity_kind_t::category:
      add_optional_field(request, vm, "name", field_t::name);
      add_optional_field(request, vm, "emoji", field_t::emoji);
      add_optional_field(request, vm, "color-name", field_t::color_name);
      add_optional_field(request, vm, "excluded", field_t::excluded);
      break;
    case entity_kind_t::tag:
      add_optional_field(request, vm, "name", field_t::name);
      add_optional_field(request, vm, "color-name", field_t::color_name);
      break;
    case entity_kind_t::recurring:
      add_optional_field(request, vm, "name-contains", field_t::name_contains);
      add_optional_field(request, vm, "min-amount", field_t::min_amount);
      add_optional_field(request, vm, "max-amount", field_t::max_amount);
      add_optional_field(request, vm, "frequency", field_t::frequency);
      break;
    case entity_kind_t::transaction:
      break;
  }
  if (request.updates.empty()) {
    throw usage_error{"nothing to edit"};
  }
  return request;
}

/// Resolve a require_confirmation decision. Returns false when the write must
/// not happen.
bool confirm(terminal& term, const std::string& action) {
  if (!term.interactive) {
    term.err << kRefusal << '\n';
    return false;
  }
  term.err << action << '\n' << "Proceed? Type 'yes' to confirm: ";
  term.err.flush();
  auto answer = std::string{};
  std::getline(term.in, answer);
  if (answer != "yes") {
    term.err << "aborted\n";
    return false;
  }
  return true;
}

/// One-line summary shown above the confirmation prompt, e.g.
/// "Update transaction t1, t2: reviewed, notes".
std::string describe_request(const tally::schema::mutation_request& request) {
  auto out = "Update " + std::string{tally::schema::to_string(request.kind)};
  for (std::size_t i = 0; i < request.ids.size(); ++i) {
    out += i == 0 ? " " : ", ";
    out += request.ids[i];
  }
  for (std::size_t i = 0; i < request.updates.size(); ++i) {
    out += i == 0 ? ": " : ", ";
    out += tally::schema::to_string(request.updates[i].field);
    if (request.updates[i].mode != tally::schema::update_mode_t::set) {
      out += " (";
      out += tally::schema::to_string(request.updates[i].mode);
      out += ")";
    }
  }
  return out;
}

tally::execution::apply_gate_input make_gate(const settings& config,
                                             const terminal& term) {
  return tally::execution::apply_gate_input{.is_write = true,
                                            .dry_run = config.dry_run,
                                            .non_interactive =
                                                !term.interactive,
                                            .confirmed = config.yes};
}

int run_mutation(const tally::schema::mutation_request& request,
                 const settings& config,
                 terminal& term) {
  auto service = tally::remote::fixture_service{config.fixtures_dir};
  auto remote = service.capabilities();
  auto catalog = service.catalog();
  auto journal = tally::journal::journal_store{config.journal_path};
  auto engine = tally::execution::engine{journal, remote, &catalog};

  const auto gate = make_gate(config, term);
  auto report = engine.submit(request, gate);
  if (report.decision ==
      tally::execution::apply_decision_t::require_confirmation) {
    if (!tally::execution::confirmation_possible(gate)) {
      term.err << kRefusal << '\n';
      return 1;
    }
    if (!confirm(term, describe_request(request))) {
      return 1;
    }
    // The gate already decided; a confirmed request goes straight to apply.
    report.decision = tally::execution::apply_decision_t::execute;
    report.outcomes = engine.plan_and_apply(request);
  }

  render_outcomes(term.out, report.outcomes, report.decision);
  return tally::execution::exit_code(
      tally::execution::summarize(report.outcomes));
}

int run_undo(const po::variables_map& vm,
             const settings& config,
             terminal& term) {
  auto target = tally::execution::undo_target{};
  if (vm.contains("sequence")) {
    target.sequence = vm["sequence"].as<uint64_t>();
  }

  auto journal = tally::journal::journal_store{config.journal_path};
  auto gate = make_gate(config, term);
  auto decision = tally::execution::decide(gate);
  if (decision != tally::execution::apply_decision_t::execute) {
    auto entry = target.sequence.has_value() ? journal.find(*target.sequence)
                                             : journal.last_eligible_entry();
    if (!entry.has_value()) {
      term.out << "no_history: nothing to undo\n";
      return 6;
    }
    if (decision == tally::execution::apply_decision_t::abort_dry_run) {
      term.out << "dry-run: would undo journal entry " << entry->sequence
               << '\n';
      render_history(term.out, {*entry});
      return 0;
    }
    render_history(term.err, {*entry});
    if (!confirm(term, "Undo journal entry " + std::to_string(entry->sequence) +
                           "?")) {
      return 1;
    }
    // Undo the entry that was shown, not whatever is last by the time the
    // user answered.
    target.sequence = entry->sequence;
  }

  auto service = tally::remote::fixture_service{config.fixtures_dir};
  auto remote = service.capabilities();
  auto engine = tally::execution::engine{journal, remote};
  auto report = engine.undo(target);
  render_undo(term.out, report);
  return tally::execution::exit_code(report);
}

int run_history(const po::variables_map& vm,
                const settings& config,
                terminal& term) {
  auto ref = std::optional<tally::schema::entity_ref_t>{};
  if (vm.contains("kind") != vm.contains("id")) {
    throw usage_error{"--kind and --id must be given together"};
  }
  if (vm.contains("kind")) {
    const auto kind_name = vm["kind"].as<std::string>();
    const auto kind =
        tally::schema::try_from_string<entity_kind_t>(kind_name);
    if (!kind.has_value()) {
      throw usage_error{"unknown kind '" + kind_name + "', expected " +
                      tally::schema::join_names(
                          tally::schema::kEntityKindMappings)};
    }
    ref = tally::schema::make_entity_ref(*kind, vm["id"].as<std::string>());
  }

  auto journal = tally::journal::journal_store{config.journal_path};
  auto remote = tally::execution::remote_capabilities{};
  auto engine = tally::execution::engine{journal, remote};
  render_history(term.out, engine.history(ref, vm["limit"].as<std::size_t>()));
  return 0;
}

tally::schema::entity_ref_t fixture_ref(const po::variables_map& vm) {
  const auto kind_name = required_string(vm, "kind");
  const auto kind = tally::schema::try_from_string<entity_kind_t>(kind_name);
  if (!kind.has_value()) {
    throw usage_error{"unknown kind '" + kind_name + "', expected " +
                      tally::schema::join_names(
                          tally::schema::kEntityKindMappings)};
  }
  return tally::schema::make_entity_ref(*kind, required_string(vm, "id"));
}

int run_fixtures(const std::vector<std::string>& args,
                 const po::variables_map& vm,
                 const settings& config,
                 terminal& term) {
  if (args.empty()) {
    throw usage_error{"fixtures needs set or show"};
  }
  auto service = tally::remote::fixture_service{config.fixtures_dir};
  const auto ref = fixture_ref(vm);

  if (args.front() == "show") {
    auto record = service.load(ref);
    if (!record.has_value()) {
      term.err << tally::schema::to_display(ref) << " not found\n";
      return 3;
    }
    render_record(term.out, *record);
    return 0;
  }
  if (args.front() != "set") {
    throw usage_error{"unknown fixtures subcommand '" + args.front() + "'"};
  }

  auto values = tally::schema::field_value_map_t{};
  const auto assignments = vm.contains("field")
                               ? vm["field"].as<std::vector<std::string>>()
                               : std::vector<std::string>{};
  for (const auto& assignment : assignments) {
    const auto equals = assignment.find('=');
    if (equals == std::string::npos) {
      throw usage_error{"--field expects name=value, got '" + assignment + "'"};
    }
    const auto name = assignment.substr(0, equals);
    const auto text = std::string_view{assignment}.substr(equals + 1);
    const auto field = tally::schema::try_from_string<field_t>(name);
    const auto* spec = field.has_value()
                           ? tally::execution::find_field(ref.kind, *field)
                           : nullptr;
    if (spec == nullptr) {
      throw usage_error{"unknown " +
                        std::string{tally::schema::to_string(ref.kind)} +
                        " field '" + name + "'"};
    }
    auto value = tally::schema::parse_field_value(text, spec->type);
    if (!value.has_value()) {
      throw usage_error{"field '" + name + "' expects " +
                        std::string{tally::schema::to_string(spec->type)}};
    }
    values[*field] = std::move(*value);
  }
  service.upsert(ref, values);
  term.out << "stored " << tally::schema::to_display(ref) << '\n';
  return 0;
}

}  // namespace

tally::schema::mutation_request build_request(
    const std::string& command,
    const std::vector<std::string>& args,
    const po::variables_map& vm) {
  if (args.empty()) {
    throw usage_error{command + " needs a subcommand"};
  }
  if (command == "transactions") {
    return build_transactions(args, vm);
  }
  if (command == "categories") {
    return build_edit(entity_kind_t::category, args, vm);
  }
  if (command == "tags") {
    return build_edit(entity_kind_t::tag, args, vm);
  }
  if (command == "recurrings") {
    return build_edit(entity_kind_t::recurring, args, vm);
  }
  throw usage_error{"unknown command '" + command + "'"};
}

int run(const po::variables_map& vm, const settings& config, terminal& term) {
  if (!vm.contains("command")) {
    throw usage_error{"a command is required"};
  }
  const auto command = vm["command"].as<std::string>();
  const auto args = positional_args(vm);
  spdlog::debug("journal {} fixtures {}", config.journal_path,
                config.fixtures_dir);

  if (command == "undo") {
    return run_undo(vm, config, term);
  }
  if (command == "history") {
    return run_history(vm, config, term);
  }
  if (command == "fixtures") {
    return run_fixtures(args, vm, config, term);
  }
  return run_mutation(build_request(command, args, vm), config, term);
}

}  // namespace tally::cli

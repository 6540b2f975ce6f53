#include <hexref/cli/commands.hpp>
#include <hexref/common/time.hpp>
#include <hexref/exporting/history_csv.hpp>
#include <hexref/storage/memory/storage.hpp>
#include <hexref/storage/rocksdb/storage.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <optional>

namespace po = boost::program_options;

namespace hexref::cli {

namespace {

inline constexpr auto kEnvironmentOptions =
    std::array<std::string_view, 4>{"db-path", "secret", "log-file", "channel"};

std::optional<std::string> optional_value(const po::variables_map& vm,
                                          const char* name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<std::string>();
}

}  // namespace

std::string map_environment(const std::string& variable) {
  if (!std::string_view{variable}.starts_with(kEnvironmentPrefix)) {
    return {};
  }
  auto name = variable.substr(kEnvironmentPrefix.size());
  std::ranges::transform(name, std::begin(name), [](const char c) {
    return c == '_' ? '-'
                    : static_cast<char>(
                          std::tolower(static_cast<unsigned char>(c)));
  });
  if (std::ranges::find(kEnvironmentOptions, name) ==
      std::end(kEnvironmentOptions)) {
    return {};
  }
  return name;
}

po::options_description make_options_description(command_line& line) {
  auto description = po::options_description{"hexref"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&line.command)->default_value("allocate"),
      "allocate | history | export | lookup | forget-secret")(
      "db-path,d",
      po::value<std::string>(&line.db_path)->default_value("hexref.db"),
      "RocksDB directory holding allocation state")(
      "type,t", po::value<std::string>(), "Procedure type: C, M, S, I or A")(
      "date", po::value<std::string>(),
      "Procedure date YYYY-MM-DD (defaults to today)")(
      "jurisdiction,j", po::value<std::string>(), "Jurisdiction code")(
      "channel,c", po::value<std::string>(), "Channel code (defaults to WEB)")(
      "secret,s", po::value<std::string>(),
      "HMAC secret (defaults to the remembered secret)")(
      "remember",
      "Remember --secret after a successful allocation; without it a given "
      "--secret clears any remembered one")(
      "id", po::value<std::string>(), "Identifier for lookup")(
      "output,o", po::value<std::string>(),
      "Export path (defaults to hexref_history_<date>.csv)")(
      "config", po::value<std::string>(&line.config_file),
      "INI file with option defaults")(
      "log-file",
      po::value<std::string>(&line.log_file)->default_value("hexref.log"),
      "Log file path, empty to disable")(
      "verbose,v", "Enable verbose output");
  return description;
}

void parse_command_line(const std::vector<std::string>& args,
                        const po::options_description& description,
                        command_line& line) {
  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  po::store(po::command_line_parser(args)
                .options(description)
                .positional(positional)
                .run(),
            line.vm);
  if (line.vm.contains("config")) {
    po::store(po::parse_config_file(
                  line.vm["config"].as<std::string>().c_str(), description),
              line.vm);
  }
  po::store(po::parse_environment(description, map_environment), line.vm);
  po::notify(line.vm);
}

template <typename Library>
int dispatch(const command_line& line,
             hexref::allocation::store<Library>& store,
             hexref::allocation::allocator<Library>& allocator,
             std::ostream& out) {
  if (line.command == "allocate") {
    return run_allocate(store, allocator, line.vm, out);
  }
  if (line.command == "history") {
    return run_history(allocator, out);
  }
  if (line.command == "export") {
    return run_export(allocator, line.vm);
  }
  if (line.command == "lookup") {
    return run_lookup(allocator, line.vm, out);
  }
  if (line.command == "forget-secret") {
    store.forget_secret();
    spdlog::info("Remembered secret cleared");
    return kExitOk;
  }
  spdlog::error("Unknown command '{}'", line.command);
  return kExitUsage;
}

template <typename Library>
int run_allocate(hexref::allocation::store<Library>& store,
                 hexref::allocation::allocator<Library>& allocator,
                 const po::variables_map& vm,
                 std::ostream& out) {
  if (!vm.contains("type")) {
    spdlog::error("allocate requires --type");
    return kExitUsage;
  }

  auto attributes = hexref::schema::raw_attributes_t{};
  attributes.type = vm["type"].as<std::string>();
  attributes.date = optional_value(vm, "date");
  attributes.jurisdiction = optional_value(vm, "jurisdiction");
  attributes.channel = optional_value(vm, "channel");
  auto explicit_secret = optional_value(vm, "secret");
  if (explicit_secret) {
    attributes.secret = *explicit_secret;
  } else if (auto remembered = store.remembered_secret()) {
    spdlog::debug("Using remembered secret");
    attributes.secret = *remembered;
  }

  auto result = allocator.allocate(attributes);
  if (!result.ok()) {
    spdlog::error("[{}:{}] {}: {}", result.codespace,
                  static_cast<uint32_t>(result.code), result.log, result.info);
    return kExitFailure;
  }

  if (vm.contains("remember")) {
    store.remember_secret(attributes.secret);
  } else if (explicit_secret) {
    store.forget_secret();
  }
  spdlog::info("{} identifier {}", result.reused ? "Reused" : "Allocated",
               result.id);
  out << result.id << std::endl;
  return kExitOk;
}

template <typename Library>
int run_history(hexref::allocation::allocator<Library>& allocator,
                std::ostream& out) {
  for (const auto& entry : allocator.history()) {
    out << entry.id << '\t' << hexref::schema::to_string(entry.type) << '\t'
        << entry.date << '\t' << entry.jurisdiction << '\t' << entry.channel
        << '\t' << entry.created_at << '\n';
  }
  out.flush();
  return kExitOk;
}

template <typename Library>
int run_export(hexref::allocation::allocator<Library>& allocator,
               const po::variables_map& vm) {
  auto path = optional_value(vm, "output").value_or(
      hexref::exporting::make_export_filename(
          hexref::common::utc_date_iso(hexref::common::system_now())));

  auto output = std::ofstream{path, std::ios::binary | std::ios::trunc};
  if (!output) {
    spdlog::error("Cannot open '{}' for writing", path);
    return kExitFailure;
  }
  output << allocator.export_history();
  output.close();
  if (!output) {
    spdlog::error("Failed writing history export to '{}'", path);
    return kExitFailure;
  }
  spdlog::info("Exported history to {}", path);
  return kExitOk;
}

template <typename Library>
int run_lookup(hexref::allocation::allocator<Library>& allocator,
               const po::variables_map& vm,
               std::ostream& out) {
  if (!vm.contains("id")) {
    spdlog::error("lookup requires --id");
    return kExitUsage;
  }
  auto id = vm["id"].as<std::string>();
  auto record = allocator.lookup(id);
  if (!record) {
    spdlog::error("No allocation recorded for '{}'", id);
    return kExitFailure;
  }
  out << "id: " << record->id << '\n'
      << "type: " << hexref::schema::to_string(record->type) << '\n'
      << "date: " << record->date << '\n'
      << "jurisdiction: " << record->jurisdiction << '\n'
      << "channel: " << record->channel << '\n'
      << "disambiguator: " << record->disambiguator << '\n'
      << "created_at: " << record->created_at << std::endl;
  return kExitOk;
}

using hexref::allocation::allocator;
using hexref::allocation::store;
using rocksdb_tag_t = hexref::storage::rocksdb_storage_tag;
using memory_tag_t = hexref::storage::memory_storage_tag;

template int dispatch(const command_line&,
                      store<rocksdb_tag_t>&,
                      allocator<rocksdb_tag_t>&,
                      std::ostream&);
template int run_allocate(store<rocksdb_tag_t>&,
                          allocator<rocksdb_tag_t>&,
                          const po::variables_map&,
                          std::ostream&);
template int run_history(allocator<rocksdb_tag_t>&,
                         std::ostream&);
template int run_export(allocator<rocksdb_tag_t>&,
                        const po::variables_map&);
template int run_lookup(allocator<rocksdb_tag_t>&,
                        const po::variables_map&,
                        std::ostream&);

template int dispatch(const command_line&,
                      store<memory_tag_t>&,
                      allocator<memory_tag_t>&,
                      std::ostream&);
template int run_allocate(store<memory_tag_t>&,
                          allocator<memory_tag_t>&,
                          const po::variables_map&,
                          std::ostream&);
template int run_history(allocator<memory_tag_t>&,
                         std::ostream&);
template int run_export(allocator<memory_tag_t>&,
                        const po::variables_map&);
template int run_lookup(allocator<memory_tag_t>&,
                        const po::variables_map&,
                        std::ostream&);

}  // namespace hexref::cli

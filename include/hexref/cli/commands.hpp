#pragma once

#include <hexref/allocation/allocator.hpp>
#include <hexref/allocation/store.hpp>

#include <boost/program_options.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace hexref::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

inline constexpr std::string_view kEnvironmentPrefix{"HEXREF_"};

/// Parsed invocation. Options bound to plain strings are filled by
/// boost::program_options::notify.
struct command_line final {
  std::string command;
  std::string db_path;
  std::string log_file;
  std::string config_file;
  boost::program_options::variables_map vm;
};

/// HEXREF_DB_PATH -> db-path. Variables without the prefix, or naming an
/// option that cannot come from the environment, map to "".
std::string map_environment(const std::string& variable);

boost::program_options::options_description make_options_description(
    command_line& line);

/// Command line first, then the --config INI file, then HEXREF_ variables.
/// `args` excludes the program name. Throws boost::program_options::error.
void parse_command_line(const std::vector<std::string>& args,
                        const boost::program_options::options_description&
                            description,
                        command_line& line);

/// Runs one subcommand and returns the process exit status. Command output
/// goes to `out`; diagnostics go to the default logger.
template <typename Library>
int dispatch(const command_line& line,
             hexref::allocation::store<Library>& store,
             hexref::allocation::allocator<Library>& allocator,
             std::ostream& out);

template <typename Library>
int run_allocate(hexref::allocation::store<Library>& store,
                 hexref::allocation::allocator<Library>& allocator,
                 const boost::program_options::variables_map& vm,
                 std::ostream& out);

template <typename Library>
int run_history(hexref::allocation::allocator<Library>& allocator,
                std::ostream& out);

template <typename Library>
int run_export(hexref::allocation::allocator<Library>& allocator,
               const boost::program_options::variables_map& vm);

template <typename Library>
int run_lookup(hexref::allocation::allocator<Library>& allocator,
               const boost::program_options::variables_map& vm,
               std::ostream& out);

}  // namespace hexref::cli

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <hexref/allocation/allocator.hpp>
#include <hexref/allocation/store.hpp>
#include <hexref/cli/commands.hpp>
#include <hexref/schema/encoding/scale/encoder.hpp>
#include <hexref/storage/rocksdb/storage.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using storage_tag_t = hexref::storage::rocksdb_storage_tag;
using encoder_t = hexref::schema::encoding::encoder<
    hexref::schema::encoding::scale_encoder_tag>;

void configure_logging(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto sinks = std::vector<spdlog::sink_ptr>{console_sink};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "main", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto line = hexref::cli::command_line{};
  auto description = hexref::cli::make_options_description(line);
  try {
    hexref::cli::parse_command_line(
        std::vector<std::string>{argv + 1, argv + argc}, description, line);
  } catch (const boost::program_options::error& ex) {
    std::cerr << "hexref: " << ex.what() << '\n' << description << std::endl;
    return hexref::cli::kExitUsage;
  }

  if (line.vm.contains("help")) {
    std::cout << description << std::endl;
    return hexref::cli::kExitOk;
  }

  configure_logging(line.log_file, line.vm.contains("verbose"));

  auto encoder = encoder_t{};
  auto storage = hexref::storage::make_storage<storage_tag_t>(line.db_path);
  auto store = hexref::allocation::store<storage_tag_t>{encoder, storage};
  auto allocator = hexref::allocation::allocator<storage_tag_t>{store};

  auto status = hexref::cli::dispatch(line, store, allocator, std::cout);

  spdlog::shutdown();
  return status;
}

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <registrar/common/critical.hpp>
#include <registrar/execution/engine.hpp>
#include <registrar/schema/primitives.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

using encoder_t = registrar::schema::encoding::encoder<
    registrar::schema::encoding::scale_encoder_tag>;

// The host ledger owns balances. The standalone runner accepts every fee
// transfer and records it in the log.
bool log_value_transfer(const registrar::schema::amount_t amount,
                        const registrar::schema::identity_t& from,
                        const registrar::schema::identity_t& to) {
  spdlog::info("Transferring issuer fee {} from '{}' to '{}'", amount, from,
               to);
  return true;
}

void print_transaction_result(
    const std::size_t index,
    const registrar::schema::transaction_result_t& result) {
  std::cout << "tx[" << index << "] code=" << result.code
            << " codespace=" << result.codespace;
  if (!result.log.empty()) {
    std::cout << " log=\"" << result.log << '"';
  }
  if (!result.info.empty()) {
    std::cout << " info=\"" << result.info << '"';
  }
  if (!result.data.empty()) {
    std::cout << " data=" << registrar::schema::to_hex(result.data);
  }
  std::cout << '\n';
  for (const auto& event : result.events) {
    std::cout << "  event " << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("registrar.log",
                                                          false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  auto db_path = std::string{};
  auto height = uint64_t{};
  auto txs = std::vector<std::string>{};
  auto query_path = std::string{};
  auto query_data = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Registrar"};
  description.add_options()("help,h", "Show the help message")(
      "db,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "registrar.db"),
      "RocksDB directory holding the registry state")(
      "height",
      boost::program_options::value<uint64_t>(&height)->default_value(0),
      "Block height the transactions execute at")(
      "tx,t", boost::program_options::value<std::vector<std::string>>(&txs),
      "Hex encoded transaction, repeatable")(
      "query,q", boost::program_options::value<std::string>(&query_path),
      "Query route, e.g. /item or /serial/registered")(
      "data", boost::program_options::value<std::string>(&query_data),
      "Hex encoded query argument")("verbose,v", "Enable verbose output");
  boost::program_options::store(
      boost::program_options::parse_command_line(argc, argv, description), vm);
  boost::program_options::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto storage = registrar::storage::make_storage<
      registrar::storage::rocksdb_storage_tag>(db_path);
  auto encoder = encoder_t{};
  auto engine =
      registrar::execution::engine{encoder, storage, log_value_transfer};

  auto exit_code = 0;
  if (!query_path.empty()) {
    auto data = registrar::schema::try_from_hex(query_data);
    if (!data) {
      registrar::common::critical("--data must be a hex string");
    }
    auto result =
        engine.query(query_path, registrar::schema::make_bytes_view(*data));
    if (result.code != 0) {
      std::cout << "code=" << result.code << " codespace=" << result.codespace
                << " log=\"" << result.log << "\"\n";
      exit_code = 1;
    } else {
      std::cout << registrar::schema::to_hex(result.value) << '\n';
    }
  } else if (!txs.empty()) {
    auto block = std::vector<registrar::schema::bytes_t>{};
    block.reserve(txs.size());
    for (const auto& tx : txs) {
      auto raw = registrar::schema::try_from_hex(tx);
      if (!raw) {
        registrar::common::critical("--tx must be a hex string");
      }
      block.push_back(std::move(*raw));
    }

    auto result = engine.finalize_block(height, block);
    for (std::size_t i = 0; i < result.tx_results.size(); ++i) {
      print_transaction_result(i, result.tx_results[i]);
    }
    auto committed = engine.commit();
    std::cout << "committed height=" << committed.committed_height
              << " state_root="
              << registrar::schema::to_hex(committed.state_root) << '\n';
  } else {
    auto info = engine.info();
    std::cout << info.data << ' ' << info.version
              << " height=" << info.last_block_height << " state_root="
              << registrar::schema::to_hex(info.last_block_state_root)
              << '\n';
  }

  spdlog::shutdown();
  return exit_code;
}

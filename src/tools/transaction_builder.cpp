#include <boost/program_options.hpp>
#include <registrar/common/critical.hpp>
#include <registrar/schema/encoding/scale/encoder.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace {

using encoder_t = registrar::schema::encoding::encoder<
    registrar::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    registrar::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

uint64_t get_uint(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    registrar::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<uint64_t>();
}

registrar::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto op = vm["op"].as<std::string>();
  if (op == "set-authority") {
    return registrar::schema::set_authority_t{
        .authority = get_string(vm, "authority")};
  }
  if (op == "set-issuer-fee") {
    return registrar::schema::set_issuer_fee_t{.fee = get_uint(vm, "fee")};
  }
  if (op == "set-max-items") {
    return registrar::schema::set_max_items_t{
        .max_items = get_uint(vm, "max-items")};
  }
  if (op == "set-default-location") {
    return registrar::schema::set_default_location_t{
        .location = get_string(vm, "location")};
  }
  if (op == "mint") {
    return registrar::schema::mint_item_t{
        .metadata = get_string(vm, "metadata"),
        .item_type = get_string(vm, "item-type"),
        .expiry = get_uint(vm, "expiry"),
        .serial = get_string(vm, "serial"),
        .location = vm["location"].as<std::string>(),
        .category = get_string(vm, "category")};
  }
  if (op == "update") {
    return registrar::schema::update_item_t{
        .id = get_uint(vm, "id"),
        .metadata = get_string(vm, "metadata"),
        .expiry = get_uint(vm, "expiry"),
        .location = vm["location"].as<std::string>()};
  }
  if (op == "deactivate") {
    return registrar::schema::deactivate_item_t{.id = get_uint(vm, "id")};
  }
  registrar::common::critical("unsupported operation '{}'", op);
}

registrar::schema::bytes_t build_query_data(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/config" || path == "/items/count") {
    return {};
  }
  if (path == "/item" || path == "/item/amendment") {
    return encoder.encode(get_uint(vm, "id"));
  }
  if (path == "/items/by_type") {
    return encoder.encode(get_string(vm, "item-type"));
  }
  if (path == "/serial/registered" || path == "/serial/item") {
    return encoder.encode(get_string(vm, "serial"));
  }
  registrar::common::critical("unsupported query path '{}'", path);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  registrar_tx transaction --caller NAME --op OP [options]\n"
            << "  registrar_tx query-data --path PATH [options]\n\n"
            << "Operations: set-authority, set-issuer-fee, set-max-items,\n"
            << "  set-default-location, mint, update, deactivate\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"registrar_tx options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "transaction|query-data")(
      "caller", po::value<std::string>(), "identity submitting the operation")(
      "op", po::value<std::string>(), "registry operation")(
      "path", po::value<std::string>(), "query route")(
      "authority", po::value<std::string>(), "authority identity")(
      "fee", po::value<uint64_t>(), "issuer fee")(
      "max-items", po::value<uint64_t>(), "maximum number of items")(
      "id", po::value<uint64_t>(), "item id")(
      "metadata", po::value<std::string>(), "item metadata")(
      "item-type", po::value<std::string>(), "passport|visa|aid-kit|document")(
      "expiry", po::value<uint64_t>(), "expiry height")(
      "serial", po::value<std::string>(), "item serial number")(
      "location", po::value<std::string>()->default_value(""),
      "item location, or the new default location")(
      "category", po::value<std::string>(), "item category");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("op")) {
      registrar::common::critical("transaction mode requires --op");
    }
    auto transaction =
        registrar::schema::transaction_t{.version = 1,
                                         .caller = get_string(vm, "caller"),
                                         .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << registrar::schema::to_hex(encoded) << '\n';
    return 0;
  }

  if (command == "query-data") {
    if (!vm.contains("path")) {
      registrar::common::critical("query-data mode requires --path");
    }
    auto data = build_query_data(vm);
    std::cout << registrar::schema::to_hex(data) << '\n';
    return 0;
  }

  registrar::common::critical("command must be transaction|query-data");
}

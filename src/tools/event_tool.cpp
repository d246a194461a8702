#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <herald/abci/event_json.hpp>
#include <herald/abci/event_sink.hpp>
#include <herald/events/attributes.hpp>
#include <herald/events/event.hpp>
#include <herald/schema/encoding/scale/encoder.hpp>
#include <herald/schema/transaction.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace {

using encoder_t =
    herald::schema::encoding::encoder<herald::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

void configure_logging(const bool verbose) {
  // stdout carries command output; diagnostics go to stderr.
  auto logger = spdlog::stderr_color_mt("herald");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage: herald_event_tool <command> [options]\n"
            << "Commands:\n"
            << "  tx-event  Build the event of an encoded transaction\n"
            << "  parse     Parse the attributes of a subscription event\n\n"
            << options << '\n';
}

std::optional<std::string> read_input(const std::string& path) {
  if (path == "-") {
    return std::string{std::istreambuf_iterator<char>{std::cin},
                       std::istreambuf_iterator<char>{}};
  }
  auto input = std::ifstream{path};
  if (!input.good()) {
    spdlog::error("Failed opening input '{}'", path);
    return std::nullopt;
  }
  return std::string{std::istreambuf_iterator<char>{input},
                     std::istreambuf_iterator<char>{}};
}

int run_tx_event(const po::variables_map& vm) {
  if (!vm.contains("tx")) {
    spdlog::error("tx-event requires --tx");
    return 1;
  }
  auto raw = herald::schema::try_from_base64(vm["tx"].as<std::string>());
  if (!raw) {
    spdlog::error("--tx is not valid base64");
    return 1;
  }
  auto tx = encoder_t{}.try_decode<herald::schema::transaction_t>(
      herald::schema::make_bytes_view(*raw));
  if (!tx) {
    spdlog::error("--tx is not a SCALE encoded transaction");
    return 1;
  }
  if (std::holds_alternative<herald::schema::raw_header_t>(tx->header.type)) {
    spdlog::error("raw transactions are never included in a block");
    return 1;
  }

  auto height = vm["height"].as<uint64_t>();
  auto event = herald::events::new_tx_event(*tx, height);
  spdlog::debug("Built '{}' event for height {}",
                herald::events::to_string(event.kind()), height);
  auto wire = herald::abci::to_abci_event(std::move(event));
  std::cout << herald::abci::to_json(wire).dump() << '\n';
  return 0;
}

int run_parse(const po::variables_map& vm) {
  auto text = read_input(vm["input"].as<std::string>());
  if (!text) {
    return 1;
  }
  auto json = nlohmann::json::parse(*text, nullptr, false);
  if (json.is_discarded()) {
    spdlog::error("Input is not valid JSON");
    return 1;
  }

  auto error = herald::events::attribute_error{};
  auto attributes = herald::events::try_parse_attributes(json, error);
  if (!attributes) {
    spdlog::error("{}", error.message());
    return 1;
  }
  if (json.contains("type") && json["type"].is_string()) {
    auto kind =
        herald::events::parse_event_kind(json["type"].get<std::string>());
    spdlog::info("Parsed '{}' event with {} attribute(s)",
                 herald::events::to_string(kind), attributes->size());
  }
  for (const auto& [key, value] : attributes->values()) {
    std::cout << key << '=' << value << '\n';
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto options = po::options_description{"Options"};
  options.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable debug logging")(
      "command", po::value<std::string>(&command), "tx-event|parse")(
      "tx", po::value<std::string>(), "base64 SCALE encoded transaction")(
      "height", po::value<uint64_t>()->default_value(0),
      "finalized block height")(
      "input", po::value<std::string>()->default_value("-"),
      "subscription event JSON file, '-' for stdin");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    return 2;
  }

  configure_logging(vm.contains("verbose"));

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto exit_code = 2;
  if (command == "tx-event") {
    exit_code = run_tx_event(vm);
  } else if (command == "parse") {
    exit_code = run_parse(vm);
  } else {
    spdlog::error("command must be tx-event|parse");
  }
  spdlog::shutdown();
  return exit_code;
}

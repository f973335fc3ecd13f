#include <clearhouse/config/settings.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <stdexcept>
#include <vector>

using namespace clearhouse::schema;
namespace po = boost::program_options;

namespace clearhouse::config {

namespace {

constexpr auto kLogLevels = std::array<std::string_view, 8>{
    "trace", "debug", "info", "warn", "warning", "error", "critical", "off"};

std::pair<std::string_view, std::string_view> split_once(
    const std::string_view text,
    const char separator,
    const std::string_view what) {
  auto position = text.find(separator);
  if (position == std::string_view::npos || position == 0 ||
      position + 1 == text.size()) {
    throw std::invalid_argument{"malformed " + std::string{what} + " '" +
                                std::string{text} + "'"};
  }
  return {text.substr(0, position), text.substr(position + 1)};
}

std::string require_currency(const std::string_view code,
                             const std::string_view what) {
  if (!find_currency(code)) {
    throw std::invalid_argument{"unsupported currency '" + std::string{code} +
                                "' in " + std::string{what}};
  }
  return std::string{code};
}

cost_t require_decimal(const std::string_view text,
                       const std::string_view what) {
  auto value = parse_decimal(text);
  if (!value) {
    throw std::invalid_argument{"invalid " + std::string{what} + " '" +
                                std::string{text} + "'"};
  }
  return *value;
}

}  // namespace

std::optional<cost_t> parse_decimal(const std::string_view text) {
  auto dot = text.find('.');
  auto whole = text.substr(0, dot);
  auto fraction =
      dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);
  auto is_digits = [](const std::string_view digits) {
    return std::ranges::all_of(digits,
                               [](const char c) { return c >= '0' && c <= '9'; });
  };
  if (whole.empty() || !is_digits(whole) || !is_digits(fraction) ||
      (dot != std::string_view::npos && fraction.empty())) {
    return std::nullopt;
  }
  return cost_t{std::string{text}};
}

std::pair<currency_pair_t, cost_t> parse_fx_spread(const std::string_view text) {
  auto [pair_text, bps_text] = split_once(text, '=', "fx-spread");
  auto [source, destination] = split_once(pair_text, '/', "fx-spread pair");
  return {currency_pair_t{.source = require_currency(source, "fx-spread"),
                          .destination =
                              require_currency(destination, "fx-spread")},
          require_decimal(bps_text, "fx-spread bps")};
}

std::tuple<settlement_window_t, std::string, amount_t> parse_liquidity_cap(
    const std::string_view text) {
  auto [key, amount_text] = split_once(text, '=', "liquidity-cap");
  auto [window_text, currency_text] = split_once(key, ':', "liquidity-cap key");
  auto window = try_from_string<settlement_window_t>(window_text);
  if (!window) {
    throw std::invalid_argument{"unknown settlement window '" +
                                std::string{window_text} +
                                "' in liquidity-cap"};
  }
  auto currency = require_currency(currency_text, "liquidity-cap");
  auto amount = parse_amount(amount_text, *find_currency(currency));
  if (!amount) {
    throw std::invalid_argument{"invalid liquidity-cap amount '" +
                                std::string{amount_text} + "'"};
  }
  return {*window, currency, *amount};
}

std::pair<counterparty_id_t, cost_t> parse_exposure_cap(
    const std::string_view text) {
  auto position = text.rfind('=');
  if (position == std::string_view::npos || position == 0 ||
      position + 1 == text.size()) {
    throw std::invalid_argument{"malformed exposure-cap '" +
                                std::string{text} + "'"};
  }
  return {counterparty_id_t{text.substr(0, position)},
          require_decimal(text.substr(position + 1), "exposure-cap amount")};
}

po::options_description make_options_description(settings& out) {
  auto description = po::options_description{"clearhouse"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI-style configuration file")(
      "listen,l", po::value<std::string>(&out.listen)->default_value(out.listen),
      "IP:Port for the gRPC service")(
      "db-path", po::value<std::string>(&out.db_path),
      "RocksDB directory for the event log and batches (in memory if unset)")(
      "log-level",
      po::value<std::string>(&out.log_level)->default_value(out.log_level),
      "trace, debug, info, warn, error, critical or off")(
      "log-file",
      po::value<std::string>(&out.log_file)->default_value(out.log_file),
      "Log file path")(
      "max-batch-size",
      po::value<uint32_t>(&out.limits.max_batch_size)
          ->default_value(out.limits.max_batch_size),
      "Maximum transactions per batch")(
      "max-chunk-size",
      po::value<size_t>(&out.engine.chunking.max_chunk_size)
          ->default_value(out.engine.chunking.max_chunk_size),
      "Maximum transactions per chunk")(
      "batch-timeout-ms",
      po::value<uint64_t>(&out.engine.chunking.batch_timeout)
          ->default_value(out.engine.chunking.batch_timeout),
      "Age of the oldest queued transaction that forces a chunk")(
      "solver-budget-ms", po::value<uint64_t>()->default_value(100),
      "Time budget per solver run")(
      "wire-cost", po::value<std::string>()->default_value("5.00"),
      "Cost per wire in major units")(
      "consolidation-discount", po::value<std::string>()->default_value("0.15"),
      "Fraction of the wire cost refunded per consolidated wire")(
      "default-spread-bps", po::value<std::string>()->default_value("5.0"),
      "FX spread for pairs without an fx-spread entry")(
      "fx-spread", po::value<std::vector<std::string>>()->composing(),
      "SRC/DST=bps, repeatable; overrides the built-in table")(
      "liquidity-cap", po::value<std::vector<std::string>>()->composing(),
      "WINDOW:CCY=amount, repeatable")(
      "default-exposure-cap", po::value<std::string>(),
      "Per-batch exposure cap for counterparties without their own")(
      "exposure-cap", po::value<std::vector<std::string>>()->composing(),
      "COUNTERPARTY=amount, repeatable")(
      "dedup-retention-s", po::value<uint64_t>()->default_value(86400),
      "Retention horizon of idempotency records")(
      "max-pending-intents",
      po::value<size_t>(&out.engine.max_pending_intents)
          ->default_value(out.engine.max_pending_intents),
      "Queued transactions before submissions are refused")(
      "max-deferrals",
      po::value<uint32_t>(&out.engine.max_deferrals)
          ->default_value(out.engine.max_deferrals),
      "Deferrals before a transaction is marked failed")(
      "tick-ms", po::value<uint64_t>(&out.tick)->default_value(out.tick),
      "Scheduler period")(
      "workers",
      po::value<size_t>(&out.engine.workers)->default_value(out.engine.workers),
      "Lanes processed in parallel");
  return description;
}

std::optional<settings> parse_settings(const int argc,
                                       const char* const argv[],
                                       std::ostream& help_out) {
  auto out = settings{};
  auto description = make_options_description(out);
  auto vm = po::variables_map{};
  po::store(po::parse_command_line(argc, argv, description), vm);

  if (vm.contains("help")) {
    help_out << description << std::endl;
    return std::nullopt;
  }

  if (vm.contains("config")) {
    auto path = vm["config"].as<std::string>();
    auto file = std::ifstream{path};
    if (!file) {
      throw std::invalid_argument{"cannot open config file '" + path + "'"};
    }
    po::store(po::parse_config_file(file, description), vm);
  }
  po::notify(vm);

  out.engine.solver_budget =
      std::chrono::milliseconds{vm["solver-budget-ms"].as<uint64_t>()};
  out.dedup_retention = vm["dedup-retention-s"].as<uint64_t>() * 1000;
  out.pricing.wire_cost =
      require_decimal(vm["wire-cost"].as<std::string>(), "wire-cost");
  out.pricing.consolidation_discount = require_decimal(
      vm["consolidation-discount"].as<std::string>(), "consolidation-discount");
  out.pricing.default_spread_bps = require_decimal(
      vm["default-spread-bps"].as<std::string>(), "default-spread-bps");

  if (vm.contains("fx-spread")) {
    for (const auto& entry : vm["fx-spread"].as<std::vector<std::string>>()) {
      auto [pair, bps] = parse_fx_spread(entry);
      out.pricing.fx_spreads[pair] = bps;
    }
  }
  if (vm.contains("liquidity-cap")) {
    for (const auto& entry :
         vm["liquidity-cap"].as<std::vector<std::string>>()) {
      auto [window, currency, amount] = parse_liquidity_cap(entry);
      out.limits.liquidity_caps[std::pair{window, currency}] = amount;
    }
  }
  if (vm.contains("default-exposure-cap")) {
    out.limits.default_exposure_cap = require_decimal(
        vm["default-exposure-cap"].as<std::string>(), "default-exposure-cap");
  }
  if (vm.contains("exposure-cap")) {
    for (const auto& entry :
         vm["exposure-cap"].as<std::vector<std::string>>()) {
      auto [counterparty, cap] = parse_exposure_cap(entry);
      out.limits.exposure_caps[counterparty] = cap;
    }
  }

  if (out.limits.max_batch_size == 0 ||
      out.engine.chunking.max_chunk_size == 0) {
    throw std::invalid_argument{"batch and chunk sizes must be positive"};
  }
  if (out.engine.workers == 0 || out.tick == 0) {
    throw std::invalid_argument{"workers and tick-ms must be positive"};
  }
  if (out.pricing.consolidation_discount > 1) {
    throw std::invalid_argument{"consolidation-discount must not exceed 1"};
  }
  if (std::ranges::find(kLogLevels, out.log_level) == std::end(kLogLevels)) {
    throw std::invalid_argument{"unknown log level '" + out.log_level + "'"};
  }
  return out;
}

}  // namespace clearhouse::config

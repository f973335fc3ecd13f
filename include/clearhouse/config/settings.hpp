#pragma once

#include <clearhouse/execution/engine.hpp>
#include <clearhouse/optimizer/cost_model.hpp>
#include <clearhouse/schema/currency.hpp>
#include <clearhouse/schema/primitives.hpp>
#include <clearhouse/schema/settlement_window.hpp>

#include <boost/program_options.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace clearhouse::config {

/// Runtime configuration of the settlement service.
struct settings final {
  std::string listen{"0.0.0.0:50061"};
  /// RocksDB directory; empty keeps the log and batches in memory.
  std::string db_path;
  std::string log_level{"info"};
  std::string log_file{"clearhouse.log"};
  clearhouse::schema::duration_milliseconds_t dedup_retention{86'400'000};
  clearhouse::schema::duration_milliseconds_t tick{50};
  clearhouse::execution::engine_options_t engine;
  clearhouse::optimizer::pricing_t pricing{
      clearhouse::optimizer::default_pricing()};
  clearhouse::optimizer::limits_t limits;
};

/// Plain non-negative decimal ("5", "0.15", "2.50") as an exact cost.
std::optional<clearhouse::schema::cost_t> parse_decimal(std::string_view text);

/// `SRC/DST=bps`, e.g. `USD/EUR=2.5`.
std::pair<clearhouse::schema::currency_pair_t, clearhouse::schema::cost_t>
parse_fx_spread(std::string_view text);

/// `WINDOW:CCY=amount`, e.g. `rtgs:USD=1000000.00`; amount in major units.
std::tuple<clearhouse::schema::settlement_window_t,
           std::string,
           clearhouse::schema::amount_t>
parse_liquidity_cap(std::string_view text);

/// `COUNTERPARTY=amount`, amount in major units.
std::pair<clearhouse::schema::counterparty_id_t, clearhouse::schema::cost_t>
parse_exposure_cap(std::string_view text);

/// Options understood by the service, bound to `out` where scalar.
boost::program_options::options_description make_options_description(
    settings& out);

/// Parse the command line and the optional `--config` file (command line
/// wins). Returns std::nullopt after printing usage for `--help`.
///
/// Throws boost::program_options::error for unknown or malformed options
/// and std::invalid_argument for values outside their domain.
std::optional<settings> parse_settings(int argc,
                                       const char* const argv[],
                                       std::ostream& help_out);

}  // namespace clearhouse::config

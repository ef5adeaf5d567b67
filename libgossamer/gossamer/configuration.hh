#pragma once

#include "gossamer/defaults.hh"
#include "gossamer/network_info.hh"
#include "gossamer/peer_id.hh"
#include "gossamer/time.hh"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gossamer {

class tcp_transport;

struct skip_init_t {};

constexpr skip_init_t skip_init = skip_init_t{};

/// Wraps the user-facing gossamer parameters.
struct gossamer_options {
  /// How long a TCP connect attempt may take.
  timespan connect_timeout = defaults::connect_timeout;

  /// How many bytes a channel reads from its socket at once.
  size_t read_chunk_size = defaults::read_chunk_size;

  /// Minimum severity for console output or "quiet" to disable it.
  std::string console_verbosity = std::string{defaults::console_verbosity};

  /// Static address book entries in the format `<peer-id>=<host>:<port>`.
  std::vector<std::string> peers;

  gossamer_options() = default;

  gossamer_options(const gossamer_options&) = default;

  gossamer_options& operator=(const gossamer_options&) = default;
};

/// Configures gossamer components.
///
/// The configuration draws user-provided options from three sources (in order):
/// 1. A configuration file passed via `--config-file=<path>`. Contents of this
///    file override hard-coded defaults.
/// 2. Environment variables. Gossamer currently recognizes the following
///    environment variables:
///    - `GOSSAMER_CONSOLE_VERBOSITY`: enables console output by overriding
///      `gossamer.console-verbosity`. Valid values are `critical`, `error`,
///      `warning`, `info`, `verbose`, `debug` and `quiet`.
///    - `GOSSAMER_CONNECT_TIMEOUT`: overrides `gossamer.connect-timeout`, e.g.,
///      `500ms`.
/// 3. Command line arguments (if provided).
///
/// Initializing the configuration installs a console logger unless the console
/// verbosity is `quiet`.
class configuration {
public:
  // --- member types ----------------------------------------------------------

  struct impl;

  // --- construction and destruction ------------------------------------------

  /// Constructs the configuration without calling `init` implicitly. Requires
  /// the user to call `init` manually.
  explicit configuration(skip_init_t);

  configuration();

  configuration(configuration&&) noexcept;

  /// Constructs a configuration with non-default options.
  explicit configuration(gossamer_options opts);

  /// Constructs a configuration from command line arguments.
  /// @throws std::invalid_argument if an environment variable or a peer entry
  ///         has an invalid value.
  /// @throws std::runtime_error if parsing the configuration file or the
  ///         command line fails.
  configuration(int argc, char** argv);

  ~configuration();

  // -- properties -------------------------------------------------------------

  const gossamer_options& options() const;

  std::string help_text() const;

  const std::vector<std::string>& remainder() const;

  bool cli_helptext_printed() const;

  /// Returns the parsed entries of `gossamer.peers`.
  std::vector<std::pair<peer_id, network_info>> peer_addresses() const;

  // -- mutators ---------------------------------------------------------------

  void init(int argc, char** argv);

  /// Adds all entries of `gossamer.peers` to the address book of `tr`.
  void apply(tcp_transport& tr) const;

  /// Initializes any global state required by gossamer such as the global meta
  /// object table for gossamer and CAF. This function is safe to call multiple
  /// times (repeated calls have no effect).
  static void init_global_state();

private:
  std::unique_ptr<impl> impl_;
};

/// Parses a peer entry in the format `<peer-id>=<host>:<port>`.
/// @relates configuration
bool parse_peer_entry(std::string_view str, peer_id& id, network_info& addr);

} // namespace gossamer

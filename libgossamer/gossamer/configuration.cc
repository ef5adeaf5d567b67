#include "gossamer/configuration.hh"

#include "gossamer/error.hh"
#include "gossamer/event.hh"
#include "gossamer/logger.hh"
#include "gossamer/tcp_transport.hh"

#include <caf/actor_system_config.hpp>
#include <caf/config_option_adder.hpp>
#include <caf/config_value.hpp>
#include <caf/init_global_meta_objects.hpp>

#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gossamer {

namespace {

template <class... Ts>
auto concat(Ts... xs) {
  std::string result;
  ((result += xs), ...);
  return result;
}

bool valid_verbosity(std::string_view x) {
  if (x == "quiet")
    return true;
  event::severity_level tmp;
  return convert(x, tmp);
}

std::string to_verbosity(const char* var, const char* cstr) {
  std::string str = cstr;
  if (valid_verbosity(str))
    return str;
  auto what = concat("illegal value for environment variable ", var, ": '",
                     cstr,
                     "' (legal values: 'critical', 'error', 'warning', "
                     "'info', 'verbose', 'debug', 'quiet')");
  throw std::invalid_argument(what);
}

} // namespace

bool parse_peer_entry(std::string_view str, peer_id& id, network_info& addr) {
  auto sep = str.find('=');
  if (sep == std::string_view::npos)
    return false;
  return convert(str.substr(0, sep), id)
         && convert(str.substr(sep + 1), addr);
}

struct configuration::impl : public caf::actor_system_config {
  using super = caf::actor_system_config;

  impl() {
    opt_group{custom_options_, "gossamer"}
      .add(options.connect_timeout, "connect-timeout",
           "maximum time for establishing a TCP connection")
      .add(options.read_chunk_size, "read-chunk-size",
           "number of bytes a channel reads from its socket at once")
      .add(options.console_verbosity, "console-verbosity",
           "minimum severity for console output or 'quiet'")
      .add(options.peers, "peers",
           "static address book with entries such as '<id>=<host>:<port>'");
  }

  void init(int argc, char** argv);

  void validate();

  void install_logger();

  gossamer_options options;
};

configuration::configuration(skip_init_t) {
  init_global_state();
  impl_ = std::make_unique<impl>();
}

configuration::configuration(gossamer_options opts)
  : configuration(skip_init) {
  impl_->options = std::move(opts);
  impl_->set("gossamer.connect-timeout", impl_->options.connect_timeout);
  impl_->set("gossamer.read-chunk-size", impl_->options.read_chunk_size);
  impl_->set("gossamer.console-verbosity", impl_->options.console_verbosity);
  impl_->set("gossamer.peers", impl_->options.peers);
  init(0, nullptr);
}

configuration::configuration() : configuration(skip_init) {
  init(0, nullptr);
}

configuration::configuration(configuration&& other) noexcept
  : impl_(std::move(other.impl_)) {
  // cannot '= default' this because impl is incomplete in the header.
}

configuration::configuration(int argc, char** argv)
  : configuration(skip_init) {
  init(argc, argv);
}

configuration::~configuration() {
  // nop, but must stay out-of-line because impl is incomplete in the header.
}

void configuration::impl::init(int argc, char** argv) {
  std::vector<std::string> args;
  if (argc > 1 && argv != nullptr)
    args.assign(argv + 1, argv + argc);
  // Phase 1: parse the configuration file specified by the user on the command
  //          line (overrides hard-coded defaults).
  std::vector<std::string> args_subset;
  auto predicate = [](const std::string& str) {
    return str.compare(0, 14, "--config-file=") != 0;
  };
  auto sep = std::stable_partition(args.begin(), args.end(), predicate);
  if (sep != args.end()) {
    args_subset.assign(std::make_move_iterator(sep),
                       std::make_move_iterator(args.end()));
    args.erase(sep, args.end());
    if (auto err = parse(std::move(args_subset))) {
      auto what = concat("Error while reading configuration file: ",
                         to_string(err));
      throw std::runtime_error(what);
    }
  }
  // Phase 2: parse environment variables (override config file settings).
  if (auto env = getenv("GOSSAMER_CONSOLE_VERBOSITY")) {
    auto level = to_verbosity("GOSSAMER_CONSOLE_VERBOSITY", env);
    set("gossamer.console-verbosity", level);
  }
  if (auto env = getenv("GOSSAMER_CONNECT_TIMEOUT")) {
    // Check for validity before overriding any CLI or config file value.
    caf::config_value val{std::string{env}};
    if (auto timeout = caf::get_as<caf::timespan>(val);
        timeout && timeout->count() > 0) {
      set("gossamer.connect-timeout", *timeout);
    } else {
      auto what = concat("invalid value for GOSSAMER_CONNECT_TIMEOUT: ", env,
                         " (expected a positive interval such as '5s')");
      throw std::invalid_argument(what);
    }
  }
  // Phase 3: parse command line arguments.
  if (!args.empty()) {
    std::stringstream dummy;
    if (auto err = parse(std::move(args), dummy)) {
      auto what = concat("Error while parsing CLI arguments: ", to_string(err));
      throw std::runtime_error(what);
    }
  }
  validate();
  install_logger();
}

void configuration::impl::validate() {
  if (options.connect_timeout.count() <= 0)
    throw std::invalid_argument("gossamer.connect-timeout must be positive");
  if (options.read_chunk_size == 0)
    throw std::invalid_argument("gossamer.read-chunk-size must be positive");
  if (!valid_verbosity(options.console_verbosity)) {
    auto what = concat("illegal value for gossamer.console-verbosity: '",
                       options.console_verbosity, "'");
    throw std::invalid_argument(what);
  }
  for (const auto& entry : options.peers) {
    peer_id id;
    network_info addr;
    if (!parse_peer_entry(entry, id, addr)) {
      auto what = concat("invalid entry in gossamer.peers: '", entry,
                         "' (expected '<id>=<host>:<port>')");
      throw std::invalid_argument(what);
    }
  }
}

void configuration::impl::install_logger() {
  if (options.console_verbosity != "quiet")
    set_console_logger(options.console_verbosity);
}

void configuration::init(int argc, char** argv) {
  impl_->init(argc, argv);
}

const gossamer_options& configuration::options() const {
  return impl_->options;
}

std::string configuration::help_text() const {
  return impl_->custom_options().help_text();
}

const std::vector<std::string>& configuration::remainder() const {
  return impl_->remainder;
}

bool configuration::cli_helptext_printed() const {
  return impl_->cli_helptext_printed;
}

std::vector<std::pair<peer_id, network_info>>
configuration::peer_addresses() const {
  std::vector<std::pair<peer_id, network_info>> result;
  for (const auto& entry : impl_->options.peers) {
    peer_id id;
    network_info addr;
    // Entries were validated in init.
    if (parse_peer_entry(entry, id, addr))
      result.emplace_back(id, std::move(addr));
  }
  return result;
}

void configuration::apply(tcp_transport& tr) const {
  for (auto& [id, addr] : peer_addresses())
    tr.add_address(id, std::move(addr));
}

void configuration::init_global_state() {
  static std::once_flag flag;
  std::call_once(flag, [] {
    caf::init_global_meta_objects<caf::id_block::gossamer>();
    caf::core::init_global_meta_objects();
  });
}

} // namespace gossamer

#ifndef HISTVAULT_CLI_HPP
#define HISTVAULT_CLI_HPP

#include <iostream>
#include <map>
#include <string>
#include <vector>
#include "config/settings.hpp"

namespace histvault::cli {

// Command line front end. Each run() call executes one command and returns
// the process exit code.
class CLI {
public:
  // ---- CONSTRUCTOR ----
  explicit CLI(config::Settings settings, std::ostream& out = std::cout, std::ostream& err = std::cerr);


  // ---- STARTUP ----
  // args excludes the program name
  int run(const std::vector<std::string>& args);
  void print_usage() const;

private:
  using Flags = std::map<std::string, std::string>;

  // ---- PARAMETERS ----
  config::Settings settings_;
  std::ostream& out_;
  std::ostream& err_;


  // ---- COMMAND PROCESSING ----
  int dispatch(const std::vector<std::string>& args);
  int handle_register(const Flags& flags);
  int handle_login(const Flags& flags);
  int handle_logout();
  int handle_key();
  int handle_sync(const Flags& flags);
  int handle_status();
  int handle_history_add(const Flags& flags, const std::vector<std::string>& command);
  int handle_history_list(const Flags& flags);
  int handle_server_start(const Flags& flags);
  int handle_uuid();


  // ---- ARGUMENT PARSING ----
  // Reads "-x value" pairs; switches listed in boolean_flags take no value.
  // Arguments after "--" are returned through rest.
  static Flags parse_flags(const std::vector<std::string>& args, std::size_t start,
                           const std::vector<std::string>& boolean_flags,
                           std::vector<std::string>* rest = nullptr);
  static std::string flag_value(const Flags& flags, const std::string& short_name,
                                const std::string& long_name, const std::string& fallback = "");


  // ---- SESSION FILE ----
  std::string load_session() const;
  void save_session(const std::string& token) const;

  void log_and_display_error(const std::string& message, const std::string& error) const;
};

} // namespace histvault::cli

#endif // HISTVAULT_CLI_HPP

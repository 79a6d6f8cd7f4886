#pragma once

#include <string>

#include "app/config_types.hpp"
#include "mpb/core/expected.hpp"

int run_cli_impl(int argc, char** argv);

namespace mpb::app {

mpb::Expected<Config> parse_args(int argc, char** argv);

std::string protocol_to_string(Protocol protocol);
mpb::Expected<Protocol> parse_protocol(const std::string& s);

}  // namespace mpb::app

#pragma once
#include "protocol/cli_request.hpp"
#include "core/errors/warden_errors.hpp"

namespace warden::app::cli {
    warden::core::errors::Result<warden::protocol::CliRequest> parse_and_validate(int argc, char* argv[]);
}

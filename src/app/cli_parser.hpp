#pragma once
#include "protocol/cli_request.hpp"
#include "core/errors/bridge_errors.hpp"

namespace inobridge::app::cli {
    inobridge::core::errors::Result<inobridge::protocol::CliRequest> parse_and_validate(int argc, char* argv[]);
}

#pragma once

#include "tether/tether.hpp"

#include <optional>

namespace tether::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);
    int run(startup_config& cfg);
    void run_repl(startup_config& cfg, mcp_client& client, exec::execution_manager& manager);

}  // namespace tether::cli

#pragma once

#include "agentcfg/config/types.hpp"

namespace agentcfg::config {

/// Starter configuration written by `agentcfg init`.
AgentConfigFile default_config();

} // namespace agentcfg::config

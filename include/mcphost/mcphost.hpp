#pragma once

/// Umbrella header for the mcphost tool-server supervisor.

#include "version.hpp"
#include "error.hpp"
#include "message.hpp"
#include "codec.hpp"
#include "line_framer.hpp"
#include "types.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "backoff.hpp"
#include "timer_queue.hpp"
#include "process.hpp"
#include "correlator.hpp"
#include "negotiator.hpp"
#include "status_channel.hpp"
#include "health_monitor.hpp"
#include "managed_server.hpp"
#include "registry.hpp"
#include "transport/transport.hpp"
#include "transport/process_transport.hpp"

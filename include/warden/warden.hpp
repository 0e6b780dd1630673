#pragma once

// Core types
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

// Event bus
#include "bus/bus.hpp"

// Agent protocol
#include "protocol/control.hpp"
#include "protocol/decoder.hpp"
#include "protocol/fragment.hpp"

// Conversation model
#include "conversation/conversation.hpp"
#include "conversation/message.hpp"
#include "conversation/state_machine.hpp"
#include "conversation/transcript.hpp"

// Permissions
#include "permission/inference.hpp"
#include "permission/pattern.hpp"
#include "permission/policy.hpp"
#include "permission/store.hpp"

// Sessions
#include "session/event_log.hpp"
#include "session/network.hpp"
#include "session/session.hpp"

namespace warden {

// Initialize logging from the config's log file and level
void init(const Config& config);

// Flush and drop loggers
void shutdown();

// Get version string
std::string version();

}  // namespace warden

#pragma once

/// @file mcpchat.hpp
/// @brief Main header for mcpchat - includes the session, engine and completion APIs
///
/// Usage:
/// @code
/// #include <mcpchat.hpp>
///
/// int main() {
///     auto settings = mcpchat::Settings::from_env();
///     mcpchat::session::SessionManager session(
///         mcpchat::session::SessionOptions::from_settings(settings));
///     session.start({{"fs", "fs-server", {}, {}}});
///
///     auto service = mcpchat::completion::create_completion_service(settings.provider,
///                                                                   settings.model);
///     mcpchat::engine::ConversationEngine engine(
///         mcpchat::engine::EngineOptions::from_settings(settings));
///     mcpchat::Conversation convo{mcpchat::Message::user("read intro.md")};
///     engine.run(convo, session.registry(), *service);
/// }
/// @endcode

// Core types and exceptions
#include "mcpchat/exceptions.hpp"
#include "mcpchat/logging.hpp"
#include "mcpchat/settings.hpp"
#include "mcpchat/types.hpp"

// Provider connections
#include "mcpchat/client/connection.hpp"
#include "mcpchat/client/transports.hpp"
#include "mcpchat/client/types.hpp"
#include "mcpchat/wire/codec.hpp"

// Session and conversation loop
#include "mcpchat/completion/completion_service.hpp"
#include "mcpchat/completion/providers.hpp"
#include "mcpchat/engine/conversation_engine.hpp"
#include "mcpchat/engine/system_prompt.hpp"
#include "mcpchat/engine/tool_dispatcher.hpp"
#include "mcpchat/session/session_manager.hpp"
#include "mcpchat/session/tool_registry.hpp"

// Tracing
#include "mcpchat/telemetry.hpp"

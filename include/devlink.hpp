#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "devlink/core/constants.hpp"
#include "devlink/core/error.hpp"
#include "devlink/core/message.hpp"
#include "devlink/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "devlink/util/event.hpp"
#include "devlink/util/hex.hpp"
#include "devlink/util/state_machine.hpp"

// ─── Codec ───────────────────────────────────────────────────────────────────
#include "devlink/codec/codec.hpp"

// ─── Transports ──────────────────────────────────────────────────────────────
#include "devlink/transport/narrow_radio.hpp"
#include "devlink/transport/provider.hpp"
#include "devlink/transport/radio_socket.hpp"
#include "devlink/transport/serial_socket.hpp"
#include "devlink/transport/stream_client.hpp"
#include "devlink/transport/wide_radio.hpp"

// ─── Hardware, pins, console, firmware update ────────────────────────────────
#include "devlink/console/console.hpp"
#include "devlink/hw/channel.hpp"
#include "devlink/ota/updater.hpp"
#include "devlink/pins/registry.hpp"

// ─── Session ─────────────────────────────────────────────────────────────────
#include "devlink/session/dispatcher.hpp"
#include "devlink/session/reporter.hpp"
#include "devlink/session/session.hpp"

// ─── Agent ───────────────────────────────────────────────────────────────────
#include "devlink/agent.hpp"

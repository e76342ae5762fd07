#pragma once

#include <concepts>
#include <utility>

#include "rtmpwire/core/chunk/message.hpp"
#include "rtmpwire/core/transport/error.hpp"


namespace rtmpwire::core {

// -----------------------------------------------------------------------------
// HandlerConcept - application side of a Connection
//
// All callbacks run on the connection's dispatch thread, never concurrently.
//   on_connect()          once, when the command stream first answers
//   on_receive(msg)       every application message, in arrival order
//   on_disconnect(error)  once, after the last on_receive()
//
// Optional:
//   on_command(msg)       every command stream message
// -----------------------------------------------------------------------------
template<class H>
concept HandlerConcept =
    requires(H h, chunk::Message msg, transport::Error err)
{
    { h.on_connect() } -> std::same_as<void>;
    { h.on_disconnect(err) } -> std::same_as<void>;
    { h.on_receive(std::move(msg)) } -> std::same_as<void>;
};

template<class H>
concept CommandObserver =
    requires(H h, const chunk::Message& msg)
{
    { h.on_command(msg) } -> std::same_as<void>;
};

} // namespace rtmpwire::core

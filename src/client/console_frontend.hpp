#pragma once

#include "client/session.hpp"
#include <functional>
#include <iosfwd>
#include <mutex>
#include <string_view>

namespace peerdrop {

/**
 * ConsoleFrontend - line-oriented stand-in for a GUI.
 *
 * Prints the session's outbound events and turns typed lines into
 * session commands:
 *   select <path>    choose the file to send
 *   send <nickname>  publish the selected file and announce it
 *   roster           ask the relay for the active users
 *   status           print session, connection and transfer state
 *   disconnect       leave the relay, keep the process running
 *   quit             leave and exit
 */
class ConsoleFrontend {
public:
    explicit ConsoleFrontend(std::ostream& out);

    // Callbacks to pass to the Session constructor
    SessionCallbacks callbacks();

    void attach(Session& session) { session_ = &session; }

    // Returns false once the user asked to quit
    bool execute(std::string_view line);

    void print_help() const;

private:
    void print_status() const;

    std::ostream& out_;
    Session* session_ = nullptr;
};

// Hands work from the stdin thread to the io_context. Once close() has
// run, post() drops the work instead of touching a finished io_context.
class InputBridge {
public:
    explicit InputBridge(net::io_context& ioc) : ioc_(&ioc) {}

    // Returns false when the bridge is closed
    bool post(std::function<void()> fn);
    void close();

private:
    std::mutex mutex_;
    net::io_context* ioc_;
};

} // namespace peerdrop

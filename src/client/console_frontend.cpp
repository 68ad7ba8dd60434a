#include "client/console_frontend.hpp"
#include "common/ws_client_coro.hpp"
#include <ostream>

namespace peerdrop {

namespace {

std::string_view trim(std::string_view text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

} // anonymous namespace

ConsoleFrontend::ConsoleFrontend(std::ostream& out)
    : out_(out)
{}

SessionCallbacks ConsoleFrontend::callbacks() {
    SessionCallbacks cb;
    cb.on_ready_to_publish = [this]() {
        out_ << "* connected, registering..." << std::endl;
    };
    cb.on_register_accepted = [this]() {
        out_ << "* registration accepted" << std::endl;
    };
    cb.on_session_ready = [this]() {
        out_ << "* ready as " << (session_ ? session_->nickname() : std::string()) << std::endl;
    };
    cb.on_roster_updated = [this](const std::vector<std::string>& roster) {
        out_ << "* online (" << roster.size() << "):";
        for (const auto& name : roster) {
            out_ << " " << name;
        }
        out_ << std::endl;
    };
    cb.on_fatal_error = [this](const std::string& message) {
        out_ << "! fatal: " << message << std::endl;
    };
    cb.on_error = [this](const SessionError& error) {
        out_ << "! " << session_error_message(error) << std::endl;
    };
    cb.on_ticket_published = [this](const std::string& ticket) {
        out_ << "* sent ticket " << ticket << std::endl;
    };
    cb.on_file_received = [this](const std::filesystem::path& path) {
        out_ << "* received " << path.string() << std::endl;
    };
    return cb;
}

bool ConsoleFrontend::execute(std::string_view line) {
    line = trim(line);
    if (line.empty()) {
        return true;
    }

    auto space = line.find(' ');
    auto verb = line.substr(0, space);
    auto arg = space == std::string_view::npos ? std::string_view{} : trim(line.substr(space + 1));

    if (verb == "quit" || verb == "exit") {
        return false;
    }
    if (verb == "help") {
        print_help();
        return true;
    }
    if (!session_) {
        out_ << "! no session" << std::endl;
        return true;
    }
    if (verb == "status") {
        print_status();
        return true;
    }

    std::expected<void, SessionError> submitted;
    if (verb == "select" && !arg.empty()) {
        submitted = session_->submit(SelectFileForTransfer{std::filesystem::path(std::string(arg))});
    } else if (verb == "send" && !arg.empty()) {
        submitted = session_->submit(PublishToPeer{std::string(arg)});
    } else if (verb == "roster") {
        submitted = session_->submit(RequestRoster{});
    } else if (verb == "disconnect") {
        submitted = session_->submit(Disconnect{});
    } else {
        out_ << "! unknown command: " << line << std::endl;
        print_help();
    }

    if (!submitted) {
        out_ << "! " << session_error_message(submitted.error()) << std::endl;
    }
    return true;
}

void ConsoleFrontend::print_help() const {
    out_ << "Commands:\n"
         << "  select <path>    choose the file to send\n"
         << "  send <nickname>  publish the selected file and announce it\n"
         << "  roster           list active users\n"
         << "  status           show session state\n"
         << "  disconnect       leave the relay\n"
         << "  quit             leave and exit" << std::endl;
}

void ConsoleFrontend::print_status() const {
    const auto& s = *session_;
    out_ << "state:    " << s.state_name() << "\n"
         << "nickname: " << (s.nickname().empty() ? "-" : s.nickname()) << "\n"
         << "roster:   " << s.roster().size() << " user(s)\n"
         << "pending:  " << (s.pending_file() ? s.pending_file()->string() : "-") << "\n";

    if (auto* failed = std::get_if<Failed>(&s.state())) {
        out_ << "reason:   " << failed->reason << "\n";
    }

    if (auto channel = s.channel()) {
        out_ << "relay:    " << channel->describe();
        if (auto ws = std::dynamic_pointer_cast<WsClientCoro>(channel)) {
            auto st = ws->stats();
            out_ << " (tx " << st.frames_sent << " frames/" << st.bytes_sent << " B, rx "
                 << st.frames_received << " frames/" << st.bytes_received << " B)";
        }
        out_ << "\n";
    }

    if (auto transfer = s.transfer()) {
        out_ << "transfer: " << transfer->describe();
        if (auto endpoint = std::dynamic_pointer_cast<TransferEndpoint>(transfer)) {
            auto st = endpoint->stats();
            out_ << " (" << endpoint->store().count() << " blob(s), served " << st.blobs_served
                 << ", fetched " << st.blobs_fetched << ")";
        }
        out_ << "\n";
    }

    out_ << "tasks:\n";
    for (const auto& task : s.tasks().snapshot()) {
        out_ << "  #" << task.id << " " << task.name << " " << task_state_name(task.state);
        if (!task.exit_reason.empty()) {
            out_ << " (" << task.exit_reason << ")";
        }
        out_ << "\n";
    }
    out_ << std::flush;
}

bool InputBridge::post(std::function<void()> fn) {
    std::lock_guard lock(mutex_);
    if (!ioc_) {
        return false;
    }
    net::post(*ioc_, std::move(fn));
    return true;
}

void InputBridge::close() {
    std::lock_guard lock(mutex_);
    ioc_ = nullptr;
}

} // namespace peerdrop

/*
 * Status Console Implementation
 */

#include "status_console.hpp"
#include "clock.hpp"

#include <iomanip>
#include <variant>

namespace deck_relay {

namespace {

void print_axis(std::ostream& out, const char* name, float value) {
    out << "  " << std::setw(10) << std::left << name
        << ": " << std::setw(7) << std::right << std::fixed << std::setprecision(3) << value << std::endl;
}

void print_connection(std::ostream& out, const ConnectionState& state, uint64_t now) {
    out << connectionStateName(state);
    if (const auto* connected = std::get_if<Connected>(&state)) {
        out << " for " << (now >= connected->since ? (now - connected->since) / 1000 : 0) << "s";
    } else if (const auto* reconnecting = std::get_if<Reconnecting>(&state)) {
        if (reconnecting->attempt > 0) {
            uint64_t wait = reconnecting->next_retry_at > now ? reconnecting->next_retry_at - now : 0;
            out << " (attempt " << reconnecting->attempt << ", retry in " << wait << " ms)";
        } else {
            out << " (waiting for peer)";
        }
    }
}

}  // namespace

StatusConsole::StatusConsole(std::ostream& out, bool clear_screen, size_t activity_lines)
    : out_(out), clear_screen_(clear_screen), activity_lines_(activity_lines) {
}

void StatusConsole::render(const Session& session) {
    const uint64_t now = monotonicMillis();

    if (clear_screen_) {
        // Clear screen and move cursor to top
        out_ << "\033[2J\033[H";
    }

    out_ << "=== Deck Relay (" << roleName(session.config().role) << ") ===" << std::endl << std::endl;

    out_ << "Session   : " << sessionPhaseName(session.phase()) << std::endl;
    out_ << "Connection: ";
    print_connection(out_, *session.connectionState(), now);
    out_ << std::endl;

    std::string peer = session.peerAddress();
    if (!peer.empty()) {
        out_ << "Peer      : " << peer << std::endl;
    }
    if (session.config().role == Role::Source) {
        out_ << "Port      : " << session.boundPort() << std::endl;
        out_ << "Input     : " << samplerStatusName(session.samplerStatus()) << std::endl;
        out_ << "Sent      : " << session.statesSent() << " states" << std::endl;
    } else {
        out_ << "Applied   : " << session.statesApplied() << " states" << std::endl;
    }
    out_ << "Latency   : ";
    if (session.hasLatency()) {
        out_ << session.lastLatency() << " ms" << std::endl;
    } else {
        out_ << "-" << std::endl;
    }
    if (session.malformedCount() > 0) {
        out_ << "Malformed : " << session.malformedCount() << " frames dropped" << std::endl;
    }

    auto controllers = session.peerControllers();
    if (controllers && !controllers->names.empty()) {
        out_ << std::endl << "Peer controllers:" << std::endl;
        for (const auto& name : controllers->names) {
            out_ << "  " << name << std::endl;
        }
    }

    auto state = session.latestState();
    if (state) {
        out_ << std::endl << "Buttons:" << std::endl;
        for (Button b : kAllButtons) {
            out_ << "  " << std::setw(10) << std::left << buttonName(b)
                 << ": " << (state->pressed(b) ? "[PRESSED ]" : "[        ]") << std::endl;
        }

        out_ << std::endl << "Axes:" << std::endl;
        print_axis(out_, "Left-X", state->leftStickX());
        print_axis(out_, "Left-Y", state->leftStickY());
        print_axis(out_, "Right-X", state->rightStickX());
        print_axis(out_, "Right-Y", state->rightStickY());
        print_axis(out_, "LT", state->leftTrigger());
        print_axis(out_, "RT", state->rightTrigger());
    }

    if (activity_lines_ > 0) {
        std::vector<ActivityEntry> entries = session.activity().snapshot();
        if (!entries.empty()) {
            out_ << std::endl << "Recent activity:" << std::endl;
            size_t first = entries.size() > activity_lines_ ? entries.size() - activity_lines_ : 0;
            for (size_t i = entries.size(); i-- > first;) {
                out_ << "  " << std::setw(8) << std::right << (entries[i].received_at % 100000)
                     << "  " << entries[i].details << std::endl;
            }
        }
    }

    out_.flush();
}

}  // namespace deck_relay

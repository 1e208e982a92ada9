/*
 * Status Console
 *
 * Terminal debug view of a running Session. Reads snapshots only and never
 * touches session state.
 */

#ifndef DECK_RELAY_STATUS_CONSOLE_HPP
#define DECK_RELAY_STATUS_CONSOLE_HPP

#include "session.hpp"

#include <cstddef>
#include <iostream>

namespace deck_relay {

class StatusConsole {
public:
    // With clear_screen the view is redrawn in place using ANSI escapes
    explicit StatusConsole(std::ostream& out = std::cout, bool clear_screen = true,
                           size_t activity_lines = 10);

    void render(const Session& session);

private:
    std::ostream& out_;
    bool clear_screen_;
    size_t activity_lines_;
};

}  // namespace deck_relay

#endif  // DECK_RELAY_STATUS_CONSOLE_HPP

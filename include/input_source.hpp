/*
 * Input Source Interface
 *
 * Abstract access to the physical controller sampled by the Sampler.
 */

#ifndef DECK_RELAY_INPUT_SOURCE_HPP
#define DECK_RELAY_INPUT_SOURCE_HPP

#include "state_model.hpp"

#include <string>
#include <vector>

namespace deck_relay {

class InputSource {
public:
    virtual ~InputSource() = default;

    // Fills `out` with the current controller state.
    // Returns false when no controller is available.
    virtual bool readState(RawInput& out) = 0;

    // Names of the controllers currently attached
    virtual std::vector<std::string> controllerNames() const = 0;
};

}  // namespace deck_relay

#endif  // DECK_RELAY_INPUT_SOURCE_HPP

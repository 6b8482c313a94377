#include "agent/Session.hpp"

#include <stdexcept>

namespace shrine::agent {

std::string to_string(const State state) {
    switch (state) {
        case State::Locked: return "locked";
        case State::Unlocking: return "unlocking";
        case State::Unlocked: return "unlocked";
        default: throw std::invalid_argument("Unknown State enum value");
    }
}

}

/*
 * Virtual Pad Sink
 */

#include "virtual_pad.hpp"

namespace deck_relay {

bool PadReport::operator==(const PadReport& o) const {
    return buttons == o.buttons &&
           left_trigger == o.left_trigger && right_trigger == o.right_trigger &&
           thumb_lx == o.thumb_lx && thumb_ly == o.thumb_ly &&
           thumb_rx == o.thumb_rx && thumb_ry == o.thumb_ry;
}

const char* sinkErrorName(SinkError error) {
    switch (error) {
        case SinkError::None: return "none";
        case SinkError::NotReady: return "virtual device not ready";
        case SinkError::WriteFailure: return "write failure";
    }
    return "unknown";
}

}  // namespace deck_relay

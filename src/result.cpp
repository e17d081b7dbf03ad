#include "planfix/result.hpp"

namespace planfix {

const char* to_string(Status status) {
    switch (status) {
        case Status::ok: return "ok";
        case Status::not_calibrated: return "not_calibrated";
        case Status::degenerate: return "degenerate";
    }
    return "unknown";
}

} // namespace planfix

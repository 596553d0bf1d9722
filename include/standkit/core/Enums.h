#pragma once
#include <string>

namespace standkit {

// Enumeration: stand session phase.
enum class SessionPhase {
    IDLE = 0,
    ACTIVE
};

// Transition produced by one step of the session state machine.
enum class Transition {
    NONE = 0,
    ACTIVATED,
    DEACTIVATED
};

// Coarse age classification reported to the backend as "group".
enum class AgeBucket {
    CHILD = 0,
    YOUNG,
    ADULT,
    SENIOR
};

// Why the worker loop ended.
enum class LoopExit {
    CANCELLED = 0,
    CAPTURE_FAILURE
};

inline std::string toString(SessionPhase p) {
    switch (p) {
        case SessionPhase::IDLE:   return "IDLE";
        case SessionPhase::ACTIVE: return "ACTIVE";
        default:                   return "UNKNOWN";
    }
}

inline std::string toString(Transition t) {
    switch (t) {
        case Transition::NONE:        return "NONE";
        case Transition::ACTIVATED:   return "ACTIVATED";
        case Transition::DEACTIVATED: return "DEACTIVATED";
        default:                      return "UNKNOWN";
    }
}

// lowercase: these strings go over the wire
inline std::string toString(AgeBucket b) {
    switch (b) {
        case AgeBucket::CHILD:  return "child";
        case AgeBucket::YOUNG:  return "young";
        case AgeBucket::ADULT:  return "adult";
        case AgeBucket::SENIOR: return "senior";
        default:                return "senior";
    }
}

inline std::string toString(LoopExit e) {
    switch (e) {
        case LoopExit::CANCELLED:       return "CANCELLED";
        case LoopExit::CAPTURE_FAILURE: return "CAPTURE_FAILURE";
        default:                        return "UNKNOWN";
    }
}

} // namespace standkit

#pragma once

#include <cstdint>

namespace core {

enum class ProtocolPhase : std::uint8_t {
    Handshaking,
    Status,
    Login,
    Configuration,
    Play
};

inline const char* phase_name(ProtocolPhase p) noexcept {
    switch (p) {
    case ProtocolPhase::Handshaking: return "handshaking";
    case ProtocolPhase::Status: return "status";
    case ProtocolPhase::Login: return "login";
    case ProtocolPhase::Configuration: return "configuration";
    case ProtocolPhase::Play: return "play";
    }
    return "unknown";
}

// Identifiers that advance the phase. Only the identifier is inspected.
inline constexpr std::int32_t login_finished_id = 0x02;
inline constexpr std::int32_t configuration_finished_id = 0x03;

// Recordings start after the handshake, so scanning begins in Login.
struct PhaseTracker {
    ProtocolPhase phase{ProtocolPhase::Login};
    std::uint64_t packets_seen{0};
    std::uint64_t transitions{0};
};

// Returns the phase the packet was read in; the transition it triggers is
// visible only to later packets. Play is terminal.
inline ProtocolPhase observe_packet(PhaseTracker& trk, std::int32_t id) noexcept {
    const ProtocolPhase current = trk.phase;
    ++trk.packets_seen;
    if (current == ProtocolPhase::Login && id == login_finished_id) {
        trk.phase = ProtocolPhase::Configuration;
        ++trk.transitions;
    } else if (current == ProtocolPhase::Configuration && id == configuration_finished_id) {
        trk.phase = ProtocolPhase::Play;
        ++trk.transitions;
    }
    return current;
}

inline void reset_tracker(PhaseTracker& trk, ProtocolPhase initial = ProtocolPhase::Login) noexcept {
    trk.phase = initial;
    trk.packets_seen = 0;
    trk.transitions = 0;
}

} // namespace core

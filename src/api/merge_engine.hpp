#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>

#include "api/merge_config.hpp"
#include "core/packet.hpp"
#include "core/packet_filter.hpp"
#include "core/protocol_phase.hpp"
#include "core/session_metadata.hpp"
#include "persist/archive.hpp"
#include "persist/replay_status.hpp"

namespace api {

enum class MergeStage : std::uint8_t {
    None,
    OpenInput,
    ReadPackets,
    ReadMetadata,
    OpenOutput,
    WritePackets,
    WriteMetadata,
    FinishOutput
};

const char* stage_name(MergeStage stage) noexcept;

struct MergeResult {
    persist::ReplayStatus status{persist::ReplayStatus::Ok};
    MergeStage stage{MergeStage::None};
    std::size_t input_index{0};
    int error_code{0};
    std::string detail;
    bool stopped{false};   // visitor ended the merge early

    bool ok() const noexcept { return status == persist::ReplayStatus::Ok; }
};

struct MergeOptions {
    int compression_level{default_packet_compression_level};
    std::uint32_t interval{0};
    std::int32_t reset_id{default_reset_packet_id};
};

struct MergeCounters {
    std::uint64_t packets_read{0};
    std::uint64_t packets_admitted{0};
    std::uint64_t packets_written{0};
    std::uint64_t filtered_out{0};
    std::uint64_t suppressed_phase{0};   // pre-Play packets of later inputs
    std::uint64_t suppressed_reset{0};
    std::uint64_t backward_timestamps{0};
    std::uint64_t inputs_completed{0};
    std::uint64_t bytes_written{0};
};

// Invoked once per admitted packet, after its time has been rebased and it
// has been written. Returning true stops the merge.
using PacketVisitor = std::function<bool(const core::Packet&, core::ProtocolPhase)>;

// Concatenates the recording streams of `inputs` in order onto one timeline.
//
// Each input starts at the running offset, which advances by the input's
// declared duration plus the configured interval once the input is
// exhausted. The first input is filtered by the mask only; later inputs also
// lose every packet read before Play and every reset packet. Metadata is
// written once, after the last input; a stop from the visitor skips it but
// still completes the output container. Any failure aborts the merge and
// output already forwarded is left in place.
class MergeEngine {
public:
    MergeEngine(const core::PacketFilterMask& mask, MergeOptions opts) noexcept
        : mask_(mask), opts_(opts) {}

    // `output` may be null for a dry run.
    MergeResult run(std::span<persist::IArchiveReader* const> inputs,
                    persist::IArchiveWriter* output,
                    const PacketVisitor& visitor = {});

    const MergeCounters& counters() const noexcept { return counters_; }
    // Accumulated metadata; complete only after a run that was not stopped.
    const core::SessionMetadata& metadata() const noexcept { return metadata_; }

    bool admits(const core::Packet& packet, core::ProtocolPhase phase, bool first_input) noexcept;

private:
    const core::PacketFilterMask& mask_;
    MergeOptions opts_;
    MergeCounters counters_{};
    core::SessionMetadata metadata_{};
};

} // namespace api

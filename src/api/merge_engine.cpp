#include "api/merge_engine.hpp"

#include <limits>

#include "persist/metadata_codec.hpp"
#include "persist/packet_stream.hpp"
#include "util/log.hpp"

namespace api {

namespace {

MergeResult make_failure(persist::ReplayStatus status, MergeStage stage, std::size_t input_index,
                         int error_code, std::string detail) {
    MergeResult res;
    res.status = status;
    res.stage = stage;
    res.input_index = input_index;
    res.error_code = error_code;
    res.detail = std::move(detail);
    return res;
}

// Completes whatever output exists after an aborted merge so the packets
// already forwarded stay readable. Failures here are logged; the first
// error is what gets reported.
void abandon_output(persist::PacketStreamWriter& writer, persist::IArchiveWriter* output) noexcept {
    if (output == nullptr) {
        return;
    }
    const persist::IoResult closed = writer.close();
    if (!closed.ok) {
        LOG_SLOW_ERROR("closing recording entry after abort failed: errno=%d", closed.error_code);
    }
    const persist::StorageResult finished = output->finish();
    if (!finished.ok()) {
        LOG_SLOW_ERROR("finishing output after abort failed: %s errno=%d",
                       persist::status_name(finished.status), finished.error_code);
    }
}

void adopt_descriptive_fields(core::SessionMetadata& into, const core::SessionMetadata& from) {
    into.singleplayer = from.singleplayer;
    into.server_name = from.server_name;
    into.custom_server_name = from.custom_server_name;
    into.date = from.date;
    into.mc_version = from.mc_version;
    into.protocol = from.protocol;
    into.self_id = from.self_id;
}

} // namespace

const char* stage_name(MergeStage stage) noexcept {
    switch (stage) {
    case MergeStage::None: return "none";
    case MergeStage::OpenInput: return "open input";
    case MergeStage::ReadPackets: return "read packets";
    case MergeStage::ReadMetadata: return "read metadata";
    case MergeStage::OpenOutput: return "open output";
    case MergeStage::WritePackets: return "write packets";
    case MergeStage::WriteMetadata: return "write metadata";
    case MergeStage::FinishOutput: return "finish output";
    }
    return "unknown";
}

bool MergeEngine::admits(const core::Packet& packet, core::ProtocolPhase phase, bool first_input) noexcept {
    if (!mask_.admits(packet.id())) {
        ++counters_.filtered_out;
        return false;
    }
    if (first_input) {
        return true;
    }
    if (phase != core::ProtocolPhase::Play) {
        ++counters_.suppressed_phase;
        return false;
    }
    if (packet.id() == opts_.reset_id) {
        ++counters_.suppressed_reset;
        return false;
    }
    return true;
}

MergeResult MergeEngine::run(std::span<persist::IArchiveReader* const> inputs,
                             persist::IArchiveWriter* output,
                             const PacketVisitor& visitor) {
    counters_ = MergeCounters{};
    metadata_ = core::SessionMetadata{};

    if (inputs.empty()) {
        return make_failure(persist::ReplayStatus::InvalidArgument, MergeStage::OpenInput, 0, 0, "no inputs");
    }

    persist::PacketStreamWriter writer;
    if (output != nullptr) {
        const persist::StorageResult opened = writer.open(*output, opts_.compression_level);
        if (!opened.ok()) {
            abandon_output(writer, output);
            return make_failure(opened.status, MergeStage::OpenOutput, 0, opened.error_code,
                                "cannot open recording entry for write");
        }
    }

    std::uint64_t offset = 0;
    std::uint32_t last_time = 0;
    bool emitted_any = false;
    bool stopped = false;

    for (std::size_t i = 0; i < inputs.size() && !stopped; ++i) {
        const bool first_input = i == 0;
        persist::PacketStreamReader reader;
        const persist::StorageResult opened = reader.open(*inputs[i]);
        if (!opened.ok()) {
            abandon_output(writer, output);
            return make_failure(opened.status, MergeStage::OpenInput, i, opened.error_code,
                                "cannot open recording entry");
        }

        const std::uint64_t suppressed_before = counters_.suppressed_phase + counters_.suppressed_reset;
        bool warned_backward = false;
        core::Packet packet;
        core::ProtocolPhase phase = core::ProtocolPhase::Login;
        while (true) {
            const persist::PacketReadResult res = reader.next(packet, phase);
            if (res.status == persist::ReplayStatus::EndOfStream) {
                break;
            }
            if (res.status != persist::ReplayStatus::Ok) {
                abandon_output(writer, output);
                return make_failure(res.status, MergeStage::ReadPackets, i, res.error_code,
                                    "record " + std::to_string(reader.stats().packets_read + 1));
            }
            ++counters_.packets_read;

            const std::uint64_t rebased = static_cast<std::uint64_t>(packet.time()) + offset;
            if (rebased > std::numeric_limits<std::uint32_t>::max()) {
                abandon_output(writer, output);
                return make_failure(persist::ReplayStatus::InvalidArgument, MergeStage::ReadPackets, i, 0,
                                    "rebased timestamp exceeds 32 bits");
            }
            packet.rebase_time(static_cast<std::uint32_t>(rebased));

            if (!admits(packet, phase, first_input)) {
                continue;
            }
            ++counters_.packets_admitted;

            if (emitted_any && packet.time() < last_time) {
                ++counters_.backward_timestamps;
                if (!warned_backward) {
                    LOG_SLOW_WARN("input %zu: packet time %u precedes previous output time %u",
                                  i, packet.time(), last_time);
                    warned_backward = true;
                }
            }
            last_time = packet.time();
            emitted_any = true;

            if (writer.is_open()) {
                const persist::PacketWriteResult w = writer.write(packet);
                if (w.status != persist::ReplayStatus::Ok) {
                    abandon_output(writer, output);
                    return make_failure(w.status, MergeStage::WritePackets, i, w.error_code,
                                        "cannot append packet");
                }
                ++counters_.packets_written;
                counters_.bytes_written += w.bytes_written;
            }

            if (visitor && visitor(packet, phase)) {
                stopped = true;
                break;
            }
        }
        if (stopped) {
            LOG_SLOW_INFO("merge stopped during input %zu", i);
            break;
        }

        const std::uint64_t suppressed = counters_.suppressed_phase + counters_.suppressed_reset - suppressed_before;
        if (suppressed > 0) {
            LOG_SLOW_WARN("input %zu: dropped %llu packets outside the play phase or resetting the world",
                          i, static_cast<unsigned long long>(suppressed));
        }

        core::SessionMetadata meta;
        const persist::MetadataResult m = persist::read_metadata(*inputs[i], meta);
        if (!m.ok()) {
            abandon_output(writer, output);
            return make_failure(m.status, MergeStage::ReadMetadata, i, 0, m.error);
        }
        if (first_input) {
            adopt_descriptive_fields(metadata_, meta);
        }
        core::merge_players(metadata_, meta);
        offset += meta.duration + opts_.interval;
        ++counters_.inputs_completed;
        LOG_SLOW_DEBUG("input %zu done: %llu packets, duration %llu, next offset %llu",
                       i,
                       static_cast<unsigned long long>(reader.stats().packets_read),
                       static_cast<unsigned long long>(meta.duration),
                       static_cast<unsigned long long>(offset));
    }

    // Trailing gap is not part of the session.
    metadata_.duration = offset >= opts_.interval ? offset - opts_.interval : 0;
    metadata_.file_format = std::string(core::merged_file_format);
    metadata_.file_format_version = core::merged_file_format_version;
    metadata_.generator = std::string(core::merged_generator);

    MergeResult result;
    result.stopped = stopped;
    if (output == nullptr) {
        return result;
    }

    const persist::IoResult closed = writer.close();
    if (!closed.ok) {
        abandon_output(writer, output);
        return make_failure(persist::ReplayStatus::IoError, MergeStage::WritePackets, inputs.size() - 1,
                            closed.error_code, "cannot complete recording entry");
    }
    if (!stopped) {
        const persist::MetadataResult m = persist::write_metadata(*output, metadata_);
        if (!m.ok()) {
            abandon_output(writer, output);
            return make_failure(m.status, MergeStage::WriteMetadata, inputs.size() - 1, 0, m.error);
        }
    }
    const persist::StorageResult finished = output->finish();
    if (!finished.ok()) {
        return make_failure(finished.status, MergeStage::FinishOutput, inputs.size() - 1,
                            finished.error_code, "cannot finalize output");
    }
    return result;
}

} // namespace api

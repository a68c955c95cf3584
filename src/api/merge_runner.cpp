#include "api/merge_runner.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "api/merge_engine.hpp"
#include "api/packet_stats.hpp"
#include "core/packet_filter.hpp"
#include "persist/action_log_format.hpp"
#include "persist/archive_factory.hpp"
#include "persist/packet_stream.hpp"
#include "util/log.hpp"

namespace api {

namespace {

void apply_log_level(const MergeConfig& cfg) {
    if (cfg.quiet) {
        util::set_log_level(util::LogLevel::Error);
    } else if (cfg.verbose) {
        util::set_log_level(util::LogLevel::Debug);
    }
}

bool open_inputs(const MergeConfig& cfg, std::vector<std::unique_ptr<persist::IArchiveReader>>& out) {
    out.clear();
    for (const auto& path : cfg.inputs) {
        std::unique_ptr<persist::IArchiveReader> reader;
        const persist::StorageResult res = persist::open_archive_reader(path, reader);
        if (!res.ok()) {
            util::log(util::LogLevel::Error, "Cannot open input %s: %s (errno=%d)",
                      path.string().c_str(), persist::status_name(res.status), res.error_code);
            return false;
        }
        out.push_back(std::move(reader));
    }
    return true;
}

int dump_packets(persist::IArchiveReader& archive, const MergeConfig& cfg, std::ostream& out) {
    persist::PacketStreamReader reader;
    const persist::StorageResult opened = reader.open(archive);
    if (!opened.ok()) {
        util::log(util::LogLevel::Error, "Cannot open recording entry: %s", persist::status_name(opened.status));
        return exit_merge_failure;
    }
    core::Packet packet;
    core::ProtocolPhase phase = core::ProtocolPhase::Login;
    char line[96];
    while (cfg.max_packets == 0 || reader.stats().packets_read < cfg.max_packets) {
        const persist::PacketReadResult res = reader.next(packet, phase);
        if (res.status == persist::ReplayStatus::EndOfStream) {
            break;
        }
        if (res.status != persist::ReplayStatus::Ok) {
            util::log(util::LogLevel::Error, "Record %llu: %s",
                      static_cast<unsigned long long>(reader.stats().packets_read + 1),
                      persist::status_name(res.status));
            return exit_merge_failure;
        }
        std::snprintf(line, sizeof(line), "%10u %-13s 0x%02x %zu\n",
                      packet.time(), core::phase_name(phase),
                      static_cast<unsigned>(packet.id()), packet.data().size());
        out << line;
    }
    return exit_ok;
}

int dump_actions(persist::IArchiveReader& archive, const MergeConfig& cfg, std::ostream& out) {
    persist::ActionLogChunkReader reader;
    persist::ActionLogReadResult res = reader.open(archive, cfg.dump_chunk);
    if (res.status != persist::ReplayStatus::Ok) {
        util::log(util::LogLevel::Error, "Cannot read chunk %s: %s",
                  cfg.dump_chunk.c_str(), persist::status_name(res.status));
        return exit_merge_failure;
    }
    persist::ActionRecord record;
    char line[96];
    while (cfg.max_packets == 0 || reader.stats().actions_read < cfg.max_packets) {
        res = reader.next(record);
        if (res.status == persist::ReplayStatus::EndOfStream) {
            break;
        }
        if (res.status != persist::ReplayStatus::Ok) {
            util::log(util::LogLevel::Error, "Action %llu: %s",
                      static_cast<unsigned long long>(reader.stats().actions_read + 1),
                      persist::status_name(res.status));
            return exit_merge_failure;
        }
        if (record.kind == persist::ActionKind::NextTick) {
            continue;
        }
        std::snprintf(line, sizeof(line), "%10llu %-24s %zu\n",
                      static_cast<unsigned long long>(reader.tick()),
                      persist::action_kind_name(record.kind), record.payload.size());
        out << line;
    }
    out << "ticks: " << reader.stats().ticks << '\n';
    return exit_ok;
}

} // namespace

int run_merge(const MergeConfig& cfg, std::ostream& out) {
    std::string error;
    if (!validate_merge_config(cfg, error)) {
        util::log(util::LogLevel::Error, "%s", error.c_str());
        return exit_config_error;
    }
    apply_log_level(cfg);

    std::vector<std::unique_ptr<persist::IArchiveReader>> owned;
    if (!open_inputs(cfg, owned)) {
        return exit_merge_failure;
    }
    std::vector<persist::IArchiveReader*> inputs;
    inputs.reserve(owned.size());
    for (auto& r : owned) {
        inputs.push_back(r.get());
    }

    std::unique_ptr<persist::IArchiveWriter> writer;
    if (!cfg.output.empty()) {
        const persist::StorageResult res = persist::open_archive_writer(cfg.output, writer);
        if (!res.ok()) {
            util::log(util::LogLevel::Error, "Cannot open output %s: %s (errno=%d)",
                      cfg.output.string().c_str(), persist::status_name(res.status), res.error_code);
            return exit_merge_failure;
        }
    }

    const core::PacketFilterMask mask = core::make_filter_mask(cfg.include_ids, cfg.exclude_ids, cfg.admit_unknown);
    MergeOptions opts;
    opts.compression_level = cfg.compression_level;
    opts.interval = cfg.interval;
    opts.reset_id = cfg.reset_id;

    PacketStats stats;
    std::uint64_t visited = 0;
    const PacketVisitor visitor = [&](const core::Packet& packet, core::ProtocolPhase) {
        stats.record(packet);
        ++visited;
        return cfg.max_packets != 0 && visited >= cfg.max_packets;
    };

    MergeEngine engine(mask, opts);
    const MergeResult result = engine.run(inputs, writer.get(), visitor);
    if (!result.ok()) {
        const std::string where = result.stage == MergeStage::OpenOutput ||
                                          result.stage == MergeStage::WriteMetadata ||
                                          result.stage == MergeStage::FinishOutput
                                      ? cfg.output.string()
                                      : cfg.inputs[result.input_index].string();
        util::log(util::LogLevel::Error, "Merge failed at %s (%s): %s %s",
                  stage_name(result.stage), where.c_str(), persist::status_name(result.status),
                  result.detail.c_str());
        return exit_merge_failure;
    }

    const auto& c = engine.counters();
    const auto& meta = engine.metadata();
    out << "inputs: " << c.inputs_completed << '/' << inputs.size() << '\n'
        << "packets read: " << c.packets_read << '\n'
        << "packets admitted: " << c.packets_admitted << '\n'
        << "packets written: " << c.packets_written << '\n'
        << "filtered out: " << c.filtered_out << '\n'
        << "suppressed (later inputs): " << (c.suppressed_phase + c.suppressed_reset) << '\n';
    if (!result.stopped) {
        out << "duration: " << meta.duration << " ms\n"
            << "players: " << meta.players.size() << '\n';
    } else {
        out << "stopped after " << visited << " packets; metadata not written\n";
    }
    if (cfg.details) {
        stats.render_table(out);
    }
    return exit_ok;
}

int run_dump(const MergeConfig& cfg, std::ostream& out) {
    std::string error;
    if (!validate_merge_config(cfg, error)) {
        util::log(util::LogLevel::Error, "%s", error.c_str());
        return exit_config_error;
    }
    apply_log_level(cfg);

    std::vector<std::unique_ptr<persist::IArchiveReader>> owned;
    if (!open_inputs(cfg, owned)) {
        return exit_merge_failure;
    }
    if (!cfg.dump_chunk.empty()) {
        return dump_actions(*owned.front(), cfg, out);
    }
    return dump_packets(*owned.front(), cfg, out);
}

} // namespace api

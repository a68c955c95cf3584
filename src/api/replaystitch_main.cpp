#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "api/merge_config.hpp"
#include "api/merge_runner.hpp"
#include "util/log.hpp"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --input <archive|dir>[,...] [options]\n"
              << "Options:\n"
              << "  --input <path[,path]>     Input archive or directory (repeatable, merged in order)\n"
              << "  --output <path>           Output .mcpr/.zip archive or directory (omit for dry run)\n"
              << "  --include <0xNN>          Admit only listed packet ids (repeatable)\n"
              << "  --exclude <0xNN>          Drop packet id (repeatable)\n"
              << "  --unknown-packets <bool>  Admit ids outside 0x00-0xff (default true)\n"
              << "  --compression-level <N>   Recording entry compression, -1..9 (default 9)\n"
              << "  --interval <ms>           Gap inserted between inputs (default 0)\n"
              << "  --reset-id <0xNN>         Reset packet dropped from later inputs (default 0x47)\n"
              << "  --details                 Print per-packet statistics table\n"
              << "  --job <file.json>         Load options from a job file; later flags override\n"
              << "  --dump                    Print the packets of one input instead of merging\n"
              << "  --dump-chunk <entry>      Print the actions of an action-log chunk entry\n"
              << "  --max-packets <N>         Stop after N admitted packets\n"
              << "  --quiet                   Suppress non-error logs\n"
              << "  --verbose                 Enable verbose logging\n";
}

void append_inputs(const std::string& s, std::vector<std::filesystem::path>& out) {
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.emplace_back(item);
        }
    }
}

bool parse_bool_flag(const std::string& s, bool& out) {
    if (s == "true" || s == "1" || s == "yes") {
        out = true;
        return true;
    }
    if (s == "false" || s == "0" || s == "no") {
        out = false;
        return true;
    }
    return false;
}

bool parse_id_flag(const char* flag, const std::string& s, std::uint8_t& out) {
    const auto id = api::parse_packet_id(s);
    if (!id) {
        util::log(util::LogLevel::Error, "Invalid packet id for %s: %s", flag, s.c_str());
        return false;
    }
    out = *id;
    return true;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return api::exit_config_error;
    }

    api::MergeConfig cfg;

    // The job file is applied first so flags on the command line win.
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--job") {
            std::string error;
            if (!api::load_merge_job(argv[i + 1], cfg, error)) {
                util::log(util::LogLevel::Error, "%s", error.c_str());
                return api::exit_config_error;
            }
            break;
        }
    }

    bool inputs_from_flags = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            if (!inputs_from_flags) {
                cfg.inputs.clear();
                inputs_from_flags = true;
            }
            append_inputs(argv[++i], cfg.inputs);
        } else if (arg == "--output" && i + 1 < argc) {
            cfg.output = argv[++i];
        } else if (arg == "--include" && i + 1 < argc) {
            std::uint8_t id = 0;
            if (!parse_id_flag("--include", argv[++i], id)) {
                return api::exit_config_error;
            }
            cfg.include_ids.push_back(id);
        } else if (arg == "--exclude" && i + 1 < argc) {
            std::uint8_t id = 0;
            if (!parse_id_flag("--exclude", argv[++i], id)) {
                return api::exit_config_error;
            }
            cfg.exclude_ids.push_back(id);
        } else if (arg == "--unknown-packets" && i + 1 < argc) {
            if (!parse_bool_flag(argv[++i], cfg.admit_unknown)) {
                print_usage(argv[0]);
                return api::exit_config_error;
            }
        } else if (arg == "--compression-level" && i + 1 < argc) {
            cfg.compression_level = static_cast<int>(std::strtol(argv[++i], nullptr, 10));
        } else if (arg == "--interval" && i + 1 < argc) {
            cfg.interval = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--reset-id" && i + 1 < argc) {
            std::uint8_t id = 0;
            if (!parse_id_flag("--reset-id", argv[++i], id)) {
                return api::exit_config_error;
            }
            cfg.reset_id = id;
        } else if (arg == "--details") {
            cfg.details = true;
        } else if (arg == "--job" && i + 1 < argc) {
            ++i; // already loaded
        } else if (arg == "--dump") {
            cfg.dump = true;
        } else if (arg == "--dump-chunk" && i + 1 < argc) {
            cfg.dump_chunk = argv[++i];
        } else if (arg == "--max-packets" && i + 1 < argc) {
            cfg.max_packets = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "--quiet") {
            cfg.quiet = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else {
            print_usage(argv[0]);
            return api::exit_config_error;
        }
    }

    if (cfg.dump || !cfg.dump_chunk.empty()) {
        return api::run_dump(cfg, std::cout);
    }
    return api::run_merge(cfg, std::cout);
}

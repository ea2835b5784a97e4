/**
 * Copyright (c) 2026 Cr4nkSt4r - GdsStreamParser
 */
#include "gds/gds_json.h"
#include "gds_parser.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

struct Settings {
    fs::path input;
    std::optional<fs::path> output;
    bool write_metadata = false;
    bool quiet = false;
    bool debug = false;
};

static void print_usage() {
    GDS_LOG_INFO(
        "Usage:\n" \
        "    gds_parser <input.gds> [output.json] [--metadata] [--quiet] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a GDSII stream file\n" \
        "    output.json   writes the decoded [name, values] pairs as JSON\n" \
        "    --metadata    writes <output>_metadata.json (or prints it without an output path)\n" \
        "    --quiet       does not print each record while decoding\n" \
        "    --debug       enables extra logging\n"
    );
}

static void print_record(const gds::stream::DecodedRecord& rec) {
    GDS_LOG_INFO("%s", gds::stream::record_to_json(rec).dump().c_str());
}

static int process_file(const Settings& settings) {
    if (!gds::fs_utils::is_gds_file(settings.input)) {
        GDS_LOG_WARN("Input has no .gds extension: %s", settings.input.string().c_str());
    }

    gds::ParserDecodeOptions opt{};
    opt.collect_metadata = settings.write_metadata;
    opt.debug = settings.debug;
    if (!settings.quiet) {
        opt.on_record = print_record;
    }

    try {
        const auto res = gds::GdsParser::DecodeGdsFile(settings.input, opt);
        if (settings.output.has_value()) {
            gds::fs_utils::write_text_file(*settings.output, res.records.dump(4));
            GDS_LOG_INFO("Wrote: %s", settings.output->string().c_str());
        }
        if (settings.write_metadata) {
            if (settings.output.has_value()) {
                const fs::path meta_path = gds::fs_utils::metadata_path_for(*settings.output);
                gds::fs_utils::write_text_file(meta_path, res.metadata.dump(2));
                GDS_LOG_INFO("Wrote: %s", meta_path.string().c_str());
            } else {
                GDS_LOG_INFO("%s", res.metadata.dump(2).c_str());
            }
        }
    } catch (const std::exception& e) {
        GDS_LOG_ERROR("Failed: %s (%s)", settings.input.string().c_str(), e.what());
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    const std::string_view first_arg = argv[1];
    if (first_arg == "-h" || first_arg == "--help") {
        print_usage();
        return 0;
    }
    if (!first_arg.empty() && first_arg[0] == '-') {
        GDS_LOG_ERROR("First argument must be a GDSII file.");
        print_usage();
        return 2;
    }

    Settings settings;
    settings.input = fs::path(std::string(first_arg));
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--metadata") {
            settings.write_metadata = true;
            continue;
        }
        if (arg == "--quiet") {
            settings.quiet = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (!arg.empty() && arg[0] != '-' && !settings.output.has_value()) {
            settings.output = fs::path(std::string(arg));
            continue;
        }
        GDS_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }
    gds::log::set_debug(settings.debug);

    if (!fs::exists(settings.input)) {
        GDS_LOG_ERROR("Input does not exist: %s", settings.input.string().c_str());
        return 2;
    }

    return process_file(settings);
}

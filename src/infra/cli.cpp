/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file cli.cpp
 * @brief Implementation of the `ulidkit` command-line parser.
 */

#include "ulidkit/infra/cli.hpp"

#include <cctype>
#include <stdexcept>

namespace ulidkit::infra {

namespace {

std::uint64_t parse_count(const std::string& raw)
{
    const auto rejected = std::invalid_argument("--count expects a non-negative integer, got '" +
                                                raw + "'");
    if (raw.empty() || !std::isdigit(static_cast<unsigned char>(raw[0]))) {
        throw rejected;
    }

    std::size_t used = 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(raw, &used);
    } catch (const std::out_of_range&) {
        throw rejected;
    }
    if (used != raw.size()) {
        throw rejected;
    }
    return n;
}

double parse_time(const std::string& raw)
{
    const auto rejected = std::invalid_argument("--time expects a number, got '" + raw + "'");

    std::size_t used = 0;
    double t = 0;
    try {
        t = std::stod(raw, &used);
    } catch (const std::logic_error&) {
        throw rejected;
    }
    if (used != raw.size()) {
        throw rejected;
    }
    return t;
}

} // namespace

Options CommandLine::parse(const std::vector<std::string>& args)
{
    Options opts;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--count") {
            opts.count = parse_count(value());
        } else if (arg == "--time") {
            opts.time = parse_time(value());
        } else if (arg == "--config") {
            opts.config_path = value();
        } else if (arg == "--monotonic") {
            opts.monotonic = true;
        } else if (arg == "--allow-insecure") {
            opts.allow_insecure = true;
        } else if (arg == "--allow-imprecise") {
            opts.allow_imprecise = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else {
            throw std::invalid_argument("unknown option '" + arg + "'");
        }
    }
    return opts;
}

Settings CommandLine::apply(const Options& opts, Settings settings)
{
    settings.monotonic = settings.monotonic || opts.monotonic;
    settings.allow_insecure = settings.allow_insecure || opts.allow_insecure;
    settings.allow_imprecise = settings.allow_imprecise || opts.allow_imprecise;
    if (opts.quiet) {
        settings.log_level = LogLevel::ERROR;
    }
    return settings;
}

Settings CommandLine::resolve(const Options& opts)
{
    Settings settings;
    if (opts.config_path) {
        settings = ConfigLoader::load_file(*opts.config_path);
    }
    return apply(opts, settings);
}

void CommandLine::print_usage(std::ostream& out, const std::string& binary_name)
{
    out << "Usage: " << binary_name << " [OPTIONS]\n"
        << "Options:\n"
        << "  --count N          Number of identifiers to print (Default: 1)\n"
        << "  --time MS          Embed MS milliseconds since the epoch instead of now\n"
        << "  --monotonic        Strictly increasing output within one millisecond\n"
        << "  --config FILE      JSON configuration file\n"
        << "  --allow-insecure   Accept a non-cryptographic random source\n"
        << "  --allow-imprecise  Accept a clock coarser than one millisecond\n"
        << "  --quiet            Only log errors\n"
        << "  --help             Show this help message\n";
}

} // namespace ulidkit::infra

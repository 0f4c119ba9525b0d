#include <iostream>
#include <optional>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "sim/link_simulation.h"

using JitFhss::Configuration;

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options
    cxxopts::Options options("jitfhss_sim", "JIT-FHSS satellite link simulation");

    options.add_options()
        ("f,config", "YAML configuration file", cxxopts::value<std::string>())
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("d,duration", "Simulated time in seconds", cxxopts::value<double>())
        ("t,time_step", "Simulation step in seconds", cxxopts::value<double>())
        ("hop_duration", "Dwell time per frequency in seconds", cxxopts::value<double>())
        ("c,channels", "Number of redundant pattern channels", cxxopts::value<int>())
        ("frequencies", "Number of frequencies in the hop band", cxxopts::value<int>())
        ("b,buffer_size", "Pattern buffer capacity per participant", cxxopts::value<size_t>())
        ("s,seed", "Random seed, 0 for nondeterministic", cxxopts::value<size_t>())
        ("jam", "Enable the jamming window")
        ("no_jam", "Disable the jamming window")
        ("h,help", "Print usage");

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid arguments: " << e.what();
        return 1;
    }
    const cxxopts::ParseResult& result = *parsed;

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }
    FLAGS_v = result["log_level"].as<int>();

    Configuration& config = Configuration::getInstance();
    if (result.count("config")) {
        const std::string path = result["config"].as<std::string>();
        if (!config.loadFromFile(path)) {
            LOG(ERROR) << "Failed to load configuration from " << path;
            for (const auto& error : config.getValidationErrors()) {
                LOG(ERROR) << "  " << error;
            }
            return 1;
        }
    }

    // Command line overrides the YAML file
    auto& cfg = config.config();
    if (result.count("duration")) cfg.simulation.duration.set(result["duration"].as<double>());
    if (result.count("time_step")) cfg.simulation.time_step.set(result["time_step"].as<double>());
    if (result.count("hop_duration")) cfg.hop.hop_duration.set(result["hop_duration"].as<double>());
    if (result.count("channels")) cfg.source.num_channels.set(result["channels"].as<int>());
    if (result.count("frequencies")) cfg.source.num_frequencies.set(result["frequencies"].as<int>());
    if (result.count("buffer_size")) cfg.buffer.capacity.set(result["buffer_size"].as<size_t>());
    if (result.count("seed")) cfg.simulation.seed.set(result["seed"].as<size_t>());
    if (result.count("jam")) cfg.jamming.enabled.set(true);
    if (result.count("no_jam")) cfg.jamming.enabled.set(false);

    if (!config.validate()) {
        LOG(ERROR) << "Invalid configuration:";
        for (const auto& error : config.getValidationErrors()) {
            LOG(ERROR) << "  " << error;
        }
        return 1;
    }

    JitFhss::SimulationOptions sim_options = config.makeSimulationOptions();
    LOG(INFO) << "JIT-FHSS link: " << sim_options.source.num_channels << " channel(s), "
              << sim_options.source.num_frequencies << " frequencies in ["
              << sim_options.source.min_frequency / 1e9 << ", "
              << sim_options.source.max_frequency / 1e9 << "] GHz, buffer "
              << sim_options.participant.buffer_capacity;

    JitFhss::LinkSimulation simulation(sim_options);
    simulation.Run();
    simulation.LogSummary();

    return 0;
}

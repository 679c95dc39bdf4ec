#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <atomic>
#include <csignal>
#include <sstream>
#include <filesystem>
#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>
#include <Common.hpp>
#include <OFDMCore.hpp>
#include <LinkSimulation.hpp>

using namespace LinkSim;
using namespace LinkSim::Core;

namespace po = boost::program_options;
namespace fs = std::filesystem;

std::atomic<bool> stop_signal(false);

void signal_handler(int) {
    stop_signal.store(true);
}

namespace {

// Parse a comma-separated list of Eb/N0 values, e.g. "0,5,10"
bool parse_ebno_list(const std::string& text, std::vector<double>& out) {
    std::vector<double> values;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        try {
            size_t pos = 0;
            double v = std::stod(item, &pos);
            if (pos != item.size()) {
                std::cerr << "[Config] Invalid Eb/N0 value: " << item << std::endl;
                return false;
            }
            values.push_back(v);
        } catch (const std::exception&) {
            std::cerr << "[Config] Invalid Eb/N0 value: " << item << std::endl;
            return false;
        }
    }
    if (values.empty()) return false;
    out = values;
    return true;
}

void print_setup(const LinkSimulation& sim) {
    const Config& cfg = sim.config();
    const ResourceGrid& grid = sim.grid();
    const LDPCCode& code = sim.code();
    std::cout << "[Sim] Resource grid: " << grid.num_ofdm_symbols() << " OFDM symbols x "
              << grid.fft_size() << " subcarriers, CP " << grid.cp_length()
              << ", spacing " << grid.subcarrier_spacing() / 1e3 << " kHz" << std::endl;
    std::cout << "[Sim] Data elements: " << grid.num_data_symbols()
              << ", pilot elements: " << grid.num_pilot_symbols()
              << ", overhead: " << grid.overhead() << std::endl;
    std::cout << "[Sim] " << (size_t(1) << cfg.num_bits_per_symbol) << "-QAM, code (n=" << code.n()
              << ", k=" << code.k() << "), rate " << code.rate() << std::endl;
    std::cout << "[LDPC] Base graph " << code.base_graph()
              << (code.standard_base_graph() ? " (table " + cfg.ldpc_base_graph_dir + ")" : " (generated)")
              << ", kb=" << code.kb() << ", " << code.info_columns() << "+" << code.mb() << " columns"
              << ", Z=" << code.lifting_size() << " (iLS " << code.lifting_set_index() << ")"
              << ", filler " << code.num_filler_bits() << ", punctured " << code.num_punctured_bits() << std::endl;
    std::cout << "[Sim] Channel: " << cfg.channel_model << " (" << cfg.channel_domain << " domain), "
              << cfg.carrier_frequency / 1e9 << " GHz, " << cfg.ue_speed << " m/s, delay spread "
              << cfg.delay_spread * 1e9 << " ns, max Doppler " << sim.channel().max_doppler() << " Hz" << std::endl;
    std::cout << "[Sim] Receiver: " << (cfg.perfect_csi ? "perfect CSI" : cfg.interpolation + " interpolation")
              << ", " << (cfg.unbiased_equalizer ? "unbiased " : "") << "LMMSE, "
              << cfg.demapping_method << " demapping, " << cfg.check_node_rule << " BP with "
              << cfg.decoder_iterations << " iterations" << std::endl;
}

void print_shapes(const Transmission& t) {
    std::cout << "[Sim] Shape of info bits:       " << shape_to_string(t.info_bits.shape) << std::endl;
    std::cout << "[Sim] Shape of tx grid:         " << shape_to_string(t.tx_grid.shape) << std::endl;
    std::cout << "[Sim] Shape of rx grid:         " << shape_to_string(t.rx_grid.shape) << std::endl;
    std::cout << "[Sim] Shape of h_freq:          " << shape_to_string(t.h_freq.shape) << std::endl;
    std::cout << "[Sim] Shape of h_hat:           " << shape_to_string(t.rx.h_hat.shape) << std::endl;
    std::cout << "[Sim] Shape of x_hat:           " << shape_to_string(t.rx.x_hat.shape) << std::endl;
    std::cout << "[Sim] Shape of llr:             " << shape_to_string(t.rx.llr.shape) << std::endl;
    std::cout << "[Sim] Shape of decoded bits:    " << shape_to_string(t.rx.decoded_bits.shape) << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, &signal_handler);

    // Default config file path
    const std::string default_config_file = "LinkSimulator.yaml";
    Config cfg;

    // Parse command line arguments
    std::string config_file = default_config_file;
    std::string save_config = "";
    std::string ebno_list = "";
    std::string export_alist = "";
    std::string wisdom_file = "";
    double shapes_ebno = 10.0;

    po::options_description desc("Allowed options");
    desc.add_options()
        ("help", "help message")
        ("config,c", po::value<std::string>(&config_file)->default_value(default_config_file), "Config file path (default: LinkSimulator.yaml)")
        ("save-config,s", po::value<std::string>(&save_config)->implicit_value(""), "Save current config to file and exit (optionally specify filename)")
        ("num-ofdm-symbols", po::value<size_t>(&cfg.num_ofdm_symbols), "OFDM symbols per slot (default: 14)")
        ("fft-size", po::value<size_t>(&cfg.fft_size), "FFT size / subcarriers (default: 76)")
        ("subcarrier-spacing", po::value<double>(&cfg.subcarrier_spacing), "Subcarrier spacing in Hz (default: 30e3)")
        ("cp-length", po::value<size_t>(&cfg.cp_length), "CP length (default: 6)")
        ("guard-left", po::value<size_t>(&cfg.num_guard_left), "Guard carriers at the lower band edge (default: 0)")
        ("guard-right", po::value<size_t>(&cfg.num_guard_right), "Guard carriers at the upper band edge (default: 0)")
        ("dc-null", po::value<bool>(&cfg.dc_null), "Null the DC subcarrier (default: false)")
        ("pilot-pattern", po::value<std::string>(&cfg.pilot_pattern), "Pilot pattern: kronecker, custom or empty (default: kronecker)")
        ("pilot-symbols", po::value<std::vector<size_t>>()->multitoken(), "Pilot OFDM symbol indices (default: 2 11)")
        ("pilot-sequence", po::value<std::string>(&cfg.pilot_sequence), "Pilot sequence: qpsk or zc (default: qpsk)")
        ("zc-root", po::value<int>(&cfg.zc_root), "ZC root sequence (default: 29)")
        ("bits-per-symbol", po::value<size_t>(&cfg.num_bits_per_symbol), "Bits per QAM symbol (default: 2)")
        ("code-rate", po::value<double>(&cfg.code_rate), "LDPC code rate (default: 0.5)")
        ("ldpc-base-graph-dir", po::value<std::string>(&cfg.ldpc_base_graph_dir), "Directory with bg1.txt / bg2.txt LDPC shift tables (default: generated base graph)")
        ("batch-size", po::value<size_t>(&cfg.batch_size), "Batch size (default: 10)")
        ("channel-model", po::value<std::string>(&cfg.channel_model), "Channel model: cdl-c, rayleigh or awgn (default: cdl-c)")
        ("channel-domain", po::value<std::string>(&cfg.channel_domain), "Channel domain: freq or time (default: freq)")
        ("carrier-freq", po::value<double>(&cfg.carrier_frequency), "Carrier frequency (default: 2.6e9)")
        ("ue-speed", po::value<double>(&cfg.ue_speed), "UE speed in m/s (default: 10)")
        ("delay-spread", po::value<double>(&cfg.delay_spread), "Delay spread in s (default: 100e-9)")
        ("interpolation", po::value<std::string>(&cfg.interpolation), "Channel estimate interpolation: nn or lin (default: nn)")
        ("perfect-csi", po::value<bool>(&cfg.perfect_csi), "Use ground-truth channel at the receiver (default: false)")
        ("demapping", po::value<std::string>(&cfg.demapping_method), "Demapping method: app or maxlog (default: app)")
        ("decoder-iterations", po::value<int>(&cfg.decoder_iterations), "Max BP iterations (default: 20)")
        ("check-node-rule", po::value<std::string>(&cfg.check_node_rule), "Check node rule: boxplus or minsum (default: boxplus)")
        ("seed", po::value<uint32_t>(&cfg.seed), "Simulation seed (default: 42)")
        ("ebno", po::value<std::string>(&ebno_list), "Comma-separated Eb/N0 points in dB (default: 0,5,10,15,20)")
        ("mc-iterations", po::value<size_t>(&cfg.max_mc_iterations), "Batches per Eb/N0 point (default: 1)")
        ("target-block-errors", po::value<size_t>(&cfg.target_block_errors), "Stop a point after this many block errors, 0 = never (default: 0)")
        ("early-stop", po::value<bool>(&cfg.sweep_early_stop), "Stop the sweep after the first error-free point (default: false)")
        ("shapes-ebno", po::value<double>(&shapes_ebno)->default_value(10.0), "Eb/N0 of the transmission whose tensor shapes are printed")
        ("export-alist", po::value<std::string>(&export_alist), "Write the parity-check matrix as alist and continue")
        ("fftw-wisdom", po::value<std::string>(&wisdom_file), "FFTW wisdom file to import and export")
        ("profiling-modules", po::value<std::string>(&cfg.profiling_modules), "Comma-separated modules to profile");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }

    // Load config from YAML file (if exists), then CLI args override
    if (fs::exists(config_file)) {
        if (load_config_from_yaml(cfg, config_file)) {
            std::cout << "[Config] Loaded config from: " << config_file << std::endl;
        } else {
            std::cerr << "[Config] Failed to load " << config_file << ", exiting." << std::endl;
            return 1;
        }
    } else if (config_file == default_config_file) {
        // Auto-create default config file with current defaults
        if (save_config_to_yaml(cfg, config_file)) {
            std::cout << "[Config] Config file '" << config_file << "' not found. Created with default values." << std::endl;
        }
    } else {
        std::cerr << "[Config] Config file '" << config_file << "' not found, using defaults." << std::endl;
    }

    // Re-parse CLI to override YAML values (only update options explicitly provided in CLI)
    vm.clear();
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("pilot-symbols")) {
        cfg.pilot_ofdm_symbol_indices = vm["pilot-symbols"].as<std::vector<size_t>>();
    }
    if (vm.count("ebno")) {
        if (!parse_ebno_list(ebno_list, cfg.ebno_db)) {
            std::cerr << "[Config] No valid Eb/N0 points in '" << ebno_list << "'" << std::endl;
            return 1;
        }
    }

    // Handle --save-config option
    if (vm.count("save-config")) {
        std::string output_file = config_file;
        if (!save_config.empty()) {
            output_file = save_config;
        }
        if (save_config_to_yaml(cfg, output_file)) {
            std::cout << "[Config] Config saved to: " << output_file << std::endl;
            return 0;
        }
        return 1;
    }

    if (!wisdom_file.empty()) FFTWManager::import_wisdom(wisdom_file);

    try {
        LinkSimulation sim(cfg);
        sim.set_stop_flag(&stop_signal);
        print_setup(sim);

        if (!export_alist.empty()) {
            sim.code().parity_check_matrix().write_alist(export_alist);
            std::cout << "[LDPC] Parity-check matrix written to: " << export_alist << std::endl;
        }

        Transmission t;
        sim.transmit(shapes_ebno, 0, t);
        print_shapes(t);
        const ErrorStats shape_stats = LinkSimulation::count_errors(t.info_bits, t.rx.decoded_bits);
        std::cout << "[Sim] BER at " << shapes_ebno << " dB: " << shape_stats.ber() << std::endl;

        std::cout << std::endl;
        sim.sweep(cfg.ebno_db, true);
        if (stop_signal.load()) std::cout << "[Sim] Interrupted." << std::endl;
    } catch (const ConfigurationError& e) {
        std::cerr << "[Sim] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Sim] Error: " << e.what() << std::endl;
        return 1;
    }

    if (!wisdom_file.empty()) FFTWManager::export_wisdom(wisdom_file);
    return 0;
}

#ifndef COMMON_HPP
#define COMMON_HPP

#include <vector>
#include <complex>
#include <memory>
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <cstdint>
#include <cmath>
#include <stdexcept>
#include <limits>
#include <string>
#include <utility>
#include <algorithm>
#include <filesystem>
#include <yaml-cpp/yaml.h>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

#ifndef M_SQRT1_2
#define M_SQRT1_2 0.70710678118654752440
#endif


/**
 * @brief STL-compliant Aligned Memory Allocator.
 *
 * Ensures that allocated memory is aligned to specific boundaries (default 64 bytes).
 * FFTW new-array execution and the SIMD loops of the cores rely on this alignment.
 */
template <typename T, size_t Alignment = 64>
class AlignedAllocator {
public:
    using value_type = T;
    using pointer = T*;
    using const_pointer = const T*;
    using size_type = size_t;

    template <class U>
    struct rebind {
        using other = AlignedAllocator<U, Alignment>;
    };

    AlignedAllocator() = default;
    template <class U>
    AlignedAllocator(const AlignedAllocator<U, Alignment>&) {}

    bool operator==(const AlignedAllocator&) const { return true; }
    bool operator!=(const AlignedAllocator& other) const { return !(*this == other); }

    pointer allocate(size_type n) {
        if (n > (std::numeric_limits<size_type>::max() / sizeof(value_type))) {
            throw std::bad_alloc();
        }
        size_type bytes = n * sizeof(value_type);
        size_type aligned_bytes = (bytes + Alignment - 1) & ~(Alignment - 1);
        if (aligned_bytes == 0) aligned_bytes = Alignment;
        void* ptr = std::aligned_alloc(Alignment, aligned_bytes);
        if (!ptr) throw std::bad_alloc();
        return static_cast<pointer>(ptr);
    }

    void deallocate(pointer p, size_type) { std::free(p); }
};

// Type Definitions (64-byte alignment for AVX-512 optimization)
using AlignedVector = std::vector<std::complex<float>, AlignedAllocator<std::complex<float>, 64>>;
using AlignedFloatVector = std::vector<float, AlignedAllocator<float, 64>>;
using AlignedIntVector = std::vector<int, AlignedAllocator<int, 64>>;
using AlignedByteVector = std::vector<uint8_t, AlignedAllocator<uint8_t, 64>>;
using SymbolVector = std::vector<AlignedVector>;

/**
 * @brief Raised when configuration values are invalid or inconsistent.
 *
 * Thrown only while components are being constructed. Once construction succeeded,
 * the per-batch processing functions are total over correctly shaped inputs.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error("Configuration error: " + what) {}
};

/**
 * @brief Dense row-major batch tensor with an explicit shape.
 *
 * Used as the typed data contract between transmitter, channel and receiver:
 * - bit tensors:  [batch, num_tx, num_streams_per_tx, num_bits]
 * - grid tensors: [batch, num_ofdm_symbols, fft_size]
 * The leading dimension is always the batch dimension.
 */
template <typename T>
struct BatchTensor {
    std::vector<size_t> shape;
    std::vector<T, AlignedAllocator<T, 64>> data;

    BatchTensor() = default;
    explicit BatchTensor(std::vector<size_t> dims)
        : shape(std::move(dims))
    {
        data.assign(element_count(shape), T{});
    }

    static size_t element_count(const std::vector<size_t>& dims) {
        if (dims.empty()) return 0;
        size_t n = 1;
        for (auto d : dims) n *= d;
        return n;
    }

    size_t batch_size() const { return shape.empty() ? 0 : shape[0]; }

    // Number of elements per batch entry
    size_t stride() const {
        if (shape.empty() || shape[0] == 0) return 0;
        return data.size() / shape[0];
    }

    T* batch_ptr(size_t b) { return data.data() + b * stride(); }
    const T* batch_ptr(size_t b) const { return data.data() + b * stride(); }
};

using BitTensor = BatchTensor<uint8_t>;
using LLRTensor = BatchTensor<float>;
using RealTensor = BatchTensor<float>;
using ComplexTensor = BatchTensor<std::complex<float>>;

inline std::string shape_to_string(const std::vector<size_t>& shape) {
    std::string s = "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i) s += ", ";
        s += std::to_string(shape[i]);
    }
    return s + ")";
}

/**
 * @brief System Configuration Structure.
 *
 * Holds all configurable parameters of the link simulation: resource grid geometry,
 * modulation and coding, channel model, receiver algorithms, LDPC decoder settings and
 * the Eb/N0 sweep. Defaults reproduce the reference scenario (14 x 76 grid at 30 kHz,
 * pilots on OFDM symbols 2 and 11, 4-QAM, rate 1/2, CDL-C at 2.6 GHz and 10 m/s).
 */
struct Config {
    // Resource grid
    size_t num_ofdm_symbols = 14;      // OFDM symbols per slot
    size_t fft_size = 76;              // Subcarriers (FFT size)
    double subcarrier_spacing = 30e3;  // Subcarrier spacing [Hz]
    size_t cp_length = 6;              // Cyclic prefix length [samples]
    size_t num_guard_left = 0;         // Guard carriers at the lower band edge
    size_t num_guard_right = 0;        // Guard carriers at the upper band edge
    bool dc_null = false;              // Null the DC subcarrier
    std::string pilot_pattern = "kronecker";   // kronecker, custom or empty
    std::vector<size_t> pilot_ofdm_symbol_indices = {2, 11};
    std::vector<std::pair<size_t, size_t>> custom_pilot_positions;  // (symbol, subcarrier)
    std::string pilot_sequence = "qpsk";       // qpsk or zc
    uint32_t pilot_seed = 1;
    int zc_root = 29;                  // Zadoff-Chu root for zc pilots

    // Modulation and coding
    size_t num_bits_per_symbol = 2;
    double code_rate = 0.5;
    size_t batch_size = 10;
    uint32_t interleaver_seed = 1234;

    // Channel
    std::string channel_model = "cdl-c";   // cdl-c, rayleigh or awgn
    std::string channel_domain = "freq";   // freq or time
    double carrier_frequency = 2.6e9;      // [Hz]
    double ue_speed = 10.0;                // [m/s]
    double delay_spread = 100e-9;          // [s]
    bool normalize_channel = true;

    // Receiver
    std::string interpolation = "nn";      // nn or lin
    bool perfect_csi = false;
    bool unbiased_equalizer = false;
    std::string demapping_method = "app";  // app or maxlog

    // LDPC decoder
    int decoder_iterations = 20;
    std::string check_node_rule = "boxplus";   // boxplus or minsum
    bool decoder_early_stop = true;
    uint32_t ldpc_seed = 7;                    // Base graph shift generator seed
    std::string ldpc_base_graph_dir;           // bg1.txt / bg2.txt shift tables, empty = generated

    // Simulation
    uint32_t seed = 42;
    std::vector<double> ebno_db = {0.0, 5.0, 10.0, 15.0, 20.0};
    size_t max_mc_iterations = 1;          // Batches per Eb/N0 point
    size_t target_block_errors = 0;        // Stop a point early (0 = never)
    bool sweep_early_stop = false;         // Stop sweep after first error-free point
    std::string profiling_modules = "";    // Comma-separated: transmitter, channel, estimation, equalization, demapping, decoding or "all"

    // Check if a specific module should be profiled
    bool should_profile(const std::string& module) const {
        if (profiling_modules.empty()) return false;
        if (profiling_modules == "all") return true;
        return profiling_modules.find(module) != std::string::npos;
    }

    // Samples per OFDM symbol including cyclic prefix
    size_t samples_per_symbol() const {
        return fft_size + cp_length;
    }

    // Sample rate implied by FFT size and subcarrier spacing
    double sample_rate() const {
        return static_cast<double>(fft_size) * subcarrier_spacing;
    }
};

/**
 * @brief Save config to YAML file.
 * @return false if the file cannot be written
 */
inline bool save_config_to_yaml(const Config& cfg, const std::string& filepath) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "num_ofdm_symbols" << YAML::Value << cfg.num_ofdm_symbols;
    out << YAML::Key << "fft_size" << YAML::Value << cfg.fft_size;
    out << YAML::Key << "subcarrier_spacing" << YAML::Value << cfg.subcarrier_spacing;
    out << YAML::Key << "cp_length" << YAML::Value << cfg.cp_length;
    out << YAML::Key << "num_guard_left" << YAML::Value << cfg.num_guard_left;
    out << YAML::Key << "num_guard_right" << YAML::Value << cfg.num_guard_right;
    out << YAML::Key << "dc_null" << YAML::Value << cfg.dc_null;
    out << YAML::Key << "pilot_pattern" << YAML::Value << cfg.pilot_pattern;
    out << YAML::Key << "pilot_ofdm_symbol_indices" << YAML::Value << YAML::Flow << cfg.pilot_ofdm_symbol_indices;
    out << YAML::Key << "custom_pilot_positions" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : cfg.custom_pilot_positions) {
        out << YAML::Flow << YAML::BeginSeq << p.first << p.second << YAML::EndSeq;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "pilot_sequence" << YAML::Value << cfg.pilot_sequence;
    out << YAML::Key << "pilot_seed" << YAML::Value << cfg.pilot_seed;
    out << YAML::Key << "zc_root" << YAML::Value << cfg.zc_root;
    out << YAML::Key << "num_bits_per_symbol" << YAML::Value << cfg.num_bits_per_symbol;
    out << YAML::Key << "code_rate" << YAML::Value << cfg.code_rate;
    out << YAML::Key << "batch_size" << YAML::Value << cfg.batch_size;
    out << YAML::Key << "interleaver_seed" << YAML::Value << cfg.interleaver_seed;
    out << YAML::Key << "channel_model" << YAML::Value << cfg.channel_model;
    out << YAML::Key << "channel_domain" << YAML::Value << cfg.channel_domain;
    out << YAML::Key << "carrier_frequency" << YAML::Value << cfg.carrier_frequency;
    out << YAML::Key << "ue_speed" << YAML::Value << cfg.ue_speed;
    out << YAML::Key << "delay_spread" << YAML::Value << cfg.delay_spread;
    out << YAML::Key << "normalize_channel" << YAML::Value << cfg.normalize_channel;
    out << YAML::Key << "interpolation" << YAML::Value << cfg.interpolation;
    out << YAML::Key << "perfect_csi" << YAML::Value << cfg.perfect_csi;
    out << YAML::Key << "unbiased_equalizer" << YAML::Value << cfg.unbiased_equalizer;
    out << YAML::Key << "demapping_method" << YAML::Value << cfg.demapping_method;
    out << YAML::Key << "decoder_iterations" << YAML::Value << cfg.decoder_iterations;
    out << YAML::Key << "check_node_rule" << YAML::Value << cfg.check_node_rule;
    out << YAML::Key << "decoder_early_stop" << YAML::Value << cfg.decoder_early_stop;
    out << YAML::Key << "ldpc_seed" << YAML::Value << cfg.ldpc_seed;
    out << YAML::Key << "ldpc_base_graph_dir" << YAML::Value << cfg.ldpc_base_graph_dir;
    out << YAML::Key << "seed" << YAML::Value << cfg.seed;
    out << YAML::Key << "ebno_db" << YAML::Value << YAML::Flow << cfg.ebno_db;
    out << YAML::Key << "max_mc_iterations" << YAML::Value << cfg.max_mc_iterations;
    out << YAML::Key << "target_block_errors" << YAML::Value << cfg.target_block_errors;
    out << YAML::Key << "sweep_early_stop" << YAML::Value << cfg.sweep_early_stop;
    out << YAML::Key << "profiling_modules" << YAML::Value << cfg.profiling_modules;
    out << YAML::EndMap;

    std::ofstream fout(filepath);
    if (!fout) {
        std::cerr << "[Config] Error: Cannot write to config file: " << filepath << std::endl;
        return false;
    }
    fout << out.c_str();
    fout.close();
    return true;
}

/**
 * @brief Load config from YAML file. Keys that are absent keep their current value.
 * @return false if the file does not exist or cannot be parsed
 */
inline bool load_config_from_yaml(Config& cfg, const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        return false;
    }
    try {
        YAML::Node config = YAML::LoadFile(filepath);
        if (config["num_ofdm_symbols"]) cfg.num_ofdm_symbols = config["num_ofdm_symbols"].as<size_t>();
        if (config["fft_size"]) cfg.fft_size = config["fft_size"].as<size_t>();
        if (config["subcarrier_spacing"]) cfg.subcarrier_spacing = config["subcarrier_spacing"].as<double>();
        if (config["cp_length"]) cfg.cp_length = config["cp_length"].as<size_t>();
        if (config["num_guard_left"]) cfg.num_guard_left = config["num_guard_left"].as<size_t>();
        if (config["num_guard_right"]) cfg.num_guard_right = config["num_guard_right"].as<size_t>();
        if (config["dc_null"]) cfg.dc_null = config["dc_null"].as<bool>();
        if (config["pilot_pattern"]) cfg.pilot_pattern = config["pilot_pattern"].as<std::string>();
        if (config["pilot_ofdm_symbol_indices"]) cfg.pilot_ofdm_symbol_indices = config["pilot_ofdm_symbol_indices"].as<std::vector<size_t>>();
        if (config["custom_pilot_positions"]) {
            cfg.custom_pilot_positions.clear();
            for (const auto& node : config["custom_pilot_positions"]) {
                auto pos = node.as<std::vector<size_t>>();
                if (pos.size() != 2) {
                    std::cerr << "[Config] Error: custom_pilot_positions entries must be [symbol, subcarrier]" << std::endl;
                    return false;
                }
                cfg.custom_pilot_positions.emplace_back(pos[0], pos[1]);
            }
        }
        if (config["pilot_sequence"]) cfg.pilot_sequence = config["pilot_sequence"].as<std::string>();
        if (config["pilot_seed"]) cfg.pilot_seed = config["pilot_seed"].as<uint32_t>();
        if (config["zc_root"]) cfg.zc_root = config["zc_root"].as<int>();
        if (config["num_bits_per_symbol"]) cfg.num_bits_per_symbol = config["num_bits_per_symbol"].as<size_t>();
        if (config["code_rate"]) cfg.code_rate = config["code_rate"].as<double>();
        if (config["batch_size"]) cfg.batch_size = config["batch_size"].as<size_t>();
        if (config["interleaver_seed"]) cfg.interleaver_seed = config["interleaver_seed"].as<uint32_t>();
        if (config["channel_model"]) cfg.channel_model = config["channel_model"].as<std::string>();
        if (config["channel_domain"]) cfg.channel_domain = config["channel_domain"].as<std::string>();
        if (config["carrier_frequency"]) cfg.carrier_frequency = config["carrier_frequency"].as<double>();
        if (config["ue_speed"]) cfg.ue_speed = config["ue_speed"].as<double>();
        if (config["delay_spread"]) cfg.delay_spread = config["delay_spread"].as<double>();
        if (config["normalize_channel"]) cfg.normalize_channel = config["normalize_channel"].as<bool>();
        if (config["interpolation"]) cfg.interpolation = config["interpolation"].as<std::string>();
        if (config["perfect_csi"]) cfg.perfect_csi = config["perfect_csi"].as<bool>();
        if (config["unbiased_equalizer"]) cfg.unbiased_equalizer = config["unbiased_equalizer"].as<bool>();
        if (config["demapping_method"]) cfg.demapping_method = config["demapping_method"].as<std::string>();
        if (config["decoder_iterations"]) cfg.decoder_iterations = config["decoder_iterations"].as<int>();
        if (config["check_node_rule"]) cfg.check_node_rule = config["check_node_rule"].as<std::string>();
        if (config["decoder_early_stop"]) cfg.decoder_early_stop = config["decoder_early_stop"].as<bool>();
        if (config["ldpc_seed"]) cfg.ldpc_seed = config["ldpc_seed"].as<uint32_t>();
        if (config["ldpc_base_graph_dir"]) cfg.ldpc_base_graph_dir = config["ldpc_base_graph_dir"].as<std::string>();
        if (config["seed"]) cfg.seed = config["seed"].as<uint32_t>();
        if (config["ebno_db"]) cfg.ebno_db = config["ebno_db"].as<std::vector<double>>();
        if (config["max_mc_iterations"]) cfg.max_mc_iterations = config["max_mc_iterations"].as<size_t>();
        if (config["target_block_errors"]) cfg.target_block_errors = config["target_block_errors"].as<size_t>();
        if (config["sweep_early_stop"]) cfg.sweep_early_stop = config["sweep_early_stop"].as<bool>();
        if (config["profiling_modules"]) cfg.profiling_modules = config["profiling_modules"].as<std::string>();
        return true;
    } catch (const YAML::Exception& e) {
        std::cerr << "[Config] Error parsing YAML config: " << e.what() << std::endl;
        return false;
    }
}

/**
 * @brief Derive an independent 32-bit seed for one batch element and one random stream.
 *
 * Keeps every random draw a function of (seed, batch index, stream) only, so results
 * do not change with the number of OpenMP threads.
 */
inline uint32_t derive_seed(uint32_t seed, size_t batch_index, uint32_t stream) {
    uint64_t x = (static_cast<uint64_t>(seed) << 32) ^ (static_cast<uint64_t>(batch_index) * 0x9E3779B97F4A7C15ull) ^ stream;
    // splitmix64 finalizer
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    x = x ^ (x >> 31);
    return static_cast<uint32_t>(x ^ (x >> 32));
}

#endif // COMMON_HPP

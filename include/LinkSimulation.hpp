#ifndef LINK_SIMULATION_HPP
#define LINK_SIMULATION_HPP

#include <vector>
#include <memory>
#include <atomic>
#include <chrono>
#include <iostream>
#include <iomanip>
#include <Common.hpp>
#include <OFDMCore.hpp>
#include <LDPCCode.hpp>
#include <LDPCBPDecoder.hpp>
#include <ResourceGrid.hpp>
#include <TransmitterCore.hpp>
#include <ChannelCore.hpp>
#include <ReceiverCore.hpp>

namespace LinkSim {
namespace Core {

    /**
     * @brief Error counts accumulated over one or more batches.
     */
    struct ErrorStats {
        size_t bit_errors = 0;
        size_t num_bits = 0;
        size_t block_errors = 0;
        size_t num_blocks = 0;

        double ber() const { return num_bits ? static_cast<double>(bit_errors) / static_cast<double>(num_bits) : 0.0; }
        double bler() const { return num_blocks ? static_cast<double>(block_errors) / static_cast<double>(num_blocks) : 0.0; }

        ErrorStats& operator+=(const ErrorStats& o) {
            bit_errors += o.bit_errors;
            num_bits += o.num_bits;
            block_errors += o.block_errors;
            num_blocks += o.num_blocks;
            return *this;
        }
    };

    struct SweepPoint {
        double ebno_db = 0.0;
        ErrorStats stats;
        size_t batches = 0;
        double elapsed_s = 0.0;
        bool interrupted = false;   // stop flag raised, stats hold completed batches only
    };

    /**
     * @brief All tensors of one transmission through transmitter, channel and receiver.
     */
    struct Transmission {
        BitTensor info_bits;         // [B, 1, 1, k]
        ComplexTensor tx_grid;       // [B, S, F]
        ComplexTensor rx_grid;       // [B, S, F]
        ComplexTensor h_freq;        // [B, S, F]
        ReceiverCore::RxResult rx;
    };

    /**
     * @brief End-to-end link simulation built from a Config.
     *
     * Owns the resource grid, constellation, LDPC code and interleaver permutation and
     * hands the same values to transmitter and receiver. Random realizations depend
     * only on the Monte-Carlo iteration index, so every Eb/N0 point of a sweep sees the
     * same bits, channels and noise shapes.
     */
    class LinkSimulation {
    public:
        explicit LinkSimulation(const Config& cfg)
            : _cfg(cfg),
              _grid(ResourceGrid::params_from_config(cfg)),
              _constellation(cfg.num_bits_per_symbol),
              _code(_make_code(cfg, _grid)),
              _interleaver(_code.n(), cfg.interleaver_seed)
        {
            if (cfg.batch_size == 0) throw ConfigurationError("batch_size must be positive");

            TransmitterCore::Params tx_params;
            tx_params.seed = cfg.seed;
            _transmitter = std::make_unique<TransmitterCore>(_grid, _constellation, _code, _interleaver, tx_params);

            ChannelCore::Params ch_params;
            ch_params.model = ChannelCore::parse_model(cfg.channel_model);
            ch_params.domain = ChannelCore::parse_domain(cfg.channel_domain);
            ch_params.carrier_frequency = cfg.carrier_frequency;
            ch_params.ue_speed = cfg.ue_speed;
            ch_params.delay_spread = cfg.delay_spread;
            ch_params.normalize_channel = cfg.normalize_channel;
            ch_params.seed = cfg.seed;
            _channel = std::make_unique<ChannelCore>(_grid, ch_params);

            ReceiverCore::Params rx_params;
            rx_params.estimator.interpolation = ChannelEstimatorCore::parse_interpolation(cfg.interpolation);
            rx_params.equalizer.unbiased = cfg.unbiased_equalizer;
            rx_params.demapper.method = SoftDemapperCore::parse_method(cfg.demapping_method);
            rx_params.decoder.max_iterations = cfg.decoder_iterations;
            rx_params.decoder.rule = LDPCBPDecoder::parse_rule(cfg.check_node_rule);
            rx_params.decoder.early_stop = cfg.decoder_early_stop;
            rx_params.perfect_csi = cfg.perfect_csi;
            rx_params.code_rate = cfg.code_rate;
            _receiver = std::make_unique<ReceiverCore>(_grid, _constellation, _code, _interleaver,
                                                       StreamManagement(), rx_params);
        }

        const Config& config() const { return _cfg; }
        const ResourceGrid& grid() const { return _grid; }
        const QAMConstellation& constellation() const { return _constellation; }
        const LDPCCode& code() const { return _code; }
        const RandomInterleaver& interleaver() const { return _interleaver; }
        const TransmitterCore& transmitter() const { return *_transmitter; }
        const ChannelCore& channel() const { return *_channel; }
        const ReceiverCore& receiver() const { return *_receiver; }

        void set_stop_flag(const std::atomic<bool>* stop) { _stop = stop; }

        /**
         * @brief Run one batch through the whole chain and keep every tensor.
         */
        void transmit(double ebno_db, size_t iteration, Transmission& out) const {
            using ProfileClock = std::chrono::high_resolution_clock;

            auto t0 = ProfileClock::now();
            _transmitter->process(_cfg.batch_size, iteration, out.info_bits, out.tx_grid);
            auto t1 = ProfileClock::now();

            const float n0 = static_cast<float>(_receiver->noise_variance(ebno_db));
            _channel->apply(out.tx_grid, n0, iteration, out.rx_grid, out.h_freq);
            auto t2 = ProfileClock::now();

            _receiver->receive(out.rx_grid, ebno_db, out.rx, &out.h_freq, _stop);

            if (_cfg.should_profile("transmitter")) {
                std::cout << "[Profile] Transmitter: " << std::chrono::duration<double, std::micro>(t1 - t0).count() << " us" << std::endl;
            }
            if (_cfg.should_profile("channel")) {
                std::cout << "[Profile] Channel: " << std::chrono::duration<double, std::micro>(t2 - t1).count() << " us" << std::endl;
            }
            if (_cfg.should_profile("estimation")) {
                std::cout << "[Profile] Estimation: " << out.rx.timing.estimation_us << " us" << std::endl;
            }
            if (_cfg.should_profile("equalization")) {
                std::cout << "[Profile] Equalization: " << out.rx.timing.equalization_us << " us" << std::endl;
            }
            if (_cfg.should_profile("demapping")) {
                std::cout << "[Profile] Demapping: " << out.rx.timing.demapping_us << " us" << std::endl;
            }
            if (_cfg.should_profile("decoding")) {
                std::cout << "[Profile] Decoding: " << out.rx.timing.decoding_us << " us" << std::endl;
            }
        }

        /**
         * @brief Run one batch and count bit and block errors against the info bits.
         */
        ErrorStats run(double ebno_db, size_t iteration) const {
            Transmission t;
            transmit(ebno_db, iteration, t);
            return count_errors(t.info_bits, t.rx.decoded_bits);
        }

        static ErrorStats count_errors(const BitTensor& reference, const BitTensor& decoded) {
            if (reference.shape != decoded.shape) {
                throw std::invalid_argument("count_errors: shape mismatch " + shape_to_string(reference.shape) +
                                            " vs " + shape_to_string(decoded.shape));
            }
            ErrorStats stats;
            const size_t B = reference.batch_size();
            const size_t L = reference.stride();
            for (size_t b = 0; b < B; ++b) {
                const uint8_t* r = reference.batch_ptr(b);
                const uint8_t* d = decoded.batch_ptr(b);
                size_t errors = 0;
                for (size_t i = 0; i < L; ++i) errors += (r[i] != d[i]) ? 1 : 0;
                stats.bit_errors += errors;
                stats.block_errors += errors ? 1 : 0;
            }
            stats.num_bits = B * L;
            stats.num_blocks = B;
            return stats;
        }

        /**
         * @brief BER/BLER over a list of Eb/N0 points.
         *
         * Each point runs up to max_mc_iterations batches and stops early once
         * target_block_errors block errors were counted (0 disables). With
         * sweep_early_stop the sweep ends after the first point without errors.
         * A raised stop flag ends the sweep; the batch it cut short is discarded and
         * the point is marked interrupted.
         */
        std::vector<SweepPoint> sweep(const std::vector<double>& ebno_db, bool verbose = false) const {
            std::vector<SweepPoint> points;
            if (verbose) print_table_header();
            for (const double ebno : ebno_db) {
                SweepPoint pt;
                pt.ebno_db = ebno;
                auto start = std::chrono::steady_clock::now();
                for (size_t it = 0; it < std::max<size_t>(1, _cfg.max_mc_iterations); ++it) {
                    if (_stop && _stop->load()) {
                        pt.interrupted = true;
                        break;
                    }
                    const ErrorStats batch = run(ebno, it);
                    if (_stop && _stop->load()) {
                        pt.interrupted = true;
                        break;
                    }
                    pt.stats += batch;
                    pt.batches++;
                    if (_cfg.target_block_errors > 0 && pt.stats.block_errors >= _cfg.target_block_errors) break;
                }
                pt.elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
                points.push_back(pt);
                if (verbose) print_table_row(pt);
                if (pt.interrupted) break;
                if (_cfg.sweep_early_stop && pt.stats.block_errors == 0) {
                    if (verbose) std::cout << "[Sim] No errors at " << ebno << " dB, stopping sweep." << std::endl;
                    break;
                }
            }
            return points;
        }

        static void print_table_header() {
            std::cout << std::setw(10) << "EbNo [dB]" << " |"
                      << std::setw(12) << "BER" << " |"
                      << std::setw(12) << "BLER" << " |"
                      << std::setw(11) << "bit errors" << " |"
                      << std::setw(11) << "num bits" << " |"
                      << std::setw(12) << "block errors" << " |"
                      << std::setw(11) << "num blocks" << " |"
                      << std::setw(10) << "time [s]" << std::endl;
            std::cout << std::string(110, '-') << std::endl;
        }

        static void print_table_row(const SweepPoint& pt) {
            std::cout << std::setw(10) << std::fixed << std::setprecision(2) << pt.ebno_db << " |"
                      << std::setw(12) << std::scientific << std::setprecision(4) << pt.stats.ber() << " |"
                      << std::setw(12) << pt.stats.bler() << " |"
                      << std::setw(11) << pt.stats.bit_errors << " |"
                      << std::setw(11) << pt.stats.num_bits << " |"
                      << std::setw(12) << pt.stats.block_errors << " |"
                      << std::setw(11) << pt.stats.num_blocks << " |"
                      << std::setw(10) << std::fixed << std::setprecision(2) << pt.elapsed_s
                      << (pt.interrupted ? "  (interrupted)" : "") << std::endl;
            std::cout.unsetf(std::ios::floatfield);
        }

    private:
        Config _cfg;
        ResourceGrid _grid;
        QAMConstellation _constellation;
        LDPCCode _code;
        RandomInterleaver _interleaver;
        std::unique_ptr<TransmitterCore> _transmitter;
        std::unique_ptr<ChannelCore> _channel;
        std::unique_ptr<ReceiverCore> _receiver;
        const std::atomic<bool>* _stop = nullptr;

        static LDPCCode _make_code(const Config& cfg, const ResourceGrid& grid) {
            if (!(cfg.code_rate > 0.0) || cfg.code_rate >= 1.0) {
                throw ConfigurationError("code_rate must be in (0, 1), got " + std::to_string(cfg.code_rate));
            }
            const size_t n = grid.num_data_symbols() * cfg.num_bits_per_symbol;
            const size_t k = static_cast<size_t>(std::floor(static_cast<double>(n) * cfg.code_rate));
            if (k == 0) {
                throw ConfigurationError("code_rate " + std::to_string(cfg.code_rate) + " leaves no information bits for " +
                                         std::to_string(n) + " coded bits");
            }
            LDPCCode::Params p;
            p.k = k;
            p.n = n;
            p.seed = cfg.ldpc_seed;
            p.base_graph_dir = cfg.ldpc_base_graph_dir;
            return LDPCCode(p);
        }
    };

} // namespace Core
} // namespace LinkSim

#endif // LINK_SIMULATION_HPP

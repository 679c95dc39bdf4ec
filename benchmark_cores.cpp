#include <iostream>
#include <vector>
#include <chrono>
#include <cmath>
#include <memory>
#include <string>
#include <complex>
#include <cstdlib>
#include <algorithm>
#include "Common.hpp"
#include "OFDMCore.hpp"
#include "LDPCCode.hpp"
#include "TransmitterCore.hpp"
#include "ChannelCore.hpp"
#include "ReceiverCore.hpp"

using namespace LinkSim;
using namespace LinkSim::Core;

int main(int argc, char* argv[]) {
    std::cout << "Starting Core Benchmark..." << std::endl;

    int num_iterations = 100;
    if (argc > 1) num_iterations = std::max(1, std::atoi(argv[1]));

    // Parameters
    Config cfg;
    cfg.batch_size = 64;
    cfg.channel_domain = "time";
    const double ebno_db = 5.0;

    try {
        // 1. Resource grid and shared coding values
        ResourceGrid grid(ResourceGrid::params_from_config(cfg));
        QAMConstellation constellation(cfg.num_bits_per_symbol);
        LDPCCode::Params code_params;
        code_params.n = grid.num_data_symbols() * cfg.num_bits_per_symbol;
        code_params.k = static_cast<size_t>(std::floor(code_params.n * cfg.code_rate));
        code_params.seed = cfg.ldpc_seed;
        code_params.base_graph_dir = cfg.ldpc_base_graph_dir;
        LDPCCode code(code_params);
        RandomInterleaver interleaver(code.n(), cfg.interleaver_seed);

        // 2. Initialize Transmitter
        TransmitterCore::Params tx_params;
        tx_params.seed = cfg.seed;
        auto transmitter = std::make_unique<TransmitterCore>(grid, constellation, code, interleaver, tx_params);

        // 3. Initialize Channel
        ChannelCore::Params ch_params;
        ch_params.domain = ChannelCore::Domain::Time;
        ch_params.seed = cfg.seed;
        auto channel = std::make_unique<ChannelCore>(grid, ch_params);

        // 4. Initialize Receiver
        ReceiverCore::Params rx_params;
        auto receiver = std::make_unique<ReceiverCore>(grid, constellation, code, interleaver,
                                                       StreamManagement(), rx_params);

        std::cout << "Grid " << grid.num_ofdm_symbols() << "x" << grid.fft_size()
                  << ", code (" << code.n() << ", " << code.k() << "), Z=" << code.lifting_size()
                  << ", batch " << cfg.batch_size << std::endl;
        std::cout << "Running " << num_iterations << " iterations..." << std::endl;

        BitTensor info_bits;
        ComplexTensor tx_grid, rx_grid, h_freq;
        ReceiverCore::RxResult rx;
        const float n0 = static_cast<float>(receiver->noise_variance(ebno_db));

        double tx_us = 0.0, ch_us = 0.0;
        ReceiverCore::StageTiming rx_total;
        size_t bit_errors = 0;

        auto start_time = std::chrono::high_resolution_clock::now();

        for (int i = 0; i < num_iterations; ++i) {
            auto t0 = std::chrono::high_resolution_clock::now();
            transmitter->process(cfg.batch_size, static_cast<size_t>(i), info_bits, tx_grid);
            auto t1 = std::chrono::high_resolution_clock::now();
            channel->apply(tx_grid, n0, static_cast<size_t>(i), rx_grid, h_freq);
            auto t2 = std::chrono::high_resolution_clock::now();
            receiver->receive(rx_grid, ebno_db, rx);

            tx_us += std::chrono::duration<double, std::micro>(t1 - t0).count();
            ch_us += std::chrono::duration<double, std::micro>(t2 - t1).count();
            rx_total.estimation_us += rx.timing.estimation_us;
            rx_total.equalization_us += rx.timing.equalization_us;
            rx_total.demapping_us += rx.timing.demapping_us;
            rx_total.decoding_us += rx.timing.decoding_us;

            for (size_t j = 0; j < info_bits.data.size(); ++j) {
                bit_errors += info_bits.data[j] != rx.decoded_bits.data[j] ? 1 : 0;
            }
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time).count();

        const double n = static_cast<double>(num_iterations);
        std::cout << "Total time: " << duration / 1000.0 << " ms" << std::endl;
        std::cout << "Avg time per batch: " << duration / n << " us" << std::endl;
        std::cout << "  Transmitter:  " << tx_us / n << " us" << std::endl;
        std::cout << "  Channel:      " << ch_us / n << " us" << std::endl;
        std::cout << "  Estimation:   " << rx_total.estimation_us / n << " us" << std::endl;
        std::cout << "  Equalization: " << rx_total.equalization_us / n << " us" << std::endl;
        std::cout << "  Demapping:    " << rx_total.demapping_us / n << " us" << std::endl;
        std::cout << "  Decoding:     " << rx_total.decoding_us / n << " us" << std::endl;
        std::cout << "BER at " << ebno_db << " dB: "
                  << static_cast<double>(bit_errors) / (n * static_cast<double>(cfg.batch_size * code.k())) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Benchmark failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

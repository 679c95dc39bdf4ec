// path: tests/test_link_simulation.cpp
#include "Common.hpp"
#include "LinkSimulation.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

using namespace LinkSim::Core;

template <typename F>
static bool throws_config_error(F&& f) {
    try {
        f();
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

int main() {
    // Reference scenario: 4-QAM, rate 0.5, 14 x 76 grid, pilots on symbols 2 and 11, batch 10
    {
        Config cfg;
        LinkSimulation sim(cfg);
        const size_t n = 12 * 76 * 2;
        const size_t k = n / 2;
        assert(sim.code().n() == n);
        assert(sim.code().k() == k);

        Transmission t;
        sim.transmit(10.0, 0, t);
        assert((t.info_bits.shape == std::vector<size_t>{10, 1, 1, k}));
        assert((t.tx_grid.shape == std::vector<size_t>{10, 14, 76}));
        assert(t.rx_grid.shape == t.tx_grid.shape);
        assert(t.h_freq.shape == t.tx_grid.shape);
        assert(t.rx.h_hat.shape == t.tx_grid.shape);
        assert((t.rx.x_hat.shape == std::vector<size_t>{10, 1, 1, 12 * 76}));
        assert((t.rx.llr.shape == std::vector<size_t>{10, 1, 1, n}));
        assert(t.rx.decoded_bits.shape == t.info_bits.shape);
        assert(t.rx.decoder_results.size() == 10);
        for (float v : t.rx.llr.data) assert(std::isfinite(v));

        const ErrorStats at10 = LinkSimulation::count_errors(t.info_bits, t.rx.decoded_bits);
        std::cout << "[INFO] BER at 10 dB = " << at10.ber() << std::endl;

        // BER does not increase with Eb/N0
        const std::vector<double> points = {0.0, 5.0, 10.0, 15.0, 20.0};
        const auto sweep = sim.sweep(points, true);
        assert(sweep.size() == points.size());
        for (size_t i = 0; i < sweep.size(); ++i) {
            assert(sweep[i].stats.num_bits == 10 * k);
            assert(sweep[i].stats.num_blocks == 10);
            if (i > 0) {
                assert(sweep[i].stats.ber() <= sweep[i - 1].stats.ber());
            }
        }
        assert(sweep.front().stats.ber() > sweep.back().stats.ber() || sweep.front().stats.ber() == 0.0);

        // Same iteration gives the same result
        const ErrorStats a = sim.run(5.0, 2);
        const ErrorStats b = sim.run(5.0, 2);
        assert(a.bit_errors == b.bit_errors && a.block_errors == b.block_errors);
    }

    // Small AWGN configuration decodes without errors at 20 dB
    {
        Config cfg;
        cfg.num_ofdm_symbols = 4;
        cfg.fft_size = 32;
        cfg.cp_length = 4;
        cfg.pilot_ofdm_symbol_indices = {1};
        cfg.channel_model = "awgn";
        cfg.batch_size = 8;
        LinkSimulation sim(cfg);
        const ErrorStats s = sim.run(20.0, 0);
        std::cout << "[INFO] AWGN 20 dB: " << s.bit_errors << " bit errors" << std::endl;
        assert(s.bit_errors == 0);
        assert(s.block_errors == 0);
    }

    // Perfect CSI, 16-QAM and the time-domain path
    {
        Config cfg;
        cfg.perfect_csi = true;
        cfg.num_bits_per_symbol = 4;
        cfg.channel_domain = "time";
        cfg.batch_size = 4;
        LinkSimulation sim(cfg);
        Transmission t;
        sim.transmit(25.0, 1, t);
        assert(t.rx.h_hat.data == t.h_freq.data);
        const ErrorStats s = LinkSimulation::count_errors(t.info_bits, t.rx.decoded_bits);
        std::cout << "[INFO] perfect CSI 16-QAM 25 dB BER = " << s.ber() << std::endl;
        assert(s.ber() < 1e-2);
    }

    // Linear interpolation, max-log demapping and min-sum decoding run end to end
    {
        Config cfg;
        cfg.interpolation = "lin";
        cfg.demapping_method = "maxlog";
        cfg.check_node_rule = "minsum";
        cfg.batch_size = 4;
        LinkSimulation sim(cfg);
        const ErrorStats s = sim.run(20.0, 0);
        assert(s.num_blocks == 4);
        assert(s.ber() < 1e-2);
    }

    // Sweep control: block-error target and early stop
    {
        Config cfg;
        cfg.channel_model = "awgn";
        cfg.batch_size = 2;
        cfg.max_mc_iterations = 5;
        cfg.target_block_errors = 1;
        cfg.sweep_early_stop = true;
        LinkSimulation sim(cfg);
        const auto pts = sim.sweep({-10.0, 20.0, 25.0});
        assert(pts.size() == 2);
        assert(pts[0].batches == 1);
        assert(pts[0].stats.block_errors >= 1);
        assert(pts[1].batches == 5);
        assert(pts[1].stats.block_errors == 0);
    }

    // A raised stop flag ends the sweep
    {
        Config cfg;
        cfg.batch_size = 2;
        LinkSimulation sim(cfg);
        std::atomic<bool> stop(true);
        sim.set_stop_flag(&stop);
        const auto pts = sim.sweep({0.0, 5.0});
        assert(pts.size() == 1);
        assert(pts[0].batches == 0);
        assert(pts[0].interrupted);
        assert(pts[0].stats.num_blocks == 0);
    }

    // Stop flag raised mid-sweep: the cut-short batch is dropped, completed batches are kept
    {
        Config cfg;
        cfg.batch_size = 2;
        cfg.max_mc_iterations = 1000;
        LinkSimulation sim(cfg);
        std::atomic<bool> stop(false);
        sim.set_stop_flag(&stop);
        std::thread stopper([&stop] {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            stop.store(true);
        });
        const auto pts = sim.sweep({0.0, 5.0});
        stopper.join();
        assert(pts.size() == 1);
        assert(pts[0].interrupted);
        assert(pts[0].batches < cfg.max_mc_iterations);
        std::cout << "[INFO] interrupted after " << pts[0].batches << " batches" << std::endl;

        stop.store(false);
        ErrorStats expected;
        for (size_t it = 0; it < pts[0].batches; ++it) expected += sim.run(0.0, it);
        assert(pts[0].stats.num_blocks == pts[0].batches * cfg.batch_size);
        assert(pts[0].stats.bit_errors == expected.bit_errors);
        assert(pts[0].stats.block_errors == expected.block_errors);
        assert(pts[0].stats.num_bits == expected.num_bits);
    }

    // Noise variance follows the configured code rate, not k / n after rounding
    {
        Config cfg;
        cfg.code_rate = 0.3;
        LinkSimulation sim(cfg);
        assert(sim.code().k() == 547);
        const double n0 = sim.receiver().noise_variance(5.0);
        const double expected = NoiseVarianceTranslator::ebno_to_n0(5.0, 2, 0.3, sim.grid().overhead());
        assert(std::abs(n0 - expected) <= 1e-12 * expected);
        const double rounded = NoiseVarianceTranslator::ebno_to_n0(5.0, 2, sim.code().rate(), sim.grid().overhead());
        assert(std::abs(n0 - rounded) > 1e-9 * expected);
    }

    // Invalid configurations are rejected at construction
    assert(throws_config_error([] {
        Config cfg;
        cfg.pilot_pattern = "empty";
        LinkSimulation sim(cfg);
    }));
    assert(throws_config_error([] {
        Config cfg;
        cfg.code_rate = 1.0;
        LinkSimulation sim(cfg);
    }));
    assert(throws_config_error([] {
        Config cfg;
        cfg.num_bits_per_symbol = 3;
        LinkSimulation sim(cfg);
    }));
    assert(throws_config_error([] {
        Config cfg;
        cfg.channel_model = "tdl-a";
        LinkSimulation sim(cfg);
    }));
    assert(throws_config_error([] {
        Config cfg;
        cfg.batch_size = 0;
        LinkSimulation sim(cfg);
    }));
    assert(throws_config_error([] {
        Config cfg;
        cfg.interpolation = "cubic";
        LinkSimulation sim(cfg);
    }));

    std::cout << "[PASS] link simulation" << std::endl;
    return 0;
}

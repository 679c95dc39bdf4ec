// path: tests/test_config.cpp
#include "Common.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>

int main() {
    const std::string path = "test_config_roundtrip.yaml";

    // Defaults describe the reference scenario
    {
        Config cfg;
        assert(cfg.num_ofdm_symbols == 14);
        assert(cfg.fft_size == 76);
        assert(cfg.cp_length == 6);
        assert((cfg.pilot_ofdm_symbol_indices == std::vector<size_t>{2, 11}));
        assert(cfg.num_bits_per_symbol == 2);
        assert(cfg.code_rate == 0.5);
        assert(cfg.batch_size == 10);
        assert(cfg.ldpc_base_graph_dir.empty());
        assert(cfg.samples_per_symbol() == 82);
        assert(cfg.sample_rate() == 76 * 30e3);
    }

    // Save then load reproduces every field
    {
        Config out;
        out.num_ofdm_symbols = 7;
        out.fft_size = 128;
        out.cp_length = 9;
        out.num_guard_left = 3;
        out.num_guard_right = 4;
        out.dc_null = true;
        out.pilot_pattern = "custom";
        out.custom_pilot_positions = {{1, 10}, {5, 100}};
        out.pilot_sequence = "zc";
        out.zc_root = 25;
        out.num_bits_per_symbol = 4;
        out.code_rate = 0.75;
        out.batch_size = 3;
        out.channel_model = "rayleigh";
        out.channel_domain = "time";
        out.ue_speed = 30.0;
        out.interpolation = "lin";
        out.perfect_csi = true;
        out.demapping_method = "maxlog";
        out.decoder_iterations = 12;
        out.check_node_rule = "minsum";
        out.decoder_early_stop = false;
        out.ebno_db = {-1.5, 2.0, 7.25};
        out.max_mc_iterations = 8;
        out.target_block_errors = 100;
        out.sweep_early_stop = true;
        out.ldpc_base_graph_dir = "tables/nr";
        out.profiling_modules = "decoding,channel";
        assert(save_config_to_yaml(out, path));

        Config in;
        assert(load_config_from_yaml(in, path));
        assert(in.num_ofdm_symbols == 7);
        assert(in.fft_size == 128);
        assert(in.cp_length == 9);
        assert(in.num_guard_left == 3 && in.num_guard_right == 4);
        assert(in.dc_null);
        assert(in.pilot_pattern == "custom");
        assert(in.custom_pilot_positions == out.custom_pilot_positions);
        assert(in.pilot_sequence == "zc" && in.zc_root == 25);
        assert(in.num_bits_per_symbol == 4);
        assert(in.code_rate == 0.75);
        assert(in.batch_size == 3);
        assert(in.channel_model == "rayleigh" && in.channel_domain == "time");
        assert(in.ue_speed == 30.0);
        assert(in.interpolation == "lin");
        assert(in.perfect_csi);
        assert(in.demapping_method == "maxlog");
        assert(in.decoder_iterations == 12);
        assert(in.check_node_rule == "minsum");
        assert(!in.decoder_early_stop);
        assert(in.ebno_db == out.ebno_db);
        assert(in.max_mc_iterations == 8 && in.target_block_errors == 100);
        assert(in.sweep_early_stop);
        assert(in.ldpc_base_graph_dir == "tables/nr");
        assert(in.should_profile("decoding"));
        assert(in.should_profile("channel"));
        assert(!in.should_profile("estimation"));
    }

    // Partial files keep the remaining defaults
    {
        std::ofstream f(path);
        f << "fft_size: 64\nebno_db: [3]\n";
        f.close();
        Config cfg;
        assert(load_config_from_yaml(cfg, path));
        assert(cfg.fft_size == 64);
        assert(cfg.ebno_db == std::vector<double>{3.0});
        assert(cfg.num_ofdm_symbols == 14);
    }

    // Malformed and missing files report failure
    {
        std::ofstream f(path);
        f << "fft_size: [1, 2\n";
        f.close();
        Config cfg;
        assert(!load_config_from_yaml(cfg, path));

        std::ofstream g(path);
        g << "fft_size: many\n";
        g.close();
        assert(!load_config_from_yaml(cfg, path));

        assert(!load_config_from_yaml(cfg, "no_such_config.yaml"));
        std::remove(path.c_str());
    }

    // Profiling switch
    {
        Config cfg;
        assert(!cfg.should_profile("decoding"));
        cfg.profiling_modules = "all";
        assert(cfg.should_profile("anything"));
    }

    // Seed derivation is deterministic and separates streams and batch elements
    {
        assert(derive_seed(42, 0, 1) == derive_seed(42, 0, 1));
        assert(derive_seed(42, 0, 1) != derive_seed(42, 1, 1));
        assert(derive_seed(42, 0, 1) != derive_seed(42, 0, 2));
        assert(derive_seed(42, 0, 1) != derive_seed(43, 0, 1));
    }

    // Tensor helpers
    {
        ComplexTensor t({3, 14, 76});
        assert(t.batch_size() == 3);
        assert(t.stride() == 14 * 76);
        assert(t.batch_ptr(2) == t.data.data() + 2 * 14 * 76);
        assert(shape_to_string(t.shape) == "(3, 14, 76)");
    }

    std::cout << "[PASS] config" << std::endl;
    return 0;
}

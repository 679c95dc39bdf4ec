// path: tests/test_resource_grid.cpp
#include "Common.hpp"
#include "ResourceGrid.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

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
    // Reference layout
    {
        ResourceGrid grid(ResourceGrid::Params{});
        assert(grid.num_resource_elements() == 14 * 76);
        assert(grid.num_pilot_symbols() == 2 * 76);
        assert(grid.num_data_symbols() == 12 * 76);
        for (size_t k = 0; k < 76; ++k) {
            assert(grid.role(2, k) == ResourceRole::Pilot);
            assert(grid.role(11, k) == ResourceRole::Pilot);
            assert(grid.role(0, k) == ResourceRole::Data);
        }
        // Data indices are symbol-major and ascending
        for (size_t i = 1; i < grid.data_indices().size(); ++i) {
            assert(grid.data_indices()[i] > grid.data_indices()[i - 1]);
        }
        // Unit-magnitude pilots
        for (const auto& p : grid.pilot_values()) {
            assert(std::fabs(std::abs(p) - 1.0f) < 1e-5f);
        }
    }

    // Guards and DC null
    {
        ResourceGrid::Params p;
        p.num_guard_left = 5;
        p.num_guard_right = 6;
        p.dc_null = true;
        ResourceGrid grid(p);
        assert(grid.num_effective_subcarriers() == 76 - 5 - 6 - 1);
        for (size_t s = 0; s < grid.num_ofdm_symbols(); ++s) {
            for (size_t k = 0; k < 5; ++k) assert(grid.role(s, k) == ResourceRole::Guard);
            for (size_t k = 70; k < 76; ++k) assert(grid.role(s, k) == ResourceRole::Guard);
            assert(grid.role(s, grid.dc_index()) == ResourceRole::Guard);
        }
        assert(grid.role(2, 5) == ResourceRole::Pilot);
        assert(grid.role(2, 69) == ResourceRole::Pilot);
        assert(grid.role(3, 5) == ResourceRole::Data);
        assert(grid.num_pilot_symbols() == 2 * grid.num_effective_subcarriers());
        assert(grid.num_data_symbols() == 12 * grid.num_effective_subcarriers());

        const std::string map = grid.to_string();
        assert(map.size() == 14 * 77);
        assert(map[0] == 'G');
        assert(map[2 * 77 + 5] == 'P');
        assert(map[3 * 77 + 5] == 'D');
        std::cout << "[INFO] grid map\n" << map;
    }

    // Custom and single-pilot patterns
    {
        ResourceGrid::Params p;
        p.pilot_pattern = "custom";
        p.custom_pilot_positions = {{0, 0}, {7, 40}, {13, 75}};
        ResourceGrid grid(p);
        assert(grid.num_pilot_symbols() == 3);
        assert(grid.pilot_indices()[1] == 7 * 76 + 40);
        assert(grid.num_data_symbols() == 14 * 76 - 3);
    }

    // Zadoff-Chu pilots are unit magnitude too
    {
        ResourceGrid::Params p;
        p.pilot_sequence = "zc";
        ResourceGrid grid(p);
        for (const auto& v : grid.pilot_values()) assert(std::fabs(std::abs(v) - 1.0f) < 1e-4f);
    }

    // Empty pattern is a valid grid (rejected later by the estimator)
    {
        ResourceGrid::Params p;
        p.pilot_pattern = "empty";
        ResourceGrid grid(p);
        assert(grid.num_pilot_symbols() == 0);
        assert(grid.num_data_symbols() == 14 * 76);
    }

    // Invalid configurations
    assert(throws_config_error([] {
        ResourceGrid::Params p;
        p.fft_size = 0;
        ResourceGrid g(p);
    }));
    assert(throws_config_error([] {
        ResourceGrid::Params p;
        p.cp_length = 76;
        ResourceGrid g(p);
    }));
    assert(throws_config_error([] {
        ResourceGrid::Params p;
        p.pilot_ofdm_symbol_indices = {14};
        ResourceGrid g(p);
    }));
    assert(throws_config_error([] {
        ResourceGrid::Params p;
        p.num_guard_left = 40;
        p.dc_null = true;
        ResourceGrid g(p);
    }));
    assert(throws_config_error([] {
        ResourceGrid::Params p;
        p.pilot_pattern = "custom";
        p.custom_pilot_positions = {{1, 1}, {1, 1}};
        ResourceGrid g(p);
    }));
    assert(throws_config_error([] {
        ResourceGrid::Params p;
        p.pilot_pattern = "block";
        ResourceGrid g(p);
    }));
    assert(throws_config_error([] {
        ResourceGrid::Params p;
        p.num_ofdm_symbols = 2;
        p.pilot_ofdm_symbol_indices = {0, 1};
        ResourceGrid g(p);
    }));

    std::cout << "[PASS] resource grid" << std::endl;
    return 0;
}

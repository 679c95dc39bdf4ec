// path: tests/test_channel_estimator.cpp
#include "Common.hpp"
#include "ResourceGrid.hpp"
#include "ChannelEstimatorCore.hpp"
#include <cassert>
#include <cmath>
#include <complex>
#include <iostream>
#include <random>
#include <stdexcept>

using namespace LinkSim::Core;

// rx = H * x with pilots at pilot positions and random unit symbols elsewhere
static void make_rx(const ResourceGrid& grid, size_t batch, uint32_t seed,
                    ComplexTensor& h, ComplexTensor& rx) {
    const std::vector<size_t> shape = {batch, grid.num_ofdm_symbols(), grid.fft_size()};
    h = ComplexTensor(shape);
    rx = ComplexTensor(shape);
    std::mt19937 rng(seed);
    std::normal_distribution<float> nd(0.0f, 1.0f);
    std::uniform_real_distribution<float> ud(0.0f, 6.2831853f);
    for (size_t b = 0; b < batch; ++b) {
        std::complex<float>* hb = h.batch_ptr(b);
        std::complex<float>* rb = rx.batch_ptr(b);
        for (size_t i = 0; i < grid.num_resource_elements(); ++i) {
            hb[i] = std::complex<float>(nd(rng), nd(rng));
            rb[i] = hb[i] * std::polar(1.0f, ud(rng));
        }
        for (size_t p = 0; p < grid.num_pilot_symbols(); ++p) {
            const size_t j = grid.pilot_indices()[p];
            rb[j] = hb[j] * grid.pilot_values()[p];
        }
    }
}

int main() {
    // Exact H at pilots with N0 = 0, nearest-neighbour copy elsewhere
    {
        ResourceGrid grid(ResourceGrid::Params{});
        ChannelEstimatorCore est(grid, ChannelEstimatorCore::Params{});
        ComplexTensor h, rx, h_hat;
        RealTensor err_var;
        make_rx(grid, 4, 11, h, rx);
        est.estimate(rx, 0.0f, h_hat, err_var);
        assert(h_hat.shape == rx.shape);
        assert(err_var.shape == rx.shape);

        for (size_t b = 0; b < 4; ++b) {
            for (size_t p = 0; p < grid.num_pilot_symbols(); ++p) {
                const size_t j = grid.pilot_indices()[p];
                assert(std::abs(h_hat.batch_ptr(b)[j] - h.batch_ptr(b)[j]) < 1e-4f);
            }
            for (size_t i = 0; i < grid.num_resource_elements(); ++i) {
                const size_t j = grid.pilot_indices()[est.nearest_pilot(i)];
                assert(h_hat.batch_ptr(b)[i] == h_hat.batch_ptr(b)[j]);
                assert(err_var.batch_ptr(b)[i] == 0.0f);
            }
        }

        // Symbols 0..6 copy pilot symbol 2, symbols 7..13 copy pilot symbol 11, same subcarrier
        const size_t F = grid.fft_size();
        assert(grid.pilot_indices()[est.nearest_pilot(0 * F + 10)] == 2 * F + 10);
        assert(grid.pilot_indices()[est.nearest_pilot(6 * F + 10)] == 2 * F + 10);
        assert(grid.pilot_indices()[est.nearest_pilot(7 * F + 10)] == 11 * F + 10);
        assert(grid.pilot_indices()[est.nearest_pilot(13 * F + 75)] == 11 * F + 75);
    }

    // Error variance N0 / |p|^2 propagates
    {
        ResourceGrid grid(ResourceGrid::Params{});
        ChannelEstimatorCore est(grid, ChannelEstimatorCore::Params{});
        ComplexTensor h, rx, h_hat;
        RealTensor err_var;
        make_rx(grid, 1, 3, h, rx);
        est.estimate(rx, 0.25f, h_hat, err_var);
        for (float e : err_var.data) assert(std::fabs(e - 0.25f) < 1e-5f);
    }

    // Ties go to the lower subcarrier, then the earlier symbol
    {
        ResourceGrid::Params p;
        p.pilot_pattern = "custom";
        p.custom_pilot_positions = {{4, 10}, {4, 20}, {0, 15}, {8, 15}};
        ResourceGrid grid(p);
        ChannelEstimatorCore est(grid, ChannelEstimatorCore::Params{});
        const size_t F = grid.fft_size();
        // (4, 15) is equally close to (0, 15) and (8, 15)
        assert(grid.pilot_indices()[est.nearest_pilot(4 * F + 15)] == 0 * F + 15);
        assert(grid.pilot_indices()[est.nearest_pilot(4 * F + 12)] == 4 * F + 10);
        assert(grid.pilot_indices()[est.nearest_pilot(2 * F + 13)] == 0 * F + 15);
    }
    {
        ResourceGrid::Params p;
        p.pilot_pattern = "custom";
        p.custom_pilot_positions = {{4, 20}, {4, 10}};
        ResourceGrid grid(p);
        ChannelEstimatorCore est(grid, ChannelEstimatorCore::Params{});
        const size_t F = grid.fft_size();
        // (4, 15) is equally close to both, (1, 15) too
        assert(grid.pilot_indices()[est.nearest_pilot(4 * F + 15)] == 4 * F + 10);
        assert(grid.pilot_indices()[est.nearest_pilot(1 * F + 15)] == 4 * F + 10);
        assert(grid.pilot_indices()[est.nearest_pilot(4 * F + 16)] == 4 * F + 20);
    }

    // Single pilot broadcasts to the whole grid
    {
        ResourceGrid::Params p;
        p.pilot_pattern = "custom";
        p.custom_pilot_positions = {{5, 30}};
        ResourceGrid grid(p);
        for (auto mode : {ChannelEstimatorCore::Interpolation::NearestNeighbor,
                          ChannelEstimatorCore::Interpolation::Linear}) {
            ChannelEstimatorCore::Params ep;
            ep.interpolation = mode;
            ChannelEstimatorCore est(grid, ep);
            ComplexTensor h, rx, h_hat;
            RealTensor err_var;
            make_rx(grid, 2, 5, h, rx);
            est.estimate(rx, 0.1f, h_hat, err_var);
            for (size_t b = 0; b < 2; ++b) {
                const std::complex<float> ref = h.batch_ptr(b)[5 * grid.fft_size() + 30];
                for (size_t i = 0; i < grid.num_resource_elements(); ++i) {
                    assert(std::abs(h_hat.batch_ptr(b)[i] - ref) < 1e-4f);
                    assert(std::fabs(err_var.batch_ptr(b)[i] - 0.1f) < 1e-6f);
                }
            }
        }
    }

    // Linear interpolation is exact for a channel linear in frequency and time
    {
        ResourceGrid::Params p;
        p.pilot_pattern = "custom";
        for (size_t s : {1, 9}) {
            for (size_t k = 0; k < 76; k += 5) p.custom_pilot_positions.push_back({s, k});
        }
        ResourceGrid grid(p);
        ChannelEstimatorCore::Params ep;
        ep.interpolation = ChannelEstimatorCore::parse_interpolation("lin");
        ChannelEstimatorCore est(grid, ep);

        const size_t F = grid.fft_size();
        ComplexTensor h({1, grid.num_ofdm_symbols(), F});
        ComplexTensor rx(h.shape), h_hat;
        RealTensor err_var;
        for (size_t s = 0; s < grid.num_ofdm_symbols(); ++s) {
            for (size_t k = 0; k < F; ++k) {
                h.data[s * F + k] = std::complex<float>(0.5f + 0.01f * k, -0.2f + 0.05f * s);
            }
        }
        for (size_t q = 0; q < grid.num_pilot_symbols(); ++q) {
            const size_t j = grid.pilot_indices()[q];
            rx.data[j] = h.data[j] * grid.pilot_values()[q];
        }
        est.estimate(rx, 0.0f, h_hat, err_var);
        // Inside the pilot hull the estimate is exact
        for (size_t s = 1; s <= 9; ++s) {
            for (size_t k = 0; k <= 75; ++k) {
                assert(std::abs(h_hat.data[s * F + k] - h.data[s * F + k]) < 1e-4f);
            }
        }
        // Constant extrapolation outside
        assert(std::abs(h_hat.data[0 * F + 10] - h.data[1 * F + 10]) < 1e-4f);
        assert(std::abs(h_hat.data[13 * F + 10] - h.data[9 * F + 10]) < 1e-4f);
    }

    // No pilots: rejected once at construction
    {
        ResourceGrid::Params p;
        p.pilot_pattern = "empty";
        ResourceGrid grid(p);
        bool thrown = false;
        try {
            ChannelEstimatorCore est(grid, ChannelEstimatorCore::Params{});
        } catch (const ConfigurationError&) {
            thrown = true;
        }
        assert(thrown);
    }

    // Wrong tensor shape
    {
        ResourceGrid grid(ResourceGrid::Params{});
        ChannelEstimatorCore est(grid, ChannelEstimatorCore::Params{});
        ComplexTensor rx({2, 13, 76}), h_hat;
        RealTensor err_var;
        bool thrown = false;
        try {
            est.estimate(rx, 0.1f, h_hat, err_var);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    }

    std::cout << "[PASS] channel estimator" << std::endl;
    return 0;
}

// path: tests/test_channel.cpp
#include "Common.hpp"
#include "OFDMCore.hpp"
#include "ResourceGrid.hpp"
#include "ChannelCore.hpp"
#include <cassert>
#include <cmath>
#include <complex>
#include <iostream>
#include <random>

using namespace LinkSim::Core;

static ComplexTensor random_grid(const ResourceGrid& grid, size_t batch, uint32_t seed) {
    ComplexTensor tx({batch, grid.num_ofdm_symbols(), grid.fft_size()});
    QAMConstellation qam(2);
    std::mt19937 rng(seed);
    for (auto& v : tx.data) v = qam.point(rng() & 3u);
    return tx;
}

static float max_error(const ComplexTensor& rx, const ComplexTensor& h, const ComplexTensor& tx) {
    float worst = 0.0f;
    for (size_t i = 0; i < rx.data.size(); ++i) {
        worst = std::max(worst, std::abs(rx.data[i] - h.data[i] * tx.data[i]));
    }
    return worst;
}

int main() {
    ResourceGrid grid(ResourceGrid::Params{});
    const size_t B = 4;
    const ComplexTensor tx = random_grid(grid, B, 1);

    // Geometry of the reference scenario
    {
        ChannelCore ch(grid, ChannelCore::Params{});
        assert(ch.num_clusters() == 24);
        assert(std::fabs(ch.max_doppler() - 10.0 * 2.6e9 / 299792458.0) < 1e-9);
    }

    // AWGN model without noise is the identity in both domains
    for (auto domain : {ChannelCore::Domain::Frequency, ChannelCore::Domain::Time}) {
        ChannelCore::Params p;
        p.model = ChannelCore::parse_model("awgn");
        p.domain = domain;
        ChannelCore ch(grid, p);
        ComplexTensor rx, h;
        ch.apply(tx, 0.0f, 0, rx, h);
        assert(rx.shape == tx.shape && h.shape == tx.shape);
        for (size_t i = 0; i < tx.data.size(); ++i) {
            assert(std::abs(h.data[i] - std::complex<float>(1.0f, 0.0f)) < 1e-4f);
            assert(std::abs(rx.data[i] - tx.data[i]) < 1e-4f);
        }
    }

    // Fading without noise: rx = H x holds exactly in the frequency domain and through the
    // FFT / cyclic prefix path in the time domain
    for (auto domain : {"freq", "time"}) {
        for (auto model : {"cdl-c", "rayleigh"}) {
            ChannelCore::Params p;
            p.model = ChannelCore::parse_model(model);
            p.domain = ChannelCore::parse_domain(domain);
            ChannelCore ch(grid, p);
            ComplexTensor rx, h;
            ch.apply(tx, 0.0f, 3, rx, h);
            const float err = max_error(rx, h, tx);
            std::cout << "[INFO] " << model << "/" << domain << " max |y - Hx| = " << err << std::endl;
            assert(err < 2e-3f);

            // Unit average power per batch element
            for (size_t b = 0; b < B; ++b) {
                double power = 0.0;
                for (size_t i = 0; i < grid.num_resource_elements(); ++i) power += std::norm(h.batch_ptr(b)[i]);
                power /= static_cast<double>(grid.num_resource_elements());
                assert(std::fabs(power - 1.0) < 1e-3);
            }
        }
    }

    // Frequency selectivity of CDL-C: H varies across subcarriers
    {
        ChannelCore::Params p;
        p.delay_spread = 300e-9;
        ChannelCore ch(grid, p);
        ComplexTensor rx, h;
        ch.apply(tx, 0.0f, 0, rx, h);
        const std::complex<float> first = h.data[0];
        float spread = 0.0f;
        for (size_t k = 0; k < grid.fft_size(); ++k) spread = std::max(spread, std::abs(h.data[k] - first));
        assert(spread > 1e-2f);
    }

    // Realizations depend only on the iteration index
    {
        ChannelCore ch(grid, ChannelCore::Params{});
        ComplexTensor rx1, h1, rx2, h2, rx3, h3;
        ch.apply(tx, 0.1f, 5, rx1, h1);
        ch.apply(tx, 0.1f, 5, rx2, h2);
        ch.apply(tx, 0.1f, 6, rx3, h3);
        assert(rx1.data == rx2.data);
        assert(h1.data == h2.data);
        assert(h1.data != h3.data);

        // Batch elements are independent realizations
        bool differs = false;
        for (size_t i = 0; i < grid.num_resource_elements(); ++i) {
            differs |= h1.batch_ptr(0)[i] != h1.batch_ptr(1)[i];
        }
        assert(differs);

        // Same seed and iteration, different noise level: same channel
        ComplexTensor rx4, h4;
        ch.apply(tx, 0.5f, 5, rx4, h4);
        assert(h4.data == h1.data);
    }

    // Noise variance per resource element
    for (auto domain : {ChannelCore::Domain::Frequency, ChannelCore::Domain::Time}) {
        ChannelCore::Params p;
        p.model = ChannelCore::Model::AWGN;
        p.domain = domain;
        ChannelCore ch(grid, p);
        ComplexTensor zero({10, grid.num_ofdm_symbols(), grid.fft_size()});
        ComplexTensor rx, h;
        const float n0 = 0.5f;
        ch.apply(zero, n0, 0, rx, h);
        double power = 0.0;
        for (const auto& v : rx.data) power += std::norm(v);
        power /= static_cast<double>(rx.data.size());
        std::cout << "[INFO] measured noise power " << power << " (N0 = " << n0 << ")" << std::endl;
        assert(std::fabs(power - n0) < 0.05 * n0);
    }

    // Invalid parameters and shapes
    {
        bool thrown = false;
        try {
            ChannelCore::parse_model("tdl-a");
        } catch (const ConfigurationError&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            ChannelCore::Params p;
            p.carrier_frequency = 0.0;
            ChannelCore ch(grid, p);
        } catch (const ConfigurationError&) {
            thrown = true;
        }
        assert(thrown);

        ChannelCore ch(grid, ChannelCore::Params{});
        ComplexTensor bad({1, 3, 3}), rx, h;
        thrown = false;
        try {
            ch.apply(bad, 0.1f, 0, rx, h);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    }

    std::cout << "[PASS] channel" << std::endl;
    return 0;
}

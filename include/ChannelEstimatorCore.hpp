#ifndef CHANNEL_ESTIMATOR_CORE_HPP
#define CHANNEL_ESTIMATOR_CORE_HPP

#include <vector>
#include <complex>
#include <string>
#include <stdexcept>
#include <algorithm>
#include <limits>
#include <omp.h>
#include <Common.hpp>
#include <ResourceGrid.hpp>

namespace LinkSim {
namespace Core {

    /**
     * @brief Least-squares pilot channel estimator with interpolation.
     *
     * At each pilot: H_ls = y_p / p, err_var = N0 / |p|^2. Every element of the grid then
     * takes a weighted combination of pilot estimates. The weights are computed once
     * at construction:
     * - NearestNeighbor: weight 1 on the closest pilot (Euclidean distance in
     *   (symbol, subcarrier) index space, ties to the lower subcarrier, then the
     *   earlier symbol)
     * - Linear: linear across subcarriers within each pilot-bearing symbol, then linear
     *   across symbols, constant extrapolation at the edges
     * Error variances use the same weights.
     */
    class ChannelEstimatorCore {
    public:
        enum class Interpolation {
            NearestNeighbor,
            Linear
        };

        struct Params {
            Interpolation interpolation = Interpolation::NearestNeighbor;
        };

        static Interpolation parse_interpolation(const std::string& name) {
            if (name == "nn") return Interpolation::NearestNeighbor;
            if (name == "lin") return Interpolation::Linear;
            throw ConfigurationError("unknown interpolation '" + name + "' (expected nn or lin)");
        }

        ChannelEstimatorCore(const ResourceGrid& grid, const Params& params)
            : _grid(grid), _params(params)
        {
            if (_grid.num_pilot_symbols() == 0) {
                throw ConfigurationError("channel estimation needs at least one pilot");
            }
            _pilot_symbol.resize(_grid.num_pilot_symbols());
            _pilot_subcarrier.resize(_grid.num_pilot_symbols());
            for (size_t p = 0; p < _grid.num_pilot_symbols(); ++p) {
                _pilot_symbol[p] = _grid.pilot_indices()[p] / _grid.fft_size();
                _pilot_subcarrier[p] = _grid.pilot_indices()[p] % _grid.fft_size();
            }

            _inv_pilots.resize(_grid.num_pilot_symbols());
            _inv_pilot_energy.resize(_grid.num_pilot_symbols());
            for (size_t p = 0; p < _grid.num_pilot_symbols(); ++p) {
                const auto pv = _grid.pilot_values()[p];
                const float e = std::norm(pv);
                if (!(e > 0.0f)) throw ConfigurationError("pilot symbols must be non-zero");
                _inv_pilots[p] = std::conj(pv) / e;
                _inv_pilot_energy[p] = 1.0f / e;
            }

            if (_params.interpolation == Interpolation::NearestNeighbor) {
                _build_nearest_neighbor_taps();
            } else {
                _build_linear_taps();
            }
        }

        const ResourceGrid& grid() const { return _grid; }

        // Index of the pilot an element copies from (nearest-neighbour mode only)
        size_t nearest_pilot(size_t flat_index) const {
            return _tap_pilot[_tap_offsets[flat_index]];
        }

        /**
         * @brief Estimate one batch element.
         * @param rx Received grid [num_ofdm_symbols * fft_size]
         * @param n0 Noise variance
         * @param h_hat Output channel estimate [num_ofdm_symbols * fft_size]
         * @param err_var Output estimation error variance [num_ofdm_symbols * fft_size]
         */
        void estimate_one(const std::complex<float>* rx, float n0,
                          std::complex<float>* h_hat, float* err_var) const
        {
            const size_t P = _grid.num_pilot_symbols();
            const size_t* __restrict__ pilot_idx = _grid.pilot_indices().data();
            AlignedVector h_ls(P);
            AlignedFloatVector e_ls(P);

            #pragma omp simd simdlen(16)
            for (size_t p = 0; p < P; ++p) {
                h_ls[p] = rx[pilot_idx[p]] * _inv_pilots[p];
                e_ls[p] = n0 * _inv_pilot_energy[p];
            }

            const size_t total = _grid.num_resource_elements();
            for (size_t i = 0; i < total; ++i) {
                std::complex<float> h(0.0f, 0.0f);
                float e = 0.0f;
                for (uint32_t t = _tap_offsets[i]; t < _tap_offsets[i + 1]; ++t) {
                    const float w = _tap_weight[t];
                    h += w * h_ls[_tap_pilot[t]];
                    e += w * e_ls[_tap_pilot[t]];
                }
                h_hat[i] = h;
                err_var[i] = e;
            }
        }

        /**
         * @brief Estimate the channel for a batch of received grids.
         * @param rx_grid [batch, num_ofdm_symbols, fft_size]
         * @param n0 Noise variance (same for every batch element)
         * @param h_hat Output [batch, num_ofdm_symbols, fft_size]
         * @param err_var Output [batch, num_ofdm_symbols, fft_size]
         */
        void estimate(const ComplexTensor& rx_grid, float n0, ComplexTensor& h_hat, RealTensor& err_var) const {
            _check_grid_shape(rx_grid, "rx_grid");
            const size_t B = rx_grid.batch_size();
            const std::vector<size_t> shape = {B, _grid.num_ofdm_symbols(), _grid.fft_size()};
            if (h_hat.shape != shape) h_hat = ComplexTensor(shape);
            if (err_var.shape != shape) err_var = RealTensor(shape);

            #pragma omp parallel for
            for (long b = 0; b < static_cast<long>(B); ++b) {
                const size_t bi = static_cast<size_t>(b);
                estimate_one(rx_grid.batch_ptr(bi), n0, h_hat.batch_ptr(bi), err_var.batch_ptr(bi));
            }
        }

    private:
        ResourceGrid _grid;
        Params _params;

        std::vector<size_t> _pilot_symbol;
        std::vector<size_t> _pilot_subcarrier;
        AlignedVector _inv_pilots;
        AlignedFloatVector _inv_pilot_energy;

        // Sparse interpolation weights per grid element (CSR layout)
        std::vector<uint32_t> _tap_offsets;
        std::vector<uint32_t> _tap_pilot;
        std::vector<float> _tap_weight;

        void _check_grid_shape(const ComplexTensor& t, const char* name) const {
            if (t.shape.size() != 3 || t.shape[1] != _grid.num_ofdm_symbols() || t.shape[2] != _grid.fft_size()) {
                throw std::invalid_argument(std::string("ChannelEstimatorCore: ") + name + " must have shape [B, " +
                                            std::to_string(_grid.num_ofdm_symbols()) + ", " +
                                            std::to_string(_grid.fft_size()) + "], got " + shape_to_string(t.shape));
            }
        }

        void _build_nearest_neighbor_taps() {
            const size_t S = _grid.num_ofdm_symbols();
            const size_t F = _grid.fft_size();
            const size_t P = _grid.num_pilot_symbols();
            _tap_offsets.assign(S * F + 1, 0);
            _tap_pilot.resize(S * F);
            _tap_weight.assign(S * F, 1.0f);

            for (size_t s = 0; s < S; ++s) {
                for (size_t k = 0; k < F; ++k) {
                    size_t best = 0;
                    long long best_d = std::numeric_limits<long long>::max();
                    for (size_t p = 0; p < P; ++p) {
                        const long long ds = static_cast<long long>(s) - static_cast<long long>(_pilot_symbol[p]);
                        const long long dk = static_cast<long long>(k) - static_cast<long long>(_pilot_subcarrier[p]);
                        const long long d = ds * ds + dk * dk;
                        bool take = d < best_d;
                        if (d == best_d) {
                            // Tie: lower subcarrier, then earlier symbol
                            if (_pilot_subcarrier[p] != _pilot_subcarrier[best]) {
                                take = _pilot_subcarrier[p] < _pilot_subcarrier[best];
                            } else {
                                take = _pilot_symbol[p] < _pilot_symbol[best];
                            }
                        }
                        if (take) {
                            best_d = d;
                            best = p;
                        }
                    }
                    const size_t i = s * F + k;
                    _tap_pilot[i] = static_cast<uint32_t>(best);
                    _tap_offsets[i + 1] = static_cast<uint32_t>(i + 1);
                }
            }
        }

        struct Tap {
            uint32_t pilot;
            float weight;
        };

        // Linear weights between the two neighbours of x in the sorted list xs
        static void _linear_neighbors(const std::vector<size_t>& xs, size_t x,
                                      size_t& lo, size_t& hi, float& w_hi) {
            if (x <= xs.front()) { lo = hi = 0; w_hi = 0.0f; return; }
            if (x >= xs.back()) { lo = hi = xs.size() - 1; w_hi = 0.0f; return; }
            hi = static_cast<size_t>(std::upper_bound(xs.begin(), xs.end(), x) - xs.begin());
            lo = hi - 1;
            if (xs[lo] == x) { hi = lo; w_hi = 0.0f; return; }
            w_hi = static_cast<float>(x - xs[lo]) / static_cast<float>(xs[hi] - xs[lo]);
        }

        void _build_linear_taps() {
            const size_t S = _grid.num_ofdm_symbols();
            const size_t F = _grid.fft_size();
            const size_t P = _grid.num_pilot_symbols();

            // Pilots per pilot-bearing symbol, ascending subcarrier
            std::vector<std::vector<size_t>> per_symbol(S);
            for (size_t p = 0; p < P; ++p) per_symbol[_pilot_symbol[p]].push_back(p);
            std::vector<size_t> pilot_symbols;
            for (size_t s = 0; s < S; ++s) {
                if (!per_symbol[s].empty()) pilot_symbols.push_back(s);
            }

            // Frequency interpolation on every pilot-bearing symbol
            std::vector<std::vector<std::vector<Tap>>> freq_taps(S);
            for (size_t s : pilot_symbols) {
                auto& pilots = per_symbol[s];
                std::sort(pilots.begin(), pilots.end(),
                          [&](size_t a, size_t b) { return _pilot_subcarrier[a] < _pilot_subcarrier[b]; });
                std::vector<size_t> ks(pilots.size());
                for (size_t i = 0; i < pilots.size(); ++i) ks[i] = _pilot_subcarrier[pilots[i]];

                freq_taps[s].resize(F);
                for (size_t k = 0; k < F; ++k) {
                    size_t lo, hi;
                    float w_hi;
                    _linear_neighbors(ks, k, lo, hi, w_hi);
                    auto& taps = freq_taps[s][k];
                    taps.push_back({static_cast<uint32_t>(pilots[lo]), 1.0f - w_hi});
                    if (hi != lo) taps.push_back({static_cast<uint32_t>(pilots[hi]), w_hi});
                }
            }

            // Time interpolation between pilot-bearing symbols
            _tap_offsets.assign(S * F + 1, 0);
            _tap_pilot.clear();
            _tap_weight.clear();
            for (size_t s = 0; s < S; ++s) {
                size_t lo, hi;
                float w_hi;
                _linear_neighbors(pilot_symbols, s, lo, hi, w_hi);
                const size_t s_lo = pilot_symbols[lo];
                const size_t s_hi = pilot_symbols[hi];
                for (size_t k = 0; k < F; ++k) {
                    for (const auto& t : freq_taps[s_lo][k]) {
                        _tap_pilot.push_back(t.pilot);
                        _tap_weight.push_back(t.weight * (1.0f - w_hi));
                    }
                    if (s_hi != s_lo) {
                        for (const auto& t : freq_taps[s_hi][k]) {
                            _tap_pilot.push_back(t.pilot);
                            _tap_weight.push_back(t.weight * w_hi);
                        }
                    }
                    _tap_offsets[s * F + k + 1] = static_cast<uint32_t>(_tap_pilot.size());
                }
            }
        }
    };

} // namespace Core
} // namespace LinkSim

#endif // CHANNEL_ESTIMATOR_CORE_HPP

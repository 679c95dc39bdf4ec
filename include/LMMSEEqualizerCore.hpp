#ifndef LMMSE_EQUALIZER_CORE_HPP
#define LMMSE_EQUALIZER_CORE_HPP

#include <vector>
#include <complex>
#include <string>
#include <stdexcept>
#include <algorithm>
#include <omp.h>
#include <Common.hpp>
#include <OFDMCore.hpp>
#include <ResourceGrid.hpp>

namespace LinkSim {
namespace Core {

    /**
     * @brief Per-element LMMSE equalizer for a single stream.
     *
     * For every data element with s = N0 + err_var and d = max(|H|^2 + s, floor):
     *   x_hat  = conj(H) * y / d
     *   N0_eff = s / d
     * In unbiased mode both are divided by max(|H|^2, floor) instead of d.
     * Outputs are gathered in data order.
     */
    class LMMSEEqualizerCore {
    public:
        struct Params {
            bool unbiased = false;
            float denominator_floor = 1e-12f;
        };

        LMMSEEqualizerCore(const ResourceGrid& grid, const StreamManagement& stream_management, const Params& params)
            : _grid(grid), _params(params)
        {
            stream_management.require_single_stream();
            if (!(_params.denominator_floor > 0.0f)) {
                throw ConfigurationError("equalizer denominator floor must be positive");
            }
        }

        /**
         * @brief Equalize one batch element.
         * @param rx Received grid
         * @param h_hat Channel estimate
         * @param err_var Channel estimation error variance
         * @param n0 Noise variance
         * @param x_hat Output equalized data symbols [num_data_symbols]
         * @param no_eff Output effective noise variance [num_data_symbols]
         */
        void equalize_one(const std::complex<float>* rx, const std::complex<float>* h_hat, const float* err_var,
                          float n0, std::complex<float>* x_hat, float* no_eff) const
        {
            const size_t D = _grid.num_data_symbols();
            const size_t* __restrict__ idx = _grid.data_indices().data();
            const float floor = _params.denominator_floor;

            if (_params.unbiased) {
                #pragma omp simd simdlen(16)
                for (size_t i = 0; i < D; ++i) {
                    const size_t j = idx[i];
                    const std::complex<float> h = h_hat[j];
                    const float s = n0 + err_var[j];
                    const float g = std::max(std::norm(h), floor);
                    x_hat[i] = std::conj(h) * rx[j] / g;
                    no_eff[i] = s / g;
                }
            } else {
                #pragma omp simd simdlen(16)
                for (size_t i = 0; i < D; ++i) {
                    const size_t j = idx[i];
                    const std::complex<float> h = h_hat[j];
                    const float s = n0 + err_var[j];
                    const float d = std::max(std::norm(h) + s, floor);
                    x_hat[i] = std::conj(h) * rx[j] / d;
                    no_eff[i] = s / d;
                }
            }
        }

        /**
         * @brief Equalize a batch.
         * @param rx_grid [batch, num_ofdm_symbols, fft_size]
         * @param h_hat [batch, num_ofdm_symbols, fft_size]
         * @param err_var [batch, num_ofdm_symbols, fft_size]
         * @param n0 Noise variance
         * @param x_hat Output [batch, 1, 1, num_data_symbols]
         * @param no_eff Output [batch, 1, 1, num_data_symbols]
         */
        void equalize(const ComplexTensor& rx_grid, const ComplexTensor& h_hat, const RealTensor& err_var, float n0,
                      ComplexTensor& x_hat, RealTensor& no_eff) const
        {
            const size_t B = rx_grid.batch_size();
            const std::vector<size_t> grid_shape = {B, _grid.num_ofdm_symbols(), _grid.fft_size()};
            if (rx_grid.shape != grid_shape || h_hat.shape != grid_shape || err_var.shape != grid_shape) {
                throw std::invalid_argument("LMMSEEqualizerCore: rx_grid, h_hat and err_var must have shape " +
                                            shape_to_string(grid_shape));
            }
            const std::vector<size_t> out_shape = {B, 1, 1, _grid.num_data_symbols()};
            if (x_hat.shape != out_shape) x_hat = ComplexTensor(out_shape);
            if (no_eff.shape != out_shape) no_eff = RealTensor(out_shape);

            #pragma omp parallel for
            for (long b = 0; b < static_cast<long>(B); ++b) {
                const size_t bi = static_cast<size_t>(b);
                equalize_one(rx_grid.batch_ptr(bi), h_hat.batch_ptr(bi), err_var.batch_ptr(bi), n0,
                             x_hat.batch_ptr(bi), no_eff.batch_ptr(bi));
            }
        }

    private:
        ResourceGrid _grid;
        Params _params;
    };

} // namespace Core
} // namespace LinkSim

#endif // LMMSE_EQUALIZER_CORE_HPP

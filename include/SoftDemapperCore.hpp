#ifndef SOFT_DEMAPPER_CORE_HPP
#define SOFT_DEMAPPER_CORE_HPP

#include <vector>
#include <complex>
#include <string>
#include <stdexcept>
#include <algorithm>
#include <limits>
#include <cmath>
#include <omp.h>
#include <Common.hpp>
#include <OFDMCore.hpp>
#include <OFDMSignalProcessing.hpp>

namespace LinkSim {
namespace Core {

    /**
     * @brief Soft demapper for Gray-labelled QAM.
     *
     * APP:    LLR_i = logsumexp_{c: b_i=0}(-|x-c|^2/N0) - logsumexp_{c: b_i=1}(-|x-c|^2/N0)
     * MaxLog: logsumexp replaced by max
     * Positive LLR means bit 0. N0_eff is floored at min_noise_variance.
     */
    class SoftDemapperCore {
    public:
        enum class Method {
            APP,
            MaxLog
        };

        struct Params {
            Method method = Method::APP;
            float min_noise_variance = 1e-10f;
        };

        static Method parse_method(const std::string& name) {
            if (name == "app") return Method::APP;
            if (name == "maxlog") return Method::MaxLog;
            throw ConfigurationError("unknown demapping_method '" + name + "' (expected app or maxlog)");
        }

        SoftDemapperCore(const QAMConstellation& constellation, const Params& params)
            : _constellation(constellation), _params(params)
        {
            if (!(_params.min_noise_variance > 0.0f)) {
                throw ConfigurationError("demapper noise variance floor must be positive");
            }
        }

        size_t bits_per_symbol() const { return _constellation.bits_per_symbol(); }

        /**
         * @brief LLRs of one symbol.
         * @param x Equalized symbol
         * @param no Effective noise variance
         * @param llr Output, bits_per_symbol values
         */
        void demap_symbol(std::complex<float> x, float no, float* llr) const {
            const size_t m = _constellation.bits_per_symbol();
            const size_t M = _constellation.size();
            const double inv_no = 1.0 / static_cast<double>(std::max(no, _params.min_noise_variance));
            const auto& pts = _constellation.points();
            constexpr double NEG_INF = -std::numeric_limits<double>::infinity();

            double metric[4096];
            for (size_t c = 0; c < M; ++c) {
                const double dr = static_cast<double>(x.real()) - pts[c].real();
                const double di = static_cast<double>(x.imag()) - pts[c].imag();
                metric[c] = -(dr * dr + di * di) * inv_no;
            }

            for (size_t i = 0; i < m; ++i) {
                double l0 = NEG_INF;
                double l1 = NEG_INF;
                for (size_t c = 0; c < M; ++c) {
                    const bool one = _constellation.bit(static_cast<unsigned>(c), i) != 0;
                    double& acc = one ? l1 : l0;
                    if (_params.method == Method::APP) {
                        acc = DSP::log_sum_exp(acc, metric[c]);
                    } else {
                        acc = std::max(acc, metric[c]);
                    }
                }
                const double v = std::min(LLR_LIMIT, std::max(-LLR_LIMIT, l0 - l1));
                llr[i] = static_cast<float>(v);
            }
        }

        /**
         * @brief Demap a batch of equalized symbols.
         * @param x_hat [batch, 1, 1, num_symbols]
         * @param no_eff [batch, 1, 1, num_symbols]
         * @param llr Output [batch, 1, 1, num_symbols * bits_per_symbol]
         */
        void demap(const ComplexTensor& x_hat, const RealTensor& no_eff, LLRTensor& llr) const {
            if (x_hat.shape.size() != 4 || x_hat.shape != no_eff.shape) {
                throw std::invalid_argument("SoftDemapperCore: x_hat and no_eff must share a [B, 1, 1, N] shape, got " +
                                            shape_to_string(x_hat.shape) + " and " + shape_to_string(no_eff.shape));
            }
            const size_t B = x_hat.batch_size();
            const size_t N = x_hat.shape[3];
            const size_t m = _constellation.bits_per_symbol();
            const std::vector<size_t> out_shape = {B, x_hat.shape[1], x_hat.shape[2], N * m};
            if (llr.shape != out_shape) llr = LLRTensor(out_shape);

            #pragma omp parallel for
            for (long b = 0; b < static_cast<long>(B); ++b) {
                const size_t bi = static_cast<size_t>(b);
                const auto* x = x_hat.batch_ptr(bi);
                const float* no = no_eff.batch_ptr(bi);
                float* out = llr.batch_ptr(bi);
                for (size_t i = 0; i < N; ++i) {
                    demap_symbol(x[i], no[i], out + i * m);
                }
            }
        }

    private:
        static constexpr double LLR_LIMIT = 1e6;

        QAMConstellation _constellation;
        Params _params;
    };

} // namespace Core
} // namespace LinkSim

#endif // SOFT_DEMAPPER_CORE_HPP

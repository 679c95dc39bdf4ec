#ifndef OFDM_SIGNAL_PROCESSING_HPP
#define OFDM_SIGNAL_PROCESSING_HPP

#include <vector>
#include <complex>
#include <cmath>
#include <limits>
#include <random>
#include <algorithm>
#include <Common.hpp>

namespace LinkSim {
namespace DSP {

    /**
     * @brief Generate Zadoff-Chu Sequence (Frequency Domain)
     *
     * @param N Sequence length
     * @param root Root index (q)
     * @return AlignedVector vector containing the ZC sequence
     */
    inline AlignedVector generate_zc_sequence(int N, int root) {
        AlignedVector zc_seq(N);
        const int q = root;
        const int delta = (N & 1); // 0 for even N, 1 for odd N
        const double base = -M_PI * static_cast<double>(q) / static_cast<double>(N);

        #pragma omp simd
        for (int n = 0; n < N; ++n) {
            const double nd = static_cast<double>(n);
            const double arg = nd * (nd + static_cast<double>(delta));
            const double phase = base * arg;
            zc_seq[n] = std::polar(1.0f, static_cast<float>(phase));
        }
        return zc_seq;
    }

    /**
     * @brief Random unit-magnitude QPSK sequence for pilots.
     *
     * Two bits per symbol are drawn from mt19937(seed). Only the raw engine output is
     * used so the sequence is identical across standard library implementations.
     */
    inline AlignedVector generate_qpsk_sequence(size_t N, uint32_t seed) {
        AlignedVector seq(N);
        std::mt19937 rng(seed);
        const float a = static_cast<float>(M_SQRT1_2);
        for (size_t n = 0; n < N; ++n) {
            const uint32_t r = rng();
            const float re = (r & 1u) ? -a : a;
            const float im = (r & 2u) ? -a : a;
            seq[n] = std::complex<float>(re, im);
        }
        return seq;
    }

    inline double db_to_linear(double db) {
        return std::pow(10.0, db / 10.0);
    }

    /**
     * @brief Normalized sinc: sin(pi x) / (pi x)
     */
    inline double sinc(double x) {
        if (std::abs(x) < 1e-12) return 1.0;
        const double px = M_PI * x;
        return std::sin(px) / px;
    }

    /**
     * @brief Numerically stable log(exp(a) + exp(b)).
     */
    inline double log_sum_exp(double a, double b) {
        const double m = std::max(a, b);
        if (m == -std::numeric_limits<double>::infinity()) return m;
        return m + std::log1p(std::exp(-std::abs(a - b)));
    }

    /**
     * @brief FFT bin holding grid subcarrier k.
     *
     * Grid subcarriers run from the lowest frequency upwards with DC at fft_size / 2;
     * FFT bins start at DC.
     */
    inline size_t subcarrier_to_bin(size_t k, size_t fft_size) {
        return (k + fft_size - fft_size / 2) % fft_size;
    }

    /**
     * @brief Complex standard normal sample with unit variance (0.5 per component).
     */
    template<typename Rng>
    inline std::complex<float> complex_gaussian(Rng& rng, std::normal_distribution<float>& dist) {
        const float re = dist(rng);
        const float im = dist(rng);
        return std::complex<float>(re, im) * static_cast<float>(M_SQRT1_2);
    }

} // namespace DSP
} // namespace LinkSim

#endif // OFDM_SIGNAL_PROCESSING_HPP

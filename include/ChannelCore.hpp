#ifndef CHANNEL_CORE_HPP
#define CHANNEL_CORE_HPP

#include <vector>
#include <complex>
#include <string>
#include <random>
#include <array>
#include <stdexcept>
#include <cmath>
#include <fftw3.h>
#include <omp.h>
#include <Common.hpp>
#include <ResourceGrid.hpp>
#include <OFDMSignalProcessing.hpp>

namespace LinkSim {
namespace Core {

    /**
     * @brief Fading channel with AWGN applied to OFDM resource grids.
     *
     * Models:
     * - CDL_C:    24 clusters with the CDL-C normalized delay/power profile (TR 38.901
     *             Table 7.7.1-3) scaled by the delay spread. Each cluster is an
     *             independent Rayleigh process built from a sum of sinusoids at the
     *             maximum Doppler frequency v * fc / c.
     * - Rayleigh: single flat tap with the same Doppler process.
     * - AWGN:     H = 1.
     *
     * Domains:
     * - Frequency: H evaluated per OFDM symbol and subcarrier, y = H x + n.
     * - Time:      unitary IFFT, cyclic prefix, sample-spaced taps from sinc
     *              interpolation of the clusters held per OFDM symbol, AWGN, CP
     *              removal, unitary FFT. H is the FFT of the applied taps.
     *
     * All random draws depend only on (seed, iteration, batch index).
     */
    class ChannelCore {
    public:
        enum class Model {
            CDL_C,
            Rayleigh,
            AWGN
        };

        enum class Domain {
            Frequency,
            Time
        };

        struct Params {
            Model model = Model::CDL_C;
            Domain domain = Domain::Frequency;
            double carrier_frequency = 2.6e9;
            double ue_speed = 10.0;
            double delay_spread = 100e-9;
            bool normalize_channel = true;
            uint32_t seed = 42;
            size_t num_sinusoids = 16;
        };

        static Model parse_model(const std::string& name) {
            if (name == "cdl-c") return Model::CDL_C;
            if (name == "rayleigh") return Model::Rayleigh;
            if (name == "awgn") return Model::AWGN;
            throw ConfigurationError("unknown channel_model '" + name + "' (expected cdl-c, rayleigh or awgn)");
        }

        static Domain parse_domain(const std::string& name) {
            if (name == "freq") return Domain::Frequency;
            if (name == "time") return Domain::Time;
            throw ConfigurationError("unknown channel_domain '" + name + "' (expected freq or time)");
        }

        ChannelCore(const ResourceGrid& grid, const Params& params)
            : _grid(grid), _params(params)
        {
            if (!(_params.carrier_frequency > 0.0)) throw ConfigurationError("carrier_frequency must be positive");
            if (_params.ue_speed < 0.0) throw ConfigurationError("ue_speed must not be negative");
            if (_params.delay_spread < 0.0) throw ConfigurationError("delay_spread must not be negative");
            if (_params.num_sinusoids == 0) throw ConfigurationError("num_sinusoids must be positive");

            _init_clusters();
            _init_responses();
            if (_params.domain == Domain::Time) _init_fftw();
        }

        ~ChannelCore() {
            if (_fft_plan) fftwf_destroy_plan(_fft_plan);
            if (_ifft_plan) fftwf_destroy_plan(_ifft_plan);
        }

        // Non-copyable due to FFTW plans
        ChannelCore(const ChannelCore&) = delete;
        ChannelCore& operator=(const ChannelCore&) = delete;

        // Move constructible
        ChannelCore(ChannelCore&& other) noexcept
            : _grid(std::move(other._grid)),
              _params(other._params),
              _delays(std::move(other._delays)),
              _powers(std::move(other._powers)),
              _max_doppler(other._max_doppler),
              _symbol_duration(other._symbol_duration),
              _cluster_freq(std::move(other._cluster_freq)),
              _cluster_taps(std::move(other._cluster_taps)),
              _num_taps(other._num_taps),
              _fft_plan(other._fft_plan),
              _ifft_plan(other._ifft_plan)
        {
            other._fft_plan = nullptr;
            other._ifft_plan = nullptr;
        }

        const Params& params() const { return _params; }
        double max_doppler() const { return _max_doppler; }
        size_t num_clusters() const { return _delays.size(); }

        /**
         * @brief Pass a batch of transmitted grids through the channel.
         * @param tx_grid [batch, num_ofdm_symbols, fft_size]
         * @param n0 Noise variance per resource element / sample
         * @param iteration Monte-Carlo iteration index (selects the random realization)
         * @param rx_grid Output [batch, num_ofdm_symbols, fft_size]
         * @param h_freq Output ground-truth frequency response, same shape
         */
        void apply(const ComplexTensor& tx_grid, float n0, size_t iteration,
                   ComplexTensor& rx_grid, ComplexTensor& h_freq) const
        {
            const size_t S = _grid.num_ofdm_symbols();
            const size_t F = _grid.fft_size();
            if (tx_grid.shape.size() != 3 || tx_grid.shape[1] != S || tx_grid.shape[2] != F) {
                throw std::invalid_argument("ChannelCore: tx_grid must have shape [B, " + std::to_string(S) + ", " +
                                            std::to_string(F) + "], got " + shape_to_string(tx_grid.shape));
            }
            if (!(n0 >= 0.0f)) {
                throw std::invalid_argument("ChannelCore: noise variance must not be negative");
            }
            const size_t B = tx_grid.batch_size();
            if (rx_grid.shape != tx_grid.shape) rx_grid = ComplexTensor(tx_grid.shape);
            if (h_freq.shape != tx_grid.shape) h_freq = ComplexTensor(tx_grid.shape);

            const uint32_t iter_seed = derive_seed(_params.seed, iteration, STREAM_ITERATION);

            #pragma omp parallel for
            for (long b = 0; b < static_cast<long>(B); ++b) {
                const size_t bi = static_cast<size_t>(b);
                std::mt19937 fading_rng(derive_seed(iter_seed, bi, STREAM_FADING));
                std::mt19937 noise_rng(derive_seed(iter_seed, bi, STREAM_NOISE));
                if (_params.domain == Domain::Frequency) {
                    _apply_frequency_domain(tx_grid.batch_ptr(bi), n0, fading_rng, noise_rng,
                                            rx_grid.batch_ptr(bi), h_freq.batch_ptr(bi));
                } else {
                    _apply_time_domain(tx_grid.batch_ptr(bi), n0, fading_rng, noise_rng,
                                       rx_grid.batch_ptr(bi), h_freq.batch_ptr(bi));
                }
            }
        }

    private:
        static constexpr uint32_t STREAM_ITERATION = 0x11;
        static constexpr uint32_t STREAM_FADING = 0x21;
        static constexpr uint32_t STREAM_NOISE = 0x31;
        static constexpr double SPEED_OF_LIGHT = 299792458.0;

        ResourceGrid _grid;
        Params _params;

        std::vector<double> _delays;   // [s]
        std::vector<double> _powers;   // linear, sum 1
        double _max_doppler = 0.0;     // [Hz]
        double _symbol_duration = 0.0; // [s], including CP

        // Per-cluster phase ramp over subcarriers: exp(-j 2 pi (k - F/2) df tau_c), [C x F]
        AlignedVector _cluster_freq;
        // Per-cluster sample-spaced taps: sinc(l - tau_c fs), [C x num_taps]
        std::vector<double> _cluster_taps;
        size_t _num_taps = 0;

        fftwf_plan _fft_plan = nullptr;
        fftwf_plan _ifft_plan = nullptr;

        void _init_clusters() {
            // CDL-C normalized delays and powers [dB]
            static const std::array<double, 24> CDL_C_DELAYS = {{
                0.0, 0.2099, 0.2219, 0.2329, 0.2176, 0.6366, 0.6448, 0.6560,
                0.6584, 0.7935, 0.8213, 0.9336, 1.2285, 1.3083, 2.1704, 2.7105,
                4.2589, 4.6003, 5.4902, 5.6077, 6.3065, 6.6374, 7.0427, 8.6523
            }};
            static const std::array<double, 24> CDL_C_POWERS_DB = {{
                -4.4, -1.2, -3.5, -5.2, -2.5, 0.0, -2.2, -3.9,
                -7.4, -7.1, -10.7, -11.1, -5.1, -6.8, -8.7, -13.2,
                -13.9, -13.9, -15.8, -17.1, -16.0, -15.7, -21.6, -22.8
            }};

            _delays.clear();
            _powers.clear();
            switch (_params.model) {
                case Model::CDL_C: {
                    double total = 0.0;
                    for (size_t c = 0; c < CDL_C_DELAYS.size(); ++c) {
                        _delays.push_back(CDL_C_DELAYS[c] * _params.delay_spread);
                        _powers.push_back(DSP::db_to_linear(CDL_C_POWERS_DB[c]));
                        total += _powers.back();
                    }
                    for (auto& p : _powers) p /= total;
                    break;
                }
                case Model::Rayleigh:
                case Model::AWGN:
                    _delays.push_back(0.0);
                    _powers.push_back(1.0);
                    break;
            }

            _max_doppler = _params.ue_speed * _params.carrier_frequency / SPEED_OF_LIGHT;
            _symbol_duration = static_cast<double>(_grid.fft_size() + _grid.cp_length()) / _grid.sample_rate();
        }

        void _init_responses() {
            const size_t F = _grid.fft_size();
            const size_t C = _delays.size();
            const double df = _grid.subcarrier_spacing();
            const double half = static_cast<double>(F / 2);

            _cluster_freq.resize(C * F);
            for (size_t c = 0; c < C; ++c) {
                for (size_t k = 0; k < F; ++k) {
                    const double phase = -2.0 * M_PI * (static_cast<double>(k) - half) * df * _delays[c];
                    _cluster_freq[c * F + k] = std::polar(1.0f, static_cast<float>(phase));
                }
            }

            _num_taps = _grid.cp_length() + 1;
            _cluster_taps.resize(C * _num_taps);
            const double fs = _grid.sample_rate();
            for (size_t c = 0; c < C; ++c) {
                for (size_t l = 0; l < _num_taps; ++l) {
                    _cluster_taps[c * _num_taps + l] = DSP::sinc(static_cast<double>(l) - _delays[c] * fs);
                }
            }
        }

        void _init_fftw() {
            const int N = static_cast<int>(_grid.fft_size());
            AlignedVector in(_grid.fft_size());
            AlignedVector out(_grid.fft_size());
            _fft_plan = fftwf_plan_dft_1d(
                N,
                reinterpret_cast<fftwf_complex*>(in.data()),
                reinterpret_cast<fftwf_complex*>(out.data()),
                FFTW_FORWARD, FFTW_MEASURE);
            _ifft_plan = fftwf_plan_dft_1d(
                N,
                reinterpret_cast<fftwf_complex*>(in.data()),
                reinterpret_cast<fftwf_complex*>(out.data()),
                FFTW_BACKWARD, FFTW_MEASURE);
            if (!_fft_plan || !_ifft_plan) {
                throw std::runtime_error("ChannelCore: failed to create FFTW plans");
            }
        }

        struct Sinusoids {
            std::vector<double> doppler;  // 2 pi fd cos(theta) per (cluster, sinusoid)
            std::vector<double> phase;
        };

        Sinusoids _draw_sinusoids(std::mt19937& rng) const {
            const size_t C = _delays.size();
            const size_t M = _params.num_sinusoids;
            std::uniform_real_distribution<double> uni(0.0, 2.0 * M_PI);
            Sinusoids sin;
            sin.doppler.resize(C * M);
            sin.phase.resize(C * M);
            for (size_t i = 0; i < C * M; ++i) {
                const double theta = uni(rng);
                sin.doppler[i] = 2.0 * M_PI * _max_doppler * std::cos(theta);
                sin.phase[i] = uni(rng);
            }
            return sin;
        }

        // Complex cluster gains at time t
        void _cluster_gains(const Sinusoids& sin, double t, std::vector<std::complex<double>>& a) const {
            const size_t C = _delays.size();
            const size_t M = _params.num_sinusoids;
            a.resize(C);
            if (_params.model == Model::AWGN) {
                a[0] = 1.0;
                return;
            }
            for (size_t c = 0; c < C; ++c) {
                std::complex<double> acc(0.0, 0.0);
                for (size_t m = 0; m < M; ++m) {
                    const size_t i = c * M + m;
                    acc += std::polar(1.0, sin.doppler[i] * t + sin.phase[i]);
                }
                a[c] = acc * std::sqrt(_powers[c] / static_cast<double>(M));
            }
        }

        static void _normalize(std::complex<float>* h, size_t count, std::vector<std::complex<float>>* taps) {
            double power = 0.0;
            for (size_t i = 0; i < count; ++i) power += std::norm(h[i]);
            power /= static_cast<double>(count);
            if (!(power > 0.0)) return;
            const float scale = static_cast<float>(1.0 / std::sqrt(power));
            for (size_t i = 0; i < count; ++i) h[i] *= scale;
            if (taps) {
                for (auto& t : *taps) t *= scale;
            }
        }

        void _apply_frequency_domain(const std::complex<float>* tx, float n0,
                                     std::mt19937& fading_rng, std::mt19937& noise_rng,
                                     std::complex<float>* rx, std::complex<float>* h) const
        {
            const size_t S = _grid.num_ofdm_symbols();
            const size_t F = _grid.fft_size();
            const size_t C = _delays.size();

            const Sinusoids sin = _draw_sinusoids(fading_rng);
            std::vector<std::complex<double>> a;
            for (size_t s = 0; s < S; ++s) {
                _cluster_gains(sin, static_cast<double>(s) * _symbol_duration, a);
                for (size_t k = 0; k < F; ++k) {
                    std::complex<float> acc(0.0f, 0.0f);
                    for (size_t c = 0; c < C; ++c) {
                        acc += std::complex<float>(a[c]) * _cluster_freq[c * F + k];
                    }
                    h[s * F + k] = acc;
                }
            }
            if (_params.normalize_channel) _normalize(h, S * F, nullptr);

            std::normal_distribution<float> gauss(0.0f, 1.0f);
            const float sigma = std::sqrt(n0);
            for (size_t i = 0; i < S * F; ++i) {
                rx[i] = h[i] * tx[i] + sigma * DSP::complex_gaussian(noise_rng, gauss);
            }
        }

        void _apply_time_domain(const std::complex<float>* tx, float n0,
                                std::mt19937& fading_rng, std::mt19937& noise_rng,
                                std::complex<float>* rx, std::complex<float>* h) const
        {
            const size_t S = _grid.num_ofdm_symbols();
            const size_t F = _grid.fft_size();
            const size_t CP = _grid.cp_length();
            const size_t L = _num_taps;
            const size_t C = _delays.size();
            const size_t sym_len = F + CP;
            const float unitary = 1.0f / std::sqrt(static_cast<float>(F));

            // Taps held per OFDM symbol
            const Sinusoids sin = _draw_sinusoids(fading_rng);
            std::vector<std::complex<double>> a;
            std::vector<std::complex<float>> taps(S * L);
            for (size_t s = 0; s < S; ++s) {
                _cluster_gains(sin, static_cast<double>(s) * _symbol_duration, a);
                for (size_t l = 0; l < L; ++l) {
                    std::complex<double> acc(0.0, 0.0);
                    if (_params.model == Model::AWGN) {
                        acc = (l == 0) ? 1.0 : 0.0;
                    } else {
                        for (size_t c = 0; c < C; ++c) acc += a[c] * _cluster_taps[c * L + l];
                    }
                    taps[s * L + l] = std::complex<float>(acc);
                }
            }

            AlignedVector fft_in(F);
            AlignedVector fft_out(F);

            // Ground truth: unnormalized FFT of the zero-padded taps
            for (size_t s = 0; s < S; ++s) {
                std::fill(fft_in.begin(), fft_in.end(), std::complex<float>(0.0f, 0.0f));
                for (size_t l = 0; l < L; ++l) fft_in[l] = taps[s * L + l];
                fftwf_execute_dft(_fft_plan,
                    reinterpret_cast<fftwf_complex*>(fft_in.data()),
                    reinterpret_cast<fftwf_complex*>(fft_out.data()));
                for (size_t k = 0; k < F; ++k) h[s * F + k] = fft_out[DSP::subcarrier_to_bin(k, F)];
            }
            if (_params.normalize_channel) _normalize(h, S * F, &taps);

            // OFDM modulation with cyclic prefix
            AlignedVector tx_time(S * sym_len);
            for (size_t s = 0; s < S; ++s) {
                for (size_t k = 0; k < F; ++k) fft_in[DSP::subcarrier_to_bin(k, F)] = tx[s * F + k];
                fftwf_execute_dft(_ifft_plan,
                    reinterpret_cast<fftwf_complex*>(fft_in.data()),
                    reinterpret_cast<fftwf_complex*>(fft_out.data()));
                auto* sym = tx_time.data() + s * sym_len;
                for (size_t j = 0; j < CP; ++j) sym[j] = fft_out[F - CP + j] * unitary;
                for (size_t j = 0; j < F; ++j) sym[CP + j] = fft_out[j] * unitary;
            }

            // Linear convolution with the taps of the current symbol, then AWGN
            std::normal_distribution<float> gauss(0.0f, 1.0f);
            const float sigma = std::sqrt(n0);
            AlignedVector rx_time(S * sym_len);
            for (size_t n = 0; n < S * sym_len; ++n) {
                const std::complex<float>* ht = taps.data() + (n / sym_len) * L;
                std::complex<float> acc(0.0f, 0.0f);
                for (size_t l = 0; l < L && l <= n; ++l) acc += ht[l] * tx_time[n - l];
                rx_time[n] = acc + sigma * DSP::complex_gaussian(noise_rng, gauss);
            }

            // CP removal and OFDM demodulation
            for (size_t s = 0; s < S; ++s) {
                const auto* sym = rx_time.data() + s * sym_len + CP;
                std::copy(sym, sym + F, fft_in.begin());
                fftwf_execute_dft(_fft_plan,
                    reinterpret_cast<fftwf_complex*>(fft_in.data()),
                    reinterpret_cast<fftwf_complex*>(fft_out.data()));
                for (size_t k = 0; k < F; ++k) rx[s * F + k] = fft_out[DSP::subcarrier_to_bin(k, F)] * unitary;
            }
        }
    };

} // namespace Core
} // namespace LinkSim

#endif // CHANNEL_CORE_HPP

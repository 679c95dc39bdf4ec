#ifndef OFDM_CORE_HPP
#define OFDM_CORE_HPP

/**
 * @file OFDMCore.hpp
 * @brief Building blocks shared by transmitter and receiver of the link simulation.
 *
 * Pure computation classes: FFTW wisdom handling, the QAM constellation, the random
 * interleaver, stream management and the Eb/N0 to noise variance translation.
 * Everything here is immutable after construction and can be shared between threads.
 */

#include <complex>
#include <vector>
#include <cmath>
#include <algorithm>
#include <array>
#include <random>
#include <cfloat>
#include <fftw3.h>
#include "Common.hpp"
#include <cstdio>


/**
 * @brief Manager for FFTW Wisdom.
 *
 * Handles importing and exporting FFTW wisdom to/from a file.
 * This allows saving optimized FFT plans to disk to speed up subsequent initializations.
 */
class FFTWManager {
public:
    static void import_wisdom(const std::string& filename = "fftw_wisdom.dat") {
        if (FILE* f = std::fopen(filename.c_str(), "r")) {
            fftwf_import_wisdom_from_file(f);
            std::fclose(f);
            std::cout << "[FFTW] Imported wisdom from " << filename << std::endl;
        } else {
            std::cout << "[FFTW] No existing wisdom found (will act as cold start)." << std::endl;
        }
    }

    static void export_wisdom(const std::string& filename = "fftw_wisdom.dat") {
        if (FILE* f = std::fopen(filename.c_str(), "w")) {
            fftwf_export_wisdom_to_file(f);
            std::fclose(f);
            std::cout << "[FFTW] Exported wisdom to " << filename << std::endl;
        } else {
            std::cerr << "[FFTW] Failed to export wisdom to " << filename << std::endl;
        }
    }
};


/**
 * @brief Gray-labelled square QAM constellation.
 *
 * Labels follow 3GPP TS 38.211: even bit positions of a label select the in-phase
 * amplitude, odd bit positions the quadrature amplitude. The first bit of a symbol is
 * the most significant bit of its label. The constellation is scaled to unit average
 * energy.
 */
class QAMConstellation {
public:
    explicit QAMConstellation(size_t bits_per_symbol)
        : _bits_per_symbol(bits_per_symbol)
    {
        if (bits_per_symbol < 2 || bits_per_symbol > 12 || (bits_per_symbol % 2) != 0) {
            throw ConfigurationError("num_bits_per_symbol must be an even number in [2, 12], got " +
                                     std::to_string(bits_per_symbol));
        }
        const size_t M = size_t(1) << bits_per_symbol;
        _points.resize(M);

        const double norm = 1.0 / std::sqrt(2.0 * static_cast<double>(M - 1) / 3.0);
        const size_t half = bits_per_symbol / 2;
        std::vector<int> re_bits(half), im_bits(half);
        for (size_t label = 0; label < M; ++label) {
            for (size_t i = 0; i < half; ++i) {
                re_bits[i] = bit(static_cast<unsigned>(label), 2 * i);
                im_bits[i] = bit(static_cast<unsigned>(label), 2 * i + 1);
            }
            _points[label] = std::complex<float>(
                static_cast<float>(pam(re_bits, 0) * norm),
                static_cast<float>(pam(im_bits, 0) * norm));
        }
    }

    size_t bits_per_symbol() const { return _bits_per_symbol; }
    size_t size() const { return _points.size(); }
    const AlignedVector& points() const { return _points; }

    // Bit i (0 = first transmitted bit) of a constellation label
    int bit(unsigned label, size_t i) const {
        return static_cast<int>((label >> (_bits_per_symbol - 1 - i)) & 1u);
    }

    inline std::complex<float> point(unsigned label) const {
        return _points[label];
    }

    /**
     * @brief Map groups of bits_per_symbol bits to constellation points.
     * @param bits Input bits (0/1), num_symbols * bits_per_symbol entries
     * @param num_symbols Number of symbols to produce
     * @param out Output symbols
     */
    void map(const uint8_t* bits, size_t num_symbols, std::complex<float>* out) const {
        for (size_t s = 0; s < num_symbols; ++s) {
            unsigned label = 0;
            const uint8_t* b = bits + s * _bits_per_symbol;
            for (size_t i = 0; i < _bits_per_symbol; ++i) {
                label = (label << 1) | (b[i] & 1u);
            }
            out[s] = _points[label];
        }
    }

    /**
     * @brief Hard decision: label of the closest constellation point.
     */
    unsigned demodulate(std::complex<float> symbol) const {
        unsigned best = 0;
        float best_dist = std::numeric_limits<float>::max();
        for (size_t c = 0; c < _points.size(); ++c) {
            const float d = std::norm(symbol - _points[c]);
            if (d < best_dist) {
                best_dist = d;
                best = static_cast<unsigned>(c);
            }
        }
        return best;
    }

private:
    size_t _bits_per_symbol;
    AlignedVector _points;

    // pam(b) = (1 - 2 b0) * (2^(n-1) - pam(b[1:])), pam of a single bit is 1 - 2 b
    static double pam(const std::vector<int>& b, size_t start) {
        const size_t n = b.size() - start;
        const double sign = 1.0 - 2.0 * b[start];
        if (n == 1) return sign;
        return sign * (static_cast<double>(size_t(1) << (n - 1)) - pam(b, start + 1));
    }
};


/**
 * @brief Pseudo-random bit interleaver.
 *
 * Holds an explicit permutation shared by the transmitter and the receiver.
 * interleave:   out[i] = in[perm[i]]
 * deinterleave: out[perm[i]] = in[i]
 */
class RandomInterleaver {
public:
    /**
     * @brief Build the permutation with a Fisher-Yates shuffle driven by mt19937(seed).
     */
    RandomInterleaver(size_t length, uint32_t seed)
        : _perm(length)
    {
        if (length == 0) {
            throw ConfigurationError("interleaver length must be positive");
        }
        for (size_t i = 0; i < length; ++i) _perm[i] = i;
        std::mt19937 rng(seed);
        for (size_t i = length - 1; i > 0; --i) {
            const size_t j = static_cast<size_t>(rng() % (i + 1));
            std::swap(_perm[i], _perm[j]);
        }
    }

    /**
     * @brief Use an explicit permutation. Throws if it is not a permutation of [0, n).
     */
    explicit RandomInterleaver(std::vector<size_t> permutation)
        : _perm(std::move(permutation))
    {
        if (_perm.empty()) {
            throw ConfigurationError("interleaver permutation must not be empty");
        }
        std::vector<char> seen(_perm.size(), 0);
        for (auto p : _perm) {
            if (p >= _perm.size() || seen[p]) {
                throw ConfigurationError("interleaver permutation is not a permutation of [0, " +
                                         std::to_string(_perm.size()) + ")");
            }
            seen[p] = 1;
        }
    }

    size_t length() const { return _perm.size(); }
    const std::vector<size_t>& permutation() const { return _perm; }

    template<typename T>
    void interleave(const T* in, T* out) const {
        const size_t n = _perm.size();
        const size_t* __restrict__ perm = _perm.data();
        for (size_t i = 0; i < n; ++i) {
            out[i] = in[perm[i]];
        }
    }

    template<typename T>
    void deinterleave(const T* in, T* out) const {
        const size_t n = _perm.size();
        const size_t* __restrict__ perm = _perm.data();
        for (size_t i = 0; i < n; ++i) {
            out[perm[i]] = in[i];
        }
    }

private:
    std::vector<size_t> _perm;
};


/**
 * @brief Association between receivers, transmitters and streams.
 *
 * rx_tx_association[rx][tx] is 1 when receiver rx decodes streams of transmitter tx.
 * Only the single-link case is processed by the receiver cores.
 */
struct StreamManagement {
    std::vector<std::vector<uint8_t>> rx_tx_association = {{1}};
    size_t num_streams_per_tx = 1;

    size_t num_rx() const { return rx_tx_association.size(); }
    size_t num_tx() const { return rx_tx_association.empty() ? 0 : rx_tx_association[0].size(); }

    size_t num_streams_per_rx() const {
        size_t max_streams = 0;
        for (const auto& row : rx_tx_association) {
            size_t s = 0;
            for (auto a : row) s += a ? num_streams_per_tx : 0;
            max_streams = std::max(max_streams, s);
        }
        return max_streams;
    }

    void require_single_stream() const {
        if (num_rx() != 1 || num_tx() != 1 || num_streams_per_rx() != 1) {
            throw ConfigurationError("only a single stream per receiver is supported (rx=" +
                                     std::to_string(num_rx()) + ", tx=" + std::to_string(num_tx()) +
                                     ", streams=" + std::to_string(num_streams_per_rx()) + ")");
        }
    }
};


/**
 * @brief Eb/N0 to noise variance translation.
 */
class NoiseVarianceTranslator {
public:
    /**
     * @brief Compute the linear noise variance N0 for a target Eb/N0.
     *
     * N0 = grid_overhead / (10^(ebno_db/10) * bits_per_symbol * code_rate)
     *
     * @param ebno_db Eb/N0 in dB (finite)
     * @param bits_per_symbol Bits per constellation symbol (> 0)
     * @param code_rate Code rate in (0, 1]
     * @param grid_overhead Transmitted resource elements per data element (> 0)
     * @return N0, never below the smallest positive normal double
     */
    static double ebno_to_n0(double ebno_db, size_t bits_per_symbol, double code_rate, double grid_overhead) {
        if (!std::isfinite(ebno_db)) {
            throw ConfigurationError("Eb/N0 must be finite");
        }
        if (bits_per_symbol == 0) {
            throw ConfigurationError("bits_per_symbol must be positive");
        }
        if (!(code_rate > 0.0) || code_rate > 1.0) {
            throw ConfigurationError("code_rate must be in (0, 1], got " + std::to_string(code_rate));
        }
        if (!(grid_overhead > 0.0) || !std::isfinite(grid_overhead)) {
            throw ConfigurationError("grid overhead must be positive and finite");
        }

        const double ebno = std::pow(10.0, ebno_db / 10.0);
        double n0 = grid_overhead / (ebno * static_cast<double>(bits_per_symbol) * code_rate);
        if (!std::isfinite(n0)) n0 = DBL_MAX;
        return std::max(n0, DBL_MIN);
    }
};

#endif // OFDM_CORE_HPP

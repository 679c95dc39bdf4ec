#ifndef TRANSMITTER_CORE_HPP
#define TRANSMITTER_CORE_HPP

#include <vector>
#include <complex>
#include <random>
#include <stdexcept>
#include <omp.h>
#include <Common.hpp>
#include <OFDMCore.hpp>
#include <LDPCCode.hpp>
#include <ResourceGrid.hpp>

namespace LinkSim {
namespace Core {

    /**
     * @brief Transmitter Core
     *
     * Handles the transmission processing pipeline:
     * 1. Binary source (uniform bits, one mt19937 stream per batch element)
     * 2. LDPC encoding with rate matching
     * 3. Random interleaving
     * 4. QAM mapping
     * 5. Resource grid mapping (data symbol-major, pilots, zero guards)
     */
    class TransmitterCore {
    public:
        struct Params {
            uint32_t seed = 42;
        };

        TransmitterCore(const ResourceGrid& grid,
                        const QAMConstellation& constellation,
                        const LDPCCode& code,
                        const RandomInterleaver& interleaver,
                        const Params& params)
            : _grid(grid),
              _constellation(constellation),
              _code(code),
              _interleaver(interleaver),
              _params(params)
        {
            const size_t coded = _grid.num_data_symbols() * _constellation.bits_per_symbol();
            if (_code.n() != coded) {
                throw ConfigurationError("codeword length " + std::to_string(_code.n()) +
                                         " does not match the grid capacity of " + std::to_string(coded) + " bits");
            }
            if (_interleaver.length() != coded) {
                throw ConfigurationError("interleaver length " + std::to_string(_interleaver.length()) +
                                         " does not match the codeword length " + std::to_string(coded));
            }
        }

        size_t num_info_bits() const { return _code.k(); }
        size_t num_code_bits() const { return _code.n(); }

        /**
         * @brief Draw uniform info bits.
         * @param batch_size Number of batch elements
         * @param iteration Monte-Carlo iteration index
         * @param info_bits Output [batch, 1, 1, k]
         */
        void generate_bits(size_t batch_size, size_t iteration, BitTensor& info_bits) const {
            const size_t K = _code.k();
            info_bits = BitTensor({batch_size, 1, 1, K});
            const uint32_t iter_seed = derive_seed(_params.seed, iteration, STREAM_ITERATION);

            #pragma omp parallel for
            for (long b = 0; b < static_cast<long>(batch_size); ++b) {
                const size_t bi = static_cast<size_t>(b);
                std::mt19937 rng(derive_seed(iter_seed, bi, STREAM_SOURCE));
                uint8_t* out = info_bits.batch_ptr(bi);
                for (size_t i = 0; i < K; ++i) out[i] = static_cast<uint8_t>(rng() & 1u);
            }
        }

        /**
         * @brief Encode, interleave, map and place info bits onto the resource grid.
         * @param info_bits [batch, 1, 1, k]
         * @param tx_grid Output [batch, num_ofdm_symbols, fft_size]
         * @param codewords Optional output [batch, 1, 1, n] (before interleaving)
         */
        void transmit(const BitTensor& info_bits, ComplexTensor& tx_grid, BitTensor* codewords = nullptr) const {
            const size_t K = _code.k();
            const size_t N = _code.n();
            if (info_bits.shape.size() != 4 || info_bits.shape[1] != 1 || info_bits.shape[2] != 1 ||
                info_bits.shape[3] != K) {
                throw std::invalid_argument("TransmitterCore: info_bits must have shape [B, 1, 1, " +
                                            std::to_string(K) + "], got " + shape_to_string(info_bits.shape));
            }
            const size_t B = info_bits.batch_size();
            const size_t S = _grid.num_ofdm_symbols();
            const size_t F = _grid.fft_size();
            tx_grid = ComplexTensor({B, S, F});
            if (codewords) *codewords = BitTensor({B, 1, 1, N});

            #pragma omp parallel for
            for (long b = 0; b < static_cast<long>(B); ++b) {
                const size_t bi = static_cast<size_t>(b);
                std::vector<uint8_t> codeword(N);
                std::vector<uint8_t> interleaved(N);
                _code.encode(info_bits.batch_ptr(bi), codeword.data());
                if (codewords) std::copy(codeword.begin(), codeword.end(), codewords->batch_ptr(bi));
                _interleaver.interleave(codeword.data(), interleaved.data());
                _map_to_grid(interleaved.data(), tx_grid.batch_ptr(bi));
            }
        }

        /**
         * @brief Generate bits and transmit them in one call.
         */
        void process(size_t batch_size, size_t iteration, BitTensor& info_bits, ComplexTensor& tx_grid) const {
            generate_bits(batch_size, iteration, info_bits);
            transmit(info_bits, tx_grid);
        }

    private:
        static constexpr uint32_t STREAM_ITERATION = 0x12;
        static constexpr uint32_t STREAM_SOURCE = 0x41;

        ResourceGrid _grid;
        QAMConstellation _constellation;
        LDPCCode _code;
        RandomInterleaver _interleaver;
        Params _params;

        void _map_to_grid(const uint8_t* bits, std::complex<float>* grid) const {
            const size_t total = _grid.num_resource_elements();
            std::fill(grid, grid + total, std::complex<float>(0.0f, 0.0f));

            // 1. Fill Pilots
            const auto& pilot_idx = _grid.pilot_indices();
            const auto& pilots = _grid.pilot_values();
            for (size_t p = 0; p < pilot_idx.size(); ++p) {
                grid[pilot_idx[p]] = pilots[p];
            }

            // 2. Fill Data
            const auto& data_idx = _grid.data_indices();
            AlignedVector symbols(data_idx.size());
            _constellation.map(bits, data_idx.size(), symbols.data());
            const size_t* __restrict__ ds_ptr = data_idx.data();
            for (size_t d = 0; d < data_idx.size(); ++d) {
                grid[ds_ptr[d]] = symbols[d];
            }
        }
    };

} // namespace Core
} // namespace LinkSim

#endif // TRANSMITTER_CORE_HPP

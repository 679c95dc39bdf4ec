#ifndef RECEIVER_CORE_HPP
#define RECEIVER_CORE_HPP

#include <vector>
#include <complex>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <omp.h>
#include <Common.hpp>
#include <OFDMCore.hpp>
#include <LDPCCode.hpp>
#include <LDPCBPDecoder.hpp>
#include <ResourceGrid.hpp>
#include <ChannelEstimatorCore.hpp>
#include <LMMSEEqualizerCore.hpp>
#include <SoftDemapperCore.hpp>

namespace LinkSim {
namespace Core {

    /**
     * @brief Receiver Core
     *
     * Handles the reception processing pipeline:
     * 1. Eb/N0 -> N0 translation
     * 2. LS channel estimation with interpolation (or ground truth in perfect-CSI mode)
     * 3. LMMSE equalization
     * 4. Soft demapping
     * 5. Deinterleaving
     * 6. LDPC belief-propagation decoding
     */
    class ReceiverCore {
    public:
        struct Params {
            ChannelEstimatorCore::Params estimator;
            LMMSEEqualizerCore::Params equalizer;
            SoftDemapperCore::Params demapper;
            LDPCBPDecoder::Params decoder;
            bool perfect_csi = false;
            double code_rate = 0.0;   // nominal rate for Eb/N0, 0 = k / n of the code
        };

        struct StageTiming {
            double estimation_us = 0.0;
            double equalization_us = 0.0;
            double demapping_us = 0.0;
            double decoding_us = 0.0;
        };

        struct RxResult {
            float n0 = 0.0f;
            ComplexTensor h_hat;       // [B, S, F]
            RealTensor err_var;        // [B, S, F]
            ComplexTensor x_hat;       // [B, 1, 1, num_data_symbols]
            RealTensor no_eff;         // [B, 1, 1, num_data_symbols]
            LLRTensor llr;             // [B, 1, 1, n] in channel (interleaved) order
            LLRTensor llr_deinterleaved;
            BitTensor decoded_bits;    // [B, 1, 1, k]
            std::vector<LDPCBPDecoder::Result> decoder_results;
            StageTiming timing;
        };

        ReceiverCore(const ResourceGrid& grid,
                     const QAMConstellation& constellation,
                     const LDPCCode& code,
                     const RandomInterleaver& interleaver,
                     const StreamManagement& stream_management,
                     const Params& params)
            : _grid(grid),
              _code(code),
              _interleaver(interleaver),
              _params(params),
              _estimator(grid, params.estimator),
              _equalizer(grid, stream_management, params.equalizer),
              _demapper(constellation, params.demapper),
              _decoder(code, params.decoder)
        {
            const size_t coded = _grid.num_data_symbols() * constellation.bits_per_symbol();
            if (_code.n() != coded) {
                throw ConfigurationError("codeword length " + std::to_string(_code.n()) +
                                         " does not match the grid capacity of " + std::to_string(coded) + " bits");
            }
            if (_interleaver.length() != coded) {
                throw ConfigurationError("interleaver length does not match the codeword length");
            }
        }

        const ChannelEstimatorCore& estimator() const { return _estimator; }
        const LMMSEEqualizerCore& equalizer() const { return _equalizer; }
        const SoftDemapperCore& demapper() const { return _demapper; }
        const LDPCBPDecoder& decoder() const { return _decoder; }

        // Noise variance used by all receiver stages for a given Eb/N0
        double noise_variance(double ebno_db) const {
            const double rate = _params.code_rate > 0.0 ? _params.code_rate : _code.rate();
            return NoiseVarianceTranslator::ebno_to_n0(ebno_db, _demapper.bits_per_symbol(), rate,
                                                       _grid.overhead());
        }

        /**
         * @brief Recover info bits from a batch of received grids.
         * @param rx_grid [batch, num_ofdm_symbols, fft_size]
         * @param ebno_db Eb/N0 in dB
         * @param result Output tensors of every stage
         * @param h_true Ground-truth channel, required in perfect-CSI mode
         * @param stop Optional flag checked by the decoder at iteration boundaries
         */
        void receive(const ComplexTensor& rx_grid, double ebno_db, RxResult& result,
                     const ComplexTensor* h_true = nullptr, const std::atomic<bool>* stop = nullptr) const
        {
            using ProfileClock = std::chrono::high_resolution_clock;
            result.timing = StageTiming();
            result.n0 = static_cast<float>(noise_variance(ebno_db));

            // 1. Channel Estimation
            auto t0 = ProfileClock::now();
            if (_params.perfect_csi) {
                if (!h_true || h_true->shape != rx_grid.shape) {
                    throw std::invalid_argument("ReceiverCore: perfect CSI needs a ground-truth channel of shape " +
                                                shape_to_string(rx_grid.shape));
                }
                result.h_hat = *h_true;
                result.err_var = RealTensor(rx_grid.shape);
            } else {
                _estimator.estimate(rx_grid, result.n0, result.h_hat, result.err_var);
            }
            auto t1 = ProfileClock::now();
            result.timing.estimation_us = std::chrono::duration<double, std::micro>(t1 - t0).count();

            // 2. Equalization
            _equalizer.equalize(rx_grid, result.h_hat, result.err_var, result.n0, result.x_hat, result.no_eff);
            auto t2 = ProfileClock::now();
            result.timing.equalization_us = std::chrono::duration<double, std::micro>(t2 - t1).count();

            // 3. Demapping + Deinterleaving
            _demapper.demap(result.x_hat, result.no_eff, result.llr);
            const size_t B = rx_grid.batch_size();
            result.llr_deinterleaved = LLRTensor(result.llr.shape);
            for (size_t b = 0; b < B; ++b) {
                _interleaver.deinterleave(result.llr.batch_ptr(b), result.llr_deinterleaved.batch_ptr(b));
            }
            auto t3 = ProfileClock::now();
            result.timing.demapping_us = std::chrono::duration<double, std::micro>(t3 - t2).count();

            // 4. Decoding
            _decoder.decode_batch(result.llr_deinterleaved, result.decoded_bits, &result.decoder_results, stop);
            auto t4 = ProfileClock::now();
            result.timing.decoding_us = std::chrono::duration<double, std::micro>(t4 - t3).count();
        }

    private:
        ResourceGrid _grid;
        LDPCCode _code;
        RandomInterleaver _interleaver;
        Params _params;

        ChannelEstimatorCore _estimator;
        LMMSEEqualizerCore _equalizer;
        SoftDemapperCore _demapper;
        LDPCBPDecoder _decoder;
    };

} // namespace Core
} // namespace LinkSim

#endif // RECEIVER_CORE_HPP

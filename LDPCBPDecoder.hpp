#ifndef LDPC_BP_DECODER_HPP
#define LDPC_BP_DECODER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "Common.hpp"
#include "LDPCCode.hpp"

/**
 * @brief Flooding belief-propagation decoder for LDPCCode.
 *
 * Channel LLRs of the transmitted codeword are expanded to the mother code (filler bits
 * as strong zeros, punctured bits as erasures). Each iteration updates all check nodes,
 * then all variable nodes, with extrinsic messages clipped to +-llr_clip. Decoding stops
 * when the syndrome is zero (if early_stop is set), when max_iterations is reached, or
 * when the optional stop flag is raised at an iteration boundary.
 *
 * LLR convention: positive means bit 0.
 */
class LDPCBPDecoder {
public:
    enum class CheckNodeRule {
        BoxPlus,
        MinSum
    };

    struct Params {
        int max_iterations = 20;
        CheckNodeRule rule = CheckNodeRule::BoxPlus;
        bool early_stop = true;
        float llr_clip = 20.0f;
    };

    struct Result {
        std::vector<uint8_t> info_bits;  // k hard decisions
        std::vector<uint8_t> codeword;   // n hard decisions (transmitted positions)
        std::vector<float> soft_output;  // n final beliefs (transmitted positions)
        int iterations = 0;
        bool converged = false;
    };

    LDPCBPDecoder(const LDPCCode& code, const Params& params);

    static CheckNodeRule parse_rule(const std::string& name);

    const LDPCCode& code() const { return code_; }
    const Params& params() const { return params_; }

    // Decode one codeword of n channel LLRs
    Result decode(const float* llr, const std::atomic<bool>* stop = nullptr) const;

    /**
     * @brief Decode a batch in parallel.
     * @param llr [batch, 1, 1, n] channel LLRs
     * @param info_bits Output [batch, 1, 1, k] hard info bits
     * @param results Optional per-codeword results
     */
    void decode_batch(const LLRTensor& llr,
                      BitTensor& info_bits,
                      std::vector<Result>* results = nullptr,
                      const std::atomic<bool>* stop = nullptr) const;

private:
    LDPCCode code_;
    Params params_;

    // Edges in check-major order
    std::vector<int> check_ptr_;   // m + 1 offsets into edge arrays
    std::vector<int> edge_var_;    // variable node of each edge
    std::vector<int> var_ptr_;     // n + 1 offsets into var_edges_
    std::vector<int> var_edges_;   // edge indices grouped by variable node

    void build_graph();
    void check_node_update_boxplus(const float* v2c, float* c2v) const;
    void check_node_update_minsum(const float* v2c, float* c2v) const;
};

#endif // LDPC_BP_DECODER_HPP

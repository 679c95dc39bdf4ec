#include "LDPCBPDecoder.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <omp.h>

namespace {

static inline float clip(float v, float limit) {
    return std::min(limit, std::max(-limit, v));
}

} // namespace

LDPCBPDecoder::LDPCBPDecoder(const LDPCCode& code, const Params& params)
    : code_(code)
    , params_(params) {
    if (params_.max_iterations <= 0) {
        throw ConfigurationError("LDPC decoder: max_iterations must be positive");
    }
    if (!(params_.llr_clip > 0.0f)) {
        throw ConfigurationError("LDPC decoder: llr_clip must be positive");
    }
    build_graph();
}

LDPCBPDecoder::CheckNodeRule LDPCBPDecoder::parse_rule(const std::string& name) {
    if (name == "boxplus") return CheckNodeRule::BoxPlus;
    if (name == "minsum") return CheckNodeRule::MinSum;
    throw ConfigurationError("unknown check_node_rule '" + name + "' (expected boxplus or minsum)");
}

void LDPCBPDecoder::build_graph() {
    const auto& h = code_.parity_check_matrix();
    const int m = h.m();
    const int n = h.n();

    check_ptr_.assign(static_cast<size_t>(m) + 1, 0);
    edge_var_.clear();
    edge_var_.reserve(h.num_edges());
    for (int r = 0; r < m; ++r) {
        for (const int v : h.row_adj()[static_cast<size_t>(r)]) edge_var_.push_back(v);
        check_ptr_[static_cast<size_t>(r) + 1] = static_cast<int>(edge_var_.size());
    }

    var_ptr_.assign(static_cast<size_t>(n) + 1, 0);
    for (const int v : edge_var_) var_ptr_[static_cast<size_t>(v) + 1]++;
    for (int v = 0; v < n; ++v) var_ptr_[static_cast<size_t>(v) + 1] += var_ptr_[static_cast<size_t>(v)];

    var_edges_.assign(edge_var_.size(), 0);
    std::vector<int> fill(var_ptr_.begin(), var_ptr_.end() - 1);
    for (size_t e = 0; e < edge_var_.size(); ++e) {
        const int v = edge_var_[e];
        var_edges_[static_cast<size_t>(fill[static_cast<size_t>(v)]++)] = static_cast<int>(e);
    }
}

void LDPCBPDecoder::check_node_update_boxplus(const float* v2c, float* c2v) const {
    const int m = static_cast<int>(check_ptr_.size()) - 1;
    const double t_max = std::tanh(0.5 * static_cast<double>(params_.llr_clip));
    std::vector<double> t;
    std::vector<double> suffix;

    for (int r = 0; r < m; ++r) {
        const int begin = check_ptr_[static_cast<size_t>(r)];
        const int end = check_ptr_[static_cast<size_t>(r) + 1];
        const int deg = end - begin;
        if (deg == 0) continue;

        t.resize(static_cast<size_t>(deg));
        suffix.resize(static_cast<size_t>(deg) + 1);
        for (int i = 0; i < deg; ++i) {
            t[static_cast<size_t>(i)] = std::tanh(0.5 * static_cast<double>(v2c[begin + i]));
        }

        // Extrinsic products from prefix and suffix products
        suffix[static_cast<size_t>(deg)] = 1.0;
        for (int i = deg - 1; i >= 0; --i) {
            suffix[static_cast<size_t>(i)] = suffix[static_cast<size_t>(i) + 1] * t[static_cast<size_t>(i)];
        }
        double prefix = 1.0;
        for (int i = 0; i < deg; ++i) {
            double prod = prefix * suffix[static_cast<size_t>(i) + 1];
            prod = std::min(t_max, std::max(-t_max, prod));
            c2v[begin + i] = clip(static_cast<float>(2.0 * std::atanh(prod)), params_.llr_clip);
            prefix *= t[static_cast<size_t>(i)];
        }
    }
}

void LDPCBPDecoder::check_node_update_minsum(const float* v2c, float* c2v) const {
    const int m = static_cast<int>(check_ptr_.size()) - 1;

    for (int r = 0; r < m; ++r) {
        const int begin = check_ptr_[static_cast<size_t>(r)];
        const int end = check_ptr_[static_cast<size_t>(r) + 1];
        if (begin == end) continue;

        float min1 = std::numeric_limits<float>::max();
        float min2 = std::numeric_limits<float>::max();
        int min1_idx = begin;
        int sign_prod = 1;
        for (int e = begin; e < end; ++e) {
            const float v = v2c[e];
            const float a = std::abs(v);
            if (v < 0.0f) sign_prod = -sign_prod;
            if (a < min1) {
                min2 = min1;
                min1 = a;
                min1_idx = e;
            } else if (a < min2) {
                min2 = a;
            }
        }
        // A degree-1 check carries no extrinsic information
        if (end - begin == 1) min2 = 0.0f;

        for (int e = begin; e < end; ++e) {
            const int s = (v2c[e] < 0.0f) ? -sign_prod : sign_prod;
            const float mag = (e == min1_idx) ? min2 : min1;
            c2v[e] = clip(static_cast<float>(s) * mag, params_.llr_clip);
        }
    }
}

LDPCBPDecoder::Result LDPCBPDecoder::decode(const float* llr, const std::atomic<bool>* stop) const {
    const auto& h = code_.parity_check_matrix();
    const size_t n_mother = static_cast<size_t>(h.n());
    const size_t num_edges = edge_var_.size();
    const float limit = params_.llr_clip;

    std::vector<float> channel(n_mother);
    code_.expand_llrs(llr, channel.data(), limit);
    for (auto& v : channel) v = clip(v, limit);

    std::vector<float> v2c(num_edges);
    std::vector<float> c2v(num_edges, 0.0f);
    std::vector<float> belief(channel);
    std::vector<uint8_t> hard(n_mother);

    for (size_t e = 0; e < num_edges; ++e) {
        v2c[e] = channel[static_cast<size_t>(edge_var_[e])];
    }

    Result result;
    bool syndrome_ok = false;

    for (int iter = 0; iter < params_.max_iterations; ++iter) {
        if (stop && stop->load(std::memory_order_relaxed)) break;

        // Check nodes
        if (params_.rule == CheckNodeRule::BoxPlus) {
            check_node_update_boxplus(v2c.data(), c2v.data());
        } else {
            check_node_update_minsum(v2c.data(), c2v.data());
        }

        // Variable nodes
        for (size_t v = 0; v < n_mother; ++v) {
            const int begin = var_ptr_[v];
            const int end = var_ptr_[v + 1];
            float total = channel[v];
            for (int i = begin; i < end; ++i) total += c2v[static_cast<size_t>(var_edges_[static_cast<size_t>(i)])];
            belief[v] = total;
            for (int i = begin; i < end; ++i) {
                const size_t e = static_cast<size_t>(var_edges_[static_cast<size_t>(i)]);
                v2c[e] = clip(total - c2v[e], limit);
            }
        }

        result.iterations = iter + 1;

        if (params_.early_stop) {
            for (size_t v = 0; v < n_mother; ++v) hard[v] = belief[v] < 0.0f ? 1 : 0;
            if (h.check_syndrome(hard.data())) {
                syndrome_ok = true;
                break;
            }
        }
    }

    for (size_t v = 0; v < n_mother; ++v) hard[v] = belief[v] < 0.0f ? 1 : 0;
    if (!syndrome_ok) syndrome_ok = h.check_syndrome(hard.data());

    const size_t k = code_.k();
    const size_t n = code_.n();
    result.converged = syndrome_ok;
    result.info_bits.assign(hard.begin(), hard.begin() + static_cast<std::ptrdiff_t>(k));
    result.codeword.resize(n);
    result.soft_output.resize(n);
    code_.select_transmitted(hard.data(), result.codeword.data());
    code_.select_transmitted(belief.data(), result.soft_output.data());
    return result;
}

void LDPCBPDecoder::decode_batch(const LLRTensor& llr,
                                 BitTensor& info_bits,
                                 std::vector<Result>* results,
                                 const std::atomic<bool>* stop) const {
    const size_t n = code_.n();
    const size_t k = code_.k();
    if (llr.shape.size() != 4 || llr.shape[3] != n || llr.shape[1] != 1 || llr.shape[2] != 1) {
        throw std::invalid_argument("LDPCBPDecoder::decode_batch: expected LLR shape [B, 1, 1, " +
                                    std::to_string(n) + "], got " + shape_to_string(llr.shape));
    }

    const size_t batch = llr.batch_size();
    info_bits = BitTensor({batch, 1, 1, k});
    if (results) results->assign(batch, Result());

    #pragma omp parallel for schedule(dynamic)
    for (long b = 0; b < static_cast<long>(batch); ++b) {
        const size_t bi = static_cast<size_t>(b);
        Result r = decode(llr.batch_ptr(bi), stop);
        std::copy(r.info_bits.begin(), r.info_bits.end(), info_bits.batch_ptr(bi));
        if (results) (*results)[bi] = std::move(r);
    }
}

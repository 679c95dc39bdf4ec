#ifndef LDPC_CODE_HPP
#define LDPC_CODE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

/**
 * @brief Sparse binary parity-check matrix.
 *
 * Holds row and column adjacency (0-based) plus packed 64-bit row masks used for the
 * syndrome check. Can be read from and written to alist files.
 */
class ParityCheckMatrix {
public:
    ParityCheckMatrix() = default;

    // n columns (variable nodes), m rows (check nodes), row_adj[r] = columns of row r
    ParityCheckMatrix(int n, int m, std::vector<std::vector<int>> row_adj);

    static ParityCheckMatrix read_alist(const std::string& path);
    void write_alist(const std::string& path) const;

    int n() const { return n_; }
    int m() const { return m_; }
    size_t num_edges() const { return num_edges_; }

    const std::vector<std::vector<int>>& row_adj() const { return row_adj_; }
    const std::vector<std::vector<int>>& col_adj() const { return col_adj_; }

    // Number of unsatisfied checks for a length-n hard word (0/1 per entry)
    int syndrome_weight(const uint8_t* bits) const;
    bool check_syndrome(const uint8_t* bits) const { return syndrome_weight(bits) == 0; }

    bool operator==(const ParityCheckMatrix& other) const;
    bool operator!=(const ParityCheckMatrix& other) const { return !(*this == other); }

private:
    int n_ = 0;
    int m_ = 0;
    int words_ = 0;
    size_t num_edges_ = 0;
    std::vector<std::vector<int>> row_adj_;
    std::vector<std::vector<int>> col_adj_;
    // Packed parity-check matrix as m rows, each row is n bits (words_ words).
    std::vector<uint64_t> row_words_;

    void build_parity_check_bitmasks();
};


/**
 * @brief Base graph shift table in the layout of 3GPP TS 38.212 Tables 5.3.2-2 / 5.3.2-3.
 *
 * Text file, '#' starts a comment. Header line "<bg> <rows> <columns>", then one line per
 * non-zero entry "<row> <column> V0 V1 V2 V3 V4 V5 V6 V7" with one shift coefficient per
 * lifting-set index iLS. A table may stop after any row; columns = rows + 22 (BG1) or
 * rows + 10 (BG2).
 */
struct BaseGraphTable {
    struct Entry {
        size_t row = 0;
        size_t col = 0;
        std::array<int, 8> values{};
    };

    int base_graph = 0;
    size_t rows = 0;
    size_t cols = 0;
    std::vector<Entry> entries;

    static BaseGraphTable read(const std::string& path);
};


/**
 * @brief Quasi-cyclic LDPC code with 5G NR dimensioning and rate matching.
 *
 * Base graph selection, Kb and the lifting size Z follow TS 38.212 5.3.2: Z is the
 * smallest a * 2^j >= K / Kb. The mother code has 22 (BG1) or 10 (BG2) information
 * columns; the first K carry the info bits and the rest are filler (known zero). The
 * parity part is a 4-row double-diagonal core followed by extension rows that each own
 * one identity parity column.
 *
 * Shift coefficients come either from 38.212 tables in base_graph_dir (bg1.txt, bg2.txt,
 * shifts V mod Z for the iLS of Z) or, when base_graph_dir is empty, from a seeded
 * generator that keeps the same layout.
 *
 * Rate matching (redundancy version 0): the first 2Z information bits are punctured,
 * filler bits are skipped, and the codeword is the first N bits of the remaining
 * circular buffer, repeating from its start when N exceeds it.
 */
class LDPCCode {
public:
    struct Params {
        size_t k = 0;                // information bits
        size_t n = 0;                // transmitted codeword bits
        uint32_t seed = 7;           // shift generator seed (generated base graph only)
        std::string base_graph_dir;  // directory holding bg1.txt / bg2.txt, empty = generated
    };

    static constexpr size_t CORE_ROWS = 4;

    explicit LDPCCode(const Params& params);

    size_t k() const { return params_.k; }
    size_t n() const { return params_.n; }
    double rate() const { return static_cast<double>(params_.k) / static_cast<double>(params_.n); }
    int base_graph() const { return base_graph_; }
    bool standard_base_graph() const { return standard_; }
    size_t kb() const { return kb_; }
    size_t info_columns() const { return info_cols_; }
    size_t mb() const { return mb_; }
    size_t lifting_size() const { return z_; }
    size_t lifting_set_index() const { return ils_; }
    size_t mother_length() const { return (info_cols_ + mb_) * z_; }
    size_t num_filler_bits() const { return info_cols_ * z_ - params_.k; }
    // Mother bits that are neither filler nor transmitted
    size_t num_punctured_bits() const { return num_punctured_; }

    // Base matrix shifts, mb rows x (info_columns + mb) columns, -1 marks an all-zero block
    const std::vector<int>& base_matrix() const { return base_; }
    int shift(size_t row, size_t col) const { return base_[row * (info_cols_ + mb_) + col]; }

    const ParityCheckMatrix& parity_check_matrix() const { return h_; }

    // Mother position of every transmitted bit
    const std::vector<size_t>& transmitted_positions() const { return tx_pos_; }

    // k info bits -> mother codeword (mother_length bits, filler included)
    void encode_mother(const uint8_t* info_bits, uint8_t* mother_bits) const;

    // k info bits -> n transmitted bits
    void encode(const uint8_t* info_bits, uint8_t* codeword_bits) const;

    // n channel LLRs -> mother_length LLRs (filler = +llr_max, punctured = 0, repeats summed)
    void expand_llrs(const float* llr, float* mother_llr, float llr_max) const;

    // mother word (bits or beliefs) -> transmitted positions
    template<typename T>
    void select_transmitted(const T* mother, T* out) const {
        for (size_t i = 0; i < tx_pos_.size(); ++i) out[i] = mother[tx_pos_[i]];
    }

    // Lifting sizes a * 2^j <= 384, ascending
    static const std::vector<size_t>& lifting_sizes();

    // Lifting-set index of TS 38.212 Table 5.3.2-1
    static size_t lifting_set_index(size_t z);

private:
    Params params_;
    int base_graph_ = 2;
    bool standard_ = false;
    size_t kb_ = 0;
    size_t info_cols_ = 0;
    size_t mb_ = 0;
    size_t z_ = 0;
    size_t ils_ = 0;
    size_t num_punctured_ = 0;
    std::vector<int> base_;
    std::vector<size_t> tx_pos_;
    // Inverse of the 4Z x 4Z parity core, one packed row per core parity bit
    std::vector<uint64_t> core_inverse_;
    size_t core_words_ = 0;
    ParityCheckMatrix h_;

    void select_dimensions();
    size_t rows_needed(size_t available) const;
    void generate_base_matrix();
    void load_base_matrix(const BaseGraphTable& table);
    void check_layout() const;
    void invert_core();
    void lift();
    void build_rate_matching();

    // (P^s x)[k] = x[(k + s) mod Z], accumulated into acc
    void accumulate_shifted(const uint8_t* x, int s, uint8_t* acc) const;
};

#endif // LDPC_CODE_HPP

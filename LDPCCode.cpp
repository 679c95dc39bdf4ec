#include "LDPCCode.hpp"
#include "Common.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <random>
#include <sstream>
#include <stdexcept>

namespace {

static inline std::string trim_copy(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return std::string();
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

static inline int positive_mod(int a, int z) {
    const int r = a % z;
    return r < 0 ? r + z : r;
}

// Next non-empty line with '#' comments removed
static bool next_data_line(std::ifstream& in, std::string& line) {
    while (std::getline(in, line)) {
        const auto hash_pos = line.find('#');
        if (hash_pos != std::string::npos) line.erase(hash_pos);
        line = trim_copy(line);
        if (!line.empty()) return true;
    }
    return false;
}

constexpr size_t BG1_INFO_COLUMNS = 22;
constexpr size_t BG2_INFO_COLUMNS = 10;
constexpr size_t BG1_ROWS = 46;
constexpr size_t BG2_ROWS = 42;
constexpr int MAX_SHIFT_VALUE = 384;

} // namespace

// ---------------------------------------------------------------------------------------
// ParityCheckMatrix
// ---------------------------------------------------------------------------------------

ParityCheckMatrix::ParityCheckMatrix(int n, int m, std::vector<std::vector<int>> row_adj)
    : n_(n)
    , m_(m)
    , row_adj_(std::move(row_adj)) {
    if (n_ <= 0 || m_ <= 0) {
        throw std::runtime_error("ParityCheckMatrix: dimensions must be positive");
    }
    if (row_adj_.size() != static_cast<size_t>(m_)) {
        throw std::runtime_error("ParityCheckMatrix: row adjacency size does not match m");
    }

    col_adj_.assign(static_cast<size_t>(n_), {});
    num_edges_ = 0;
    for (int row = 0; row < m_; ++row) {
        auto& cols = row_adj_[static_cast<size_t>(row)];
        std::sort(cols.begin(), cols.end());
        if (std::adjacent_find(cols.begin(), cols.end()) != cols.end()) {
            throw std::runtime_error("ParityCheckMatrix: duplicate column in row " + std::to_string(row));
        }
        for (const int c : cols) {
            if (c < 0 || c >= n_) {
                throw std::runtime_error("ParityCheckMatrix: column index out of range in row " + std::to_string(row));
            }
            col_adj_[static_cast<size_t>(c)].push_back(row);
            ++num_edges_;
        }
    }

    words_ = (n_ + 63) / 64;
    build_parity_check_bitmasks();
}

ParityCheckMatrix ParityCheckMatrix::read_alist(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open alist: " + path);
    }

    int n = 0;
    int m = 0;
    std::string line;

    if (!next_data_line(in, line)) {
        throw std::runtime_error("Invalid alist (empty): " + path);
    }
    {
        std::istringstream iss(line);
        if (!(iss >> n >> m) || n <= 0 || m <= 0) {
            throw std::runtime_error("Invalid alist header dims: " + path);
        }
    }

    // max degrees line (can be ignored but must exist)
    if (!next_data_line(in, line)) {
        throw std::runtime_error("Invalid alist (missing max degree line): " + path);
    }

    std::vector<int> col_deg(static_cast<size_t>(n), 0);
    std::vector<int> row_deg(static_cast<size_t>(m), 0);

    size_t idx = 0;
    while (idx < static_cast<size_t>(n) && next_data_line(in, line)) {
        std::istringstream iss(line);
        while (idx < static_cast<size_t>(n) && (iss >> col_deg[idx])) {
            if (col_deg[idx] < 0) {
                throw std::runtime_error("Invalid negative col degree in alist: " + path);
            }
            idx++;
        }
    }
    if (idx != static_cast<size_t>(n)) {
        throw std::runtime_error("Invalid alist col degree section: " + path);
    }

    idx = 0;
    while (idx < static_cast<size_t>(m) && next_data_line(in, line)) {
        std::istringstream iss(line);
        while (idx < static_cast<size_t>(m) && (iss >> row_deg[idx])) {
            if (row_deg[idx] < 0) {
                throw std::runtime_error("Invalid negative row degree in alist: " + path);
            }
            idx++;
        }
    }
    if (idx != static_cast<size_t>(m)) {
        throw std::runtime_error("Invalid alist row degree section: " + path);
    }

    std::vector<std::vector<int>> col_adj(static_cast<size_t>(n));
    std::vector<std::vector<int>> row_adj(static_cast<size_t>(m));

    for (int col = 0; col < n; ++col) {
        if (!next_data_line(in, line)) {
            throw std::runtime_error("Invalid alist column adjacency section: " + path);
        }

        std::istringstream iss(line);
        for (int k = 0; k < col_deg[static_cast<size_t>(col)]; ++k) {
            int r = 0;
            if (!(iss >> r)) break;
            if (r <= 0) continue;
            const int rr = r - 1;
            if (rr >= m) {
                throw std::runtime_error("Out-of-range col adjacency in alist: " + path);
            }
            col_adj[static_cast<size_t>(col)].push_back(rr);
        }
    }

    for (int row = 0; row < m; ++row) {
        if (!next_data_line(in, line)) {
            throw std::runtime_error("Invalid alist row adjacency section: " + path);
        }

        std::istringstream iss(line);
        for (int k = 0; k < row_deg[static_cast<size_t>(row)]; ++k) {
            int c = 0;
            if (!(iss >> c)) break;
            if (c <= 0) continue;
            const int cc = c - 1;
            if (cc >= n) {
                throw std::runtime_error("Out-of-range row adjacency in alist: " + path);
            }
            row_adj[static_cast<size_t>(row)].push_back(cc);
        }
    }

    ParityCheckMatrix h(n, m, std::move(row_adj));

    // Both adjacency sections must describe the same matrix
    for (int col = 0; col < n; ++col) {
        auto listed = col_adj[static_cast<size_t>(col)];
        std::sort(listed.begin(), listed.end());
        if (listed != h.col_adj()[static_cast<size_t>(col)]) {
            throw std::runtime_error("Inconsistent alist (column " + std::to_string(col + 1) +
                                     " disagrees with row section): " + path);
        }
    }
    return h;
}

void ParityCheckMatrix::write_alist(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to write alist: " + path);
    }

    size_t max_col = 0;
    size_t max_row = 0;
    for (const auto& c : col_adj_) max_col = std::max(max_col, c.size());
    for (const auto& r : row_adj_) max_row = std::max(max_row, r.size());

    out << n_ << " " << m_ << "\n";
    out << max_col << " " << max_row << "\n";
    for (int col = 0; col < n_; ++col) {
        out << col_adj_[static_cast<size_t>(col)].size() << (col + 1 < n_ ? " " : "\n");
    }
    for (int row = 0; row < m_; ++row) {
        out << row_adj_[static_cast<size_t>(row)].size() << (row + 1 < m_ ? " " : "\n");
    }
    // Adjacency lists are 1-based and zero padded to the maximum degree
    for (const auto& c : col_adj_) {
        for (size_t i = 0; i < max_col; ++i) {
            out << (i < c.size() ? c[i] + 1 : 0) << (i + 1 < max_col ? " " : "\n");
        }
    }
    for (const auto& r : row_adj_) {
        for (size_t i = 0; i < max_row; ++i) {
            out << (i < r.size() ? r[i] + 1 : 0) << (i + 1 < max_row ? " " : "\n");
        }
    }

    if (!out) {
        throw std::runtime_error("Failed to write alist: " + path);
    }
}

void ParityCheckMatrix::build_parity_check_bitmasks() {
    row_words_.assign(static_cast<size_t>(m_) * static_cast<size_t>(words_), 0ull);

    for (int row = 0; row < m_; ++row) {
        const auto& cols = row_adj_[static_cast<size_t>(row)];
        for (const int cw_idx : cols) {
            const int w = cw_idx >> 6;
            const int b = cw_idx & 63;
            row_words_[static_cast<size_t>(row) * words_ + w] |= (1ull << b);
        }
    }
}

int ParityCheckMatrix::syndrome_weight(const uint8_t* bits) const {
    std::vector<uint64_t> cw_words(static_cast<size_t>(words_), 0ull);
    for (int w = 0; w < words_; ++w) {
        uint64_t word = 0ull;
        const int base = w << 6;

        #pragma omp simd reduction(|:word)
        for (int b = 0; b < 64; ++b) {
            const int idx = base + b;
            if (idx < n_) {
                word |= static_cast<uint64_t>(bits[idx] & 1) << b;
            }
        }

        cw_words[static_cast<size_t>(w)] = word;
    }

    int unsatisfied = 0;
    for (int row = 0; row < m_; ++row) {
        const uint64_t* h = &row_words_[static_cast<size_t>(row) * words_];
        int parity = 0;

        #pragma omp simd reduction(^:parity)
        for (int w = 0; w < words_; ++w) {
            const uint64_t v = cw_words[static_cast<size_t>(w)] & h[w];
            parity ^= static_cast<int>(__builtin_popcountll(v) & 1u);
        }

        unsatisfied += (parity & 1);
    }

    return unsatisfied;
}

bool ParityCheckMatrix::operator==(const ParityCheckMatrix& other) const {
    return n_ == other.n_ && m_ == other.m_ && row_adj_ == other.row_adj_;
}

// ---------------------------------------------------------------------------------------
// BaseGraphTable
// ---------------------------------------------------------------------------------------

BaseGraphTable BaseGraphTable::read(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open base graph table: " + path);
    }

    BaseGraphTable table;
    std::string line;
    if (!next_data_line(in, line)) {
        throw std::runtime_error("Invalid base graph table (empty): " + path);
    }
    {
        std::istringstream iss(line);
        long long rows = 0;
        long long cols = 0;
        if (!(iss >> table.base_graph >> rows >> cols) || (table.base_graph != 1 && table.base_graph != 2) ||
            rows <= 0 || cols <= rows) {
            throw std::runtime_error("Invalid base graph table header '" + line + "': " + path);
        }
        table.rows = static_cast<size_t>(rows);
        table.cols = static_cast<size_t>(cols);
    }

    std::vector<uint8_t> seen(table.rows * table.cols, 0);
    while (next_data_line(in, line)) {
        std::istringstream iss(line);
        long long row = -1;
        long long col = -1;
        Entry entry;
        bool ok = static_cast<bool>(iss >> row >> col);
        for (auto& v : entry.values) ok = ok && static_cast<bool>(iss >> v);
        if (!ok) {
            throw std::runtime_error("Invalid base graph entry '" + line + "': " + path);
        }
        if (row < 0 || col < 0 || static_cast<size_t>(row) >= table.rows || static_cast<size_t>(col) >= table.cols) {
            throw std::runtime_error("Out-of-range base graph entry '" + line + "': " + path);
        }
        for (const int v : entry.values) {
            if (v < 0 || v >= MAX_SHIFT_VALUE) {
                throw std::runtime_error("Invalid shift coefficient in base graph entry '" + line + "': " + path);
            }
        }

        entry.row = static_cast<size_t>(row);
        entry.col = static_cast<size_t>(col);
        uint8_t& flag = seen[entry.row * table.cols + entry.col];
        if (flag) {
            throw std::runtime_error("Duplicate base graph entry (" + std::to_string(row) + ", " +
                                     std::to_string(col) + "): " + path);
        }
        flag = 1;
        table.entries.push_back(entry);
    }

    if (table.entries.empty()) {
        throw std::runtime_error("Invalid base graph table (no entries): " + path);
    }
    return table;
}

// ---------------------------------------------------------------------------------------
// LDPCCode
// ---------------------------------------------------------------------------------------

LDPCCode::LDPCCode(const Params& params)
    : params_(params) {
    if (params_.k == 0) {
        throw ConfigurationError("LDPC: number of information bits must be positive");
    }
    if (params_.n <= params_.k) {
        throw ConfigurationError("LDPC: codeword length (" + std::to_string(params_.n) +
                                 ") must exceed the number of information bits (" +
                                 std::to_string(params_.k) + ")");
    }
    select_dimensions();
    if (params_.base_graph_dir.empty()) {
        mb_ = rows_needed(base_graph_ == 1 ? BG1_ROWS : BG2_ROWS);
        generate_base_matrix();
    } else {
        const std::string path = params_.base_graph_dir + "/bg" + std::to_string(base_graph_) + ".txt";
        load_base_matrix(BaseGraphTable::read(path));
    }
    check_layout();
    invert_core();
    lift();
    build_rate_matching();
}

const std::vector<size_t>& LDPCCode::lifting_sizes() {
    static const std::vector<size_t> sizes = [] {
        std::vector<size_t> z;
        const std::array<size_t, 8> a_set = {{2, 3, 5, 7, 9, 11, 13, 15}};
        for (const size_t a : a_set) {
            for (size_t v = a; v <= 384; v <<= 1) z.push_back(v);
        }
        std::sort(z.begin(), z.end());
        z.erase(std::unique(z.begin(), z.end()), z.end());
        return z;
    }();
    return sizes;
}

size_t LDPCCode::lifting_set_index(size_t z) {
    if (z >= 2 && z <= 384) {
        size_t a = z;
        while ((a & 1u) == 0) a >>= 1;
        if (a == 1) return 0;
        const std::array<size_t, 7> odd = {{3, 5, 7, 9, 11, 13, 15}};
        for (size_t i = 0; i < odd.size(); ++i) {
            if (odd[i] == a) return i + 1;
        }
    }
    throw ConfigurationError("LDPC: " + std::to_string(z) + " is not a lifting size");
}

void LDPCCode::select_dimensions() {
    const size_t k = params_.k;
    const double r = rate();

    if (k <= 292 || (k <= 3824 && r <= 0.67) || r <= 0.25) {
        base_graph_ = 2;
        info_cols_ = BG2_INFO_COLUMNS;
        if (k > 640) kb_ = 10;
        else if (k > 560) kb_ = 9;
        else if (k > 192) kb_ = 8;
        else kb_ = 6;
    } else {
        base_graph_ = 1;
        info_cols_ = BG1_INFO_COLUMNS;
        kb_ = 22;
    }

    const size_t min_z = (k + kb_ - 1) / kb_;
    z_ = 0;
    for (const size_t z : lifting_sizes()) {
        if (z >= min_z) {
            z_ = z;
            break;
        }
    }
    if (z_ == 0) {
        throw ConfigurationError("LDPC: K=" + std::to_string(k) + " exceeds the largest single code block (" +
                                 std::to_string(kb_ * 384) + " bits for base graph " +
                                 std::to_string(base_graph_) + ")");
    }
    ils_ = lifting_set_index(z_);
}

size_t LDPCCode::rows_needed(size_t available) const {
    // N bits after the 2Z punctured columns and the filler bits
    const size_t bits = params_.n + 2 * z_ + num_filler_bits();
    const size_t cols = (bits + z_ - 1) / z_;
    const size_t rows = std::max(CORE_ROWS, cols > info_cols_ ? cols - info_cols_ : size_t(0));
    return std::min(rows, available);
}

void LDPCCode::generate_base_matrix() {
    const size_t cols = info_cols_ + mb_;
    const size_t p = info_cols_;
    base_.assign(mb_ * cols, -1);
    auto at = [&](size_t r, size_t c) -> int& { return base_[r * cols + c]; };

    // Double-diagonal core, first parity column P^1 + P^0 + P^1 = P^0
    at(0, p) = 1;
    at(2, p) = 0;
    at(3, p) = 1;
    for (size_t j = 1; j < CORE_ROWS; ++j) {
        at(j - 1, p + j) = 0;
        at(j, p + j) = 0;
    }
    for (size_t r = CORE_ROWS; r < mb_; ++r) at(r, p + r) = 0;

    std::mt19937 rng(params_.seed);
    std::vector<std::pair<size_t, size_t>> pending;

    // Punctured columns 0 and 1 join every core row, the others three of the four
    for (size_t c = 0; c < info_cols_; ++c) {
        const size_t skip = c < 2 ? CORE_ROWS : static_cast<size_t>(rng() % CORE_ROWS);
        for (size_t r = 0; r < CORE_ROWS; ++r) {
            if (r != skip) pending.emplace_back(r, c);
        }
    }
    // Extension rows: one punctured column, one further information column, one core parity column
    for (size_t r = CORE_ROWS; r < mb_; ++r) {
        pending.emplace_back(r, r % 2);
        pending.emplace_back(r, 2 + (r - CORE_ROWS) % (info_cols_ - 2));
        pending.emplace_back(r, p + 1 + r % (CORE_ROWS - 1));
    }

    // Shifts with greedy length-4 cycle avoidance
    const int Z = static_cast<int>(z_);
    constexpr int MAX_ATTEMPTS = 200;
    auto cycles_at = [&](size_t r, size_t c, int s) {
        int cycles = 0;
        for (size_t r2 = 0; r2 < mb_; ++r2) {
            if (r2 == r) continue;
            const int t = at(r2, c);
            if (t < 0) continue;
            for (size_t c2 = 0; c2 < cols; ++c2) {
                if (c2 == c) continue;
                const int a = at(r, c2);
                const int b = at(r2, c2);
                if (a < 0 || b < 0) continue;
                if (positive_mod(s - a + b - t, Z) == 0) ++cycles;
            }
        }
        return cycles;
    };

    for (const auto& entry : pending) {
        int best_shift = 0;
        int best_cycles = -1;
        for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
            const int s = static_cast<int>(rng() % z_);
            const int cycles = cycles_at(entry.first, entry.second, s);
            if (best_cycles < 0 || cycles < best_cycles) {
                best_cycles = cycles;
                best_shift = s;
            }
            if (cycles == 0) break;
        }
        at(entry.first, entry.second) = best_shift;
    }
}

void LDPCCode::load_base_matrix(const BaseGraphTable& table) {
    if (table.base_graph != base_graph_) {
        throw std::runtime_error("LDPC: base graph table holds BG" + std::to_string(table.base_graph) +
                                 ", expected BG" + std::to_string(base_graph_));
    }
    if (table.cols != table.rows + info_cols_) {
        throw std::runtime_error("LDPC: BG" + std::to_string(base_graph_) + " table with " +
                                 std::to_string(table.rows) + " rows must have " +
                                 std::to_string(table.rows + info_cols_) + " columns");
    }
    if (table.rows < CORE_ROWS) {
        throw std::runtime_error("LDPC: base graph table needs at least the " + std::to_string(CORE_ROWS) +
                                 " core rows");
    }

    mb_ = rows_needed(table.rows);
    const size_t cols = info_cols_ + mb_;
    const int Z = static_cast<int>(z_);
    base_.assign(mb_ * cols, -1);
    for (const auto& e : table.entries) {
        if (e.row >= mb_) continue;
        if (e.col >= cols) {
            throw std::runtime_error("LDPC: base graph row " + std::to_string(e.row) + " uses parity column " +
                                     std::to_string(e.col) + " beyond its own extension column");
        }
        base_[e.row * cols + e.col] = e.values[ils_] % Z;
    }
    standard_ = true;
}

void LDPCCode::check_layout() const {
    const size_t cols = info_cols_ + mb_;
    for (size_t r = 0; r < mb_; ++r) {
        for (size_t c = info_cols_ + CORE_ROWS; c < cols; ++c) {
            const bool own = c == info_cols_ + r;
            if (own && shift(r, c) < 0) {
                throw ConfigurationError("LDPC: extension row " + std::to_string(r) + " has no own parity column");
            }
            if (!own && shift(r, c) >= 0) {
                throw ConfigurationError("LDPC: row " + std::to_string(r) + " connects to extension parity column " +
                                         std::to_string(c));
            }
        }
    }
}

void LDPCCode::invert_core() {
    const size_t n = CORE_ROWS * z_;
    const size_t W = (n + 63) / 64;
    std::vector<uint64_t> a(n * W, 0ull);
    std::vector<uint64_t> inv(n * W, 0ull);

    for (size_t r = 0; r < CORE_ROWS; ++r) {
        for (size_t k = 0; k < z_; ++k) {
            const size_t row = r * z_ + k;
            for (size_t j = 0; j < CORE_ROWS; ++j) {
                const int s = shift(r, info_cols_ + j);
                if (s < 0) continue;
                const size_t col = j * z_ + (k + static_cast<size_t>(s)) % z_;
                a[row * W + (col >> 6)] ^= 1ull << (col & 63);
            }
            inv[row * W + (row >> 6)] |= 1ull << (row & 63);
        }
    }

    // Gauss-Jordan over GF(2)
    for (size_t col = 0; col < n; ++col) {
        const size_t w = col >> 6;
        const uint64_t bit = 1ull << (col & 63);
        size_t pivot = col;
        while (pivot < n && !(a[pivot * W + w] & bit)) ++pivot;
        if (pivot == n) {
            throw ConfigurationError("LDPC: parity core of base graph " + std::to_string(base_graph_) +
                                     " is singular for Z=" + std::to_string(z_));
        }
        if (pivot != col) {
            for (size_t i = 0; i < W; ++i) {
                std::swap(a[pivot * W + i], a[col * W + i]);
                std::swap(inv[pivot * W + i], inv[col * W + i]);
            }
        }
        for (size_t row = 0; row < n; ++row) {
            if (row == col || !(a[row * W + w] & bit)) continue;
            for (size_t i = 0; i < W; ++i) {
                a[row * W + i] ^= a[col * W + i];
                inv[row * W + i] ^= inv[col * W + i];
            }
        }
    }

    core_inverse_ = std::move(inv);
    core_words_ = W;
}

void LDPCCode::lift() {
    const size_t cols = info_cols_ + mb_;
    const int Z = static_cast<int>(z_);
    std::vector<std::vector<int>> row_adj(mb_ * z_);

    for (size_t r = 0; r < mb_; ++r) {
        for (int k = 0; k < Z; ++k) {
            auto& adj = row_adj[r * z_ + static_cast<size_t>(k)];
            for (size_t c = 0; c < cols; ++c) {
                const int s = shift(r, c);
                if (s < 0) continue;
                adj.push_back(static_cast<int>(c * z_) + (k + s) % Z);
            }
        }
    }

    h_ = ParityCheckMatrix(static_cast<int>(cols * z_), static_cast<int>(mb_ * z_), std::move(row_adj));
}

void LDPCCode::build_rate_matching() {
    const size_t len = mother_length();
    const size_t filler_begin = params_.k;
    const size_t filler_end = info_cols_ * z_;
    auto is_filler = [&](size_t p) { return p >= filler_begin && p < filler_end; };

    // Circular buffer from column 2 on, filler skipped
    std::vector<size_t> buffer;
    buffer.reserve(len);
    for (size_t p = 2 * z_; p < len; ++p) {
        if (!is_filler(p)) buffer.push_back(p);
    }

    tx_pos_.resize(params_.n);
    for (size_t i = 0; i < params_.n; ++i) tx_pos_[i] = buffer[i % buffer.size()];

    std::vector<uint8_t> sent(len, 0);
    for (const size_t p : tx_pos_) sent[p] = 1;
    num_punctured_ = 0;
    for (size_t p = 0; p < len; ++p) {
        if (!is_filler(p) && !sent[p]) ++num_punctured_;
    }
}

void LDPCCode::accumulate_shifted(const uint8_t* x, int s, uint8_t* acc) const {
    const size_t Z = z_;
    const size_t shift = static_cast<size_t>(s);
    for (size_t k = 0; k < Z; ++k) {
        acc[k] ^= x[(k + shift) % Z];
    }
}

void LDPCCode::encode_mother(const uint8_t* info_bits, uint8_t* mother_bits) const {
    const size_t Z = z_;
    std::fill(mother_bits, mother_bits + mother_length(), uint8_t(0));
    for (size_t i = 0; i < params_.k; ++i) {
        mother_bits[i] = info_bits[i] & 1u;
    }

    // lambda_r = sum_c P^{s(r,c)} u_c over the information columns
    std::vector<uint8_t> lambda(mb_ * Z, 0);
    for (size_t r = 0; r < mb_; ++r) {
        for (size_t c = 0; c < info_cols_; ++c) {
            const int s = shift(r, c);
            if (s >= 0) accumulate_shifted(mother_bits + c * Z, s, &lambda[r * Z]);
        }
    }

    uint8_t* parity = mother_bits + info_cols_ * Z;

    // Core parity: p_core = Hc^-1 lambda_core
    const size_t core_bits = CORE_ROWS * Z;
    std::vector<uint64_t> packed(core_words_, 0ull);
    for (size_t i = 0; i < core_bits; ++i) {
        packed[i >> 6] |= static_cast<uint64_t>(lambda[i] & 1u) << (i & 63);
    }
    for (size_t i = 0; i < core_bits; ++i) {
        const uint64_t* row = &core_inverse_[i * core_words_];
        int bit = 0;

        #pragma omp simd reduction(^:bit)
        for (size_t w = 0; w < core_words_; ++w) {
            bit ^= static_cast<int>(__builtin_popcountll(row[w] & packed[w]) & 1u);
        }

        parity[i] = static_cast<uint8_t>(bit & 1);
    }

    // Extension rows: P^{s_own} p_r = lambda_r + sum of shifted core parity blocks
    std::vector<uint8_t> t(Z);
    for (size_t r = CORE_ROWS; r < mb_; ++r) {
        std::copy(lambda.begin() + static_cast<std::ptrdiff_t>(r * Z),
                  lambda.begin() + static_cast<std::ptrdiff_t>((r + 1) * Z), t.begin());
        for (size_t j = 0; j < CORE_ROWS; ++j) {
            const int s = shift(r, info_cols_ + j);
            if (s >= 0) accumulate_shifted(parity + j * Z, s, t.data());
        }
        const size_t own = static_cast<size_t>(shift(r, info_cols_ + r));
        uint8_t* pr = parity + r * Z;
        for (size_t m = 0; m < Z; ++m) pr[m] = t[(m + Z - own) % Z];
    }
}

void LDPCCode::encode(const uint8_t* info_bits, uint8_t* codeword_bits) const {
    std::vector<uint8_t> mother(mother_length());
    encode_mother(info_bits, mother.data());
    select_transmitted(mother.data(), codeword_bits);
}

void LDPCCode::expand_llrs(const float* llr, float* mother_llr, float llr_max) const {
    std::fill(mother_llr, mother_llr + mother_length(), 0.0f);
    std::fill(mother_llr + params_.k, mother_llr + info_cols_ * z_, llr_max);
    for (size_t i = 0; i < tx_pos_.size(); ++i) mother_llr[tx_pos_[i]] += llr[i];
}

#ifndef RESOURCE_GRID_HPP
#define RESOURCE_GRID_HPP

#include <vector>
#include <complex>
#include <string>
#include <utility>
#include <algorithm>
#include <Common.hpp>
#include <OFDMSignalProcessing.hpp>

namespace LinkSim {
namespace Core {

    enum class ResourceRole : uint8_t {
        Data = 0,
        Pilot = 1,
        Guard = 2
    };

    /**
     * @brief OFDM Resource Grid
     *
     * Static role assignment (data, pilot, guard) of every resource element of one
     * slot for a single transmitter and stream. Element (s, k) lives at flat index
     * s * fft_size + k. Subcarrier 0 is the lowest frequency, DC sits at fft_size / 2.
     *
     * Pilot patterns:
     * - "kronecker": every effective subcarrier of the listed pilot OFDM symbols
     * - "custom":    explicit (symbol, subcarrier) positions
     * - "empty":     no pilots
     */
    class ResourceGrid {
    public:
        struct Params {
            size_t num_ofdm_symbols = 14;
            size_t fft_size = 76;
            double subcarrier_spacing = 30e3;
            size_t cp_length = 6;
            size_t num_guard_left = 0;
            size_t num_guard_right = 0;
            bool dc_null = false;
            std::string pilot_pattern = "kronecker";
            std::vector<size_t> pilot_ofdm_symbol_indices = {2, 11};
            std::vector<std::pair<size_t, size_t>> custom_pilot_positions;
            std::string pilot_sequence = "qpsk";
            uint32_t pilot_seed = 1;
            int zc_root = 29;
            size_t num_streams_per_tx = 1;
        };

        static Params params_from_config(const Config& cfg) {
            Params p;
            p.num_ofdm_symbols = cfg.num_ofdm_symbols;
            p.fft_size = cfg.fft_size;
            p.subcarrier_spacing = cfg.subcarrier_spacing;
            p.cp_length = cfg.cp_length;
            p.num_guard_left = cfg.num_guard_left;
            p.num_guard_right = cfg.num_guard_right;
            p.dc_null = cfg.dc_null;
            p.pilot_pattern = cfg.pilot_pattern;
            p.pilot_ofdm_symbol_indices = cfg.pilot_ofdm_symbol_indices;
            p.custom_pilot_positions = cfg.custom_pilot_positions;
            p.pilot_sequence = cfg.pilot_sequence;
            p.pilot_seed = cfg.pilot_seed;
            p.zc_root = cfg.zc_root;
            return p;
        }

        explicit ResourceGrid(const Params& params) : _params(params) {
            _validate();
            _init_roles();
            _init_pilots();
            _init_indices();
        }

        const Params& params() const { return _params; }
        size_t num_ofdm_symbols() const { return _params.num_ofdm_symbols; }
        size_t fft_size() const { return _params.fft_size; }
        size_t cp_length() const { return _params.cp_length; }
        double subcarrier_spacing() const { return _params.subcarrier_spacing; }
        double sample_rate() const { return static_cast<double>(_params.fft_size) * _params.subcarrier_spacing; }
        size_t num_streams_per_tx() const { return _params.num_streams_per_tx; }
        size_t num_resource_elements() const { return _params.num_ofdm_symbols * _params.fft_size; }

        size_t dc_index() const { return _params.fft_size / 2; }

        size_t num_effective_subcarriers() const {
            return _params.fft_size - _params.num_guard_left - _params.num_guard_right - (_params.dc_null ? 1 : 0);
        }

        bool is_effective_subcarrier(size_t k) const {
            if (k < _params.num_guard_left) return false;
            if (k >= _params.fft_size - _params.num_guard_right) return false;
            if (_params.dc_null && k == dc_index()) return false;
            return true;
        }

        ResourceRole role(size_t symbol, size_t subcarrier) const {
            return _roles[symbol * _params.fft_size + subcarrier];
        }
        const std::vector<ResourceRole>& roles() const { return _roles; }

        // Flat indices (s * fft_size + k) in symbol-major order
        const std::vector<size_t>& data_indices() const { return _data_indices; }
        const std::vector<size_t>& pilot_indices() const { return _pilot_indices; }

        size_t num_data_symbols() const { return _data_indices.size(); }
        size_t num_pilot_symbols() const { return _pilot_indices.size(); }

        // Known pilot values in pilot order
        const AlignedVector& pilot_values() const { return _pilot_values; }

        /**
         * @brief Ratio of transmitted resource elements to data elements.
         *
         * All OFDM symbols times the effective subcarriers, stretched by the cyclic
         * prefix overhead, per data element and stream.
         */
        double overhead() const {
            const double cp_factor = 1.0 + static_cast<double>(_params.cp_length) / static_cast<double>(_params.fft_size);
            const double transmitted = static_cast<double>(_params.num_ofdm_symbols) *
                                       static_cast<double>(num_effective_subcarriers()) * cp_factor;
            return transmitted / static_cast<double>(num_data_symbols()) /
                   static_cast<double>(_params.num_streams_per_tx);
        }

        /**
         * @brief Character map of the grid: D data, P pilot, G guard. One line per OFDM symbol.
         */
        std::string to_string() const {
            std::string out;
            out.reserve((_params.fft_size + 1) * _params.num_ofdm_symbols);
            for (size_t s = 0; s < _params.num_ofdm_symbols; ++s) {
                for (size_t k = 0; k < _params.fft_size; ++k) {
                    switch (role(s, k)) {
                        case ResourceRole::Data:  out += 'D'; break;
                        case ResourceRole::Pilot: out += 'P'; break;
                        case ResourceRole::Guard: out += 'G'; break;
                    }
                }
                out += '\n';
            }
            return out;
        }

    private:
        Params _params;
        std::vector<ResourceRole> _roles;
        std::vector<size_t> _data_indices;
        std::vector<size_t> _pilot_indices;
        AlignedVector _pilot_values;

        void _validate() const {
            if (_params.num_ofdm_symbols == 0) throw ConfigurationError("num_ofdm_symbols must be positive");
            if (_params.fft_size == 0) throw ConfigurationError("fft_size must be positive");
            if (!(_params.subcarrier_spacing > 0.0)) throw ConfigurationError("subcarrier_spacing must be positive");
            if (_params.cp_length >= _params.fft_size) throw ConfigurationError("cp_length must be smaller than fft_size");
            if (_params.num_streams_per_tx == 0) throw ConfigurationError("num_streams_per_tx must be positive");
            const size_t used = _params.num_guard_left + _params.num_guard_right + (_params.dc_null ? 1 : 0);
            if (used >= _params.fft_size) {
                throw ConfigurationError("guard carriers and DC null leave no effective subcarrier");
            }
            if (_params.dc_null && (dc_index() < _params.num_guard_left ||
                                    dc_index() >= _params.fft_size - _params.num_guard_right)) {
                throw ConfigurationError("DC subcarrier falls inside the guard band");
            }
            if (_params.pilot_pattern != "kronecker" && _params.pilot_pattern != "custom" &&
                _params.pilot_pattern != "empty") {
                throw ConfigurationError("unknown pilot_pattern '" + _params.pilot_pattern + "'");
            }
            if (_params.pilot_sequence != "qpsk" && _params.pilot_sequence != "zc") {
                throw ConfigurationError("unknown pilot_sequence '" + _params.pilot_sequence + "'");
            }
        }

        void _init_roles() {
            const size_t S = _params.num_ofdm_symbols;
            const size_t F = _params.fft_size;
            _roles.assign(S * F, ResourceRole::Data);

            for (size_t s = 0; s < S; ++s) {
                for (size_t k = 0; k < F; ++k) {
                    if (!is_effective_subcarrier(k)) _roles[s * F + k] = ResourceRole::Guard;
                }
            }

            if (_params.pilot_pattern == "kronecker") {
                for (auto s : _params.pilot_ofdm_symbol_indices) {
                    if (s >= S) {
                        throw ConfigurationError("pilot OFDM symbol index " + std::to_string(s) +
                                                 " out of range [0, " + std::to_string(S) + ")");
                    }
                    for (size_t k = 0; k < F; ++k) {
                        if (is_effective_subcarrier(k)) _roles[s * F + k] = ResourceRole::Pilot;
                    }
                }
            } else if (_params.pilot_pattern == "custom") {
                for (const auto& pos : _params.custom_pilot_positions) {
                    const size_t s = pos.first;
                    const size_t k = pos.second;
                    if (s >= S || k >= F) {
                        throw ConfigurationError("custom pilot position (" + std::to_string(s) + ", " +
                                                 std::to_string(k) + ") outside the grid");
                    }
                    auto& r = _roles[s * F + k];
                    if (r == ResourceRole::Guard) {
                        throw ConfigurationError("custom pilot position (" + std::to_string(s) + ", " +
                                                 std::to_string(k) + ") is a guard carrier");
                    }
                    if (r == ResourceRole::Pilot) {
                        throw ConfigurationError("duplicate custom pilot position (" + std::to_string(s) + ", " +
                                                 std::to_string(k) + ")");
                    }
                    r = ResourceRole::Pilot;
                }
            }
        }

        void _init_pilots() {
            size_t num_pilots = 0;
            for (auto r : _roles) num_pilots += (r == ResourceRole::Pilot) ? 1 : 0;
            if (num_pilots == 0) {
                _pilot_values.clear();
                return;
            }
            if (_params.pilot_sequence == "zc") {
                _pilot_values = DSP::generate_zc_sequence(static_cast<int>(num_pilots), _params.zc_root);
            } else {
                _pilot_values = DSP::generate_qpsk_sequence(num_pilots, _params.pilot_seed);
            }
        }

        void _init_indices() {
            _data_indices.clear();
            _pilot_indices.clear();
            for (size_t i = 0; i < _roles.size(); ++i) {
                if (_roles[i] == ResourceRole::Data) _data_indices.push_back(i);
                else if (_roles[i] == ResourceRole::Pilot) _pilot_indices.push_back(i);
            }
            if (_data_indices.empty()) {
                throw ConfigurationError("resource grid has no data elements");
            }
        }
    };

} // namespace Core
} // namespace LinkSim

#endif // RESOURCE_GRID_HPP

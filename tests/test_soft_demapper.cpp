// path: tests/test_soft_demapper.cpp
#include "Common.hpp"
#include "OFDMCore.hpp"
#include "SoftDemapperCore.hpp"
#include <cassert>
#include <cmath>
#include <complex>
#include <iostream>
#include <random>

using namespace LinkSim::Core;

static inline uint8_t hard_bit(float llr) { return llr < 0.f ? 1u : 0u; }

int main() {
    // Gray QPSK labelling: first bit drives the real part, second the imaginary part
    {
        QAMConstellation qpsk(2);
        const float a = static_cast<float>(M_SQRT1_2);
        assert(std::abs(qpsk.point(0) - std::complex<float>(a, a)) < 1e-6f);
        assert(std::abs(qpsk.point(1) - std::complex<float>(a, -a)) < 1e-6f);
        assert(std::abs(qpsk.point(2) - std::complex<float>(-a, a)) < 1e-6f);
        assert(std::abs(qpsk.point(3) - std::complex<float>(-a, -a)) < 1e-6f);
    }

    // Unit average energy and Gray neighbours for 16-QAM and 64-QAM
    for (size_t m : {4, 6}) {
        QAMConstellation qam(m);
        double energy = 0.0;
        for (const auto& p : qam.points()) energy += std::norm(p);
        energy /= static_cast<double>(qam.size());
        assert(std::fabs(energy - 1.0) < 1e-5);

        float dmin = 1e9f;
        for (size_t a = 0; a < qam.size(); ++a)
            for (size_t b = a + 1; b < qam.size(); ++b) dmin = std::min(dmin, std::abs(qam.points()[a] - qam.points()[b]));
        for (size_t a = 0; a < qam.size(); ++a) {
            for (size_t b = a + 1; b < qam.size(); ++b) {
                if (std::abs(qam.points()[a] - qam.points()[b]) < dmin * 1.01f) {
                    assert(__builtin_popcount(static_cast<unsigned>(a ^ b)) == 1);
                }
            }
        }
    }

    // Noise-free symbols: LLR signs match the transmitted bits
    {
        QAMConstellation qam(4);
        SoftDemapperCore demapper(qam, SoftDemapperCore::Params{});
        float llr[4];
        for (unsigned label = 0; label < qam.size(); ++label) {
            demapper.demap_symbol(qam.point(label), 0.01f, llr);
            for (size_t i = 0; i < 4; ++i) {
                assert(hard_bit(llr[i]) == qam.bit(label, i));
                assert(std::isfinite(llr[i]));
            }
        }
    }

    // QPSK APP LLR has the closed form 2 sqrt(2) Re(x) / N0
    {
        QAMConstellation qpsk(2);
        SoftDemapperCore demapper(qpsk, SoftDemapperCore::Params{});
        float llr[2];
        const std::complex<float> x(0.3f, -0.2f);
        const float no = 0.5f;
        demapper.demap_symbol(x, no, llr);
        const float expect0 = 2.0f * std::sqrt(2.0f) * x.real() / no;
        const float expect1 = 2.0f * std::sqrt(2.0f) * x.imag() / no;
        assert(std::fabs(llr[0] - expect0) < 1e-4f);
        assert(std::fabs(llr[1] - expect1) < 1e-4f);
    }

    // APP and max-log agree in sign at high SNR and APP magnitude is never larger
    {
        QAMConstellation qam(4);
        SoftDemapperCore app(qam, SoftDemapperCore::Params{});
        SoftDemapperCore::Params p;
        p.method = SoftDemapperCore::parse_method("maxlog");
        SoftDemapperCore maxlog(qam, p);

        std::mt19937 rng(99);
        std::normal_distribution<float> nd(0.0f, 0.05f);
        std::uniform_int_distribution<unsigned> label(0, 15);
        size_t agree = 0, total = 0;
        for (int t = 0; t < 2000; ++t) {
            const std::complex<float> x = qam.point(label(rng)) + std::complex<float>(nd(rng), nd(rng));
            float la[4], lm[4];
            app.demap_symbol(x, 0.005f, la);
            maxlog.demap_symbol(x, 0.005f, lm);
            for (size_t i = 0; i < 4; ++i) {
                agree += (hard_bit(la[i]) == hard_bit(lm[i])) ? 1 : 0;
                ++total;
            }
        }
        std::cout << "[INFO] APP / max-log sign agreement " << agree << " / " << total << std::endl;
        assert(agree == total);
    }

    // Tiny noise variance stays finite
    {
        QAMConstellation qam(6);
        SoftDemapperCore demapper(qam, SoftDemapperCore::Params{});
        float llr[6];
        demapper.demap_symbol(std::complex<float>(5.0f, -5.0f), 0.0f, llr);
        for (float v : llr) assert(std::isfinite(v));
    }

    // Batch demapping shape
    {
        QAMConstellation qam(2);
        SoftDemapperCore demapper(qam, SoftDemapperCore::Params{});
        ComplexTensor x({2, 1, 1, 10});
        RealTensor no({2, 1, 1, 10});
        for (auto& v : no.data) v = 0.1f;
        LLRTensor llr;
        demapper.demap(x, no, llr);
        assert((llr.shape == std::vector<size_t>{2, 1, 1, 20}));
    }

    std::cout << "[PASS] soft demapper" << std::endl;
    return 0;
}

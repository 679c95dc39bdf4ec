// path: tests/test_interleaver.cpp
#include "Common.hpp"
#include "OFDMCore.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <numeric>
#include <vector>

int main() {
    // Seeded permutation is a permutation and deterministic
    {
        RandomInterleaver a(1824, 1234);
        RandomInterleaver b(1824, 1234);
        RandomInterleaver c(1824, 4321);
        assert(a.permutation() == b.permutation());
        assert(a.permutation() != c.permutation());

        std::vector<size_t> sorted = a.permutation();
        std::sort(sorted.begin(), sorted.end());
        for (size_t i = 0; i < sorted.size(); ++i) assert(sorted[i] == i);

        size_t fixed = 0;
        for (size_t i = 0; i < a.length(); ++i) fixed += a.permutation()[i] == i ? 1 : 0;
        std::cout << "[INFO] fixed points: " << fixed << " / " << a.length() << std::endl;
        assert(fixed < a.length() / 10);
    }

    // deinterleave(interleave(x)) == x for bits and LLRs
    {
        RandomInterleaver il(257, 9);
        std::vector<uint8_t> bits(257), mixed(257), back(257);
        for (size_t i = 0; i < bits.size(); ++i) bits[i] = static_cast<uint8_t>((i * 7 + 3) % 5 == 0);
        il.interleave(bits.data(), mixed.data());
        il.deinterleave(mixed.data(), back.data());
        assert(back == bits);

        std::vector<float> llr(257), llr_mixed(257), llr_back(257);
        std::iota(llr.begin(), llr.end(), -128.0f);
        il.interleave(llr.data(), llr_mixed.data());
        for (size_t i = 0; i < llr.size(); ++i) assert(llr_mixed[i] == llr[il.permutation()[i]]);
        il.deinterleave(llr_mixed.data(), llr_back.data());
        assert(llr_back == llr);
    }

    // Explicit permutation
    {
        RandomInterleaver il(std::vector<size_t>{2, 0, 3, 1});
        const int in[4] = {10, 11, 12, 13};
        int out[4];
        il.interleave(in, out);
        assert(out[0] == 12 && out[1] == 10 && out[2] == 13 && out[3] == 11);
        int back[4];
        il.deinterleave(out, back);
        for (int i = 0; i < 4; ++i) assert(back[i] == in[i]);
    }

    // Invalid permutations
    {
        bool thrown = false;
        try {
            RandomInterleaver il(std::vector<size_t>{0, 0, 1});
        } catch (const ConfigurationError&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            RandomInterleaver il(std::vector<size_t>{0, 3});
        } catch (const ConfigurationError&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            RandomInterleaver il(0, 1);
        } catch (const ConfigurationError&) {
            thrown = true;
        }
        assert(thrown);
    }

    std::cout << "[PASS] interleaver" << std::endl;
    return 0;
}

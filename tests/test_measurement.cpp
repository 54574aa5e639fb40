#include <gtest/gtest.h>

#include "../crypto/random_source.hpp"
#include "../quantum/measurement.hpp"
#include "test_support.hpp"

using namespace qkdsim;
using qkdsim::testing_support::ScriptedRandomSource;

TEST(ProjectiveMeasurementTest, MatchingBasisReturnsPreparedBit) {
    ScriptedRandomSource rng;
    ProjectiveMeasurement m(rng);

    EXPECT_EQ(m.measure(Qubit{Bit::One, Basis::Diagonal}, Basis::Diagonal), Bit::One);
    EXPECT_EQ(m.measure(Qubit{Bit::Zero, Basis::Rectilinear}, Basis::Rectilinear), Bit::Zero);
    EXPECT_EQ(rng.bit_draws, 0u);
}

TEST(ProjectiveMeasurementTest, MismatchedBasisDrawsFreshBit) {
    ScriptedRandomSource rng(bits_from_ints({1, 0, 1}), {});
    ProjectiveMeasurement m(rng);

    EXPECT_EQ(m.measure(Qubit{Bit::Zero, Basis::Rectilinear}, Basis::Diagonal), Bit::One);
    EXPECT_EQ(m.measure(Qubit{Bit::One, Basis::Diagonal}, Basis::Rectilinear), Bit::Zero);
    EXPECT_EQ(m.measure(Qubit{Bit::Zero, Basis::Diagonal}, Basis::Rectilinear), Bit::One);
    EXPECT_EQ(rng.bit_draws, 3u);
}

TEST(RandomSourceTest, SeededSourcesReplayIdentically) {
    SeededRandomSource a(42);
    SeededRandomSource b(42);
    for (int i = 0; i < 512; ++i) {
        ASSERT_EQ(a.random_bit(), b.random_bit());
        ASSERT_EQ(a.random_basis(), b.random_basis());
    }
}

TEST(RandomSourceTest, OpenSslSourceCoversBothValues) {
    OpenSslRandomSource rng(4);
    int ones = 0;
    int diagonal = 0;
    const int draws = 4000;
    for (int i = 0; i < draws; ++i) {
        ones += bit_to_int(rng.random_bit());
        if (rng.random_basis() == Basis::Diagonal) ++diagonal;
    }
    // Far outside any plausible deviation for a fair source.
    EXPECT_GT(ones, draws / 4);
    EXPECT_LT(ones, 3 * draws / 4);
    EXPECT_GT(diagonal, draws / 4);
    EXPECT_LT(diagonal, 3 * draws / 4);
}

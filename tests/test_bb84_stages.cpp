#include <gtest/gtest.h>

#include "../bb84/bb84.hpp"
#include "test_support.hpp"

#include <stdexcept>

using namespace qkdsim;
using qkdsim::testing_support::ScriptedRandomSource;
using qkdsim::testing_support::repeat_basis;

namespace {
const Basis R = Basis::Rectilinear;
const Basis D = Basis::Diagonal;
} // namespace

TEST(PreparationTest, DrawsAllBitsBeforeBases) {
    ScriptedRandomSource rng(bits_from_ints({1, 0, 1}), {D, R, D});
    PreparedQubits alice = prepare_qubits(3, rng);

    EXPECT_EQ(alice.bits, bits_from_ints({1, 0, 1}));
    EXPECT_EQ(alice.bases, (BasisSequence{D, R, D}));
    EXPECT_EQ(rng.bit_draws, 3u);
    EXPECT_EQ(rng.basis_draws, 3u);
}

TEST(TransmissionTest, InterceptResendReplacesChannelWithEvesView) {
    // Eve matches Alice at index 0 and 2, mismatches at 1 and 3.
    ScriptedRandomSource rng(bits_from_ints({1, 1}), {R, R, D, R});
    ProjectiveMeasurement m(rng);

    Transmission channel;
    channel.bits = bits_from_ints({0, 0, 1, 0});
    channel.bases = {R, D, D, D};

    InterceptResult eve = intercept_resend(channel, rng, m);
    EXPECT_EQ(eve.eve_bases, (BasisSequence{R, R, D, R}));
    EXPECT_EQ(eve.eve_bits, bits_from_ints({0, 1, 1, 1}));
    EXPECT_EQ(eve.resent.bits, eve.eve_bits);
    EXPECT_EQ(eve.resent.bases, eve.eve_bases);
}

TEST(TransmissionTest, MeasureSequenceRejectsLengthMismatch) {
    ScriptedRandomSource rng;
    ProjectiveMeasurement m(rng);
    Transmission channel;
    channel.bits = bits_from_ints({0, 1});
    channel.bases = {R, R};
    EXPECT_THROW(measure_sequence(channel, {R}, m), std::invalid_argument);
}

TEST(SiftingTest, EightQubitScenarioKeepsMatchingIndices) {
    const BitSequence alice_bits = bits_from_ints({0, 1, 1, 0, 1, 0, 0, 1});
    const BasisSequence alice_bases = {R, D, D, R, R, R, D, D};
    const BasisSequence bob_bases = {R, R, D, D, R, D, D, R};

    // Noiseless channel: Bob's bit equals Alice's wherever the bases agree.
    ScriptedRandomSource rng;
    ProjectiveMeasurement m(rng);
    Transmission channel;
    channel.bits = alice_bits;
    channel.bases = alice_bases;
    BitSequence bob_bits = measure_sequence(channel, bob_bases, m);

    SiftedKeys sifted = sift_keys(alice_bases, bob_bases, alice_bits, bob_bits);
    ASSERT_EQ(sifted.length(), 4u);
    EXPECT_EQ(sifted.alice, bits_from_ints({0, 1, 1, 0}));
    EXPECT_EQ(sifted.bob, sifted.alice);
}

TEST(SiftingTest, NoAgreementGivesEmptyKeys) {
    SiftedKeys sifted = sift_keys(repeat_basis(R, 5), repeat_basis(D, 5),
                                  bits_from_ints({1, 1, 1, 1, 1}),
                                  bits_from_ints({1, 1, 1, 1, 1}));
    EXPECT_EQ(sifted.length(), 0u);
    EXPECT_TRUE(sifted.bob.empty());
}

TEST(SiftingTest, RejectsMisalignedSequences) {
    EXPECT_THROW(sift_keys({R, R}, {R}, bits_from_ints({0, 1}), bits_from_ints({0, 1})),
                 std::invalid_argument);
}

TEST(QberTest, SampleCountIsExactCeiling) {
    EXPECT_EQ(qber_sample_count(35, 20), 7u);
    EXPECT_EQ(qber_sample_count(10, 15), 2u);
    EXPECT_EQ(qber_sample_count(400, 20), 80u);
    EXPECT_EQ(qber_sample_count(3, 1), 1u);
    EXPECT_EQ(qber_sample_count(17, 0), 0u);
    EXPECT_EQ(qber_sample_count(17, 100), 17u);
    EXPECT_EQ(qber_sample_count(0, 50), 0u);
}

TEST(QberTest, CountsMismatchesInSampledPrefixOnly) {
    SiftedKeys sifted;
    sifted.alice = bits_from_ints({0, 1, 1, 0, 1, 1, 1, 1, 0, 0});
    sifted.bob   = bits_from_ints({1, 1, 1, 1, 1, 0, 0, 0, 1, 1});

    QberResult r = estimate_qber(sifted, 40);
    EXPECT_EQ(r.sample_size, 4u);
    EXPECT_EQ(r.errors, 2u);
    EXPECT_DOUBLE_EQ(r.qber, 0.5);

    SiftedKeys rest = discard_sample(sifted, r.sample_size);
    EXPECT_EQ(rest.alice, bits_from_ints({1, 1, 1, 1, 0, 0}));
    EXPECT_EQ(rest.bob, bits_from_ints({1, 0, 0, 0, 1, 1}));
}

TEST(QberTest, EmptySampleHasZeroQber) {
    SiftedKeys sifted;
    sifted.alice = bits_from_ints({0, 1});
    sifted.bob = bits_from_ints({1, 0});
    QberResult r = estimate_qber(sifted, 0);
    EXPECT_EQ(r.sample_size, 0u);
    EXPECT_EQ(r.errors, 0u);
    EXPECT_DOUBLE_EQ(r.qber, 0.0);
    EXPECT_EQ(discard_sample(sifted, 0).length(), 2u);
}

TEST(QberTest, VerdictFollowsThresholdPolicy) {
    const QberResult high{0.20, 20, 100};
    const QberResult mid{0.08, 8, 100};
    const QberResult low{0.01, 1, 100};
    const QberResult zero{0.0, 0, 100};
    const QberResult at_threshold{0.11, 11, 100};

    EXPECT_EQ(assess_qber(high, true, true), QberVerdict::EveDetected);
    EXPECT_EQ(assess_qber(high, false, true), QberVerdict::EveDetected);
    EXPECT_EQ(assess_qber(at_threshold, true, true), QberVerdict::Clean);
    EXPECT_EQ(assess_qber(high, true, false), QberVerdict::SuspectedEve);
    EXPECT_EQ(assess_qber(mid, true, false), QberVerdict::SuspectedEve);
    EXPECT_EQ(assess_qber(low, true, false), QberVerdict::Clean);
    EXPECT_EQ(assess_qber(low, false, false), QberVerdict::NoiseObserved);
    EXPECT_EQ(assess_qber(mid, false, true), QberVerdict::NoiseObserved);
    EXPECT_EQ(assess_qber(zero, false, false), QberVerdict::Clean);
}

TEST(ReconciliationTest, CorrectsOneErrorPerBlock) {
    const BitSequence alice = bits_from_ints({0, 1, 1, 0, 1, 0, 0, 1, 1});
    const BitSequence bob   = bits_from_ints({0, 0, 1, 0, 1, 0, 1, 1, 0});

    ReconciliationResult r = reconcile_keys(alice, bob, 4);
    EXPECT_EQ(r.errors_corrected, 3u);
    EXPECT_TRUE(r.keys_match);
    EXPECT_EQ(r.corrected_bob, alice);
}

TEST(ReconciliationTest, EvenErrorCountInBlockGoesUnnoticed) {
    const BitSequence alice = bits_from_ints({0, 1, 1, 0});
    const BitSequence bob   = bits_from_ints({1, 0, 1, 0});

    ReconciliationResult r = reconcile_keys(alice, bob, 4);
    EXPECT_EQ(r.errors_corrected, 0u);
    EXPECT_FALSE(r.keys_match);
    EXPECT_EQ(r.corrected_bob, bob);
}

TEST(ReconciliationTest, OddErrorCountFixesOnlyFirstError) {
    const BitSequence alice = bits_from_ints({0, 0, 0, 0, 0});
    const BitSequence bob   = bits_from_ints({0, 1, 1, 1, 0});

    ReconciliationResult r = reconcile_keys(alice, bob, 5);
    EXPECT_EQ(r.errors_corrected, 1u);
    EXPECT_FALSE(r.keys_match);
    EXPECT_EQ(r.corrected_bob, bits_from_ints({0, 0, 1, 1, 0}));
}

TEST(ReconciliationTest, BlockLargerThanKeyAndEmptyKey) {
    ReconciliationResult r = reconcile_keys(bits_from_ints({1, 0}), bits_from_ints({1, 1}), 32);
    EXPECT_EQ(r.errors_corrected, 1u);
    EXPECT_TRUE(r.keys_match);

    ReconciliationResult empty = reconcile_keys({}, {}, 8);
    EXPECT_EQ(empty.errors_corrected, 0u);
    EXPECT_TRUE(empty.keys_match);
}

TEST(ReconciliationTest, RejectsBadInput) {
    EXPECT_THROW(reconcile_keys(bits_from_ints({1}), bits_from_ints({1, 0}), 4), std::invalid_argument);
    EXPECT_THROW(reconcile_keys(bits_from_ints({1}), bits_from_ints({1}), 0), std::invalid_argument);
}

TEST(ParametersTest, ValidationRejectsOutOfRangeValues) {
    SimulationParameters ok{100, 20, 8, 64, false, false};
    EXPECT_NO_THROW(validate_parameters(ok));

    auto bad = ok;
    bad.num_qubits = 0;
    EXPECT_THROW(validate_parameters(bad), std::invalid_argument);
    bad = ok;
    bad.num_qubits = -3;
    EXPECT_THROW(validate_parameters(bad), std::invalid_argument);
    bad = ok;
    bad.qber_sample_size = 101;
    EXPECT_THROW(validate_parameters(bad), std::invalid_argument);
    bad = ok;
    bad.qber_sample_size = -1;
    EXPECT_THROW(validate_parameters(bad), std::invalid_argument);
    bad = ok;
    bad.error_correction_block_size = 0;
    EXPECT_THROW(validate_parameters(bad), std::invalid_argument);
    bad = ok;
    bad.privacy_amplification_length = 0;
    EXPECT_THROW(validate_parameters(bad), std::invalid_argument);
}

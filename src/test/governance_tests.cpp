// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"
#include "lending/lending.h"
#include "lending/lending_logic.h"
#include "test/test_zklend.h"

#include <limits>

#include <boost/test/unit_test.hpp>

namespace {

struct GovernanceSetup : public BasicTestingSetup {
    Governance governance;
    InstitutionalPool pool;
    const uint256 voterA = TestAddress(0xa1);
    const uint256 voterB = TestAddress(0xb1);
    const uint256 outsider = TestAddress(0xcc);

    GovernanceSetup()
    {
        governance.address = TestAddress(0x70);
        pool.address = TestAddress(0x50);
        pool.poolOwner = TestAddress(0x51);
        pool.whitelist = {voterA, voterB};
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(governance_tests, GovernanceSetup)

BOOST_AUTO_TEST_CASE(propose_starts_new_proposal)
{
    CValidationState state;
    BOOST_CHECK(ApplyProposeChange(1, 7, governance, state));
    BOOST_CHECK_EQUAL(governance.proposalId, 1U);
    BOOST_CHECK_EQUAL(governance.proposalType, 1);
    BOOST_CHECK_EQUAL(governance.newValue, 7U);
    BOOST_CHECK_EQUAL(governance.votes, 0);
}

BOOST_AUTO_TEST_CASE(vote_tally)
{
    CValidationState state;
    BOOST_REQUIRE(ApplyProposeChange(0, 8, governance, state));

    BOOST_CHECK(ApplyVote(pool, voterA, 1, true, governance, state));
    BOOST_CHECK(ApplyVote(pool, voterB, 1, true, governance, state));
    BOOST_CHECK_EQUAL(governance.votes, 2);

    BOOST_CHECK(ApplyVote(pool, voterB, 1, false, governance, state));
    BOOST_CHECK_EQUAL(governance.votes, 1);

    // Nothing is enacted
    BOOST_CHECK_EQUAL(governance.newValue, 8U);
}

BOOST_AUTO_TEST_CASE(repeated_votes_count)
{
    CValidationState state;
    BOOST_REQUIRE(ApplyProposeChange(0, 1, governance, state));
    for (int i = 0; i < 5; i++) {
        BOOST_CHECK(ApplyVote(pool, voterA, 1, true, governance, state));
    }
    BOOST_CHECK_EQUAL(governance.votes, 5);
}

BOOST_AUTO_TEST_CASE(tally_can_go_negative)
{
    CValidationState state;
    BOOST_REQUIRE(ApplyProposeChange(0, 1, governance, state));
    BOOST_CHECK(ApplyVote(pool, voterA, 1, false, governance, state));
    BOOST_CHECK(ApplyVote(pool, voterB, 1, false, governance, state));
    BOOST_CHECK_EQUAL(governance.votes, -2);
}

BOOST_AUTO_TEST_CASE(supersession)
{
    CValidationState state;
    BOOST_REQUIRE(ApplyProposeChange(0, 1, governance, state));
    BOOST_REQUIRE(ApplyVote(pool, voterA, 1, true, governance, state));

    BOOST_REQUIRE(ApplyProposeChange(2, 99, governance, state));
    BOOST_CHECK_EQUAL(governance.proposalId, 2U);
    BOOST_CHECK_EQUAL(governance.votes, 0);

    // Stale id
    BOOST_CHECK(!ApplyVote(pool, voterA, 1, true, governance, state));
    BOOST_CHECK(GetLendError(state) == LendError::INVALID_PROPOSAL);
    BOOST_CHECK_EQUAL(governance.votes, 0);

    CValidationState state2;
    BOOST_CHECK(ApplyVote(pool, voterA, 2, true, governance, state2));
    BOOST_CHECK_EQUAL(governance.votes, 1);
}

BOOST_AUTO_TEST_CASE(vote_before_any_proposal)
{
    // Live id is 0 until the first proposal
    CValidationState state;
    BOOST_CHECK(!ApplyVote(pool, voterA, 1, true, governance, state));
    BOOST_CHECK(GetLendError(state) == LendError::INVALID_PROPOSAL);
}

BOOST_AUTO_TEST_CASE(vote_unauthorized)
{
    CValidationState state;
    BOOST_REQUIRE(ApplyProposeChange(0, 1, governance, state));

    BOOST_CHECK(!ApplyVote(pool, outsider, 1, true, governance, state));
    BOOST_CHECK(GetLendError(state) == LendError::UNAUTHORIZED_VOTER);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-lend-unauthorized-voter");
    BOOST_CHECK_EQUAL(governance.votes, 0);
}

BOOST_AUTO_TEST_CASE(whitelist_checked_before_id)
{
    CValidationState state;
    BOOST_CHECK(!ApplyVote(pool, outsider, 42, true, governance, state));
    BOOST_CHECK(GetLendError(state) == LendError::UNAUTHORIZED_VOTER);
}

BOOST_AUTO_TEST_CASE(tally_overflow)
{
    CValidationState state;
    BOOST_REQUIRE(ApplyProposeChange(0, 1, governance, state));
    governance.votes = std::numeric_limits<int64_t>::max();

    BOOST_CHECK(!ApplyVote(pool, voterA, 1, true, governance, state));
    BOOST_CHECK(GetLendError(state) == LendError::MATH_OVERFLOW);
    BOOST_CHECK_EQUAL(governance.votes, std::numeric_limits<int64_t>::max());
}

BOOST_AUTO_TEST_CASE(proposal_id_overflow)
{
    governance.proposalId = std::numeric_limits<uint64_t>::max();

    CValidationState state;
    BOOST_CHECK(!ApplyProposeChange(0, 1, governance, state));
    BOOST_CHECK(GetLendError(state) == LendError::MATH_OVERFLOW);
    BOOST_CHECK_EQUAL(governance.proposalId, std::numeric_limits<uint64_t>::max());
}

BOOST_AUTO_TEST_SUITE_END()

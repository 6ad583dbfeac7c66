#include <catch2/catch_test_macros.hpp>
#include <set>
#include <stdexcept>
#include <vector>

#include "Bracket.h"

using namespace knockout;

TEST_CASE("BracketBuilder builds a 32 entrant draw", "[bracket]")
{
  const Bracket bracket = BracketBuilder::buildBracket(32);

  REQUIRE(bracket.getNumEntrants() == 32);
  REQUIRE(bracket.getNumRounds() == 5);
  REQUIRE(bracket.getNumMatches() == 31);

  const std::vector<std::size_t> expectedMatches{16, 8, 4, 2, 1};
  std::size_t nextIndex = 0;
  for (unsigned int r = 1; r <= 5; ++r)
    {
      const Round& round = bracket.getRound(r);
      REQUIRE(round.getRoundIndex() == r);
      REQUIRE(round.getNumMatches() == expectedMatches[r - 1]);
      REQUIRE_FALSE(round.hasBestOf());

      // Contiguous arena numbering, round by round.
      for (std::size_t k = 0; k < round.getNumMatches(); ++k)
	{
	  REQUIRE(round.getMatchIndices()[k] == nextIndex);
	  const Match& match = bracket.getMatch(nextIndex);
	  REQUIRE(match.getRoundIndex() == r);
	  REQUIRE(match.getPositionInRound() == k);
	  ++nextIndex;
	}
    }

  SECTION("Round 1 matches have no sources and no players")
  {
    for (std::size_t matchIndex : bracket.getRound(1).getMatchIndices())
      {
	const Match& match = bracket.getMatch(matchIndex);
	REQUIRE_FALSE(match.hasSourceMatches());
	REQUIRE_FALSE(match.hasPlayers());
	REQUIRE_THROWS_AS(match.getSourceMatch1(), std::logic_error);
      }
    REQUIRE_FALSE(bracket.isSeeded());
  }

  SECTION("Later rounds consume every previous match exactly once, in order")
  {
    for (unsigned int r = 2; r <= 5; ++r)
      {
	const auto& previous = bracket.getRound(r - 1).getMatchIndices();
	const auto& current = bracket.getRound(r).getMatchIndices();

	std::multiset<std::size_t> referenced;
	for (std::size_t k = 0; k < current.size(); ++k)
	  {
	    const Match& match = bracket.getMatch(current[k]);
	    REQUIRE(match.getSourceMatch1() == previous[2 * k]);
	    REQUIRE(match.getSourceMatch2() == previous[2 * k + 1]);
	    referenced.insert(match.getSourceMatch1());
	    referenced.insert(match.getSourceMatch2());
	  }

	REQUIRE(referenced.size() == previous.size());
	for (std::size_t matchIndex : previous)
	  REQUIRE(referenced.count(matchIndex) == 1);
      }
  }

  SECTION("Final is the last match")
  {
    const Match& finalMatch = bracket.getMatch(30);
    REQUIRE(finalMatch.getSourceMatch1() == 28);
    REQUIRE(finalMatch.getSourceMatch2() == 29);
  }
}

TEST_CASE("BracketBuilder rejects fields that are not powers of two", "[bracket]")
{
  for (std::size_t n : {0, 1, 3, 6, 12, 24, 33})
    REQUIRE_THROWS_AS(BracketBuilder::buildBracket(n), ConfigurationException);

  REQUIRE(BracketBuilder::buildBracket(2).getNumRounds() == 1);
  REQUIRE(BracketBuilder::isPowerOfTwo(64));
  REQUIRE_FALSE(BracketBuilder::isPowerOfTwo(96));
}

TEST_CASE("Bracket best-of schedule", "[bracket][schedule]")
{
  Bracket bracket = BracketBuilder::buildBracket(8);

  SECTION("Valid schedule")
  {
    bracket.setBestOfSchedule({9, 11, 19});
    REQUIRE(bracket.hasBestOfSchedule());
    REQUIRE(bracket.getBestOfSchedule() == std::vector<int>{9, 11, 19});
    REQUIRE(bracket.getRound(3).getBestOf() == 19);
  }

  SECTION("Wrong length")
  {
    REQUIRE_THROWS_AS(bracket.setBestOfSchedule({9, 11}), ConfigurationException);
    REQUIRE_THROWS_AS(bracket.setBestOfSchedule({9, 11, 19, 35}), ConfigurationException);
  }

  SECTION("Even or non-positive entry leaves the schedule untouched")
  {
    REQUIRE_THROWS_AS(bracket.setBestOfSchedule({9, 10, 19}), ConfigurationException);
    REQUIRE_THROWS_AS(bracket.setBestOfSchedule({9, 11, 0}), ConfigurationException);
    REQUIRE_FALSE(bracket.hasBestOfSchedule());
    REQUIRE_FALSE(bracket.getRound(1).hasBestOf());
  }

  SECTION("Builder overload")
  {
    const Bracket scheduled = BracketBuilder::buildBracket(4, {3, 5});
    REQUIRE(scheduled.getBestOfSchedule() == std::vector<int>{3, 5});
  }
}

TEST_CASE("Bracket seeding from a fixture", "[bracket][fixture]")
{
  Bracket bracket = BracketBuilder::buildBracket(4);

  SECTION("Fixture fills round 1 in order")
  {
    bracket.seedFirstRound(Round1Fixture({{"A", "B"}, {"C", "D"}}));
    REQUIRE(bracket.isSeeded());
    REQUIRE(*bracket.getMatch(0).getPlayer1() == "A");
    REQUIRE(*bracket.getMatch(0).getPlayer2() == "B");
    REQUIRE(*bracket.getMatch(1).getPlayer1() == "C");
    REQUIRE_FALSE(bracket.getMatch(2).hasPlayers());
  }

  SECTION("Fixture size must match round 1")
  {
    Round1Fixture tooShort;
    tooShort.addMatch("A", "B");
    REQUIRE_THROWS_AS(bracket.seedFirstRound(tooShort), ConfigurationException);
    REQUIRE_THROWS_AS(bracket.seedFirstRound(Round1Fixture({{"A", "B"}, {"C", "D"}, {"E", "F"}})),
		      ConfigurationException);
  }
}

TEST_CASE("Bracket verifies hand-built topologies", "[bracket][topology]")
{
  const std::vector<Match> round1{Match(0, 1, 0), Match(1, 1, 1), Match(2, 1, 2), Match(3, 1, 3)};

  auto makeRounds = []() {
    return std::vector<Round>{Round(1, {0, 1, 2, 3}), Round(2, {4, 5}), Round(3, {6})};
  };

  SECTION("Crossed references are still a valid draw")
  {
    std::vector<Match> matches(round1);
    matches.emplace_back(4, 2, 0, 0, 2);
    matches.emplace_back(5, 2, 1, 1, 3);
    matches.emplace_back(6, 3, 0, 4, 5);
    REQUIRE_NOTHROW(Bracket(matches, makeRounds()));
  }

  SECTION("Previous-round match referenced twice")
  {
    std::vector<Match> matches(round1);
    matches.emplace_back(4, 2, 0, 0, 1);
    matches.emplace_back(5, 2, 1, 1, 3);
    matches.emplace_back(6, 3, 0, 4, 5);
    REQUIRE_THROWS_AS(Bracket(matches, makeRounds()), ConfigurationException);
  }

  SECTION("Same source twice")
  {
    std::vector<Match> matches(round1);
    matches.emplace_back(4, 2, 0, 0, 0);
    matches.emplace_back(5, 2, 1, 2, 3);
    matches.emplace_back(6, 3, 0, 4, 5);
    REQUIRE_THROWS_AS(Bracket(matches, makeRounds()), ConfigurationException);
  }

  SECTION("Reference skipping a round")
  {
    std::vector<Match> matches(round1);
    matches.emplace_back(4, 2, 0, 0, 1);
    matches.emplace_back(5, 2, 1, 2, 3);
    matches.emplace_back(6, 3, 0, 4, 3);
    REQUIRE_THROWS_AS(Bracket(matches, makeRounds()), ConfigurationException);
  }

  SECTION("Round that does not halve")
  {
    std::vector<Match> matches(round1);
    matches.emplace_back(4, 2, 0, 0, 1);
    matches.emplace_back(5, 2, 1, 2, 3);
    matches.emplace_back(6, 2, 2, 0, 1);
    std::vector<Round> rounds{Round(1, {0, 1, 2, 3}), Round(2, {4, 5, 6})};
    REQUIRE_THROWS_AS(Bracket(matches, rounds), ConfigurationException);
  }

  SECTION("Arena index out of place")
  {
    std::vector<Match> matches{Match(1, 1, 0), Match(0, 1, 1)};
    matches.emplace_back(2, 2, 0, 0, 1);
    std::vector<Round> rounds{Round(1, {0, 1}), Round(2, {2})};
    REQUIRE_THROWS_AS(Bracket(matches, rounds), ConfigurationException);
  }
}

TEST_CASE("Bracket accessors reject bad indices", "[bracket]")
{
  const Bracket bracket = BracketBuilder::buildBracket(4);
  REQUIRE_THROWS_AS(bracket.getRound(0), std::out_of_range);
  REQUIRE_THROWS_AS(bracket.getRound(3), std::out_of_range);
  REQUIRE_THROWS_AS(bracket.getMatch(3), std::out_of_range);
}

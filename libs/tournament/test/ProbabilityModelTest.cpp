#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <vector>

#include "ProbabilityModel.h"
#include "TournamentException.h"

using namespace knockout;
using Catch::Approx;

TEST_CASE("frameWinProb is the unclamped linear model", "[model][frame]")
{
  REQUIRE(frameWinProb(0.0) == 0.5);
  REQUIRE(frameWinProb(0.1) == Approx(0.57));
  REQUIRE(frameWinProb(-0.1) == Approx(0.43));
  REQUIRE(frameWinProb(0.1, 1.0) == Approx(0.6));

  // No clamping in the free function.
  REQUIRE(frameWinProb(1.0) == Approx(1.2));
  REQUIRE(frameWinProb(-1.0) == Approx(-0.2));
}

TEST_CASE("framesToWin and binomialCoefficient", "[model][combinatorics]")
{
  REQUIRE(framesToWin(1) == 1);
  REQUIRE(framesToWin(3) == 2);
  REQUIRE(framesToWin(19) == 10);
  REQUIRE(framesToWin(35) == 18);

  REQUIRE_THROWS_AS(framesToWin(0), ConfigurationException);
  REQUIRE_THROWS_AS(framesToWin(4), ConfigurationException);
  REQUIRE_THROWS_AS(framesToWin(-3), ConfigurationException);

  REQUIRE(binomialCoefficient(0, 0) == 1.0);
  REQUIRE(binomialCoefficient(5, 2) == 10.0);
  REQUIRE(binomialCoefficient(10, 10) == 1.0);
  REQUIRE(binomialCoefficient(3, 4) == 0.0);
  REQUIRE(binomialCoefficient(34, 17) == 2333606220.0);
}

TEST_CASE("matchWinProb boundary values", "[model][match]")
{
  SECTION("Even frame probability gives an even match for every length")
  {
    for (int bestOf : {1, 3, 5, 7, 9, 11, 17, 19, 25, 33, 35, 55, 57})
      REQUIRE(matchWinProb(0.5, bestOf) == 0.5);
  }

  SECTION("Even frame probability beyond exact path counts")
  {
    for (int bestOf : {59, 63, 75, 101, 151})
      REQUIRE(matchWinProb(0.5, bestOf) == Approx(0.5).margin(1e-12));
  }

  SECTION("Best of one is a single frame")
  {
    for (double p : {0.0, 0.1, 0.37, 0.5, 0.64, 0.9, 1.0})
      REQUIRE(matchWinProb(p, 1) == p);
  }

  SECTION("Certain outcomes")
  {
    REQUIRE(matchWinProb(1.0, 7) == 1.0);
    REQUIRE(matchWinProb(0.0, 7) == 0.0);
  }

  SECTION("Best of three by hand")
  {
    // p^2 + 2 p^2 (1-p)
    const double p = 0.57;
    REQUIRE(matchWinProb(p, 3) == Approx(p * p + 2.0 * p * p * (1.0 - p)));
  }

  SECTION("Complementary players")
  {
    for (int bestOf : {3, 7, 19})
      REQUIRE(matchWinProb(0.64, bestOf) + matchWinProb(0.36, bestOf) == Approx(1.0));
  }

  SECTION("Invalid lengths")
  {
    REQUIRE_THROWS_AS(matchWinProb(0.5, 0), ConfigurationException);
    REQUIRE_THROWS_AS(matchWinProb(0.5, 2), ConfigurationException);
    REQUIRE_THROWS_AS(matchWinProb(0.5, -1), ConfigurationException);
  }
}

TEST_CASE("matchWinProb monotonicity", "[model][match]")
{
  SECTION("Increasing in frame probability")
  {
    for (int bestOf : {1, 3, 9, 19})
      {
	double previous = matchWinProb(0.0, bestOf);
	for (int i = 1; i <= 100; ++i)
	  {
	    const double current = matchWinProb(i / 100.0, bestOf);
	    REQUIRE(current >= previous);
	    previous = current;
	  }
      }
  }

  SECTION("Longer matches favour the stronger player")
  {
    for (double p : {0.51, 0.57, 0.64, 0.8})
      {
	double previous = matchWinProb(p, 1);
	for (int bestOf = 3; bestOf <= 35; bestOf += 2)
	  {
	    const double current = matchWinProb(p, bestOf);
	    REQUIRE(current > previous);
	    previous = current;
	  }
      }
  }
}

TEST_CASE("scorelineDistribution", "[model][scoreline]")
{
  const double p = 0.57;
  const auto scorelines = scorelineDistribution(p, 7);

  REQUIRE(scorelines.size() == 8);

  double total = 0.0;
  double wins = 0.0;
  for (const auto& s : scorelines)
    {
      total += s.probability;
      if (s.isWin())
	wins += s.probability;
    }

  REQUIRE(total == Approx(1.0));
  REQUIRE(wins == Approx(matchWinProb(p, 7)));

  // Winning scorelines first, 4-0 to 4-3, then 0-4 to 3-4.
  REQUIRE(scorelines.front().framesWon == 4);
  REQUIRE(scorelines.front().framesLost == 0);
  REQUIRE(scorelines.front().paths == 1.0);
  REQUIRE(scorelines[3].framesLost == 3);
  REQUIRE(scorelines[3].paths == 20.0);
  REQUIRE_FALSE(scorelines[4].isWin());
  REQUIRE(scorelines.back().framesWon == 3);
  REQUIRE(scorelines.back().framesLost == 4);
}

TEST_CASE("RangePolicy names", "[model][policy]")
{
  REQUIRE(rangePolicyToString(RangePolicy::Unclamped) == "unclamped");
  REQUIRE(rangePolicyToString(RangePolicy::ClampWithDiagnostic) == "clamp");
  REQUIRE(rangePolicyToString(RangePolicy::Reject) == "reject");

  REQUIRE(rangePolicyFromString("clamp") == RangePolicy::ClampWithDiagnostic);
  REQUIRE(rangePolicyFromString(" Reject ") == RangePolicy::Reject);
  REQUIRE(rangePolicyFromString("UNCLAMPED") == RangePolicy::Unclamped);
  REQUIRE_THROWS_AS(rangePolicyFromString("saturate"), ConfigurationException);
}

TEST_CASE("FrameProbabilityModel applies its range policy", "[model][policy]")
{
  SECTION("In range values pass through under every policy")
  {
    for (RangePolicy policy : {RangePolicy::Unclamped, RangePolicy::ClampWithDiagnostic, RangePolicy::Reject})
      {
	FrameProbabilityModel model(0.7, policy);
	const FrameProbability f = model.evaluate(0.1);
	REQUIRE(f.raw == Approx(0.57));
	REQUIRE(f.applied == f.raw);
	REQUIRE_FALSE(f.outOfRange);
      }
  }

  SECTION("Clamp")
  {
    FrameProbabilityModel model;
    REQUIRE(model.getRangePolicy() == RangePolicy::ClampWithDiagnostic);
    REQUIRE(model.getScalingFactor() == 0.7);

    const FrameProbability high = model.evaluate(1.0);
    REQUIRE(high.outOfRange);
    REQUIRE(high.raw == Approx(1.2));
    REQUIRE(high.applied == 1.0);

    const FrameProbability low = model.evaluate(-1.0);
    REQUIRE(low.outOfRange);
    REQUIRE(low.applied == 0.0);
  }

  SECTION("Unclamped keeps the raw value")
  {
    FrameProbabilityModel model(0.7, RangePolicy::Unclamped);
    const FrameProbability f = model.evaluate(1.0);
    REQUIRE(f.outOfRange);
    REQUIRE(f.applied == f.raw);
  }

  SECTION("Invalid scaling factors")
  {
    REQUIRE_THROWS_AS(FrameProbabilityModel(0.0), ConfigurationException);
    REQUIRE_THROWS_AS(FrameProbabilityModel(-0.7), ConfigurationException);
    REQUIRE_THROWS_AS(FrameProbabilityModel(std::numeric_limits<double>::infinity()), ConfigurationException);
  }
}

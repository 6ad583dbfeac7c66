// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __KNOCKOUT_PROBABILITY_MODEL_H
#define __KNOCKOUT_PROBABILITY_MODEL_H 1

#include <string>
#include <vector>
#include "TournamentException.h"

namespace knockout
{
  constexpr double DefaultScalingFactor = 0.7;

  /**
   * @brief Probability that the first player wins a single frame.
   *
   * Returns 0.5 + scalingFactor * ratingDiff. No clamping: a large enough
   * |ratingDiff| gives a value outside [0,1]. FrameProbabilityModel applies a
   * range policy on top of this function.
   *
   * @param ratingDiff rating(player1) - rating(player2)
   * @param scalingFactor slope of the linear model
   */
  double frameWinProb(double ratingDiff, double scalingFactor = DefaultScalingFactor);

  /**
   * @brief Frames needed to win a best-of-N match, ceil(N/2).
   * @throws ConfigurationException unless bestOf is positive and odd.
   */
  unsigned int framesToWin(int bestOf);

  /**
   * @brief n choose k as a double.
   *
   * Computed with the multiplicative formula; every intermediate value is an
   * integer, so the result is exact while C(n,k) stays below 2^53.
   */
  double binomialCoefficient(unsigned int n, unsigned int k);

  /**
   * @brief Probability of winning a best-of-N match given the frame probability.
   *
   * Sums, over every scoreline (firstTo, lost) with lost in [0, firstTo),
   * the number of frame orderings C(firstTo - 1 + lost, lost) (the clinching
   * frame is always last) times frameProb^firstTo * (1 - frameProb)^lost.
   *
   * matchWinProb(p, 1) is exactly p. matchWinProb(0.5, n) is exactly 0.5 up to
   * best of 57, the longest length whose path counts all stay below 2^53;
   * longer matches are within a few ulps of 0.5.
   *
   * @throws ConfigurationException unless bestOf is positive and odd. An even
   *         length admits drawn scores.
   */
  double matchWinProb(double frameProb, int bestOf);

  /**
   * @brief One possible final score of a best-of-N match, seen from the first player.
   */
  struct Scoreline
  {
    unsigned int framesWon;
    unsigned int framesLost;
    double paths;        // number of frame orderings ending on this score
    double probability;

    bool isWin() const
    {
      return framesWon > framesLost;
    }
  };

  /**
   * @brief Every final scoreline of a best-of-N match with its probability.
   *
   * Winning scorelines come first (by frames lost, ascending), then losing
   * ones. For frameProb in [0,1] the probabilities sum to 1 and the winning
   * ones sum to matchWinProb(frameProb, bestOf).
   */
  std::vector<Scoreline> scorelineDistribution(double frameProb, int bestOf);

  /**
   * @brief What to do with a frame probability outside [0,1].
   */
  enum class RangePolicy
  {
    Unclamped,            ///< use the raw value (matches the bare linear model)
    ClampWithDiagnostic,  ///< clamp to [0,1] and report a range warning
    Reject                ///< abort the run with ModelRangeException
  };

  std::string rangePolicyToString(RangePolicy policy);

  /**
   * @brief Parse "unclamped", "clamp" or "reject" (case-insensitive).
   * @throws ConfigurationException on any other string.
   */
  RangePolicy rangePolicyFromString(const std::string& policyName);

  struct FrameProbability
  {
    double raw;       // 0.5 + scalingFactor * ratingDiff
    double applied;   // value after the range policy
    bool outOfRange;  // raw was outside [0,1]
  };

  /**
   * @class FrameProbabilityModel
   * @brief Linear rating-difference model with an explicit out-of-range policy.
   *
   * evaluate() never throws; under RangePolicy::Reject the caller decides how
   * to report an out-of-range result since only it knows which players and
   * round are involved.
   */
  class FrameProbabilityModel
  {
  public:
    /**
     * @throws ConfigurationException if scalingFactor is not finite and positive.
     */
    explicit FrameProbabilityModel(double scalingFactor = DefaultScalingFactor,
				   RangePolicy policy = RangePolicy::ClampWithDiagnostic);

    FrameProbability evaluate(double ratingDiff) const;

    double getScalingFactor() const
    {
      return mScalingFactor;
    }

    RangePolicy getRangePolicy() const
    {
      return mRangePolicy;
    }

  private:
    double mScalingFactor;
    RangePolicy mRangePolicy;
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <algorithm>
#include <cmath>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include "ProbabilityModel.h"

namespace knockout
{
  // Repeated multiplication keeps p^1 == p and powers of 0.5 exact.
  static double integerPower(double base, unsigned int exponent)
  {
    double result = 1.0;
    for (unsigned int i = 0; i < exponent; ++i)
      result *= base;

    return result;
  }

  double frameWinProb(double ratingDiff, double scalingFactor)
  {
    return 0.5 + scalingFactor * ratingDiff;
  }

  unsigned int framesToWin(int bestOf)
  {
    if (bestOf <= 0 || (bestOf % 2) == 0)
      {
	std::ostringstream msg;
	msg << "framesToWin - best-of length must be a positive odd integer, got " << bestOf;
	throw ConfigurationException(msg.str());
      }

    return static_cast<unsigned int>(bestOf / 2 + 1);
  }

  double binomialCoefficient(unsigned int n, unsigned int k)
  {
    if (k > n)
      return 0.0;

    k = std::min(k, n - k);
    double result = 1.0;
    for (unsigned int i = 1; i <= k; ++i)
      result = result * static_cast<double>(n - k + i) / static_cast<double>(i);

    return result;
  }

  double matchWinProb(double frameProb, int bestOf)
  {
    const unsigned int firstTo = framesToWin(bestOf);
    const double clinchProb = integerPower(frameProb, firstTo);
    const double lossProb = 1.0 - frameProb;

    double total = 0.0;
    for (unsigned int lost = 0; lost < firstTo; ++lost)
      {
	const double paths = binomialCoefficient(firstTo - 1 + lost, lost);
	total += paths * clinchProb * integerPower(lossProb, lost);
      }

    return total;
  }

  std::vector<Scoreline> scorelineDistribution(double frameProb, int bestOf)
  {
    const unsigned int firstTo = framesToWin(bestOf);
    const double lossProb = 1.0 - frameProb;

    std::vector<Scoreline> scorelines;
    scorelines.reserve(2 * firstTo);

    for (unsigned int lost = 0; lost < firstTo; ++lost)
      {
	const double paths = binomialCoefficient(firstTo - 1 + lost, lost);
	scorelines.push_back(Scoreline{firstTo, lost, paths,
	      paths * integerPower(frameProb, firstTo) * integerPower(lossProb, lost)});
      }

    for (unsigned int won = 0; won < firstTo; ++won)
      {
	const double paths = binomialCoefficient(firstTo - 1 + won, won);
	scorelines.push_back(Scoreline{won, firstTo, paths,
	      paths * integerPower(lossProb, firstTo) * integerPower(frameProb, won)});
      }

    return scorelines;
  }

  std::string rangePolicyToString(RangePolicy policy)
  {
    switch (policy)
      {
      case RangePolicy::Unclamped:
	return "unclamped";
      case RangePolicy::ClampWithDiagnostic:
	return "clamp";
      case RangePolicy::Reject:
	return "reject";
      }

    throw std::logic_error("rangePolicyToString - unhandled range policy");
  }

  RangePolicy rangePolicyFromString(const std::string& policyName)
  {
    const std::string name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(policyName));

    if (name == "unclamped")
      return RangePolicy::Unclamped;
    else if (name == "clamp")
      return RangePolicy::ClampWithDiagnostic;
    else if (name == "reject")
      return RangePolicy::Reject;

    throw ConfigurationException("rangePolicyFromString - unknown range policy '" + policyName +
				 "' (expected unclamped, clamp or reject)");
  }

  FrameProbabilityModel::FrameProbabilityModel(double scalingFactor, RangePolicy policy)
    : mScalingFactor(scalingFactor),
      mRangePolicy(policy)
  {
    if (!std::isfinite(mScalingFactor) || mScalingFactor <= 0.0)
      {
	std::ostringstream msg;
	msg << "FrameProbabilityModel - scaling factor must be finite and positive, got " << scalingFactor;
	throw ConfigurationException(msg.str());
      }
  }

  FrameProbability FrameProbabilityModel::evaluate(double ratingDiff) const
  {
    const double raw = frameWinProb(ratingDiff, mScalingFactor);
    const bool outOfRange = (raw < 0.0 || raw > 1.0);

    double applied = raw;
    if (outOfRange && mRangePolicy == RangePolicy::ClampWithDiagnostic)
      applied = std::clamp(raw, 0.0, 1.0);

    return FrameProbability{raw, applied, outOfRange};
  }
}

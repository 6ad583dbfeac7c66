// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include "AggregateResult.h"

namespace knockout
{
  AggregateResult::AggregateResult(const std::vector<std::string>& playerNames, unsigned int numRounds)
    : mPlayerNames(playerNames),
      mPlayerIndex(),
      mNumRounds(numRounds),
      mCounts(playerNames.size() * numRounds, 0),
      mNumTrials(0),
      mRangeWarnings()
  {
    if (numRounds == 0)
      throw std::invalid_argument("AggregateResult - number of rounds must be positive");

    for (std::size_t i = 0; i < mPlayerNames.size(); ++i)
      {
	if (!mPlayerIndex.emplace(mPlayerNames[i], i).second)
	  throw std::invalid_argument("AggregateResult - duplicate player " + mPlayerNames[i]);
      }
  }

  void AggregateResult::recordTrial(const TrialOutcome& outcome)
  {
    if (outcome.getNumEntrants() != mPlayerNames.size() || outcome.getNumRounds() != mNumRounds)
      {
	std::ostringstream msg;
	msg << "AggregateResult::recordTrial - outcome has " << outcome.getNumEntrants()
	    << " entrants and " << outcome.getNumRounds() << " rounds, expected "
	    << mPlayerNames.size() << " and " << mNumRounds;
	throw std::invalid_argument(msg.str());
      }

    for (std::size_t player = 0; player < mPlayerNames.size(); ++player)
      {
	const unsigned int reached = outcome.getRoundReached(player);
	for (unsigned int r = 1; r <= reached; ++r)
	  ++mCounts[cellIndex(player, r)];
      }

    ++mNumTrials;
  }

  void AggregateResult::merge(const AggregateResult& other)
  {
    if (other.mPlayerNames != mPlayerNames || other.mNumRounds != mNumRounds)
      throw std::invalid_argument("AggregateResult::merge - results have different players or rounds");

    for (std::size_t i = 0; i < mCounts.size(); ++i)
      mCounts[i] += other.mCounts[i];

    mNumTrials += other.mNumTrials;
  }

  std::size_t AggregateResult::getPlayerIndex(const std::string& playerName) const
  {
    auto it = mPlayerIndex.find(playerName);
    if (it == mPlayerIndex.end())
      throw UnknownPlayerException(playerName,
				   "AggregateResult::getPlayerIndex - no results for player " + playerName);

    return it->second;
  }

  std::size_t AggregateResult::cellIndex(std::size_t player, unsigned int roundIndex) const
  {
    if (player >= mPlayerNames.size() || roundIndex == 0 || roundIndex > mNumRounds)
      {
	std::ostringstream msg;
	msg << "AggregateResult - no cell for player " << player << " round " << roundIndex;
	throw std::out_of_range(msg.str());
      }

    return player * mNumRounds + (roundIndex - 1);
  }

  std::uint64_t AggregateResult::getCount(std::size_t player, unsigned int roundIndex) const
  {
    return mCounts[cellIndex(player, roundIndex)];
  }

  std::uint64_t AggregateResult::getCount(const std::string& playerName, unsigned int roundIndex) const
  {
    return getCount(getPlayerIndex(playerName), roundIndex);
  }

  double AggregateResult::getProbability(std::size_t player, unsigned int roundIndex) const
  {
    const std::uint64_t count = getCount(player, roundIndex);
    if (mNumTrials == 0)
      return 0.0;

    return static_cast<double>(count) / static_cast<double>(mNumTrials);
  }

  double AggregateResult::getProbability(const std::string& playerName, unsigned int roundIndex) const
  {
    return getProbability(getPlayerIndex(playerName), roundIndex);
  }

  double AggregateResult::getOdds(std::size_t player, unsigned int roundIndex) const
  {
    const double p = getProbability(player, roundIndex);
    if (p == 0.0)
      return std::numeric_limits<double>::infinity();

    return 1.0 / p;
  }

  double AggregateResult::getOdds(const std::string& playerName, unsigned int roundIndex) const
  {
    return getOdds(getPlayerIndex(playerName), roundIndex);
  }

  double AggregateResult::getStandardError(std::size_t player, unsigned int roundIndex) const
  {
    const double p = getProbability(player, roundIndex);
    if (mNumTrials == 0)
      return 0.0;

    return std::sqrt(p * (1.0 - p) / static_cast<double>(mNumTrials));
  }

  double AggregateResult::getStandardError(const std::string& playerName, unsigned int roundIndex) const
  {
    return getStandardError(getPlayerIndex(playerName), roundIndex);
  }

  double AggregateResult::getExpectedRoundsWon(std::size_t player) const
  {
    double expected = 0.0;
    for (unsigned int r = 1; r <= mNumRounds; ++r)
      expected += getProbability(player, r);

    return expected;
  }

  const std::string& AggregateResult::getMostLikelyChampion() const
  {
    if (mNumTrials == 0 || mPlayerNames.empty())
      throw std::logic_error("AggregateResult::getMostLikelyChampion - no trials recorded");

    std::size_t best = 0;
    for (std::size_t player = 1; player < mPlayerNames.size(); ++player)
      if (getCount(player, mNumRounds) > getCount(best, mNumRounds))
	best = player;

    return mPlayerNames[best];
  }
}

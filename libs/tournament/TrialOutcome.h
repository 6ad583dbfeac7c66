// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __KNOCKOUT_TRIAL_OUTCOME_H
#define __KNOCKOUT_TRIAL_OUTCOME_H 1

#include <cstddef>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace knockout
{
  /**
   * @class TrialOutcome
   * @brief Result of one simulated tournament: the last round each entrant reached.
   *
   * Entrants are identified by their slot in the round-1 fixture. Winning the
   * round-r match records round r as reached, so a round-1 loser stays at 0
   * and the champion ends on getNumRounds().
   */
  class TrialOutcome
  {
  public:
    TrialOutcome(std::size_t numEntrants, unsigned int numRounds)
      : mRoundReached(numEntrants, 0),
	mNumRounds(numRounds)
    {}

    /**
     * @brief Record that entrant won its match in roundIndex.
     * @throws std::logic_error if the entrant did not win the previous round
     *         or the round does not exist.
     */
    void recordWin(std::size_t entrant, unsigned int roundIndex)
    {
      if (roundIndex == 0 || roundIndex > mNumRounds || mRoundReached.at(entrant) + 1 != roundIndex)
	{
	  std::ostringstream msg;
	  msg << "TrialOutcome::recordWin - entrant " << entrant << " cannot win round "
	      << roundIndex << " after reaching round " << mRoundReached.at(entrant);
	  throw std::logic_error(msg.str());
	}

      mRoundReached[entrant] = roundIndex;
    }

    unsigned int getRoundReached(std::size_t entrant) const
    {
      return mRoundReached.at(entrant);
    }

    std::size_t getNumEntrants() const
    {
      return mRoundReached.size();
    }

    unsigned int getNumRounds() const
    {
      return mNumRounds;
    }

    // The entrant that won the final, if the trial ran to completion.
    std::optional<std::size_t> getChampion() const
    {
      for (std::size_t i = 0; i < mRoundReached.size(); ++i)
	if (mRoundReached[i] == mNumRounds)
	  return i;

      return std::nullopt;
    }

  private:
    std::vector<unsigned int> mRoundReached;
    unsigned int mNumRounds;
  };
}

#endif

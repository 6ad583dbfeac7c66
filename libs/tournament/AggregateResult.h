// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __KNOCKOUT_AGGREGATE_RESULT_H
#define __KNOCKOUT_AGGREGATE_RESULT_H 1

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "TournamentSimulator.h"
#include "TrialOutcome.h"

namespace knockout
{
  /**
   * @class AggregateResult
   * @brief Per-player, per-round counts of trials in which the player reached the round.
   *
   * Players are kept in fixture slot order, the same indexing TrialOutcome
   * uses. Rounds are 1-based. count(player, r) is the number of trials in
   * which the player won its round-r match, so the round-numRounds column
   * counts championships and sums to the number of trials.
   *
   * Results from disjoint groups of trials combine with merge(); the counts
   * are plain integer sums, so the merge order does not matter.
   */
  class AggregateResult
  {
  public:
    AggregateResult(const std::vector<std::string>& playerNames, unsigned int numRounds);

    /**
     * @throws std::invalid_argument if the outcome has a different shape.
     */
    void recordTrial(const TrialOutcome& outcome);

    /**
     * @throws std::invalid_argument if the two results have different players or rounds.
     */
    void merge(const AggregateResult& other);

    std::uint64_t getNumTrials() const
    {
      return mNumTrials;
    }

    std::size_t getNumPlayers() const
    {
      return mPlayerNames.size();
    }

    unsigned int getNumRounds() const
    {
      return mNumRounds;
    }

    const std::vector<std::string>& getPlayerNames() const
    {
      return mPlayerNames;
    }

    /**
     * @throws UnknownPlayerException if playerName is not part of the result.
     */
    std::size_t getPlayerIndex(const std::string& playerName) const;

    std::uint64_t getCount(std::size_t player, unsigned int roundIndex) const;
    std::uint64_t getCount(const std::string& playerName, unsigned int roundIndex) const;

    // count / numTrials; 0 before any trial is recorded.
    double getProbability(std::size_t player, unsigned int roundIndex) const;
    double getProbability(const std::string& playerName, unsigned int roundIndex) const;

    // Decimal odds 1 / probability; +infinity when the probability is 0.
    double getOdds(std::size_t player, unsigned int roundIndex) const;
    double getOdds(const std::string& playerName, unsigned int roundIndex) const;

    // Monte Carlo standard error sqrt(p(1-p)/numTrials) of getProbability().
    double getStandardError(std::size_t player, unsigned int roundIndex) const;
    double getStandardError(const std::string& playerName, unsigned int roundIndex) const;

    // Sum over rounds of getProbability(), the mean number of matches won.
    double getExpectedRoundsWon(std::size_t player) const;

    /**
     * @brief Player with the most championships; ties go to the earlier fixture slot.
     * @throws std::logic_error before any trial is recorded.
     */
    const std::string& getMostLikelyChampion() const;

    void setRangeWarnings(const std::vector<ModelRangeWarning>& warnings)
    {
      mRangeWarnings = warnings;
    }

    const std::vector<ModelRangeWarning>& getRangeWarnings() const
    {
      return mRangeWarnings;
    }

  private:
    std::size_t cellIndex(std::size_t player, unsigned int roundIndex) const;

    std::vector<std::string> mPlayerNames;
    std::map<std::string, std::size_t> mPlayerIndex;
    unsigned int mNumRounds;
    std::vector<std::uint64_t> mCounts;   // [player * numRounds + roundIndex - 1]
    std::uint64_t mNumTrials;
    std::vector<ModelRangeWarning> mRangeWarnings;
  };
}

#endif

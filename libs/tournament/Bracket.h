// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __KNOCKOUT_BRACKET_H
#define __KNOCKOUT_BRACKET_H 1

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "TournamentException.h"
#include "Round1Fixture.h"

namespace knockout
{
  /**
   * @class Match
   * @brief One node of the bracket arena.
   *
   * A match is identified by its position in the arena (unique across the
   * whole bracket). Matches after round 1 name the two previous-round matches
   * whose winners fill player slot 1 and player slot 2; round-1 matches name
   * none and get their players from the fixture.
   */
  class Match
  {
  public:
    // Round-1 match.
    Match(std::size_t matchIndex, unsigned int roundIndex, std::size_t positionInRound);

    // Later-round match fed by the winners of two earlier matches.
    Match(std::size_t matchIndex, unsigned int roundIndex, std::size_t positionInRound,
	  std::size_t sourceMatch1, std::size_t sourceMatch2);

    std::size_t getMatchIndex() const
    {
      return mMatchIndex;
    }

    unsigned int getRoundIndex() const
    {
      return mRoundIndex;
    }

    std::size_t getPositionInRound() const
    {
      return mPositionInRound;
    }

    bool hasSourceMatches() const
    {
      return mSourceMatch1.has_value();
    }

    /**
     * @throws std::logic_error for a round-1 match.
     */
    std::size_t getSourceMatch1() const;
    std::size_t getSourceMatch2() const;

    const std::optional<std::string>& getPlayer1() const
    {
      return mPlayer1;
    }

    const std::optional<std::string>& getPlayer2() const
    {
      return mPlayer2;
    }

    bool hasPlayers() const
    {
      return mPlayer1.has_value() && mPlayer2.has_value();
    }

    void setPlayers(const std::string& player1, const std::string& player2);

  private:
    std::size_t mMatchIndex;
    unsigned int mRoundIndex;
    std::size_t mPositionInRound;
    std::optional<std::size_t> mSourceMatch1;
    std::optional<std::size_t> mSourceMatch2;
    std::optional<std::string> mPlayer1;
    std::optional<std::string> mPlayer2;
  };

  /**
   * @class Round
   * @brief The arena indices of one round's matches plus its best-of length.
   *
   * A best-of of 0 means no schedule has been attached yet.
   */
  class Round
  {
  public:
    Round(unsigned int roundIndex, const std::vector<std::size_t>& matchIndices);

    unsigned int getRoundIndex() const
    {
      return mRoundIndex;
    }

    const std::vector<std::size_t>& getMatchIndices() const
    {
      return mMatchIndices;
    }

    std::size_t getNumMatches() const
    {
      return mMatchIndices.size();
    }

    int getBestOf() const
    {
      return mBestOf;
    }

    bool hasBestOf() const
    {
      return mBestOf > 0;
    }

    /**
     * @throws ConfigurationException unless bestOf is positive and odd.
     */
    void setBestOf(int bestOf);

  private:
    unsigned int mRoundIndex;
    std::vector<std::size_t> mMatchIndices;
    int mBestOf;
  };

  /**
   * @class Bracket
   * @brief Layered arena of matches for a single-elimination draw.
   *
   * Invariants, checked on construction:
   *   - match i of the arena has match index i;
   *   - round r+1 has half the matches of round r and the last round has one;
   *   - every match of round r+1 references two distinct matches of round r,
   *     and across round r+1 every match of round r is referenced exactly once.
   *
   * The structure is immutable once built; only the best-of schedule and the
   * round-1 players are attached afterwards, before any simulation starts.
   */
  class Bracket
  {
  public:
    /**
     * @throws ConfigurationException if the arena violates the invariants above.
     */
    Bracket(const std::vector<Match>& matches, const std::vector<Round>& rounds);

    std::size_t getNumEntrants() const
    {
      return 2 * mRounds.front().getNumMatches();
    }

    unsigned int getNumRounds() const
    {
      return static_cast<unsigned int>(mRounds.size());
    }

    std::size_t getNumMatches() const
    {
      return mMatches.size();
    }

    // roundIndex is 1-based.
    const Round& getRound(unsigned int roundIndex) const;

    const std::vector<Round>& getRounds() const
    {
      return mRounds;
    }

    const Match& getMatch(std::size_t matchIndex) const;

    const std::vector<Match>& getMatches() const
    {
      return mMatches;
    }

    /**
     * @brief Attach the best-of length of every round, round 1 first.
     * @throws ConfigurationException if the schedule length differs from the
     *         number of rounds or an entry is not a positive odd integer.
     */
    void setBestOfSchedule(const std::vector<int>& bestOfSchedule);

    bool hasBestOfSchedule() const;

    std::vector<int> getBestOfSchedule() const;

    /**
     * @brief Fill the round-1 player slots in fixture order.
     * @throws ConfigurationException if the fixture does not have exactly one
     *         pairing per round-1 match.
     */
    void seedFirstRound(const Round1Fixture& fixture);

    bool isSeeded() const;

  private:
    void verifyTopology() const;

    std::vector<Match> mMatches;
    std::vector<Round> mRounds;
  };

  /**
   * @class BracketBuilder
   * @brief Builds the match arena for a power-of-two field.
   *
   * Matches are numbered contiguously, round by round. Match k of round i
   * takes the winner of match 2k of round i-1 as player 1 and the winner of
   * match 2k+1 as player 2, so adjacent pairings of the fixture meet first.
   */
  class BracketBuilder
  {
  public:
    /**
     * @throws ConfigurationException unless numEntrants is a power of two >= 2.
     */
    static Bracket buildBracket(std::size_t numEntrants);

    static Bracket buildBracket(std::size_t numEntrants, const std::vector<int>& bestOfSchedule);

    static bool isPowerOfTwo(std::size_t n)
    {
      return n != 0 && (n & (n - 1)) == 0;
    }
  };
}

#endif

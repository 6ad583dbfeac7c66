// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __KNOCKOUT_ROUND1_FIXTURE_H
#define __KNOCKOUT_ROUND1_FIXTURE_H 1

#include <set>
#include <string>
#include <utility>
#include <vector>
#include "TournamentException.h"

namespace knockout
{
  /**
   * @class Round1Fixture
   * @brief The initial draw: an ordered list of (player1, player2) pairings.
   *
   * Pairing k fills match k of round 1, so the order of the list fixes the
   * bracket path of every entrant. Each player may appear only once.
   */
  class Round1Fixture
  {
  public:
    using Pairing = std::pair<std::string, std::string>;
    using ConstIterator = std::vector<Pairing>::const_iterator;

    Round1Fixture() = default;

    explicit Round1Fixture(const std::vector<Pairing>& pairings);

    /**
     * @throws ConfigurationException on an empty name or a player that is
     *         already in the fixture.
     */
    void addMatch(const std::string& player1, const std::string& player2);

    std::size_t getNumMatches() const
    {
      return mPairings.size();
    }

    const Pairing& getMatch(std::size_t index) const;

    // Every entrant in slot order: match 0 player1, match 0 player2, match 1 player1, ...
    std::vector<std::string> getEntrants() const;

    ConstIterator begin() const
    {
      return mPairings.begin();
    }

    ConstIterator end() const
    {
      return mPairings.end();
    }

  private:
    void validateEntrant(const std::string& playerName) const;

    std::vector<Pairing> mPairings;
    std::set<std::string> mEntrants;
  };
}

#endif

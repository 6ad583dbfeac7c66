// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <sstream>
#include "Round1Fixture.h"

namespace knockout
{
  Round1Fixture::Round1Fixture(const std::vector<Pairing>& pairings)
  {
    for (const auto& pairing : pairings)
      addMatch(pairing.first, pairing.second);
  }

  void Round1Fixture::addMatch(const std::string& player1, const std::string& player2)
  {
    if (player1 == player2)
      throw ConfigurationException("Round1Fixture::addMatch - player " + player1 +
				   " cannot be drawn against itself");

    validateEntrant(player1);
    validateEntrant(player2);

    mEntrants.insert(player1);
    mEntrants.insert(player2);
    mPairings.emplace_back(player1, player2);
  }

  const Round1Fixture::Pairing& Round1Fixture::getMatch(std::size_t index) const
  {
    if (index >= mPairings.size())
      {
	std::ostringstream msg;
	msg << "Round1Fixture::getMatch - index " << index << " out of range, fixture has "
	    << mPairings.size() << " matches";
	throw std::out_of_range(msg.str());
      }

    return mPairings[index];
  }

  std::vector<std::string> Round1Fixture::getEntrants() const
  {
    std::vector<std::string> entrants;
    entrants.reserve(2 * mPairings.size());
    for (const auto& pairing : mPairings)
      {
	entrants.push_back(pairing.first);
	entrants.push_back(pairing.second);
      }

    return entrants;
  }

  void Round1Fixture::validateEntrant(const std::string& playerName) const
  {
    if (playerName.empty())
      throw ConfigurationException("Round1Fixture::addMatch - player name is empty");

    if (mEntrants.count(playerName) != 0)
      throw ConfigurationException("Round1Fixture::addMatch - player " + playerName +
				   " appears more than once in the fixture");
  }
}

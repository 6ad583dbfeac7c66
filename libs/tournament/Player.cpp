// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <cmath>
#include <sstream>
#include "Player.h"

namespace knockout
{
  void RatingsTable::addRating(const std::string& playerName, double rating)
  {
    if (playerName.empty())
      throw ConfigurationException("RatingsTable::addRating - player name is empty");

    if (!std::isfinite(rating))
      {
	std::ostringstream msg;
	msg << "RatingsTable::addRating - rating for " << playerName << " is not finite";
	throw ConfigurationException(msg.str());
      }

    auto inserted = mRatings.emplace(playerName, rating);
    if (!inserted.second)
      throw ConfigurationException("RatingsTable::addRating - duplicate player " + playerName);
  }

  bool RatingsTable::contains(const std::string& playerName) const
  {
    return mRatings.find(playerName) != mRatings.end();
  }

  double RatingsTable::getRating(const std::string& playerName) const
  {
    auto it = mRatings.find(playerName);
    if (it == mRatings.end())
      throw UnknownPlayerException(playerName,
				   "RatingsTable::getRating - no rating for player " + playerName);

    return it->second;
  }

  Player RatingsTable::getPlayer(const std::string& playerName) const
  {
    return Player(playerName, getRating(playerName));
  }
}

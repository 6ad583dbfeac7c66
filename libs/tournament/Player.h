// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __KNOCKOUT_PLAYER_H
#define __KNOCKOUT_PLAYER_H 1

#include <map>
#include <string>
#include <vector>
#include "TournamentException.h"

namespace knockout
{
  /**
   * @class Player
   * @brief A named entrant together with its rating.
   *
   * The rating is a scalar skill estimate; only differences between two ratings
   * enter the probability model.
   */
  class Player
  {
  public:
    Player(const std::string& name, double rating)
      : mName(name),
	mRating(rating)
    {}

    const std::string& getName() const
    {
      return mName;
    }

    double getRating() const
    {
      return mRating;
    }

    bool operator==(const Player& rhs) const
    {
      return mName == rhs.mName && mRating == rhs.mRating;
    }

    bool operator!=(const Player& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    std::string mName;
    double mRating;
  };

  /**
   * @class RatingsTable
   * @brief Player name to rating lookup.
   *
   * Names are unique and ratings finite. Lookups of a name that was never
   * added throw UnknownPlayerException; there is no default rating.
   */
  class RatingsTable
  {
  public:
    using ConstIterator = std::map<std::string, double>::const_iterator;

    RatingsTable() = default;

    /**
     * @throws ConfigurationException on an empty or duplicate name, or a
     *         rating that is NaN or infinite.
     */
    void addRating(const std::string& playerName, double rating);

    bool contains(const std::string& playerName) const;

    /**
     * @throws UnknownPlayerException if playerName has no rating.
     */
    double getRating(const std::string& playerName) const;

    Player getPlayer(const std::string& playerName) const;

    std::size_t size() const
    {
      return mRatings.size();
    }

    bool empty() const
    {
      return mRatings.empty();
    }

    ConstIterator begin() const
    {
      return mRatings.begin();
    }

    ConstIterator end() const
    {
      return mRatings.end();
    }

  private:
    std::map<std::string, double> mRatings;
  };
}

#endif

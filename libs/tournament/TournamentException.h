// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __KNOCKOUT_TOURNAMENT_EXCEPTION_H
#define __KNOCKOUT_TOURNAMENT_EXCEPTION_H 1

#include <stdexcept>
#include <string>
#include <cstddef>

namespace knockout
{
  class TournamentException : public std::runtime_error
  {
  public:
    TournamentException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~TournamentException()
    {}
  };

  // Invalid bracket size, best-of value, trial count, schedule or fixture shape.
  class ConfigurationException : public TournamentException
  {
  public:
    ConfigurationException(const std::string msg)
      : TournamentException(msg)
    {}

    ~ConfigurationException()
    {}
  };

  // A fixtured player has no entry in the ratings table.
  class UnknownPlayerException : public TournamentException
  {
  public:
    UnknownPlayerException(const std::string& playerName, const std::string msg)
      : TournamentException(msg),
	mPlayerName(playerName)
    {}

    ~UnknownPlayerException()
    {}

    const std::string& getPlayerName() const
    {
      return mPlayerName;
    }

  private:
    std::string mPlayerName;
  };

  // Raised by the Reject range policy when a frame probability leaves [0,1].
  class ModelRangeException : public TournamentException
  {
  public:
    ModelRangeException(const std::string msg)
      : TournamentException(msg)
    {}

    ~ModelRangeException()
    {}
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "Bracket.h"
#include "Player.h"
#include "ProbabilityModel.h"
#include "Round1Fixture.h"

namespace knockoutsim
{
  using knockout::Bracket;
  using knockout::RatingsTable;
  using knockout::Round1Fixture;

  /**
   * @class TournamentConfiguration
   * @brief Everything needed to bind a tournament: ratings, draw, schedule and model slope.
   */
  class TournamentConfiguration
  {
  public:
    TournamentConfiguration(const RatingsTable& ratings,
			    const Round1Fixture& fixture,
			    const std::vector<int>& bestOfSchedule,
			    double scalingFactor = knockout::DefaultScalingFactor)
      : mRatings(ratings),
	mFixture(fixture),
	mBestOfSchedule(bestOfSchedule),
	mScalingFactor(scalingFactor)
    {}

    const RatingsTable& getRatings() const
    {
      return mRatings;
    }

    const Round1Fixture& getFixture() const
    {
      return mFixture;
    }

    const std::vector<int>& getBestOfSchedule() const
    {
      return mBestOfSchedule;
    }

    double getScalingFactor() const
    {
      return mScalingFactor;
    }

    void setScalingFactor(double scalingFactor)
    {
      mScalingFactor = scalingFactor;
    }

    /**
     * @brief Build the bracket for the fixture's field and attach the schedule.
     * @throws knockout::ConfigurationException if the field is not a power of
     *         two or the schedule does not fit the bracket.
     */
    Bracket createBracket() const;

  private:
    RatingsTable mRatings;
    Round1Fixture mFixture;
    std::vector<int> mBestOfSchedule;
    double mScalingFactor;
  };

  /**
   * @brief Parse a best-of list such as "9;11;19" or "9 11 19".
   * @throws knockout::ConfigurationException on an empty list or a token that
   *         is not an integer.
   */
  std::vector<int> parseBestOfSchedule(const std::string& scheduleStr);

  // Reads a ratings CSV with header Player,Rating.
  class RatingsFileReader
  {
  public:
    RatingsFileReader(const std::string& ratingsFileName);
    ~RatingsFileReader()
      {}

    RatingsTable readFile() const;

  private:
    std::string mRatingsFileName;
  };

  // Reads a round-1 fixture CSV with header Player1,Player2, one row per match in draw order.
  class FixtureFileReader
  {
  public:
    FixtureFileReader(const std::string& fixtureFileName);
    ~FixtureFileReader()
      {}

    Round1Fixture readFile() const;

  private:
    std::string mFixtureFileName;
  };

  /**
   * @class TournamentConfigurationFileReader
   * @brief Reads a one-row configuration CSV:
   *
   *   RatingsPath,FixturePath,BestOf,ScalingFactor
   *   ratings.csv,fixture.csv,9;11;19,0.7
   *
   * The header row is optional. Relative paths are resolved against the
   * directory of the configuration file. An empty ScalingFactor means the
   * default slope.
   */
  class TournamentConfigurationFileReader
  {
  public:
    TournamentConfigurationFileReader(const std::string& configurationFileName);
    ~TournamentConfigurationFileReader()
      {}

    // The summary line of what was read is written to out.
    std::shared_ptr<TournamentConfiguration> readConfigurationFile(std::ostream& out = std::cout) const;

  private:
    std::string mConfigurationFileName;
  };
}

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <iostream>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"
#include "TournamentConfiguration.h"
#include "TournamentException.h"

using knockout::ConfigurationException;

namespace knockoutsim
{
  static void checkFileExists(const boost::filesystem::path& filePath, const std::string& description)
  {
    if (!boost::filesystem::exists(filePath))
      throw ConfigurationException(description + " " + filePath.string() + " does not exist");

    if (!boost::filesystem::is_regular_file(filePath))
      throw ConfigurationException(description + " " + filePath.string() + " is not a regular file");
  }

  static boost::filesystem::path resolvePath(const std::string& pathStr,
					     const boost::filesystem::path& baseDirectory)
  {
    boost::filesystem::path filePath(boost::algorithm::trim_copy(pathStr));
    if (filePath.is_relative() && !baseDirectory.empty())
      filePath = baseDirectory / filePath;

    return filePath;
  }

  Bracket TournamentConfiguration::createBracket() const
  {
    return knockout::BracketBuilder::buildBracket(2 * mFixture.getNumMatches(), mBestOfSchedule);
  }

  std::vector<int> parseBestOfSchedule(const std::string& scheduleStr)
  {
    const std::string trimmed = boost::algorithm::trim_copy(scheduleStr);

    std::vector<std::string> tokens;
    if (!trimmed.empty())
      boost::split(tokens, trimmed, boost::is_any_of(" ;\t"), boost::token_compress_on);

    if (tokens.empty())
      throw ConfigurationException("parseBestOfSchedule - best-of schedule is empty");

    std::vector<int> schedule;
    schedule.reserve(tokens.size());
    for (const auto& token : tokens)
      {
	try
	  {
	    schedule.push_back(boost::lexical_cast<int>(token));
	  }
	catch (const boost::bad_lexical_cast&)
	  {
	    throw ConfigurationException("parseBestOfSchedule - best-of value '" + token +
					 "' is not an integer");
	  }
      }

    return schedule;
  }

  //
  // RatingsFileReader
  //

  RatingsFileReader::RatingsFileReader(const std::string& ratingsFileName)
    : mRatingsFileName(ratingsFileName)
  {}

  RatingsTable RatingsFileReader::readFile() const
  {
    checkFileExists(boost::filesystem::path(mRatingsFileName), "Ratings file");

    RatingsTable ratings;
    try
      {
	io::CSVReader<2> csvRatingsFile(mRatingsFileName.c_str());
	csvRatingsFile.read_header(io::ignore_extra_column, "Player", "Rating");

	std::string playerName;
	double rating;
	while (csvRatingsFile.read_row(playerName, rating))
	  ratings.addRating(playerName, rating);
      }
    catch (const io::error::base& e)
      {
	throw ConfigurationException("RatingsFileReader::readFile - " + mRatingsFileName + ": " + e.what());
      }

    if (ratings.empty())
      throw ConfigurationException("RatingsFileReader::readFile - " + mRatingsFileName + " has no ratings");

    return ratings;
  }

  //
  // FixtureFileReader
  //

  FixtureFileReader::FixtureFileReader(const std::string& fixtureFileName)
    : mFixtureFileName(fixtureFileName)
  {}

  Round1Fixture FixtureFileReader::readFile() const
  {
    checkFileExists(boost::filesystem::path(mFixtureFileName), "Fixture file");

    Round1Fixture fixture;
    try
      {
	io::CSVReader<2> csvFixtureFile(mFixtureFileName.c_str());
	csvFixtureFile.read_header(io::ignore_extra_column, "Player1", "Player2");

	std::string player1, player2;
	while (csvFixtureFile.read_row(player1, player2))
	  fixture.addMatch(player1, player2);
      }
    catch (const io::error::base& e)
      {
	throw ConfigurationException("FixtureFileReader::readFile - " + mFixtureFileName + ": " + e.what());
      }

    if (fixture.getNumMatches() == 0)
      throw ConfigurationException("FixtureFileReader::readFile - " + mFixtureFileName + " has no matches");

    return fixture;
  }

  //
  // TournamentConfigurationFileReader
  //

  TournamentConfigurationFileReader::TournamentConfigurationFileReader(const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  std::shared_ptr<TournamentConfiguration> TournamentConfigurationFileReader::readConfigurationFile(std::ostream& out) const
  {
    const boost::filesystem::path configurationPath(mConfigurationFileName);
    checkFileExists(configurationPath, "Configuration file");

    std::string ratingsPathStr, fixturePathStr, bestOfStr, scalingFactorStr;

    try
      {
	// Check if the file has a header row by reading the first line
	io::CSVReader<4> csvConfigFileCheck(mConfigurationFileName.c_str());
	char* firstLine = csvConfigFileCheck.next_line();
	bool hasHeader = false;
	if (firstLine)
	  {
	    std::string firstLineStr(firstLine);
	    hasHeader = (firstLineStr.find("RatingsPath") != std::string::npos &&
			 firstLineStr.find("FixturePath") != std::string::npos);
	  }

	io::CSVReader<4> csvConfigFile(mConfigurationFileName.c_str());
	if (hasHeader)
	  csvConfigFile.read_header(io::ignore_no_column, "RatingsPath", "FixturePath", "BestOf", "ScalingFactor");
	else
	  csvConfigFile.set_header("RatingsPath", "FixturePath", "BestOf", "ScalingFactor");

	if (!csvConfigFile.read_row(ratingsPathStr, fixturePathStr, bestOfStr, scalingFactorStr))
	  throw ConfigurationException("TournamentConfigurationFileReader::readConfigurationFile - " +
				       mConfigurationFileName + " has no configuration row");
      }
    catch (const io::error::base& e)
      {
	throw ConfigurationException("TournamentConfigurationFileReader::readConfigurationFile - " +
				     mConfigurationFileName + ": " + e.what());
      }

    const boost::filesystem::path baseDirectory = configurationPath.parent_path();
    const boost::filesystem::path ratingsPath = resolvePath(ratingsPathStr, baseDirectory);
    const boost::filesystem::path fixturePath = resolvePath(fixturePathStr, baseDirectory);

    checkFileExists(ratingsPath, "Ratings path");
    checkFileExists(fixturePath, "Fixture path");

    double scalingFactor = knockout::DefaultScalingFactor;
    const std::string trimmedScalingFactor = boost::algorithm::trim_copy(scalingFactorStr);
    if (!trimmedScalingFactor.empty())
      {
	try
	  {
	    scalingFactor = boost::lexical_cast<double>(trimmedScalingFactor);
	  }
	catch (const boost::bad_lexical_cast&)
	  {
	    throw ConfigurationException("TournamentConfigurationFileReader::readConfigurationFile - scaling factor '" +
					 scalingFactorStr + "' is not a number");
	  }
      }

    const std::vector<int> bestOfSchedule = parseBestOfSchedule(bestOfStr);
    RatingsTable ratings = RatingsFileReader(ratingsPath.string()).readFile();
    Round1Fixture fixture = FixtureFileReader(fixturePath.string()).readFile();

    out << "Read " << ratings.size() << " ratings and " << fixture.getNumMatches()
	<< " round 1 matches" << std::endl;

    return std::make_shared<TournamentConfiguration>(ratings, fixture, bestOfSchedule, scalingFactor);
  }
}

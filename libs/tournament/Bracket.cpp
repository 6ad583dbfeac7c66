// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <initializer_list>
#include <sstream>
#include "Bracket.h"
#include "ProbabilityModel.h"

namespace knockout
{
  //
  // Match
  //

  Match::Match(std::size_t matchIndex, unsigned int roundIndex, std::size_t positionInRound)
    : mMatchIndex(matchIndex),
      mRoundIndex(roundIndex),
      mPositionInRound(positionInRound),
      mSourceMatch1(),
      mSourceMatch2(),
      mPlayer1(),
      mPlayer2()
  {}

  Match::Match(std::size_t matchIndex, unsigned int roundIndex, std::size_t positionInRound,
	       std::size_t sourceMatch1, std::size_t sourceMatch2)
    : mMatchIndex(matchIndex),
      mRoundIndex(roundIndex),
      mPositionInRound(positionInRound),
      mSourceMatch1(sourceMatch1),
      mSourceMatch2(sourceMatch2),
      mPlayer1(),
      mPlayer2()
  {}

  std::size_t Match::getSourceMatch1() const
  {
    if (!mSourceMatch1)
      throw std::logic_error("Match::getSourceMatch1 - round 1 match has no source matches");

    return *mSourceMatch1;
  }

  std::size_t Match::getSourceMatch2() const
  {
    if (!mSourceMatch2)
      throw std::logic_error("Match::getSourceMatch2 - round 1 match has no source matches");

    return *mSourceMatch2;
  }

  void Match::setPlayers(const std::string& player1, const std::string& player2)
  {
    mPlayer1 = player1;
    mPlayer2 = player2;
  }

  //
  // Round
  //

  Round::Round(unsigned int roundIndex, const std::vector<std::size_t>& matchIndices)
    : mRoundIndex(roundIndex),
      mMatchIndices(matchIndices),
      mBestOf(0)
  {}

  void Round::setBestOf(int bestOf)
  {
    framesToWin(bestOf);
    mBestOf = bestOf;
  }

  //
  // Bracket
  //

  Bracket::Bracket(const std::vector<Match>& matches, const std::vector<Round>& rounds)
    : mMatches(matches),
      mRounds(rounds)
  {
    verifyTopology();
  }

  const Round& Bracket::getRound(unsigned int roundIndex) const
  {
    if (roundIndex == 0 || roundIndex > mRounds.size())
      {
	std::ostringstream msg;
	msg << "Bracket::getRound - round " << roundIndex << " does not exist, bracket has "
	    << mRounds.size() << " rounds";
	throw std::out_of_range(msg.str());
      }

    return mRounds[roundIndex - 1];
  }

  const Match& Bracket::getMatch(std::size_t matchIndex) const
  {
    if (matchIndex >= mMatches.size())
      {
	std::ostringstream msg;
	msg << "Bracket::getMatch - match " << matchIndex << " does not exist, bracket has "
	    << mMatches.size() << " matches";
	throw std::out_of_range(msg.str());
      }

    return mMatches[matchIndex];
  }

  void Bracket::setBestOfSchedule(const std::vector<int>& bestOfSchedule)
  {
    if (bestOfSchedule.size() != mRounds.size())
      {
	std::ostringstream msg;
	msg << "Bracket::setBestOfSchedule - schedule has " << bestOfSchedule.size()
	    << " entries but the bracket has " << mRounds.size() << " rounds";
	throw ConfigurationException(msg.str());
      }

    // Validate everything before touching any round.
    for (std::size_t i = 0; i < bestOfSchedule.size(); ++i)
      {
	if (bestOfSchedule[i] <= 0 || (bestOfSchedule[i] % 2) == 0)
	  {
	    std::ostringstream msg;
	    msg << "Bracket::setBestOfSchedule - round " << (i + 1) << " best-of "
		<< bestOfSchedule[i] << " is not a positive odd integer";
	    throw ConfigurationException(msg.str());
	  }
      }

    for (std::size_t i = 0; i < bestOfSchedule.size(); ++i)
      mRounds[i].setBestOf(bestOfSchedule[i]);
  }

  bool Bracket::hasBestOfSchedule() const
  {
    for (const auto& round : mRounds)
      if (!round.hasBestOf())
	return false;

    return true;
  }

  std::vector<int> Bracket::getBestOfSchedule() const
  {
    std::vector<int> schedule;
    schedule.reserve(mRounds.size());
    for (const auto& round : mRounds)
      schedule.push_back(round.getBestOf());

    return schedule;
  }

  void Bracket::seedFirstRound(const Round1Fixture& fixture)
  {
    const Round& firstRound = mRounds.front();
    if (fixture.getNumMatches() != firstRound.getNumMatches())
      {
	std::ostringstream msg;
	msg << "Bracket::seedFirstRound - fixture has " << fixture.getNumMatches()
	    << " matches but round 1 has " << firstRound.getNumMatches();
	throw ConfigurationException(msg.str());
      }

    const auto& matchIndices = firstRound.getMatchIndices();
    for (std::size_t k = 0; k < matchIndices.size(); ++k)
      {
	const auto& pairing = fixture.getMatch(k);
	mMatches[matchIndices[k]].setPlayers(pairing.first, pairing.second);
      }
  }

  bool Bracket::isSeeded() const
  {
    for (std::size_t matchIndex : mRounds.front().getMatchIndices())
      if (!mMatches[matchIndex].hasPlayers())
	return false;

    return true;
  }

  void Bracket::verifyTopology() const
  {
    if (mRounds.empty())
      throw ConfigurationException("Bracket - a bracket needs at least one round");

    for (std::size_t i = 0; i < mMatches.size(); ++i)
      {
	if (mMatches[i].getMatchIndex() != i)
	  {
	    std::ostringstream msg;
	    msg << "Bracket - arena position " << i << " holds match index "
		<< mMatches[i].getMatchIndex();
	    throw ConfigurationException(msg.str());
	  }
      }

    std::vector<int> owningRound(mMatches.size(), 0);
    std::size_t matchesInRounds = 0;
    for (std::size_t r = 0; r < mRounds.size(); ++r)
      {
	const Round& round = mRounds[r];
	if (round.getRoundIndex() != r + 1)
	  throw ConfigurationException("Bracket - rounds must be numbered 1..n in order");

	if (round.getNumMatches() == 0)
	  throw ConfigurationException("Bracket - every round needs at least one match");

	if (r > 0 && 2 * round.getNumMatches() != mRounds[r - 1].getNumMatches())
	  {
	    std::ostringstream msg;
	    msg << "Bracket - round " << (r + 1) << " has " << round.getNumMatches()
		<< " matches, expected half of " << mRounds[r - 1].getNumMatches();
	    throw ConfigurationException(msg.str());
	  }

	for (std::size_t matchIndex : round.getMatchIndices())
	  {
	    if (matchIndex >= mMatches.size() || owningRound[matchIndex] != 0)
	      throw ConfigurationException("Bracket - a match index is out of range or listed in two rounds");

	    if (mMatches[matchIndex].getRoundIndex() != round.getRoundIndex())
	      throw ConfigurationException("Bracket - match round index disagrees with its round");

	    owningRound[matchIndex] = static_cast<int>(r + 1);
	  }
	matchesInRounds += round.getNumMatches();
      }

    if (matchesInRounds != mMatches.size())
      throw ConfigurationException("Bracket - some matches belong to no round");

    if (mRounds.back().getNumMatches() != 1)
      throw ConfigurationException("Bracket - the last round must be a single final");

    for (std::size_t r = 0; r < mRounds.size(); ++r)
      {
	const int previousRound = static_cast<int>(r);   // 1-based index of round r-1
	std::vector<int> timesReferenced(mMatches.size(), 0);

	for (std::size_t matchIndex : mRounds[r].getMatchIndices())
	  {
	    const Match& match = mMatches[matchIndex];
	    if (r == 0)
	      {
		if (match.hasSourceMatches())
		  throw ConfigurationException("Bracket - round 1 matches cannot have source matches");
		continue;
	      }

	    if (!match.hasSourceMatches())
	      {
		std::ostringstream msg;
		msg << "Bracket - match " << matchIndex << " of round " << (r + 1)
		    << " has no source matches";
		throw ConfigurationException(msg.str());
	      }

	    const std::size_t source1 = match.getSourceMatch1();
	    const std::size_t source2 = match.getSourceMatch2();
	    if (source1 == source2)
	      throw ConfigurationException("Bracket - a match references the same source twice");

	    for (std::size_t source : {source1, source2})
	      {
		if (source >= mMatches.size() || owningRound[source] != previousRound)
		  {
		    std::ostringstream msg;
		    msg << "Bracket - match " << matchIndex << " references match " << source
			<< " which is not in round " << previousRound;
		    throw ConfigurationException(msg.str());
		  }
		++timesReferenced[source];
	      }
	  }

	if (r == 0)
	  continue;

	for (std::size_t sourceIndex : mRounds[r - 1].getMatchIndices())
	  {
	    if (timesReferenced[sourceIndex] != 1)
	      {
		std::ostringstream msg;
		msg << "Bracket - match " << sourceIndex << " of round " << previousRound
		    << " is referenced " << timesReferenced[sourceIndex] << " times by round " << (r + 1);
		throw ConfigurationException(msg.str());
	      }
	  }
      }
  }

  //
  // BracketBuilder
  //

  Bracket BracketBuilder::buildBracket(std::size_t numEntrants)
  {
    if (numEntrants < 2 || !isPowerOfTwo(numEntrants))
      {
	std::ostringstream msg;
	msg << "BracketBuilder::buildBracket - number of entrants must be a power of two >= 2, got "
	    << numEntrants;
	throw ConfigurationException(msg.str());
      }

    std::vector<Match> matches;
    std::vector<Round> rounds;
    matches.reserve(numEntrants - 1);

    std::vector<std::size_t> previousRound;
    std::size_t matchesInRound = numEntrants / 2;
    unsigned int roundIndex = 1;

    while (matchesInRound >= 1)
      {
	std::vector<std::size_t> currentRound;
	currentRound.reserve(matchesInRound);

	for (std::size_t k = 0; k < matchesInRound; ++k)
	  {
	    const std::size_t matchIndex = matches.size();
	    if (roundIndex == 1)
	      matches.emplace_back(matchIndex, roundIndex, k);
	    else
	      matches.emplace_back(matchIndex, roundIndex, k,
				   previousRound[2 * k], previousRound[2 * k + 1]);

	    currentRound.push_back(matchIndex);
	  }

	rounds.emplace_back(roundIndex, currentRound);
	previousRound.swap(currentRound);
	matchesInRound /= 2;
	++roundIndex;
      }

    return Bracket(matches, rounds);
  }

  Bracket BracketBuilder::buildBracket(std::size_t numEntrants, const std::vector<int>& bestOfSchedule)
  {
    Bracket bracket = buildBracket(numEntrants);
    bracket.setBestOfSchedule(bestOfSchedule);
    return bracket;
  }
}

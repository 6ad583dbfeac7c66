// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <initializer_list>
#include <sstream>
#include "TournamentSimulator.h"

namespace knockout
{
  std::string ModelRangeWarning::toString() const
  {
    std::ostringstream msg;
    msg << "frame probability " << rawFrameProbability << " for " << player1 << " vs " << player2
	<< " in round " << roundIndex << " is outside [0,1]";
    if (appliedFrameProbability != rawFrameProbability)
      msg << ", clamped to " << appliedFrameProbability;

    return msg.str();
  }

  TournamentSimulator::TournamentSimulator(const Bracket& bracket,
					   const RatingsTable& ratings,
					   const Round1Fixture& fixture,
					   const FrameProbabilityModel& model)
    : mBracket(seedBracket(bracket, fixture)),
      mModel(model),
      mEntrants(),
      mEntrantIndex(),
      mWinProbability(),
      mMeetingRound(),
      mRangeWarnings()
  {
    bindEntrants(ratings, fixture);
    buildProbabilityTable();
  }

  Bracket TournamentSimulator::seedBracket(const Bracket& bracket, const Round1Fixture& fixture)
  {
    if (!bracket.hasBestOfSchedule())
      throw ConfigurationException("TournamentSimulator - bracket has no best-of schedule");

    Bracket seeded(bracket);
    seeded.seedFirstRound(fixture);
    return seeded;
  }

  void TournamentSimulator::bindEntrants(const RatingsTable& ratings, const Round1Fixture& fixture)
  {
    mEntrants.reserve(2 * fixture.getNumMatches());

    std::size_t matchNumber = 0;
    for (const auto& pairing : fixture)
      {
	++matchNumber;
	for (const std::string& name : {pairing.first, pairing.second})
	  {
	    if (!ratings.contains(name))
	      {
		std::ostringstream msg;
		msg << "TournamentSimulator - player " << name << " in round 1 match " << matchNumber
		    << " has no rating";
		throw UnknownPlayerException(name, msg.str());
	      }

	    mEntrantIndex.emplace(name, mEntrants.size());
	    mEntrants.push_back(ratings.getPlayer(name));
	  }
      }
  }

  void TournamentSimulator::buildProbabilityTable()
  {
    const std::size_t n = mEntrants.size();
    mWinProbability.assign(n * n, 0.0);
    mMeetingRound.assign(n * n, 0);

    // Entrants that can arrive in slot 1 and slot 2 of each match.
    const std::vector<Match>& matches = mBracket.getMatches();
    std::vector<std::vector<std::size_t>> slot1Entrants(matches.size());
    std::vector<std::vector<std::size_t>> slot2Entrants(matches.size());

    for (const Round& round : mBracket.getRounds())
      {
	for (std::size_t matchIndex : round.getMatchIndices())
	  {
	    const Match& match = matches[matchIndex];
	    auto& left = slot1Entrants[matchIndex];
	    auto& right = slot2Entrants[matchIndex];

	    if (match.hasSourceMatches())
	      {
		const std::size_t source1 = match.getSourceMatch1();
		const std::size_t source2 = match.getSourceMatch2();
		left = slot1Entrants[source1];
		left.insert(left.end(), slot2Entrants[source1].begin(), slot2Entrants[source1].end());
		right = slot1Entrants[source2];
		right.insert(right.end(), slot2Entrants[source2].begin(), slot2Entrants[source2].end());
	      }
	    else
	      {
		left.push_back(2 * match.getPositionInRound());
		right.push_back(2 * match.getPositionInRound() + 1);
	      }

	    for (std::size_t a : left)
	      {
		for (std::size_t b : right)
		  {
		    mMeetingRound[a * n + b] = round.getRoundIndex();
		    mMeetingRound[b * n + a] = round.getRoundIndex();
		    mWinProbability[a * n + b] = pairProbability(a, b, round.getRoundIndex(), true);
		    mWinProbability[b * n + a] = pairProbability(b, a, round.getRoundIndex(), false);
		  }
	      }
	  }
      }
  }

  double TournamentSimulator::pairProbability(std::size_t a, std::size_t b,
					      unsigned int roundIndex, bool recordWarning)
  {
    const Player& player1 = mEntrants[a];
    const Player& player2 = mEntrants[b];
    const FrameProbability frame = mModel.evaluate(player1.getRating() - player2.getRating());

    if (frame.outOfRange)
      {
	ModelRangeWarning warning{player1.getName(), player2.getName(), roundIndex,
				  frame.raw, frame.applied};

	if (mModel.getRangePolicy() == RangePolicy::Reject)
	  throw ModelRangeException("TournamentSimulator - " + warning.toString());

	if (recordWarning)
	  mRangeWarnings.push_back(warning);
      }

    return matchWinProb(frame.applied, mBracket.getRound(roundIndex).getBestOf());
  }

  std::size_t TournamentSimulator::getEntrantIndex(const std::string& playerName) const
  {
    auto it = mEntrantIndex.find(playerName);
    if (it == mEntrantIndex.end())
      throw UnknownPlayerException(playerName,
				   "TournamentSimulator::getEntrantIndex - " + playerName + " is not in the fixture");

    return it->second;
  }

  void TournamentSimulator::checkPair(std::size_t a, std::size_t b) const
  {
    if (a >= mEntrants.size() || b >= mEntrants.size() || a == b)
      {
	std::ostringstream msg;
	msg << "TournamentSimulator - invalid entrant pair (" << a << ", " << b << ") for a field of "
	    << mEntrants.size();
	throw std::invalid_argument(msg.str());
      }
  }

  unsigned int TournamentSimulator::getMeetingRound(std::size_t a, std::size_t b) const
  {
    checkPair(a, b);
    return mMeetingRound[a * mEntrants.size() + b];
  }

  double TournamentSimulator::getMatchProbability(std::size_t a, std::size_t b) const
  {
    checkPair(a, b);
    return mWinProbability[a * mEntrants.size() + b];
  }
}

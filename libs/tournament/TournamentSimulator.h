// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __KNOCKOUT_TOURNAMENT_SIMULATOR_H
#define __KNOCKOUT_TOURNAMENT_SIMULATOR_H 1

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "Bracket.h"
#include "Player.h"
#include "ProbabilityModel.h"
#include "Round1Fixture.h"
#include "RngUtils.h"
#include "TrialOutcome.h"

namespace knockout
{
  /**
   * @brief A pairing whose frame probability fell outside [0,1].
   *
   * Recorded under RangePolicy::ClampWithDiagnostic and RangePolicy::Unclamped.
   */
  struct ModelRangeWarning
  {
    std::string player1;
    std::string player2;
    unsigned int roundIndex;
    double rawFrameProbability;
    double appliedFrameProbability;

    std::string toString() const;
  };

  /**
   * @class TournamentSimulator
   * @brief Plays one randomized pass over a seeded bracket per call to simulate().
   *
   * Construction binds the bracket, ratings, fixture and probability model and
   * validates them:
   *   - the bracket must carry a best-of schedule;
   *   - the fixture must have one pairing per round-1 match;
   *   - every fixtured player must have a rating (UnknownPlayerException).
   *
   * Two entrants can only ever meet in one round, the round where their
   * bracket paths merge. The constructor therefore computes every match
   * probability the run can need once, applying the range policy of the model
   * with player names and round in hand. simulate() is const and touches no
   * shared mutable state, so one simulator can serve any number of threads,
   * each with its own random engine.
   *
   * The probability table holds numEntrants^2 doubles.
   */
  class TournamentSimulator
  {
  public:
    /**
     * @throws ConfigurationException on a missing schedule or fixture size mismatch.
     * @throws UnknownPlayerException if a fixtured player has no rating.
     * @throws ModelRangeException under RangePolicy::Reject when some pairing
     *         that can occur has a frame probability outside [0,1].
     */
    TournamentSimulator(const Bracket& bracket,
			const RatingsTable& ratings,
			const Round1Fixture& fixture,
			const FrameProbabilityModel& model = FrameProbabilityModel());

    /**
     * @brief Simulate one tournament.
     *
     * Rounds are resolved in order. For each match the players are taken from
     * the fixture (round 1) or from the winners of the two source matches;
     * one uniform u in [0,1) is drawn and player 1 advances when
     * u < P(player 1 wins). Exactly one draw is consumed per match, in arena
     * order.
     */
    template <class Rng>
    TrialOutcome simulate(Rng& rng) const
    {
      const std::size_t numEntrants = mEntrants.size();
      const std::vector<Match>& matches = mBracket.getMatches();

      TrialOutcome outcome(numEntrants, mBracket.getNumRounds());
      std::vector<std::size_t> winners(matches.size());

      for (const Round& round : mBracket.getRounds())
	{
	  for (std::size_t matchIndex : round.getMatchIndices())
	    {
	      const Match& match = matches[matchIndex];

	      std::size_t player1;
	      std::size_t player2;
	      if (match.hasSourceMatches())
		{
		  player1 = winners[match.getSourceMatch1()];
		  player2 = winners[match.getSourceMatch2()];
		}
	      else
		{
		  player1 = 2 * match.getPositionInRound();
		  player2 = player1 + 1;
		}

	      const double matchProb = mWinProbability[player1 * numEntrants + player2];
	      const double u = rng_utils::get_random_uniform_01(rng);
	      const std::size_t winner = (u < matchProb) ? player1 : player2;

	      winners[matchIndex] = winner;
	      outcome.recordWin(winner, round.getRoundIndex());
	    }
	}

      return outcome;
    }

    std::size_t getNumEntrants() const
    {
      return mEntrants.size();
    }

    unsigned int getNumRounds() const
    {
      return mBracket.getNumRounds();
    }

    // Entrants in fixture slot order; TrialOutcome indices refer to this vector.
    const std::vector<Player>& getEntrants() const
    {
      return mEntrants;
    }

    /**
     * @throws UnknownPlayerException if playerName is not in the fixture.
     */
    std::size_t getEntrantIndex(const std::string& playerName) const;

    // The seeded bracket this simulator plays.
    const Bracket& getBracket() const
    {
      return mBracket;
    }

    const FrameProbabilityModel& getModel() const
    {
      return mModel;
    }

    /**
     * @brief Round in which entrants a and b would meet.
     * @throws std::invalid_argument if a == b or either index is out of range.
     */
    unsigned int getMeetingRound(std::size_t a, std::size_t b) const;

    /**
     * @brief Probability that entrant a beats entrant b in their meeting round.
     * @throws std::invalid_argument if a == b or either index is out of range.
     */
    double getMatchProbability(std::size_t a, std::size_t b) const;

    const std::vector<ModelRangeWarning>& getRangeWarnings() const
    {
      return mRangeWarnings;
    }

  private:
    static Bracket seedBracket(const Bracket& bracket, const Round1Fixture& fixture);
    void bindEntrants(const RatingsTable& ratings, const Round1Fixture& fixture);
    void buildProbabilityTable();
    double pairProbability(std::size_t a, std::size_t b, unsigned int roundIndex, bool recordWarning);
    void checkPair(std::size_t a, std::size_t b) const;

    Bracket mBracket;
    FrameProbabilityModel mModel;
    std::vector<Player> mEntrants;
    std::map<std::string, std::size_t> mEntrantIndex;
    std::vector<double> mWinProbability;      // [a * n + b] = P(a beats b)
    std::vector<unsigned int> mMeetingRound;  // [a * n + b], 0 on the diagonal
    std::vector<ModelRangeWarning> mRangeWarnings;
  };

  /**
   * @brief One-shot convenience: bind and simulate a single tournament.
   */
  template <class Rng>
  TrialOutcome simulateTournament(const Bracket& bracket,
				  const RatingsTable& ratings,
				  const Round1Fixture& fixture,
				  Rng& rng,
				  const FrameProbabilityModel& model = FrameProbabilityModel())
  {
    TournamentSimulator simulator(bracket, ratings, fixture, model);
    return simulator.simulate(rng);
  }
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __KNOCKOUT_MONTE_CARLO_AGGREGATOR_H
#define __KNOCKOUT_MONTE_CARLO_AGGREGATOR_H 1

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include "AggregateResult.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "RngUtils.h"
#include "TournamentException.h"
#include "TournamentSimulator.h"

namespace knockout
{
  /**
   * @class MonteCarloAggregator
   * @brief Runs a tournament numTrials times and reduces the outcomes into an AggregateResult.
   *
   * Trial t always uses the engine provider.make_engine(t), so the random
   * stream of a trial is fixed by the run seed and the trial index alone.
   * Trials are split into contiguous ranges by concurrency::parallel_for_ranges;
   * each range accumulates into its own AggregateResult and merges it into
   * the run result once, under a mutex. Since the reduction is an integer sum
   * the result is identical for any executor and any chunk size.
   *
   * @tparam Engine   random engine type. std::mt19937_64 or a wrapper with
   *                  engine(), e.g. randutils::mt19937_rng.
   * @tparam Executor executor policy from ParallelExecutors.h.
   */
  template <class Engine = std::mt19937_64,
	    class Executor = concurrency::SingleThreadExecutor>
  class MonteCarloAggregator
  {
  public:
    using EngineProvider = rng_utils::TrialEngineProvider<Engine>;

    /**
     * @throws ConfigurationException if numTrials < 1.
     */
    explicit MonteCarloAggregator(long numTrials,
				  std::shared_ptr<Executor> executor = std::make_shared<Executor>())
      : mNumTrials(numTrials),
	mExecutor(executor),
	mChunkSizeHint(0),
	mVerbose(false),
	mProgressStream(&std::cout)
    {
      if (mNumTrials < 1)
	{
	  std::ostringstream msg;
	  msg << "MonteCarloAggregator - number of trials must be at least 1, got " << mNumTrials;
	  throw ConfigurationException(msg.str());
	}

      if (!mExecutor)
	throw std::invalid_argument("MonteCarloAggregator - executor is null");
    }

    /**
     * @brief Simulate numTrials tournaments with a bound simulator.
     */
    AggregateResult run(const TournamentSimulator& simulator, const EngineProvider& provider) const
    {
      std::vector<std::string> playerNames;
      playerNames.reserve(simulator.getNumEntrants());
      for (const auto& player : simulator.getEntrants())
	playerNames.push_back(player.getName());

      AggregateResult result(playerNames, simulator.getNumRounds());
      result.setRangeWarnings(simulator.getRangeWarnings());

      const std::size_t numTrials = static_cast<std::size_t>(mNumTrials);
      std::mutex resultMutex;

      concurrency::parallel_for_ranges(numTrials, *mExecutor,
	[&](std::size_t start, std::size_t end) {
	  AggregateResult rangeResult(playerNames, simulator.getNumRounds());
	  for (std::size_t trial = start; trial < end; ++trial)
	    {
	      Engine rng = provider.make_engine(trial);
	      rangeResult.recordTrial(simulator.simulate(rng));
	    }

	  std::lock_guard<std::mutex> lock(resultMutex);
	  result.merge(rangeResult);
	  if (mVerbose)
	    *mProgressStream << "Completed " << result.getNumTrials() << " of " << numTrials
		      << " trials" << std::endl;
	},
	mChunkSizeHint);

      return result;
    }

    AggregateResult run(const TournamentSimulator& simulator, std::uint64_t runSeed) const
    {
      return run(simulator, EngineProvider(runSeed));
    }

    /**
     * @brief Bind the field and run it.
     * @throws ConfigurationException, UnknownPlayerException or ModelRangeException
     *         from TournamentSimulator before any trial is played.
     */
    AggregateResult run(const Bracket& bracket,
			const RatingsTable& ratings,
			const Round1Fixture& fixture,
			const EngineProvider& provider,
			const FrameProbabilityModel& model = FrameProbabilityModel()) const
    {
      TournamentSimulator simulator(bracket, ratings, fixture, model);
      return run(simulator, provider);
    }

    long getNumTrials() const
    {
      return mNumTrials;
    }

    // Trials per range handed to the executor; 0 lets parallel_for_ranges decide.
    void setChunkSizeHint(std::size_t chunkSizeHint)
    {
      mChunkSizeHint = chunkSizeHint;
    }

    // Progress lines go to progressStream, which must outlive every run().
    void setVerbose(bool verbose, std::ostream& progressStream = std::cout)
    {
      mVerbose = verbose;
      mProgressStream = &progressStream;
    }

  private:
    long mNumTrials;
    std::shared_ptr<Executor> mExecutor;
    std::size_t mChunkSizeHint;
    bool mVerbose;
    std::ostream* mProgressStream;
  };
}

#endif

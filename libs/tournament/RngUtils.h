// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <type_traits>
#include <utility>

namespace knockout
{
  namespace rng_utils
  {
    // True for generator wrappers that expose their engine through engine(),
    // such as randutils::mt19937_rng.
    template <typename T, typename = void>
    struct has_engine_method : std::false_type {};

    template <typename T>
    struct has_engine_method<T, std::void_t<decltype(std::declval<T&>().engine())>> : std::true_type {};

    // The raw engine: the wrapped one for randutils generators, rng itself
    // for the standard engines.
    template <typename Rng>
    inline auto& get_engine(Rng& rng)
    {
      if constexpr (has_engine_method<Rng>::value)
	return rng.engine();
      else
	return rng;
    }

    /**
     * @brief Draw one double in [0, 1) from the engine behind rng.
     *
     * This is the only draw a simulated match consumes, so a trial with M
     * matches advances its engine by exactly M uniform draws.
     */
    template <typename Rng>
    inline double get_random_uniform_01(Rng& rng)
    {
      std::uniform_real_distribution<double> unit(0.0, 1.0);
      return unit(get_engine(rng));
    }

    // SplitMix64 finalizer.
    inline std::uint64_t splitmix64(std::uint64_t value)
    {
      value += 0x9e3779b97f4a7c15ull;
      value = (value ^ (value >> 30)) * 0xbf58476d1ce4e5b9ull;
      value = (value ^ (value >> 27)) * 0x94d049bb133111ebull;
      return value ^ (value >> 31);
    }

    // Folds the values left to right; the result depends on their order.
    inline std::uint64_t hash_combine64(std::initializer_list<std::uint64_t> values)
    {
      std::uint64_t state = 0x6a09e667f3bcc909ull;
      for (std::uint64_t value : values)
	state = splitmix64(state ^ value);

      return state;
    }

    // Eight 32-bit seed words taken from successive SplitMix64 outputs of seed64.
    inline std::seed_seq make_seed_seq(std::uint64_t seed64)
    {
      std::array<std::uint32_t, 8> words;
      std::uint64_t state = seed64;

      for (std::size_t i = 0; i < words.size(); i += 2)
	{
	  const std::uint64_t output = splitmix64(state);
	  state += 0x9e3779b97f4a7c15ull;

	  words[i] = static_cast<std::uint32_t>(output);
	  words[i + 1] = static_cast<std::uint32_t>(output >> 32);
	}

      return std::seed_seq(words.begin(), words.end());
    }

    // Standard engines take the seed_seq in their constructor; randutils
    // generators are default constructed and then reseeded.
    template<class Eng>
    inline Eng construct_seeded_engine(std::seed_seq& seeds)
    {
      if constexpr (std::is_constructible_v<Eng, std::seed_seq&>)
	{
	  return Eng(seeds);
	}
      else
	{
	  Eng engine;
	  engine.seed(seeds);
	  return engine;
	}
    }

    /**
     * @brief Hands out one independent engine per trial of a run.
     *
     * The engine for trial t depends only on (runSeed, streamTag, t), never on
     * which worker thread asks for it or in which order, so a run is
     * reproducible under any executor.
     *
     * @tparam Eng engine type; std::mt19937_64 or a wrapper exposing engine()
     *         such as randutils::mt19937_rng.
     */
    template<class Eng = std::mt19937_64>
    class TrialEngineProvider
    {
    public:
      using Engine = Eng;

      explicit TrialEngineProvider(std::uint64_t runSeed, std::uint64_t streamTag = 0)
	: mRunSeed(runSeed),
	  mStreamTag(streamTag)
      {}

      // Independent family of streams under the same run seed.
      TrialEngineProvider withStreamTag(std::uint64_t streamTag) const
      {
	return TrialEngineProvider(mRunSeed, streamTag);
      }

      std::uint64_t makeSeedFor(std::size_t trial) const
      {
	return hash_combine64({mRunSeed, mStreamTag, static_cast<std::uint64_t>(trial)});
      }

      Engine make_engine(std::size_t trial) const
      {
	std::seed_seq seeds = make_seed_seq(makeSeedFor(trial));
	return construct_seeded_engine<Engine>(seeds);
      }

      std::uint64_t getRunSeed() const noexcept
      {
	return mRunSeed;
      }

      std::uint64_t getStreamTag() const noexcept
      {
	return mStreamTag;
      }

    private:
      std::uint64_t mRunSeed;
      std::uint64_t mStreamTag;
    };
  }
}

#include <array>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <boost/program_options.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include "randutils.hpp"
#include "MonteCarloAggregator.h"
#include "ParallelExecutors.h"
#include "TournamentConfiguration.h"
#include "TournamentSimulator.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;

using namespace knockout;
using knockoutsim::TournamentConfiguration;
using knockoutsim::TournamentConfigurationFileReader;
using knockoutsim::utils::TeeStream;

using Engine = randutils::mt19937_rng;

void printUsage(const po::options_description& desc) {
    std::cout << "knockoutsim - Monte Carlo round-by-round odds for a single-elimination draw\n\n";
    std::cout << "Usage: knockoutsim [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Run from a configuration file\n";
    std::cout << "  knockoutsim --config worlds.csv --trials 200000\n\n";
    std::cout << "  # Give the inputs directly and repeat an earlier run\n";
    std::cout << "  knockoutsim --ratings ratings.csv --fixture draw.csv --best-of \"19;25;33;35;35\" --seed 1234\n\n";
    std::cout << "  # Refuse ratings that push a frame probability outside [0,1]\n";
    std::cout << "  knockoutsim --config worlds.csv --range-policy reject\n";
}

std::shared_ptr<TournamentConfiguration> loadConfiguration(const po::variables_map& vm, std::ostream& out) {
    if (vm.count("config")) {
        TournamentConfigurationFileReader reader(vm["config"].as<std::string>());
        return reader.readConfigurationFile(out);
    }

    if (!vm.count("ratings") || !vm.count("fixture") || !vm.count("best-of")) {
        throw ConfigurationException("either --config or all of --ratings, --fixture and --best-of are required");
    }

    knockoutsim::RatingsFileReader ratingsReader(vm["ratings"].as<std::string>());
    knockoutsim::FixtureFileReader fixtureReader(vm["fixture"].as<std::string>());

    return std::make_shared<TournamentConfiguration>(ratingsReader.readFile(),
                                                     fixtureReader.readFile(),
                                                     knockoutsim::parseBestOfSchedule(vm["best-of"].as<std::string>()));
}

std::uint64_t makeRunSeed(const po::variables_map& vm) {
    if (vm.count("seed")) {
        return vm["seed"].as<std::uint64_t>();
    }

    randutils::auto_seed_128 seeder;
    std::array<std::uint32_t, 2> words;
    seeder.generate(words.begin(), words.end());
    return (static_cast<std::uint64_t>(words[0]) << 32) | words[1];
}

template <class Executor>
AggregateResult runTrials(const TournamentSimulator& simulator,
                          long numTrials,
                          std::uint64_t runSeed,
                          std::shared_ptr<Executor> executor,
                          bool verbose,
                          std::ostream& out) {
    MonteCarloAggregator<Engine, Executor> aggregator(numTrials, executor);
    aggregator.setVerbose(verbose, out);
    return aggregator.run(simulator, rng_utils::TrialEngineProvider<Engine>(runSeed));
}

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("config,c", po::value<std::string>(), "Tournament configuration CSV (RatingsPath,FixturePath,BestOf,ScalingFactor)")
            ("ratings", po::value<std::string>(), "Ratings CSV (Player,Rating)")
            ("fixture", po::value<std::string>(), "Round 1 fixture CSV (Player1,Player2)")
            ("best-of", po::value<std::string>(), "Best-of length per round, e.g. \"9;11;19\"")
            ("trials,n", po::value<long>()->default_value(100000), "Number of simulated tournaments")
            ("seed", po::value<std::uint64_t>(), "Run seed. If not specified, a random seed is drawn and printed.")
            ("scaling-factor", po::value<double>(), "Slope of the frame probability model (default 0.7)")
            ("range-policy", po::value<std::string>()->default_value("clamp"), "Frame probabilities outside [0,1]: clamp, reject or unclamped")
            ("executor", po::value<std::string>()->default_value("pool"), "Trial executor: single, pool or boost")
            ("threads", po::value<std::size_t>()->default_value(0), "Worker threads for the pool executor (0 = hardware concurrency)")
            ("output,o", po::value<std::string>(), "Result CSV file, or a directory for a timestamped file")
            ("log-file", po::value<std::string>(), "Mirror console output into this file")
            ("verbose,v", "Verbose output");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(desc);
            return 0;
        }

        const bool verbose = vm.count("verbose") > 0;

        std::unique_ptr<std::ofstream> logFile;
        std::unique_ptr<TeeStream> teeLog;
        if (vm.count("log-file")) {
            const std::string logPath = vm["log-file"].as<std::string>();
            logFile = std::make_unique<std::ofstream>(logPath);
            if (!logFile->is_open()) {
                std::cerr << "Error: cannot open log file " << logPath << std::endl;
                return 1;
            }
            teeLog = std::make_unique<TeeStream>(std::cout, *logFile);
        }
        std::ostream& out = teeLog ? static_cast<std::ostream&>(*teeLog) : std::cout;

        auto configuration = loadConfiguration(vm, out);
        if (vm.count("scaling-factor")) {
            configuration->setScalingFactor(vm["scaling-factor"].as<double>());
        }

        const RangePolicy policy = rangePolicyFromString(vm["range-policy"].as<std::string>());
        const FrameProbabilityModel model(configuration->getScalingFactor(), policy);
        const Bracket bracket = configuration->createBracket();

        TournamentSimulator simulator(bracket, configuration->getRatings(), configuration->getFixture(), model);

        for (const auto& warning : simulator.getRangeWarnings()) {
            std::cerr << "Warning: " << warning.toString() << std::endl;
        }

        const long numTrials = vm["trials"].as<long>();
        const std::uint64_t runSeed = makeRunSeed(vm);
        const std::string executorName = boost::algorithm::to_lower_copy(vm["executor"].as<std::string>());

        out << "Entrants: " << simulator.getNumEntrants() << ", rounds: " << simulator.getNumRounds() << std::endl;
        out << "Scaling factor: " << model.getScalingFactor()
            << ", range policy: " << rangePolicyToString(policy) << std::endl;
        out << "Run seed: " << runSeed << std::endl;
        out << "Running " << numTrials << " trials with the " << executorName << " executor" << std::endl;

        std::unique_ptr<AggregateResult> result;
        if (executorName == "single") {
            result = std::make_unique<AggregateResult>(
                runTrials(simulator, numTrials, runSeed,
                          std::make_shared<concurrency::SingleThreadExecutor>(), verbose, out));
        }
        else if (executorName == "pool") {
            auto executor = std::make_shared<concurrency::ThreadPoolExecutor<>>(vm["threads"].as<std::size_t>());
            if (verbose) {
                out << "Thread pool size: " << executor->getNumThreads() << std::endl;
            }
            result = std::make_unique<AggregateResult>(
                runTrials(simulator, numTrials, runSeed, executor, verbose, out));
        }
        else if (executorName == "boost") {
            result = std::make_unique<AggregateResult>(
                runTrials(simulator, numTrials, runSeed,
                          std::make_shared<concurrency::BoostRunnerExecutor>(), verbose, out));
        }
        else {
            std::cerr << "Error: unknown executor '" << executorName << "' (expected single, pool or boost)" << std::endl;
            return 1;
        }

        out << std::endl;
        knockoutsim::utils::printResultTable(*result, out);
        out << "Most likely champion: " << result->getMostLikelyChampion() << std::endl;

        if (vm.count("output")) {
            std::string outputPath = vm["output"].as<std::string>();
            if (boost::filesystem::is_directory(outputPath)) {
                outputPath = knockoutsim::utils::createResultFileName(outputPath);
            }
            knockoutsim::utils::writeResultCsv(*result, outputPath);
            out << "Results written to " << outputPath << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

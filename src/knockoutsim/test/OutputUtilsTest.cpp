#include <catch2/catch_test_macros.hpp>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include "utils/OutputUtils.h"
#include "utils/TimeUtils.h"
#include "AggregateResult.h"
#include "TrialOutcome.h"

using namespace knockoutsim::utils;
using knockout::AggregateResult;
using knockout::TrialOutcome;

namespace
{
  // Four entrants, two rounds. Slot 0 plays 1 and slot 2 plays 3 in round 1.
  TrialOutcome makeOutcome(std::size_t winnerTop, std::size_t winnerBottom, std::size_t champion)
  {
    TrialOutcome outcome(4, 2);
    outcome.recordWin(winnerTop, 1);
    outcome.recordWin(winnerBottom, 1);
    outcome.recordWin(champion, 2);
    return outcome;
  }

  AggregateResult makeResult()
  {
    AggregateResult result({"A", "B", "C", "D"}, 2);
    result.recordTrial(makeOutcome(0, 2, 0));
    result.recordTrial(makeOutcome(0, 2, 0));
    result.recordTrial(makeOutcome(0, 2, 2));
    result.recordTrial(makeOutcome(0, 3, 0));
    return result;
  }

  std::vector<std::string> splitLines(const std::string& text)
  {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
      lines.push_back(line);
    return lines;
  }
}

TEST_CASE("formatOdds", "[output]")
{
  REQUIRE(formatOdds(4.0 / 3.0) == "1.33");
  REQUIRE(formatOdds(2.5, 1) == "2.5");
  REQUIRE(formatOdds(std::numeric_limits<double>::infinity()) == "inf");
}

TEST_CASE("writeResultCsv writes one row per player", "[output]")
{
  const AggregateResult result = makeResult();

  std::ostringstream csv;
  writeResultCsv(result, csv);

  const auto lines = splitLines(csv.str());
  REQUIRE(lines.size() == 5);
  REQUIRE(lines[0] == "Player,P_R1,P_R2,Odds_R1,Odds_R2,ExpectedRoundsWon");
  REQUIRE(lines[1] == "A,1,0.75,1,1.333333333,1.75");
  REQUIRE(lines[2] == "B,0,0,inf,inf,0");
  REQUIRE(lines[3] == "C,0.75,0.25,1.333333333,4,1");
  REQUIRE(lines[4] == "D,0.25,0,4,inf,0.25");
}

TEST_CASE("writeResultCsv to a file", "[output]")
{
  const AggregateResult result = makeResult();
  const boost::filesystem::path directory = boost::filesystem::temp_directory_path() /
    boost::filesystem::unique_path("knockoutsim-out-%%%%-%%%%");

  SECTION("Timestamped file inside a new directory")
  {
    const std::string fileName = createResultFileName(directory.string());
    REQUIRE(boost::filesystem::is_directory(directory));
    REQUIRE(fileName.find("knockoutsim_Results_") != std::string::npos);
    REQUIRE(fileName.substr(fileName.size() - 4) == ".csv");

    writeResultCsv(result, fileName);

    std::ifstream in(fileName);
    std::string header;
    std::getline(in, header);
    REQUIRE(header == "Player,P_R1,P_R2,Odds_R1,Odds_R2,ExpectedRoundsWon");
  }

  SECTION("Unwritable location")
  {
    const std::string fileName = (directory / "missing" / "result.csv").string();
    REQUIRE_THROWS_AS(writeResultCsv(result, fileName), std::runtime_error);
  }

  boost::system::error_code ec;
  boost::filesystem::remove_all(directory, ec);
}

TEST_CASE("printResultTable", "[output]")
{
  std::ostringstream table;
  printResultTable(makeResult(), table);

  const std::string text = table.str();
  REQUIRE(text.find("Player") != std::string::npos);
  REQUIRE(text.find("Odds_R2") != std::string::npos);
  REQUIRE(text.find("inf") != std::string::npos);
  REQUIRE(text.find("Trials: 4") != std::string::npos);
  REQUIRE(splitLines(text).size() == 6);
}

TEST_CASE("TeeStream mirrors output to both streams", "[output]")
{
  std::ostringstream console;
  std::ostringstream logFile;

  TeeStream tee(console, logFile);
  tee << "Run seed: " << 42 << std::endl;

  REQUIRE(console.str() == "Run seed: 42\n");
  REQUIRE(logFile.str() == console.str());
}

TEST_CASE("getCurrentTimestamp", "[output]")
{
  const std::string timestamp = getCurrentTimestamp();
  // Mon_DD_YYYY_HHMM
  REQUIRE(timestamp.size() == 16);
  REQUIRE(timestamp[3] == '_');
  REQUIRE(timestamp[6] == '_');
  REQUIRE(timestamp[11] == '_');
}

#include "OutputUtils.h"
#include "TimeUtils.h"
#include <boost/filesystem.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using knockout::AggregateResult;

namespace knockoutsim
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string formatOdds(double odds, int precision)
{
    if (std::isinf(odds))
        return "inf";

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << odds;
    return ss.str();
}

void printResultTable(const AggregateResult& result, std::ostream& out)
{
    const unsigned int numRounds = result.getNumRounds();

    std::size_t nameWidth = 6;
    for (const auto& name : result.getPlayerNames())
        nameWidth = std::max(nameWidth, name.size());
    nameWidth += 2;

    out << std::left << std::setw(static_cast<int>(nameWidth)) << "Player" << std::right;
    for (unsigned int r = 1; r <= numRounds; ++r)
        out << std::setw(10) << ("P_R" + std::to_string(r));
    for (unsigned int r = 1; r <= numRounds; ++r)
        out << std::setw(11) << ("Odds_R" + std::to_string(r));
    out << std::setw(10) << "E[Wins]" << std::endl;

    for (std::size_t p = 0; p < result.getNumPlayers(); ++p)
    {
        out << std::left << std::setw(static_cast<int>(nameWidth)) << result.getPlayerNames()[p]
            << std::right << std::fixed << std::setprecision(4);
        for (unsigned int r = 1; r <= numRounds; ++r)
            out << std::setw(10) << result.getProbability(p, r);
        for (unsigned int r = 1; r <= numRounds; ++r)
            out << std::setw(11) << formatOdds(result.getOdds(p, r));
        out << std::setw(10) << std::setprecision(3) << result.getExpectedRoundsWon(p) << std::endl;
    }

    out << std::defaultfloat;
    out << "Trials: " << result.getNumTrials() << std::endl;
}

void writeResultCsv(const AggregateResult& result, std::ostream& out)
{
    const unsigned int numRounds = result.getNumRounds();

    out << "Player";
    for (unsigned int r = 1; r <= numRounds; ++r)
        out << ",P_R" << r;
    for (unsigned int r = 1; r <= numRounds; ++r)
        out << ",Odds_R" << r;
    out << ",ExpectedRoundsWon" << "\n";

    out << std::setprecision(10);
    for (std::size_t p = 0; p < result.getNumPlayers(); ++p)
    {
        out << result.getPlayerNames()[p];
        for (unsigned int r = 1; r <= numRounds; ++r)
            out << "," << result.getProbability(p, r);
        for (unsigned int r = 1; r <= numRounds; ++r)
        {
            const double odds = result.getOdds(p, r);
            if (std::isinf(odds))
                out << ",inf";
            else
                out << "," << odds;
        }
        out << "," << result.getExpectedRoundsWon(p) << "\n";
    }
}

void writeResultCsv(const AggregateResult& result, const std::string& fileName)
{
    std::ofstream resultFile(fileName);
    if (!resultFile.is_open()) {
        throw std::runtime_error("Cannot open result file for writing: " + fileName);
    }

    writeResultCsv(result, resultFile);
    resultFile.close();
}

std::string createResultFileName(const std::string& outputDirectory)
{
    boost::filesystem::create_directories(outputDirectory);
    return outputDirectory + "/knockoutsim_Results_" + getCurrentTimestamp() + ".csv";
}

} // namespace utils
} // namespace knockoutsim

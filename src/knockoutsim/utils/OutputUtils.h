#pragma once

#include <streambuf>
#include <ostream>
#include <string>
#include "AggregateResult.h"

namespace knockoutsim
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * This class allows writing to two different stream buffers simultaneously,
 * useful for logging to both console and file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    /**
     * @brief Construct a TeeBuf with two target stream buffers
     * @param sb1 First stream buffer to write to
     * @param sb2 Second stream buffer to write to
     */
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Format decimal odds for display; infinite odds print as "inf"
 * @param odds Odds value, possibly +infinity
 * @param precision Digits after the decimal point
 */
std::string formatOdds(double odds, int precision = 2);

/**
 * @brief Print one row per player: probability and odds of winning each round,
 *        followed by the expected number of rounds won
 */
void printResultTable(const knockout::AggregateResult& result, std::ostream& out);

/**
 * @brief Write the result as CSV:
 *        Player,P_R1..P_Rn,Odds_R1..Odds_Rn,ExpectedRoundsWon
 */
void writeResultCsv(const knockout::AggregateResult& result, std::ostream& out);

/**
 * @brief Write the result CSV to a file
 * @throws std::runtime_error if the file cannot be opened
 */
void writeResultCsv(const knockout::AggregateResult& result, const std::string& fileName);

/**
 * @brief Create a timestamped result filename inside outputDirectory,
 *        creating the directory if needed
 */
std::string createResultFileName(const std::string& outputDirectory);

} // namespace utils
} // namespace knockoutsim

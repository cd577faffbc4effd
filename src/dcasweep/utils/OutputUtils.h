#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace dcasweep
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
 *
 * Used by the command line tool to echo console output into a run log.
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Create a timestamped output filename and its directory
 * @param outputDir Directory the file is placed in; created if missing
 * @param symbol Symbol of the simulated instrument
 * @param kind Short label for the content, e.g. "Simulation" or "Sweep"
 * @param extension File extension without the dot
 * @return outputDir/<symbol>_<kind>_<timestamp>.<extension>
 */
std::string createOutputFileName(const std::string& outputDir,
                                 const std::string& symbol,
                                 const std::string& kind,
                                 const std::string& extension);

/**
 * @brief Strip characters that are awkward in file names ("MNQ=F" -> "MNQ_F")
 */
std::string sanitizeForFileName(const std::string& text);

} // namespace utils
} // namespace dcasweep

#include "OutputUtils.h"
#include "TimeUtils.h"
#include <cctype>
#include <filesystem>

namespace dcasweep
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

std::string sanitizeForFileName(const std::string& text)
{
    std::string result;
    result.reserve(text.size());
    for (char c : text)
    {
        const unsigned char uc = static_cast<unsigned char>(c);
        result.push_back((std::isalnum(uc) || c == '-' || c == '_') ? c : '_');
    }
    return result;
}

std::string createOutputFileName(const std::string& outputDir,
                                 const std::string& symbol,
                                 const std::string& kind,
                                 const std::string& extension)
{
    const std::string fileName = sanitizeForFileName(symbol) + "_" + kind + "_"
        + getCurrentTimestamp() + "." + extension;

    if (outputDir.empty())
        return fileName;

    std::filesystem::create_directories(outputDir);
    return outputDir + "/" + fileName;
}

} // namespace utils
} // namespace dcasweep

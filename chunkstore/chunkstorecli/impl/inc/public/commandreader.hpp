#ifndef CHUNKSTORECLI_COMMANDREADER_HPP_
#define CHUNKSTORECLI_COMMANDREADER_HPP_

#include <istream>

#include "command.hpp"

namespace chunkstorecli
{
class CommandReader
{
public:
    explicit CommandReader(std::istream &input);

    // Skips blank lines; returns an invalid command at the end of the input
    [[nodiscard]] Command read_next_command() const;

private:
    std::istream &input_;
};
}  // namespace chunkstorecli

#endif  // CHUNKSTORECLI_COMMANDREADER_HPP_

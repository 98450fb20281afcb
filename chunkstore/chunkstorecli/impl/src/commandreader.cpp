#include "commandreader.hpp"

#include <regex>
#include <string>
#include <vector>

namespace chunkstorecli
{
CommandReader::CommandReader(std::istream &input)
    : input_ {input}
{}

Command CommandReader::read_next_command() const
{
    static const std::regex token_rgx {"\\S+"};

    std::vector<std::string> tokens;
    std::string              input_line;

    while (tokens.empty())
    {
        if (!std::getline(input_, input_line))
        {
            return {};
        }

        std::sregex_iterator it {input_line.cbegin(), input_line.cend(), token_rgx};
        for (std::sregex_iterator end; it != end; ++it)
        {
            tokens.push_back(it->str());
        }
    }

    return {tokens.front(), tokens.cbegin() + 1, tokens.cend()};
}
}  // namespace chunkstorecli

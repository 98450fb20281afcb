#ifndef CHUNKSTORE_TEST_CONFIGLOADER_MOCK_HPP_
#define CHUNKSTORE_TEST_CONFIGLOADER_MOCK_HPP_

#include <gmock/gmock.h>

#include "configloader.hpp"

using namespace ::chunkstore::config;

class ConfigLoaderMock : public ConfigLoader
{
public:
    MOCK_METHOD((std::map<std::string, std::any>), load, (), (const, override));
};

#endif  // CHUNKSTORE_TEST_CONFIGLOADER_MOCK_HPP_

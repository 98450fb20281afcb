#ifndef CHUNKSTORE_TEST_STORAGEBACKEND_MOCK_HPP_
#define CHUNKSTORE_TEST_STORAGEBACKEND_MOCK_HPP_

#include <gmock/gmock.h>

#include "storagebackend.hpp"

using namespace ::chunkstore::storage;

class StorageBackendMock : public StorageBackend
{
public:
    MOCK_METHOD(Handle, root_directory, (), (const, override));
    MOCK_METHOD(Handle, open_directory, (Handle, const std::string &, bool), (override));
    MOCK_METHOD(Handle, open_file, (Handle, const std::string &, bool), (override));
    MOCK_METHOD(std::unique_ptr<WriteStream>, open_write_stream, (Handle, bool), (override));
    MOCK_METHOD(bool, file_size, (Handle, uint64_t &), (override));
    MOCK_METHOD(bool, read_range, (Handle, uint64_t, uint64_t, std::vector<uint8_t> &), (override));
    MOCK_METHOD(bool, list_entries, (Handle, std::vector<std::string> &), (override));
    MOCK_METHOD(bool, remove_entry, (Handle, const std::string &, bool), (override));
};

#endif  // CHUNKSTORE_TEST_STORAGEBACKEND_MOCK_HPP_

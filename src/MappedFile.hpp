#pragma once
#include <string>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

// Read-only memory mapping of a whole file. Empty files are not mapped and report size 0.
// Throws boost::interprocess::interprocess_exception if the file cannot be opened or mapped.
class MappedFile {
public:
    explicit MappedFile(const std::string& path);

    size_t size() const;
    const char* data() const;

private:
    boost::interprocess::file_mapping fileMapping;
    boost::interprocess::mapped_region region;
    size_t segmentSize;
};

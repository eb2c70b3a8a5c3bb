#include "MappedFile.hpp"
#include <filesystem>

MappedFile::MappedFile(const std::string& path)
    : fileMapping(path.c_str(), boost::interprocess::read_only),
      segmentSize(0) {
    std::error_code ec;
    auto bytes = std::filesystem::file_size(path, ec);
    if (!ec && bytes > 0) {
        region = boost::interprocess::mapped_region(fileMapping, boost::interprocess::read_only);
        segmentSize = region.get_size();
    }
}

size_t MappedFile::size() const {
    return segmentSize;
}

const char* MappedFile::data() const {
    return static_cast<const char*>(region.get_address());
}

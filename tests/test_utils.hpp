#pragma once
#include <fstream>
#include <sstream>
#include <string>

#include "gtest/gtest.h"

// Write `content` to a file under the gtest temp dir and return its path
inline std::string write_temp(const std::string& name, const std::string& content) {
    const std::string path = ::testing::TempDir() + "tblift_" + name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline bool file_exists(const std::string& path) {
    std::ifstream in(path);
    return in.good();
}

#pragma once

#ifndef sonogram_file_io_hpp
#define sonogram_file_io_hpp

#include <fstream>
#include <stdexcept>
#include <streambuf>
#include <string>

namespace sonogram
{
    inline std::string read_file_text(const std::string & path)
    {
        if (path.empty()) return {}; // no-op if path is empty

        std::ifstream file(path.c_str());
        if (!file.is_open()) throw std::runtime_error("could not open ascii ifstream to path " + path);
        return { (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>() };
    }

} // end namespace sonogram

#endif // end sonogram_file_io_hpp

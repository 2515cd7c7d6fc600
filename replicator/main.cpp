// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// main.cpp
//
#include "replication-tool.hpp"
#include "str-util.hpp"
#include "util.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(const int argc, const char * const argv[])
{
    using namespace replicator;

    try
    {
        ReplicationTool tool(std::vector<std::string>((argv + 1), (argv + argc)));
        return tool.run();
    }
    catch (const silent_runtime_error &)
    {
        // already printed
    }
    catch (const std::exception & ex)
    {
        std::wcout << L"Error: " << strutil::toWideString(ex.what()) << std::endl;
    }

    return exit_status::usage_error;
}

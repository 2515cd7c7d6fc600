// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// unit_path_mapping.cpp
//
#undef NDEBUG

#include "path-mapping.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace replicator;

static std::wstring
    mapped(const std::wstring & source, const std::wstring & root, const std::wstring & dest)
{
    return mapDestinationPath(fs::path(source), fs::path(root), fs::path(dest)).wstring();
}

static void test_unc_share_to_drive()
{
    assert(
        mapped(L"\\\\server\\share\\folder\\", L"\\\\server\\share\\", L"D:\\Backup\\") ==
        L"D:\\Backup\\folder");
}

static void test_trailing_separator_variations()
{
    const std::wstring expected{ L"D:\\Backup\\folder" };

    for (const std::wstring source : { L"\\\\server\\share\\folder",
                                       L"\\\\server\\share\\folder\\",
                                       L"\\\\server\\share\\folder\\\\" })
    {
        for (const std::wstring root : { L"\\\\server\\share", L"\\\\server\\share\\" })
        {
            for (const std::wstring dest : { L"D:\\Backup", L"D:\\Backup\\" })
            {
                assert(mapped(source, root, dest) == expected);
            }
        }
    }
}

static void test_deeper_remainder_keeps_every_level()
{
    assert(
        mapped(L"\\\\server\\share\\a\\b\\c", L"\\\\server\\share", L"D:\\Backup") ==
        L"D:\\Backup\\a\\b\\c");

    assert(
        mapped(L"/data/projects/2024/q1/", L"/data/", L"/mnt/backup") ==
        L"/mnt/backup/projects/2024/q1");
}

static void test_root_maps_to_destination_root()
{
    assert(mapped(L"\\\\server\\share\\", L"\\\\server\\share", L"D:\\Backup\\") == L"D:\\Backup");
    assert(mapped(L"/data", L"/data/", L"/mnt/backup/") == L"/mnt/backup");

    // bare roots are kept as given, because trimming them changes their meaning
    assert(mapped(L"/data", L"/data", L"/") == L"/");
    assert(mapped(L"\\\\server\\share", L"\\\\server\\share", L"D:\\") == L"D:\\");
}

static void test_joins_with_the_destination_separator()
{
    assert(mapped(L"/data/photos", L"/data", L"E:\\Copies") == L"E:\\Copies\\photos");
    assert(mapped(L"\\\\nas\\media\\music", L"\\\\nas\\media", L"/backup") == L"/backup/music");
}

static void test_prefix_must_end_on_a_path_boundary()
{
    assert(!relativeRemainder(L"/data/abc", L"/data/a"));
    assert(relativeRemainder(L"/data/a/bc", L"/data/a").value() == L"bc");
    assert(relativeRemainder(L"/data/a", L"/data/a/").value().empty());
    assert(!relativeRemainder(L"/data", L"/data/a"));
    assert(!relativeRemainder(L"/other/a", L"/data"));
}

static void test_source_outside_root_throws()
{
    bool didThrow{ false };

    try
    {
        const fs::path path{ mapDestinationPath(
            fs::path("/elsewhere/x"), fs::path("/data"), fs::path("/mnt/backup")) };

        std::wcout << L"unexpected mapping: " << path.wstring() << std::endl;
    }
    catch (const std::invalid_argument &)
    {
        didThrow = true;
    }

    assert(didThrow);
}

int main()
{
    test_unc_share_to_drive();
    test_trailing_separator_variations();
    test_deeper_remainder_keeps_every_level();
    test_root_maps_to_destination_root();
    test_joins_with_the_destination_separator();
    test_prefix_must_end_on_a_path_boundary();
    test_source_outside_root_throws();

    std::cout << "All path mapping tests passed" << std::endl;
    return 0;
}

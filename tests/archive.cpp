////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `binform`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "pfs/binform/archive.hpp"
#include <utility>
#include <vector>

using archive_t = binform::archive;

constexpr char const * kABC = "ABC";

TEST_CASE("constructors") {
    archive_t ar1;

    CHECK(ar1.empty());
    CHECK(ar1.data() == nullptr);

    archive_t ar2 {kABC, 3};
    CHECK_EQ(ar2.size(), 3);

    archive_t ar3 {std::move(ar2)};
    CHECK_EQ(ar3.size(), 3);
    CHECK(ar2.empty());

    archive_t ar4 {std::vector<char>{'x', 'y'}};
    CHECK_EQ(ar4.size(), 2);
    CHECK_EQ(ar4.data()[0], 'x');
    CHECK_EQ(ar4.data()[1], 'y');

    archive_t ar5 {ar4};
    CHECK_EQ(ar5.size(), 2);
    CHECK_EQ(ar4.size(), 2);
    CHECK(ar5 == ar4);
}

TEST_CASE("load does not validate") {
    // Any content is accepted, errors are detected lazily on decode
    archive_t ar {"\377\377\377", 3};
    CHECK_EQ(ar.size(), 3);
}

TEST_CASE("move assignment") {
    archive_t ar1 {kABC, 3};
    archive_t ar2;

    ar2 = std::move(ar1);
    CHECK_EQ(ar2.size(), 3);
    CHECK(ar1.empty());
}

TEST_CASE("append") {
    archive_t ar;
    ar.append(kABC, 3);
    ar.append('x');
    ar.append(nullptr, 0);

    CHECK_EQ(ar.size(), 4);
    CHECK_EQ(ar.data()[0], 'A');
    CHECK_EQ(ar.data()[1], 'B');
    CHECK_EQ(ar.data()[2], 'C');
    CHECK_EQ(ar.data()[3], 'x');

    archive_t tail {"yz", 2};
    ar.append(tail);
    CHECK_EQ(ar, archive_t{"ABCxyz", 6});

    ar.append(archive_t{});
    CHECK_EQ(ar.size(), 6);
}

TEST_CASE("export bytes") {
    archive_t ar {kABC, 3};

    auto bytes = ar.bytes();
    CHECK_EQ(bytes.size(), 3);
    CHECK_EQ(ar.size(), 3);
    CHECK((bytes == std::vector<char>{'A', 'B', 'C'}));

    auto c = std::move(ar).container();
    CHECK((c == std::vector<char>{'A', 'B', 'C'}));
    CHECK(ar.empty());
}

TEST_CASE("available") {
    archive_t ar {kABC, 3};

    CHECK_EQ(ar.available(0), 3);
    CHECK_EQ(ar.available(1), 2);
    CHECK_EQ(ar.available(3), 0);
    CHECK_EQ(ar.available(100), 0);

    archive_t empty;
    CHECK_EQ(empty.available(0), 0);
}

TEST_CASE("comparison") {
    CHECK_EQ(archive_t{kABC, 3}, archive_t{kABC, 3});
    CHECK_NE(archive_t{kABC, 3}, archive_t{kABC, 2});
    CHECK_EQ(archive_t{}, archive_t{});
}

#include "TempFileFixture.hpp"
#include <DatasetErrors.hpp>
#include <FileHandleCache.hpp>
#include <catch2/catch_test_macros.hpp>

using msms::FileHandleCache;

TEST_CASE("FileHandleCache has capacity one", "[cache]") {
	STATIC_REQUIRE(FileHandleCache::CAPACITY == 1);
}

TEST_CASE("FileHandleCache reuses the handle for the same file", "[cache]") {
	TempFileFixture fixture;
	auto path = fixture.write("cache_same.txt", "0123456789");

	FileHandleCache cache;
	CHECK_FALSE(cache.is_open());
	CHECK(cache.read(path, 0, 4) == "0123");
	CHECK(cache.read(path, 4, 3) == "456");
	CHECK(cache.read(path, 7, 3) == "789");

	CHECK(cache.is_open());
	CHECK(cache.cached_path() == path);
	CHECK(cache.open_count() == 1);
	CHECK(cache.eviction_count() == 0);
	// Contiguous reads never seek
	CHECK(cache.seek_count() == 0);
}

TEST_CASE("FileHandleCache seeks only for non-contiguous reads", "[cache]") {
	TempFileFixture fixture;
	auto path = fixture.write("cache_seek.txt", "abcdefghij");

	FileHandleCache cache;
	CHECK(cache.read(path, 5, 2) == "fg");
	CHECK(cache.seek_count() == 1);
	CHECK(cache.read(path, 7, 3) == "hij");
	CHECK(cache.seek_count() == 1);
	CHECK(cache.read(path, 0, 1) == "a");
	CHECK(cache.seek_count() == 2);
}

TEST_CASE("FileHandleCache evicts on every file switch", "[cache]") {
	TempFileFixture fixture;
	auto a = fixture.write("cache_a.txt", "AAAA");
	auto b = fixture.write("cache_b.txt", "BBBB");

	FileHandleCache cache;
	CHECK(cache.read(a, 0, 2) == "AA");
	CHECK(cache.read(b, 0, 2) == "BB");
	CHECK(cache.cached_path() == b);
	CHECK(cache.read(a, 2, 2) == "AA");
	CHECK(cache.cached_path() == a);
	CHECK(cache.read(b, 2, 2) == "BB");

	CHECK(cache.open_count() == 4);
	CHECK(cache.eviction_count() == 3);
}

TEST_CASE("FileHandleCache drops the handle after a failed read", "[cache]") {
	TempFileFixture fixture;
	auto path = fixture.write("cache_short.txt", "short");

	FileHandleCache cache;
	CHECK(cache.read(path, 0, 2) == "sh");
	CHECK_THROWS_AS(cache.read(path, 2, 100), msms::StorageError);
	CHECK_FALSE(cache.is_open());
	CHECK(cache.cached_path().empty());

	// The next read reopens the file
	CHECK(cache.read(path, 0, 5) == "short");
	CHECK(cache.open_count() == 2);
}

TEST_CASE("FileHandleCache reports missing files", "[cache]") {
	FileHandleCache cache;
	CHECK_THROWS_AS(cache.read("does_not_exist.mgf", 0, 1), msms::StorageError);
	CHECK_FALSE(cache.is_open());
}

TEST_CASE("FileHandleCache release closes the handle", "[cache]") {
	TempFileFixture fixture;
	auto path = fixture.write("cache_release.txt", "xyz");

	FileHandleCache cache;
	CHECK(cache.read(path, 0, 1) == "x");
	cache.release();
	CHECK_FALSE(cache.is_open());
	CHECK(cache.read(path, 1, 2) == "yz");
	CHECK(cache.open_count() == 2);
	CHECK(cache.eviction_count() == 0);
}

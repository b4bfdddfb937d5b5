#include <catch2/catch_test_macros.hpp>
#include "lxid/crypto/secure_memory_handle.hpp"
#include "lxid/crypto/sodium_interop.hpp"
#include "lxid/core/constants.hpp"
#include <algorithm>
#include <vector>
using namespace lxid;
using namespace lxid::crypto;

TEST_CASE("SecureMemoryHandle - Allocate", "[crypto][memory][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Identity-sized region") {
        auto result = SecureMemoryHandle::Allocate(Constants::IDENTITY_SECRET_SIZE);
        REQUIRE(result.IsOk());
        const auto& handle = result.Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == 64);
        REQUIRE(handle.View().size() == 64);
    }
    SECTION("Zero size is refused") {
        auto result = SecureMemoryHandle::Allocate(0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::AllocationFailed);
    }
    SECTION("Default handle is invalid and views as empty") {
        SecureMemoryHandle handle;
        REQUIRE(handle.IsInvalid());
        REQUIRE(handle.Size() == 0);
        REQUIRE(handle.View().empty());
        REQUIRE(handle.MutableView().empty());
    }
}

TEST_CASE("SecureMemoryHandle - Write", "[crypto][memory][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto handle = SecureMemoryHandle::Allocate(8).Unwrap();

    SECTION("Exact fit is readable through the view") {
        const std::vector<uint8_t> data{1, 2, 3, 4, 5, 6, 7, 8};
        REQUIRE(handle.Write(data).IsOk());
        REQUIRE(std::ranges::equal(handle.View(), data));
    }
    SECTION("Shorter data zeroes the remainder") {
        const std::vector<uint8_t> full(8, 0xEE);
        const std::vector<uint8_t> partial{0x01, 0x02};
        REQUIRE(handle.Write(full).IsOk());
        REQUIRE(handle.Write(partial).IsOk());
        const std::vector<uint8_t> expected{0x01, 0x02, 0, 0, 0, 0, 0, 0};
        REQUIRE(std::ranges::equal(handle.View(), expected));
    }
    SECTION("Oversized data is refused") {
        const std::vector<uint8_t> data(9, 0x01);
        auto result = handle.Write(data);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("Released handle refuses writes") {
        SecureMemoryHandle owner(std::move(handle));
        const std::vector<uint8_t> data(8, 0x01);
        auto result = handle.Write(data);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::InvalidOperation);
    }
}

TEST_CASE("SecureMemoryHandle - ownership", "[crypto][memory][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Move construction keeps the region in place") {
        auto first = SecureMemoryHandle::Allocate(16).Unwrap();
        first.MutableView()[0] = 0x7F;
        const auto* region = first.View().data();
        SecureMemoryHandle second(std::move(first));
        REQUIRE(first.IsInvalid());
        REQUIRE(first.Size() == 0);
        REQUIRE(second.View().data() == region);
        REQUIRE(second.View()[0] == 0x7F);
    }
    SECTION("Move assignment releases the target's old region") {
        auto source = SecureMemoryHandle::Allocate(16).Unwrap();
        auto target = SecureMemoryHandle::Allocate(32).Unwrap();
        target = std::move(source);
        REQUIRE(source.IsInvalid());
        REQUIRE(target.Size() == 16);
    }
}

#include "lxid/vanity/vanity_search.hpp"
#include "lxid/crypto/sodium_interop.hpp"
#include "lxid/identity/address_deriver.hpp"
#include "lxid/identity/identity_generator.hpp"
#include "lxid/debug/key_logger.hpp"

#include <format>
#include <system_error>
#include <thread>
#include <vector>

namespace lxid::vanity {

using crypto::SodiumInterop;
using identity::AddressDeriver;
using identity::IdentityGenerator;
using identity::IdentitySecret;

VanitySearch::VanitySearch(
    AddressPattern pattern,
    const size_t worker_count,
    const Option<uint64_t> max_attempts)
    : pattern_(std::move(pattern))
    , worker_count_(worker_count)
    , max_attempts_(max_attempts) {
}

Result<Option<VanityMatch>, IdentityFailure> VanitySearch::Run() {
    if (worker_count_ == 0) {
        return Result<Option<VanityMatch>, IdentityFailure>::Err(
            IdentityFailure::InvalidInput("workers must be at least 1"));
    }
    auto init_result = SodiumInterop::Initialize().MapErr(IdentityFailure::FromSodiumFailure);
    if (init_result.IsErr()) {
        return Result<Option<VanityMatch>, IdentityFailure>::Err(std::move(init_result).UnwrapErr());
    }

    {
        std::lock_guard lock(result_mutex_);
        match_.reset();
        failure_.reset();
    }
    attempts_.store(0, std::memory_order_relaxed);
    stop_.store(false, std::memory_order_release);

    std::vector<std::thread> workers;
    workers.reserve(worker_count_);
    try {
        for (size_t i = 0; i < worker_count_; ++i) {
            workers.emplace_back(&VanitySearch::Worker, this);
        }
    } catch (const std::system_error& ex) {
        RequestStop();
        for (auto& worker : workers) {
            worker.join();
        }
        return Result<Option<VanityMatch>, IdentityFailure>::Err(
            IdentityFailure::Generic(std::format("Failed to start worker thread: {}", ex.what())));
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::lock_guard lock(result_mutex_);
    if (match_.has_value()) {
        match_->attempts = attempts_.load(std::memory_order_relaxed);
        debug::LogVanityMatch(match_->attempts, match_->derived.address);
        Option<VanityMatch> result = std::move(match_);
        match_.reset();
        return Result<Option<VanityMatch>, IdentityFailure>::Ok(std::move(result));
    }
    if (failure_.has_value()) {
        return Result<Option<VanityMatch>, IdentityFailure>::Err(std::move(*failure_));
    }
    return Result<Option<VanityMatch>, IdentityFailure>::Ok(None<VanityMatch>());
}

void VanitySearch::RequestStop() noexcept {
    stop_.store(true, std::memory_order_release);
}

uint64_t VanitySearch::Attempts() const noexcept {
    return attempts_.load(std::memory_order_relaxed);
}

void VanitySearch::Worker() {
    // Candidates stay on the stack; only a match is copied into secure memory.
    IdentitySecret::Bytes candidate{};
    Search(candidate);
    auto wipe_result = SodiumInterop::SecureWipe(candidate);
    if (wipe_result.IsErr()) {
        PublishFailure(IdentityFailure::FromSodiumFailure(wipe_result.UnwrapErr()));
    }
}

void VanitySearch::Search(IdentitySecret::Bytes& candidate) {
    while (!stop_.load(std::memory_order_acquire)) {
        if (!ReserveAttempt()) {
            RequestStop();
            return;
        }

        auto generate_result = IdentityGenerator::GenerateInto(candidate);
        if (generate_result.IsErr()) {
            PublishFailure(std::move(generate_result).UnwrapErr());
            return;
        }

        auto derive_result = AddressDeriver::Derive(candidate);
        if (derive_result.IsErr()) {
            PublishFailure(std::move(derive_result).UnwrapErr());
            return;
        }

        if (pattern_.Matches(derive_result.Unwrap().address)) {
            auto secret_result = IdentitySecret::FromBytes(candidate);
            if (secret_result.IsErr()) {
                PublishFailure(std::move(secret_result).UnwrapErr());
                return;
            }
            PublishMatch(VanityMatch{std::move(secret_result).Unwrap(), derive_result.Unwrap(), 0});
            return;
        }
    }
}

bool VanitySearch::ReserveAttempt() noexcept {
    if (!max_attempts_.has_value()) {
        attempts_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }
    uint64_t current = attempts_.load(std::memory_order_relaxed);
    do {
        if (current >= *max_attempts_) {
            return false;
        }
    } while (!attempts_.compare_exchange_weak(current, current + 1, std::memory_order_relaxed));
    return true;
}

void VanitySearch::PublishMatch(VanityMatch match) {
    std::lock_guard lock(result_mutex_);
    if (!match_.has_value()) {
        match_.emplace(std::move(match));
    }
    RequestStop();
}

void VanitySearch::PublishFailure(IdentityFailure failure) {
    std::lock_guard lock(result_mutex_);
    if (!failure_.has_value()) {
        failure_.emplace(std::move(failure));
    }
    RequestStop();
}

} // namespace lxid::vanity

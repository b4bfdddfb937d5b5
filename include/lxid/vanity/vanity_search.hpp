#pragma once

#include "lxid/core/result.hpp"
#include "lxid/core/option.hpp"
#include "lxid/core/failures.hpp"
#include "lxid/identity/derived_identity.hpp"
#include "lxid/identity/identity_secret.hpp"
#include "lxid/vanity/address_pattern.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>

namespace lxid::vanity {

struct VanityMatch {
    identity::IdentitySecret secret;
    identity::DerivedIdentity derived;
    /// Total attempts across all workers when the search ended.
    uint64_t attempts = 0;
};

/**
 * @brief Brute-force search for an identity whose LXMF address fits a pattern
 *
 * Each worker thread generates random identities, derives their address and
 * tests it against the pattern. The first worker to find a match publishes it
 * and signals the others to stop; later matches are discarded.
 *
 * Thread-safety: Run() must not be called concurrently with itself.
 * RequestStop() and Attempts() may be called from any thread.
 */
class VanitySearch {
public:
    /**
     * @param pattern Address pattern to look for
     * @param worker_count Number of worker threads (>= 1)
     * @param max_attempts Optional cap on attempts across all workers
     */
    VanitySearch(AddressPattern pattern, size_t worker_count, Option<uint64_t> max_attempts);

    VanitySearch(const VanitySearch&) = delete;
    VanitySearch& operator=(const VanitySearch&) = delete;

    /**
     * @brief Runs the workers and blocks until they finish
     *
     * @return Some(match) on success, None if the attempt limit was reached
     *         or RequestStop() was called during the run, Err on a derivation or
     *         randomness failure in any worker
     */
    [[nodiscard]] Result<Option<VanityMatch>, IdentityFailure> Run();

    void RequestStop() noexcept;

    [[nodiscard]] uint64_t Attempts() const noexcept;

    /// Live counter for progress reporting.
    [[nodiscard]] const std::atomic<uint64_t>& AttemptCounter() const noexcept {
        return attempts_;
    }

    [[nodiscard]] size_t WorkerCount() const noexcept { return worker_count_; }

private:
    void Worker();
    void Search(identity::IdentitySecret::Bytes& candidate);
    bool ReserveAttempt() noexcept;
    void PublishMatch(VanityMatch match);
    void PublishFailure(IdentityFailure failure);

    AddressPattern pattern_;
    size_t worker_count_;
    Option<uint64_t> max_attempts_;

    std::atomic<bool> stop_{false};
    std::atomic<uint64_t> attempts_{0};

    std::mutex result_mutex_;
    Option<VanityMatch> match_;
    Option<IdentityFailure> failure_;
};

} // namespace lxid::vanity

#include "lxid/verification/verification_report.hpp"
#include "lxid/core/constants.hpp"
namespace lxid::verification {
    std::string_view OutcomeName(const VerificationOutcome outcome) noexcept {
        switch (outcome) {
            case VerificationOutcome::Match:
                return "match";
            case VerificationOutcome::Mismatch:
                return "mismatch";
            case VerificationOutcome::ReferenceUnavailable:
                return "reference unavailable";
        }
        return "unknown";
    }

    int VerificationReport::ExitCode() const noexcept {
        return outcome == VerificationOutcome::Mismatch ? ExitCodes::FAILURE : ExitCodes::SUCCESS;
    }
}

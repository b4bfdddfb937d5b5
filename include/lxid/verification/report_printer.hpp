#pragma once
#include "lxid/core/failures.hpp"
#include "lxid/core/option.hpp"
#include "lxid/verification/verification_report.hpp"
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string_view>
namespace lxid::verification {
/// Human-readable rendering of verification runs for the command line.
class ReportPrinter {
public:
    /// Header, key halves, companion comparison, derived keys, manual
    /// calculation, reference result and verdict.
    static void Print(std::ostream& out, const VerificationReport& report);

    /// Output for runs that stopped before a report existed. The size line
    /// of a wrong-size file is printed only when file_size is known.
    static void PrintFailure(
        std::ostream& out,
        const std::filesystem::path& path,
        const IdentityFailure& failure,
        Option<std::uintmax_t> file_size = None<std::uintmax_t>());

    static void PrintUsage(std::ostream& out, std::string_view program);
private:
    static void PrintCompanion(std::ostream& out, const CompanionResult& companion);
    static void PrintVerdict(std::ostream& out, const VerificationReport& report);

    ReportPrinter() = delete;
};
}

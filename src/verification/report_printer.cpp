#include "lxid/verification/report_printer.hpp"
#include "lxid/core/constants.hpp"
#include "lxid/encoding/hex.hpp"
#include <format>
namespace lxid::verification {
    using encoding::ToHex;

    namespace {
        constexpr std::string_view CHECK_MARK = "✓";
        constexpr std::string_view CROSS_MARK = "✗";

        void PrintHeader(std::ostream& out) {
            out << "=== LXMF Identity File Verification ===\n\n";
        }
    }

    void ReportPrinter::Print(std::ostream& out, const VerificationReport& report) {
        PrintHeader(out);
        if (!report.identity_path.empty()) {
            out << std::format("File: {}\n", report.identity_path.string());
        }
        out << std::format("Size: {} bytes\n", report.file_size);
        out << std::format("{} Correct size ({} bytes)\n\n", CHECK_MARK, Constants::IDENTITY_SECRET_SIZE);
        if (!report.identity_path.empty()) {
            out << std::format("Loading identity from: {}\n\n", report.identity_path.string());
        }

        out << "Identity private key:\n";
        out << std::format("  X25519 Private:  {}\n", ToHex(report.secret.X25519Private()));
        out << std::format("  Ed25519 Seed:    {}\n", ToHex(report.secret.Ed25519Seed()));

        if (report.companion.has_value()) {
            PrintCompanion(out, *report.companion);
        }

        out << "\nDerived public keys:\n";
        out << std::format("  X25519 Public:   {}\n", ToHex(report.derived.X25519Public()));
        out << std::format("  Ed25519 Public:  {}\n", ToHex(report.derived.Ed25519Public()));
        out << "\nManual calculation:\n";
        out << std::format("  Identity Hash: {}\n", ToHex(report.derived.identity_hash));
        out << std::format("  LXMF Address:  {}\n", ToHex(report.derived.address));

        PrintVerdict(out, report);
    }

    void ReportPrinter::PrintCompanion(std::ostream& out, const CompanionResult& companion) {
        out << std::format("\nComparing with {}...\n", companion.path.string());
        const auto& check = companion.check;
        if (check.x25519_private_matches) {
            out << std::format("{} X25519 private key matches\n", CHECK_MARK);
        } else {
            out << std::format("{} X25519 private key MISMATCH!\n", CROSS_MARK);
        }
        if (check.ed25519_seed_matches) {
            out << std::format("{} Ed25519 seed matches\n", CHECK_MARK);
        } else {
            out << std::format("{} Ed25519 seed MISMATCH!\n", CROSS_MARK);
        }
        for (const auto& line : check.echoed_lines) {
            if (line.starts_with(CompanionTextConstants::ADDRESS_MARKER)) {
                out << '\n';
            }
            out << line << '\n';
        }
    }

    void ReportPrinter::PrintVerdict(std::ostream& out, const VerificationReport& report) {
        const std::string_view reference_name = report.reference_name.empty()
            ? std::string_view("Reference implementation")
            : std::string_view(report.reference_name);
        out << std::format("\n{} verification:\n", reference_name);

        const Option<bool> companion_passed = report.companion.has_value()
            ? Some(report.companion->check.AllMatch())
            : None<bool>();

        switch (report.outcome) {
            case VerificationOutcome::Match:
                out << std::format("  LXMF Address: {}\n", ToHex(*report.reference_address));
                out << std::format("\n{} SUCCESS: Addresses match! Implementation is compatible.\n", CHECK_MARK);
                if (companion_passed.has_value()) {
                    if (*companion_passed) {
                        out << std::format("{} .txt file verification also passed.\n", CHECK_MARK);
                    } else {
                        out << std::format("{} Warning: .txt file verification failed!\n", CROSS_MARK);
                    }
                }
                break;
            case VerificationOutcome::Mismatch:
                out << std::format("  LXMF Address: {}\n", ToHex(*report.reference_address));
                out << std::format("\n{} FAILURE: Addresses DO NOT match!\n", CROSS_MARK);
                out << std::format("  Expected: {}\n", ToHex(*report.reference_address));
                out << std::format("  Got:      {}\n", ToHex(report.derived.address));
                break;
            case VerificationOutcome::ReferenceUnavailable:
                out << "  Reference implementation not available\n";
                out << "  Cannot perform full verification, but manual calculation shown above.\n";
                if (companion_passed.has_value()) {
                    if (*companion_passed) {
                        out << std::format("{} .txt file verification passed.\n", CHECK_MARK);
                    } else {
                        out << std::format("{} .txt file verification failed!\n", CROSS_MARK);
                    }
                }
                break;
        }
    }

    void ReportPrinter::PrintFailure(
        std::ostream& out,
        const std::filesystem::path& path,
        const IdentityFailure& failure,
        const Option<std::uintmax_t> file_size) {
        if (failure.type != IdentityFailureType::InvalidLength) {
            out << std::format("Error: {}\n", failure.message);
            return;
        }
        PrintHeader(out);
        out << std::format("File: {}\n", path.string());
        if (file_size.has_value()) {
            out << std::format("Size: {} bytes\n", *file_size);
        }
        out << std::format("\n⚠️  WARNING: {}\n", failure.message);
        out << "This file may not be compatible with Reticulum!\n";
    }

    void ReportPrinter::PrintUsage(std::ostream& out, std::string_view program) {
        out << std::format("Usage: {} [--no-reference] [--no-companion] <identity_file>\n", program);
    }
}

/// \file pmd_report.hpp \brief Conversion of the PMD JSON report into
/// analyzer findings

#ifndef PMD_REPORT_HPP
#define PMD_REPORT_HPP

#include <nlohmann/json_fwd.hpp>

#include "commit_ir.hpp"

struct PmdReport {
    /// Violations keyed by the path relative to the analyzed root. Files
    /// without violations are not listed.
    ir::AnalysisReport findings;
    /// `{file, message}` pairs for the files PMD failed to process
    Vec<Pair<Str, Str>> processing_errors;
};

/// \brief Convert file name from the report into the path relative to the
/// \arg root. Names that are already relative are only normalized.
Str relative_report_path(CR<Str> filename, CR<Path> root);

/// \brief Parse the `-f json` PMD report. Throws `analysis_error` with
/// `MalformedReport` cause if the document does not have the expected
/// structure.
PmdReport parse_pmd_report(CR<nlohmann::json> report, CR<Path> root);

/// \brief Parse report text, see the `json` overload
PmdReport parse_pmd_report(CR<Str> text, CR<Path> root);

#endif // PMD_REPORT_HPP

#include "pmd_report.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

Str relative_report_path(CR<Str> filename, CR<Path> root) {
    Path file{filename};
    if (file.is_absolute()) {
        Path relative = file.lexically_relative(root.lexically_normal());
        if (!relative.empty() && *relative.begin() != "..") {
            return relative.generic_string();
        }
    }

    return file.lexically_normal().generic_string();
}

PmdReport parse_pmd_report(CR<json> report, CR<Path> root) {
    PmdReport result;
    try {
        for (const auto& file : report.at("files")) {
            Str   relpath = relative_report_path(
                file.at("filename").get<Str>(), root);
            auto& violations = result.findings[relpath];
            for (const auto& item : file.at("violations")) {
                violations.push_back(ir::Violation{
                    .rule     = item.at("rule").get<Str>(),
                    .ruleset  = item.value("ruleset", Str{}),
                    .priority = item.value("priority", 0),
                    .line     = item.value("beginline", 0),
                    .message  = item.value("description", Str{}),
                });
            }
        }

        if (report.contains("processingErrors")) {
            for (const auto& item : report["processingErrors"]) {
                result.processing_errors.push_back(
                    {relative_report_path(
                         item.value("filename", Str{}), root),
                     item.value("message", Str{})});
            }
        }
    } catch (json::exception& err) {
        throw analysis_error(
            ir::FailureCause::MalformedReport,
            fmt::format("Unexpected PMD report structure: {}", err.what()));
    }

    return result;
}

PmdReport parse_pmd_report(CR<Str> text, CR<Path> root) {
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (json::exception& err) {
        throw analysis_error(
            ir::FailureCause::MalformedReport,
            fmt::format("PMD report is not valid JSON: {}", err.what()));
    }

    return parse_pmd_report(parsed, root);
}

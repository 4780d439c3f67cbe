// ==============================================================================
// enforce.cpp - Команда enforce
// ==============================================================================

#include "repoguard/enforce.hpp"

#include "repoguard/config.hpp"
#include "repoguard/platform.hpp"
#include "repoguard/report.hpp"
#include "repoguard/scanner.hpp"

#include <string>

namespace repoguard::app {

int exit_code_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Config:
        return report::EXIT_USAGE;
    case ErrorKind::NotFound:
        return report::EXIT_NOT_FOUND;
    case ErrorKind::Read:
    case ErrorKind::Write:
        return report::EXIT_VIOLATIONS;
    }
    return report::EXIT_VIOLATIONS;
}

int run_enforce(const cli::EnforceCommand& cmd, output::Writer& writer) {
    try {
        // ConfigError проверяется до любого файлового I/O
        config::ScanConfig base = cmd.config_path.has_value()
                                      ? config::load_config_file(*cmd.config_path)
                                      : config::default_config();
        config::ScanConfig cfg = config::resolve(base, cmd.overrides);

        if (cmd.config_path.has_value()) {
            writer.debug("loaded configuration from " + platform::path_to_utf8(*cmd.config_path));
        }
        writer.debug(std::string("line endings target: ") +
                     config::line_ending_target_to_string(cfg.line_ending_target) +
                     (cfg.dry_run ? " (dry run)" : ""));

        platform::install_interrupt_handler();

        report::ScanReport result =
            scan::run_scan(cmd.folder, cfg, &platform::interrupt_flag(), &writer);

        for (const auto& warning : result.warnings) {
            writer.warn(warning.format());
        }
        if (result.summary.scanned == 0 && !result.interrupted) {
            writer.warn("No matching files were found in " + platform::path_to_utf8(cmd.folder));
        }

        report::print(result, cfg, writer, cmd.json);

        if (result.interrupted) {
            writer.warn("Scan interrupted, the report is partial");
        }
        return report::exit_status(result);
    } catch (const Exception& e) {
        writer.error(e.error().format());
        return exit_code_for(e.kind());
    }
}

}  // namespace repoguard::app

// dump-idents, utility to print the identifier occurrences of a source file as the identifier store sees them.
#include "canon/ErrorReporter.hpp"
#include "canon/IdentScanner.hpp"
#include "canon/IdentStore.hpp"
#include "canon/SourceFile.hpp"
#include "canon/StoreDumpJSON.hpp"

#include "fmt/format.h"
#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <iostream>
#include <memory>

DEFINE_string(sourceFile, "", "Path to the source code file to scan.");
DEFINE_bool(json, false, "Dump the identifier store as JSON instead of a table.");
DEFINE_bool(pretty, false, "Pretty-print the dumped JSON.");
DEFINE_string(logLevel, "warn", "Log level, one of trace, debug, info, warn, err, critical, off.");

int main(int argc, char* argv[]) {
    gflags::ParseCommandLineFlags(&argc, &argv, false);

    spdlog::set_level(spdlog::level::from_str(FLAGS_logLevel));

    if (FLAGS_sourceFile.empty()) {
        SPDLOG_ERROR("Missing required --sourceFile flag.");
        return -1;
    }

    canon::SourceFile sourceFile(FLAGS_sourceFile);
    if (!sourceFile.read()) {
        return -1;
    }
    SPDLOG_INFO("Read {} bytes from {}", sourceFile.size(), sourceFile.path());

    canon::IdentScanner scanner(sourceFile.codeView());
    if (!scanner.scan()) {
        return -1;
    }

    auto errorReporter = std::make_shared<canon::ErrorReporter>();
    errorReporter->setCode(sourceFile.codeView());
    canon::IdentStore store;
    for (const auto& span : scanner.spans()) {
        auto idx = store.insert(span.text, span.region, errorReporter.get());
        if (!idx.isValid()) {
            break;
        }
    }
    SPDLOG_INFO("Interned {} identifier occurrences, {} distinct, {} bytes of text", store.size(),
                store.interner().size(), store.interner().textBytes());

    if (FLAGS_json) {
        canon::StoreDumpJSON dumper;
        if (!dumper.dump(store, FLAGS_pretty)) {
            return -1;
        }
        std::cout << dumper.json() << std::endl;
    } else {
        for (uint32_t i = 0; i < store.size(); ++i) {
            auto idx = store.occurrence(i);
            auto region = store.regionOf(idx);
            std::cout << fmt::format("{:>6} {:>5}:{:<6} {}{}{} {}\n", idx.index(),
                                     errorReporter->getLineNumber(region.start), region.start,
                                     idx.isEffectful() ? 'e' : '-', idx.isIgnored() ? 'i' : '-',
                                     idx.isReassignable() ? 'r' : '-', store.textOf(idx));
        }
    }

    if (errorReporter->warningCount()) {
        SPDLOG_INFO("{} identifier style warnings", errorReporter->warningCount());
    }

    return errorReporter->ok() ? 0 : -1;
}

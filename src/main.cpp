#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "config.hpp"
#include "log.hpp"
#include "scanner.hpp"
#include "sinks/spool_sink.h"
#include "sinks/stream_sink.h"

using namespace winnow;

static void usage(const char* prog) {
    std::cerr << "usage: " << prog
              << " <file-or-dir> [output.wfp|-] [spool-dir]\n"
              << "  output.wfp  WFP output (default: stdout)\n"
              << "  spool-dir   also store each request batch there, LZ4 "
                 "compressed\n";
}

int main(int argc, char* argv[]) try {
    if (argc < 2 || argc > 4) {
        usage(argv[0]);
        return 1;
    }

    const fs::path scanRoot{argv[1]};
    const std::string outArg = argc > 2 ? argv[2] : "-";

    Config config;
    config.validate();

    std::ofstream outFile;
    if (outArg != "-") {
        outFile.open(outArg, std::ios::binary | std::ios::trunc);
        if (!outFile) {
            std::cerr << "Cannot open " << outArg << '\n';
            return 1;
        }
    }
    StreamSink stream(outArg == "-" ? std::cout : outFile);

    std::unique_ptr<SpoolSink> spool;
    if (argc > 3) spool = std::make_unique<SpoolSink>(fs::path{argv[3]}, true);

    Scanner scanner(config, [&](ScanRequestBatch&& batch) {
        stream.write(batch);
        if (spool) spool->write(batch);
    });

    const auto files = scanner.collect(scanRoot);
    logInfo("Fingerprinting ", files.size(), " file(s) under ",
            scanRoot.string(), "...");
    const ScanSummary summary = scanner.run(files);

    logInfo("Done: ", summary.fingerprinted, " fingerprinted, ",
            summary.tooSmall, " too small, ", summary.binary, " binary, ",
            summary.tooLarge, " too large, ", summary.failed.size(),
            " failed; ", summary.batches, " request batch(es) (",
            summary.failedBatches, " undelivered), ",
            stream.bytesWritten(), " bytes");
    for (const auto& path : summary.failed) logWarn("Not fingerprinted: ", path);
    for (const auto& path : summary.undelivered)
        logWarn("Fingerprinted but not written: ", path);

    return summary.failed.empty() && summary.undelivered.empty() ? 0 : 3;
}
catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 2;
}

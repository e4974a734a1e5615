/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "BinaryInspector.h"
#include <chrono>
#include <iomanip>
#include "ArchiveReader.h"
#include "BinExceptions.h"
#include "CorrelationReporter.h"
#include "ElfModelReader.h"
#include "FormatDetector.h"
#include "FormatNames.h"
#include "MachOReader.h"
#include "OffsetLocator.h"
#include "PatternSearch.h"
#include "PeReader.h"
#include "StructuralModelAdapter.h"
#include "ThreadPool.h"
#include "output/ReportPrinter.h"

using BinReaderExceptions::BinaryParsingError;

BinaryInspector::BinaryInspector(Config config, std::ostream& out)
    : config_(std::move(config)), out_(out) {}

std::optional<std::pair<std::string, std::vector<uint8_t>>> BinaryInspector::prepareNeedle(
    const Config& config) {
    if (config.searchText) {
        std::vector<uint8_t> needle = PatternSearch::fromText(*config.searchText);
        if (needle.empty()) {
            throw BinReaderExceptions::SearchPatternError("Search pattern must not be empty");
        }
        return std::make_pair(*config.searchText, std::move(needle));
    }
    if (config.searchHex) {
        return std::make_pair(*config.searchHex, PatternSearch::parseHexPattern(*config.searchHex));
    }
    return std::nullopt;
}

void BinaryInspector::analyze() {
    // Reject a bad pattern before producing any output
    needle_ = prepareNeedle(config_);

    FileAccessConfig access_config;
    access_config.mmap_threshold = config_.mmapThreshold;
    std::unique_ptr<FileAccessStrategy> file =
        FileAccessStrategy::create(config_.inputFile, access_config);

    if (config_.verbosity > 0) {
        std::cerr << "Loaded " << config_.inputFile << " (" << file->size() << " bytes) using "
                  << file->getStrategyName() << " access\n";
        if (config_.verbosity > 1) {
            std::cerr << file->getPerformanceMetrics() << "\n";
        }
    }

    const uint8_t* data = file->data();
    const size_t size = file->size();

    BinaryFormat format = FormatDetector::detect(data, size);
    if (config_.verbosity > 0) {
        std::cerr << "Detected format: " << FormatDetector::formatName(format) << "\n";
    }

    ReportPrinter::Options options;
    options.color = config_.color;
    options.pretty = config_.pretty;
    options.demangle = config_.demangle;
    ReportPrinter printer(out_, options);

    switch (format) {
        case BinaryFormat::Elf:
            inspectElf(data, size, printer);
            break;
        case BinaryFormat::MachO:
            inspectMachO(data, size, printer);
            break;
        case BinaryFormat::MachFat:
            inspectFat(data, size, printer);
            break;
        case BinaryFormat::PE:
            inspectPe(data, size, printer);
            break;
        case BinaryFormat::Archive:
            inspectArchive(data, size, printer);
            break;
        case BinaryFormat::Unknown:
            out_ << "unknown magic: 0x" << std::hex << FormatDetector::peekMagic(data, size)
                 << std::dec << "\n";
            break;
    }
}

// ============================================================================
// Per-format pipelines
// ============================================================================

void BinaryInspector::inspectElf(const uint8_t* data, size_t size, ReportPrinter& printer) {
    ElfModel model = ElfModelReader::read(data, size, config_.inputFile);
    std::vector<Range> ranges = ElfRangeAdapter(model).buildRanges();
    showRanges(ranges, printer);
    if (!config_.json) {
        printer.printElf(model);
    }
    finish(BinaryFormat::Elf, ranges, data, size, printer);
}

void BinaryInspector::inspectMachO(const uint8_t* data, size_t size, ReportPrinter& printer) {
    MachOModel model = MachOReader::read(data, size, config_.inputFile);
    reportWarnings(model.warnings);
    std::vector<Range> ranges = MachORangeAdapter(model).buildRanges();
    showRanges(ranges, printer);
    if (!config_.json) {
        printer.printMachO(model);
    }
    finish(BinaryFormat::MachO, ranges, data, size, printer);
}

void BinaryInspector::inspectFat(const uint8_t* data, size_t size, ReportPrinter& printer) {
    std::vector<MachOFatArch> arches = MachOReader::readFatArches(data, size, config_.inputFile);

    // Slice offsets are absolute, so one Range table covers the whole file
    std::vector<MachOModel> slices;
    std::vector<Range> ranges;
    for (size_t i = 0; i < arches.size(); ++i) {
        try {
            MachOModel slice = MachOReader::readSlice(data, size, arches[i], config_.inputFile);
            reportWarnings(slice.warnings);
            std::vector<Range> slice_ranges = MachORangeAdapter(slice).buildRanges();
            ranges.insert(ranges.end(), slice_ranges.begin(), slice_ranges.end());
            slices.push_back(std::move(slice));
        } catch (const BinaryParsingError& e) {
            std::cerr << "Error: fat slice " << i << " (" << MachONames::cpuType(arches[i].cputype)
                      << "): " << e.getDetailedMessage() << "\n";
        }
    }

    showRanges(ranges, printer);
    if (!config_.json) {
        printer.printFatArches(arches);
        for (const auto& slice : slices) {
            printer.printMachO(slice);
            out_ << "\n";
        }
    }
    finish(BinaryFormat::MachFat, ranges, data, size, printer);
}

void BinaryInspector::inspectPe(const uint8_t* data, size_t size, ReportPrinter& printer) {
    PeModel model = PeReader::read(data, size, config_.inputFile);
    std::vector<Range> ranges = EmptyRangeAdapter().buildRanges();
    showRanges(ranges, printer);
    if (!config_.json) {
        printer.printPe(model);
    }
    finish(BinaryFormat::PE, ranges, data, size, printer);
}

void BinaryInspector::inspectArchive(const uint8_t* data, size_t size, ReportPrinter& printer) {
    ArchiveModel model = ArchiveReader::read(data, size, config_.inputFile);
    std::vector<Range> ranges = EmptyRangeAdapter().buildRanges();
    showRanges(ranges, printer);
    if (!config_.json) {
        printer.printArchive(model);
    }
    finish(BinaryFormat::Archive, ranges, data, size, printer);
}

// ============================================================================
// Shared steps
// ============================================================================

void BinaryInspector::showRanges(const std::vector<Range>& ranges, ReportPrinter& printer) const {
    if (config_.verbosity > 0) {
        std::cerr << "Built " << ranges.size() << " ranges\n";
    }
    if (config_.debug && !config_.json) {
        printer.printRanges(ranges);
    }
}

void BinaryInspector::reportWarnings(const std::vector<std::string>& warnings) const {
    for (const auto& warning : warnings) {
        std::cerr << "Warning: " << warning << "\n";
    }
}

void BinaryInspector::finish(BinaryFormat format,
                             const std::vector<Range>& ranges,
                             const uint8_t* data,
                             size_t size,
                             ReportPrinter& printer) {
    std::vector<MatchReport> reports;
    if (needle_) {
        OffsetLocator locator(ranges);
        CorrelationReporter reporter(locator);
        auto start_time = std::chrono::steady_clock::now();

        if (config_.threadCount != 1) {
            ThreadPool pool(config_.threadCount);
            reports = reporter.correlate(data, size, needle_->second, &pool);
            if (config_.verbosity > 1) {
                const ThreadPoolMetrics& metrics = pool.getMetrics();
                std::cerr << "Search used " << pool.getThreadCount() << " threads, "
                          << metrics.tasks_completed.load() << " chunks, average "
                          << std::fixed << std::setprecision(1)
                          << metrics.getAverageExecutionTime() << " us per chunk\n";
            }
        } else {
            reports = reporter.correlate(data, size, needle_->second);
        }

        if (config_.verbosity > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start_time);
            std::cerr << "Search found " << reports.size() << " matches in " << elapsed.count()
                      << " us\n";
        }
    }

    if (config_.json) {
        std::optional<std::string> label;
        if (needle_) {
            label = needle_->first;
        }
        printer.printJson(config_.inputFile, format, ranges, label, reports);
    } else if (needle_) {
        printer.printMatches(needle_->first, reports);
    }
}

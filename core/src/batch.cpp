#include "mpkit/metadata/batch.hpp"
#include "mpkit/errors.hpp"
#include "mpkit/logging.hpp"

#include <hdf5.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

namespace mpkit {
namespace metadata {

namespace {

BatchResult failure(const std::string& path, ErrorKind kind, const std::string& message) {
    MPKIT_LOG_WARN("batch item failed", {stringField("path", path),
                                         stringField("kind", toString(kind)),
                                         stringField("error", message)});
    BatchResult result;
    result.path = path;
    result.error = kind;
    result.message = message;
    return result;
}

bool hdf5ThreadSafe() {
    hbool_t safe = 0;
    return H5is_library_threadsafe(&safe) >= 0 && safe;
}

} // namespace

BatchResult extractOne(const std::string& path, const BatchOptions& options) {
    const auto start = std::chrono::steady_clock::now();
    BatchResult result;
    try {
        result.path = path;
        if (options.extract_file) {
            result.record = options.extract_file(path, options.extractor);
        } else {
            MetadataExtractor extractor(options.extractor);
            result.record = extractor.extract(path);
        }
    } catch (const MPError& e) {
        return failure(path, e.kind(), e.what());
    } catch (const std::exception& e) {
        return failure(path, ErrorKind::INTERNAL, e.what());
    } catch (...) {
        return failure(path, ErrorKind::INTERNAL, "unknown exception");
    }

    if (options.per_file_timeout.count() > 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (elapsed > options.per_file_timeout) {
            return failure(path, ErrorKind::TIMEOUT,
                           "extraction took " + std::to_string(elapsed.count()) +
                               " ms, limit is " +
                               std::to_string(options.per_file_timeout.count()) + " ms");
        }
    }
    return result;
}

BatchExtraction::BatchExtraction(std::vector<std::string> paths, BatchOptions options)
    : paths_(std::move(paths)), options_(std::move(options)) {}

BatchResult BatchExtraction::at(Index index) const {
    if (index >= paths_.size()) {
        throw std::out_of_range("batch index " + std::to_string(index) + " out of range");
    }
    return extractOne(paths_[index], options_);
}

std::vector<BatchResult> BatchExtraction::collect() const {
    std::vector<BatchResult> results;
    results.reserve(paths_.size());
    for (const auto& result : *this) {
        results.push_back(result);
    }
    return results;
}

std::size_t effectiveConcurrency(const BatchOptions& options, std::size_t jobs) {
    std::size_t workers = options.concurrency;
    if (workers == 0) {
        workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }
    if (workers > 1 && !hdf5ThreadSafe()) {
        workers = 1;
    }
    return std::max<std::size_t>(1, std::min(workers, jobs));
}

std::vector<BatchResult> extractAllParallel(const std::vector<std::string>& paths,
                                            const BatchOptions& options) {
    std::vector<BatchResult> results(paths.size());
    if (paths.empty()) return results;

    const std::size_t requested = options.concurrency == 0
                                      ? std::max<std::size_t>(1, std::thread::hardware_concurrency())
                                      : options.concurrency;
    const std::size_t workers = effectiveConcurrency(options, paths.size());
    if (requested > 1 && workers == 1 && paths.size() > 1 && !hdf5ThreadSafe()) {
        MPKIT_LOG_WARN("HDF5 library is not thread-safe, extracting with one worker",
                       {intField("requested", static_cast<std::int64_t>(requested))});
    }

    // Workers claim the next unprocessed index; each slot is written once
    std::atomic<std::size_t> next{0};
    auto run = [&]() {
        for (std::size_t i = next++; i < paths.size(); i = next++) {
            results[i] = extractOne(paths[i], options);
        }
    };

    if (workers == 1) {
        run();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            threads.emplace_back(run);
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    const auto failed = std::count_if(results.begin(), results.end(),
                                      [](const BatchResult& r) { return !r.ok(); });
    MPKIT_LOG_INFO("batch finished", {intField("files", static_cast<std::int64_t>(paths.size())),
                                      intField("failed", static_cast<std::int64_t>(failed)),
                                      intField("workers", static_cast<std::int64_t>(workers))});
    return results;
}

} // namespace metadata
} // namespace mpkit

#pragma once

#include "extractor.hpp"
#include <chrono>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace mpkit {
namespace metadata {

/**
 * @brief Outcome of extracting one file of a batch.
 *
 * Holds either a record (error == ErrorKind::NONE) or the kind and message
 * of the error that stopped the extraction.
 */
struct BatchResult {
    std::string path;
    std::optional<MetadataRecord> record;
    ErrorKind error = ErrorKind::NONE;
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return error == ErrorKind::NONE; }
};

/**
 * @brief Options for batch extraction.
 */
struct BatchOptions {
    /// Options applied to every file
    ExtractorOptions extractor;

    /// Worker threads for extractAllParallel (0 = hardware concurrency)
    std::size_t concurrency = 0;

    /// Files taking longer are reported as ErrorKind::TIMEOUT (0 = no limit).
    /// Checked when the file finishes; extraction is not interrupted.
    std::chrono::milliseconds per_file_timeout{0};

    /// Replaces MetadataExtractor for each file when set (receives the
    /// path and the extractor options)
    std::function<MetadataRecord(const std::string&, const ExtractorOptions&)> extract_file;
};

/**
 * @brief Extract one file, converting every failure into a result.
 */
BatchResult extractOne(const std::string& path, const BatchOptions& options = {});

/**
 * @brief Lazy sequence of batch results, one per input path.
 *
 * Files are processed in input order as the sequence is iterated; one
 * failing file never stops the others. Iterating again re-reads the files.
 *
 * Usage:
 * @code
 * for (const BatchResult& result : extractAll(paths)) {
 *     if (!result.ok()) std::cerr << result.path << ": " << result.message << "\n";
 * }
 * @endcode
 */
class BatchExtraction {
public:
    /// Input iterator; extracts the file on first dereference
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = BatchResult;
        using difference_type = std::ptrdiff_t;
        using pointer = const BatchResult*;
        using reference = const BatchResult&;

        Iterator() = default;
        Iterator(const BatchExtraction* batch, Index index) : batch_(batch), index_(index) {}

        reference operator*() const {
            if (!current_) current_ = batch_->at(index_);
            return *current_;
        }
        pointer operator->() const { return &**this; }

        Iterator& operator++() {
            ++index_;
            current_.reset();
            return *this;
        }

        bool operator==(const Iterator& other) const { return index_ == other.index_; }
        bool operator!=(const Iterator& other) const { return index_ != other.index_; }

    private:
        const BatchExtraction* batch_ = nullptr;
        Index index_ = 0;
        mutable std::optional<BatchResult> current_;
    };

    BatchExtraction(std::vector<std::string> paths, BatchOptions options = {});

    [[nodiscard]] const std::vector<std::string>& paths() const noexcept { return paths_; }
    [[nodiscard]] const BatchOptions& options() const noexcept { return options_; }
    [[nodiscard]] std::size_t size() const noexcept { return paths_.size(); }
    [[nodiscard]] bool empty() const noexcept { return paths_.empty(); }

    /**
     * @brief Extract the file at one position.
     *
     * @throws std::out_of_range if index >= size()
     */
    [[nodiscard]] BatchResult at(Index index) const;

    /// Extract every file, sequentially
    [[nodiscard]] std::vector<BatchResult> collect() const;

    [[nodiscard]] Iterator begin() const { return Iterator(this, 0); }
    [[nodiscard]] Iterator end() const { return Iterator(this, paths_.size()); }

private:
    std::vector<std::string> paths_;
    BatchOptions options_;
};

/**
 * @brief Lazy, sequential extraction of many files.
 */
inline BatchExtraction extractAll(std::vector<std::string> paths,
                                  const ExtractorOptions& options = {}) {
    BatchOptions batch;
    batch.extractor = options;
    return BatchExtraction(std::move(paths), std::move(batch));
}

/**
 * @brief Extract many files with a bounded pool of worker threads.
 *
 * Each file is opened and extracted by a single worker. Results are in
 * input order. Falls back to one worker when the HDF5 library was built
 * without thread safety.
 *
 * @param paths Files to extract
 * @param options Batch options
 * @return One result per path
 */
std::vector<BatchResult> extractAllParallel(const std::vector<std::string>& paths,
                                            const BatchOptions& options = {});

/// Number of workers extractAllParallel would use for the given options
std::size_t effectiveConcurrency(const BatchOptions& options, std::size_t jobs);

} // namespace metadata
} // namespace mpkit

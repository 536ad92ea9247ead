#pragma once

#include "pngshot/convert.h"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

/**
 * \file batch.h
 * \brief Directory mode: recursive input discovery, output naming and
 * sequential conversion with a per-item summary.
 */

namespace pngshot {

/// Output directory name used when none is given.
inline constexpr const char* kDefaultBatchOutputDir = "ios_output";

/// True for `.png`, `.jpg` and `.jpeg` in all-lower or all-upper case.
bool
is_supported_image_name(const std::string& path) noexcept;

/**
 * \brief Lists supported images under \p dir, recursively, sorted by path.
 *
 * \p exclude_dir (if non-empty and inside \p dir) is not descended into.
 * Unreadable subdirectories are skipped.
 */
std::vector<std::string>
collect_image_files(const std::string& dir, const std::string& exclude_dir);

/// Batch file name for \p input: JPEG inputs become `<stem>.png`, others
/// keep their basename.
std::string
batch_output_filename(const std::string& input);

/**
 * \brief Hands out unique file names within one output directory.
 *
 * The first request for `name.ext` gets it unchanged; later ones get
 * `name_1.ext`, `name_2.ext`, ... skipping any name already handed out.
 */
class OutputNameAllocator final {
public:
    std::string allocate(const std::string& filename);

private:
    std::set<std::string> used_;
};

struct BatchOptions final {
    /// Per-file settings. `convert.log.verbosity` is capped at Summary for
    /// items; batch lines and the tally honor it as given.
    ConvertOptions convert;

    /// Output directory; empty selects `<dir>/ios_output`.
    std::string output_dir;
};

struct BatchSummary final {
    uint32_t total     = 0;
    uint32_t succeeded = 0;
    uint32_t failed    = 0;
    /// False when the output directory could not be created.
    bool output_dir_ok = true;
};

/**
 * \brief Converts every supported image under \p dir into one flat output
 * directory.
 *
 * Items run sequentially. A failing item is reported and counted; it never
 * stops the batch.
 */
BatchSummary
convert_directory(const std::string& dir, const BatchOptions& options);

}  // namespace pngshot

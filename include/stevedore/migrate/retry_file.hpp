/**
 * @file retry_file.hpp
 * @brief Save and reload work a run did not finish
 *
 * One item per line, whitespace separated; '#' starts a comment.
 *
 *   lifecycle <n> <lo> <hi> <copy_lo> <copy_hi> <phase> <a> <b> <timeout_ms> <escalations>
 *   copy <from> <to> <key> <lo> <hi> <timeout_ms> <escalations>
 *   table <create|drop> <parent|n> <timeout_ms> <escalations>
 *
 * For bulk-copy phases <a> <b> are cursor and batch; for build-index <a>
 * is the index ordinal. Reloaded items get a fresh retry budget and keep
 * the deadline they had reached.
 */

#pragma once

#include <fstream>
#include <string>
#include <vector>

#include "stevedore/error.hpp"
#include "stevedore/logging.hpp"
#include "stevedore/migrate/bulk_copy.hpp"
#include "stevedore/migrate/lifecycle.hpp"
#include "stevedore/migrate/tables.hpp"

namespace stevedore::migrate {

std::string format_item(const LifecycleItem& item);
std::string format_item(const CopyItem& item);
std::string format_item(const TableItem& item);

// Throws IOError if the file cannot be written.
template<typename Item>
void save_retry_file(const std::string& path, const std::vector<Item>& items) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw IOError("cannot write retry file " + path, "save_retry_file", ErrorCode::FILE_NOT_FOUND);
    }
    out << "# stevedore retry file: " << items.size() << " item(s)\n";
    for (const auto& item : items) {
        out << format_item(item) << "\n";
    }
    out.flush();
    if (!out) {
        throw IOError("failed writing retry file " + path, "save_retry_file", ErrorCode::INTERNAL_ERROR);
    }
    LOG_INFO("Saved ", items.size(), " item(s) to ", path);
}

// Each loader throws IOError (FILE_NOT_FOUND or PARSE_FAILED, naming the line).
std::vector<LifecycleItem> load_lifecycle_items(const std::string& path, const PartitionLifecycle& lifecycle);

std::vector<CopyItem> load_copy_items(const std::string& path, const pool::RetryPolicy& policy);

std::vector<TableItem> load_table_items(const std::string& path, const db::PartitionSchema& schema,
                                        const pool::RetryPolicy& policy);

} // namespace stevedore::migrate

#ifndef LEDGER_ATOMIC_FILE_HPP_
#define LEDGER_ATOMIC_FILE_HPP_

#include <filesystem>
#include <optional>
#include <string>

namespace ledger {
namespace storage {

/**
 * Creates the parent directory of `file` if it does not exist.
 */
bool ensureParentDirectory(const std::filesystem::path& file);

/**
 * Temp file used while replacing `dest`: "<dest>.tmp" in the same directory.
 */
std::filesystem::path tempPathFor(const std::filesystem::path& dest);

/**
 * Replaces `dest` with `content` so that readers see either the old or the
 * new file, never a partial one.
 *
 * The content is written and fsynced to tempPathFor(dest), then renamed
 * over `dest`. If the rename fails the temp file is copied over `dest` and
 * removed. On failure the temp file is removed (when this call created it),
 * `dest` is left as it was, and false is returned. `label` names the file
 * in log output.
 */
bool writeFileAtomically(const std::filesystem::path& dest, const std::string& content,
                         const std::string& label);

/**
 * Whole file contents, or nullopt when the file is missing or unreadable.
 */
std::optional<std::string> readFile(const std::filesystem::path& path);

}  // namespace storage
}  // namespace ledger

#endif  // LEDGER_ATOMIC_FILE_HPP_

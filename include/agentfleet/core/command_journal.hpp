#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include "agentfleet/core/command.hpp"
#include "agentfleet/utils/result.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief Append-only file of saved commands, one JSON object per line.
 *
 * A line is either complete or absent: a failed append cuts the file back to
 * its previous size, and a torn final line left by a crash is dropped on
 * replay and cut off by open().
 */
class CommandJournal {
public:
    explicit CommandJournal(std::string path);
    ~CommandJournal();

    // Prevent copying
    CommandJournal(const CommandJournal&) = delete;
    CommandJournal& operator=(const CommandJournal&) = delete;

    /**
     * @brief Reads back every command already in the file.
     *
     * A missing file yields an empty list. A last line without a trailing
     * newline is a torn write and is skipped with a warning.
     *
     * @return StorageError naming the first corrupt line
     */
    Result<std::vector<Command>> replay() const;

    /**
     * @brief Cuts off any torn final line and opens the file for appending.
     *
     * Called once after replay().
     */
    Result<void> open();

    /**
     * @brief Appends and flushes one command.
     *
     * If the write fails and the file cannot be cut back to its previous size,
     * the journal refuses every later append.
     */
    Result<void> append(const Command& command);

    const std::string& path() const { return path_; }

private:
    // Caller holds mutex_.
    void rollBack(std::uintmax_t size);

    std::string path_;
    std::ofstream out_;
    bool failed_{false};
    std::mutex mutex_;
};

} // namespace core
} // namespace agentfleet

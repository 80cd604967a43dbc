#include "agentfleet/core/command_journal.hpp"
#include "agentfleet/utils/logging.hpp"
#include <filesystem>

namespace agentfleet {
namespace core {

namespace {
    // Length of the file up to and including its last newline.
    Result<std::uintmax_t> completeLinesSize(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Error(ErrorCode::StorageError, "cannot open command journal " + path);
        }
        in.seekg(0, std::ios::end);
        std::streamoff pos = in.tellg();
        char c = 0;
        while (pos > 0) {
            in.seekg(pos - 1);
            if (!in.get(c)) {
                return Error(ErrorCode::StorageError, "failed reading command journal " + path);
            }
            if (c == '\n') {
                break;
            }
            --pos;
        }
        return static_cast<std::uintmax_t>(pos);
    }
}

CommandJournal::CommandJournal(std::string path) : path_(std::move(path)) {}

CommandJournal::~CommandJournal() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

Result<std::vector<Command>> CommandJournal::replay() const {
    std::vector<Command> commands;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return commands;
    }

    std::ifstream in(path_);
    if (!in) {
        return Error(ErrorCode::StorageError, "cannot open command journal " + path_);
    }

    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (in.eof()) {
            // Every append ends with a newline, so this line was never completed.
            if (!line.empty()) {
                AGENTFLEET_LOG_WARN("ignoring torn line {} at the end of command journal {}",
                                    lineNumber, path_);
            }
            break;
        }
        if (line.empty()) {
            continue;
        }
        nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded()) {
            return Error(ErrorCode::StorageError,
                         "corrupt command journal " + path_ + " at line " + std::to_string(lineNumber));
        }
        auto command = commandFromJson(j);
        if (command.has_error()) {
            return Error(ErrorCode::StorageError,
                         "invalid command in journal " + path_ + " at line " +
                         std::to_string(lineNumber) + ": " + command.error().message);
        }
        commands.push_back(std::move(command.value()));
    }
    if (in.bad()) {
        return Error(ErrorCode::StorageError, "failed reading command journal " + path_);
    }

    AGENTFLEET_LOG_INFO("replayed {} commands from {}", commands.size(), path_);
    return commands;
}

Result<void> CommandJournal::open() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (std::filesystem::exists(path_, ec)) {
        auto size = std::filesystem::file_size(path_, ec);
        if (ec) {
            return Error(ErrorCode::StorageError, "cannot stat command journal " + path_ + ": " + ec.message());
        }
        auto complete = completeLinesSize(path_);
        if (complete.has_error()) {
            return complete.error();
        }
        if (complete.value() < size) {
            AGENTFLEET_LOG_WARN("cutting {} bytes of torn data from command journal {}",
                                size - complete.value(), path_);
            std::filesystem::resize_file(path_, complete.value(), ec);
            if (ec) {
                return Error(ErrorCode::StorageError,
                             "cannot truncate command journal " + path_ + ": " + ec.message());
            }
        }
    }

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        return Error(ErrorCode::StorageError, "cannot open command journal " + path_ + " for append");
    }
    return Result<void>();
}

Result<void> CommandJournal::append(const Command& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_) {
        return Error(ErrorCode::StorageError,
                     "command journal " + path_ + " is unusable after a failed write");
    }
    if (!out_.is_open()) {
        return Error(ErrorCode::StorageError, "command journal " + path_ + " is not open");
    }

    std::string line;
    try {
        line = commandToJson(command).dump();
    } catch (const nlohmann::json::type_error& e) {
        return Error(ErrorCode::StorageError, std::string("cannot serialize command: ") + e.what());
    }

    std::error_code ec;
    auto before = std::filesystem::file_size(path_, ec);
    if (ec) {
        return Error(ErrorCode::StorageError, "cannot stat command journal " + path_ + ": " + ec.message());
    }

    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        rollBack(before);
        return Error(ErrorCode::StorageError, "failed to append to command journal " + path_);
    }
    return Result<void>();
}

void CommandJournal::rollBack(std::uintmax_t size) {
    // Closing flushes whatever is still buffered; the resize below discards it too.
    out_.close();

    std::error_code ec;
    std::filesystem::resize_file(path_, size, ec);
    if (!ec) {
        out_.clear();
        out_.open(path_, std::ios::out | std::ios::app);
    }
    if (ec || !out_) {
        failed_ = true;
        AGENTFLEET_LOG_CRITICAL("command journal {} could not be restored after a failed write{}{}",
                                path_, ec ? ": " : "", ec ? ec.message() : std::string());
        return;
    }
    AGENTFLEET_LOG_WARN("rolled command journal {} back to {} bytes after a failed write", path_, size);
}

} // namespace core
} // namespace agentfleet

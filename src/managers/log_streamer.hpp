#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <ssh/expect.hpp>
#include "connection_pool.hpp"
#include "log_entry.hpp"

namespace fs = std::filesystem;

struct LineBatch {
    std::string host;
    std::vector<std::string> lines;
};

// Unbounded FIFO of batches. Once closed, pop drains what is left and then
// reports end of stream.
class LineBatchQueue {
public:
    void push(LineBatch batch);
    void close();
    bool closed() const;

    // True with a batch in out. False on timeout or when closed and drained;
    // check closed() to tell them apart.
    bool pop(LineBatch& out, std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<LineBatch> batches_;
    bool closed_ = false;
};

struct CaptureOptions {
    bool follow = true;
    std::vector<std::string> filter_patterns;
    std::vector<std::string> exclude_patterns;
    std::size_t buffer_size = DEFAULT_CAPTURE_BUFFER_BYTES;
    double flush_interval = DEFAULT_CAPTURE_FLUSH_SECS;
    int poll_ms = CAPTURE_POLL_MS;

    // Local copy of emitted lines; empty disables it.
    fs::path output_dir;
    std::size_t max_file_size = DEFAULT_CAPTURE_MAX_FILE;
    int rotation_count = DEFAULT_CAPTURE_ROTATIONS;
    bool compression = true;

    static CaptureOptions from_config(const Config& config);
};

// Keeps exclude-matching lines out, then (when any are set) lets through
// only lines matching a filter pattern.
class LineFilter {
public:
    LineFilter(const std::vector<std::string>& filter_patterns,
               const std::vector<std::string>& exclude_patterns);

    bool accepts(const std::string& line) const;

private:
    std::vector<Pattern> filters_;
    std::vector<Pattern> excludes_;
};

// Appends lines to <dir>/<host>.log, rotating at max_size into
// <host>.log.1 .. <host>.log.N (".gz" when compressing).
class CaptureFile {
public:
    CaptureFile(fs::path dir, const std::string& host, std::size_t max_size,
                int rotation_count, bool compress);

    void append(const std::vector<std::string>& lines);
    const fs::path& path() const { return path_; }

private:
    fs::path dir_;
    fs::path path_;
    std::size_t max_size_;
    int rotation_count_;
    bool compress_;
    std::ofstream out_;
    std::size_t size_ = 0;

    fs::path rotated_path(int n) const;
    void open();
    void rotate();
};

struct CaptureStats {
    uint64_t bytes_read = 0;
    uint64_t lines_read = 0;
    uint64_t lines_emitted = 0;
    uint64_t lines_filtered = 0;
    uint64_t batches = 0;
    uint64_t rotations = 0;
};

// Remote commands the capture loop issues.
std::string capture_stat_command(const std::string& path);
std::string capture_read_command(const std::string& path, uint64_t offset, uint64_t length);

class LogStreamer;

// Tail state for one host's file. Produced batches arrive on queue().
class CaptureSession {
    struct Token { explicit Token() = default; };

public:
    // Only LogStreamer can build a Token.
    CaptureSession(Token, std::string host, std::string path, ConnectionLease lease,
                   CaptureOptions options);
    ~CaptureSession();

    const std::string& host() const { return host_; }
    const std::string& path() const { return path_; }
    std::shared_ptr<LineBatchQueue> queue() const { return queue_; }

    CaptureStats stats() const;
    bool running() const { return running_.load(); }

    // Set when the capture ended on its own because of an error.
    std::string error() const;
    ErrorKind error_kind() const;

private:
    friend class LogStreamer;

    std::string host_;
    std::string path_;
    ConnectionLease lease_;
    CaptureOptions options_;
    LineFilter filter_;
    std::unique_ptr<CaptureFile> file_;
    std::shared_ptr<LineBatchQueue> queue_ = std::make_shared<LineBatchQueue>();

    // Position in the remote file.
    uint64_t inode_ = 0;
    bool have_inode_ = false;
    uint64_t offset_ = 0;
    std::string carry_;

    // Accepted lines not yet handed to the queue.
    std::vector<std::string> pending_;
    std::size_t pending_bytes_ = 0;
    std::chrono::steady_clock::time_point last_flush_;
    bool missing_logged_ = false;

    mutable std::mutex mutex_;          // stats_, error_, stop_requested_
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;
    std::once_flag stop_once_;
    std::atomic<bool> running_{false};
    CaptureStats stats_;
    std::string error_;
    ErrorKind error_kind_ = ErrorKind::None;
    std::thread thread_;

    // Sees every accepted batch before it is queued.
    std::function<void(const std::string& host, const std::string& path,
                       const std::vector<std::string>& lines)> on_flush_;

    void run();
    bool poll_once(bool& finished);
    void maybe_flush();
    void accept_data(const std::string& data);
    void take_line(std::string line);
    void flush();
    void fail(const std::string& error, ErrorKind kind);
    bool wait_for_stop(std::chrono::milliseconds d);
};

struct LogStatistics {
    int active_captures = 0;
    uint64_t total_lines = 0;
    std::vector<std::string> hosts;
    std::map<std::string, uint64_t> entries_by_host;
    std::map<std::string, uint64_t> entries_by_level;
    std::size_t buffered = 0;
};

// Starts and stops CaptureSessions and reports on the live ones. Every
// accepted line is parsed into a LogEntry and kept in a bounded buffer of
// the most recent entries across all captures.
class LogStreamer {
public:
    explicit LogStreamer(std::size_t recent_capacity = DEFAULT_RECENT_LOG_ENTRIES);
    ~LogStreamer();

    std::shared_ptr<CaptureSession> start_capture(const std::string& host, ConnectionLease lease,
                                                  const std::string& path,
                                                  const CaptureOptions& options);

    // Signal, join, flush, close the queue, then release the connection.
    // Idempotent and safe from any thread.
    void stop_capture(CaptureSession& session);

    void stop_all();

    LogStatistics statistics() const;

    // The last count entries, oldest first. The host and level forms filter
    // before counting; level is matched case-insensitively.
    std::vector<LogEntry> recent(std::size_t count = 100) const;
    std::vector<LogEntry> logs_by_host(const std::string& host, std::size_t count = 100) const;
    std::vector<LogEntry> logs_by_level(const std::string& level, std::size_t count = 100) const;

    // Write the buffered entries, narrowed to hosts and levels when given.
    Result<void> export_logs(const fs::path& path, LogExportFormat format,
                             const std::vector<std::string>& hosts = {},
                             const std::vector<std::string>& levels = {}) const;

    void clear_recent();

    // Parse and buffer lines as a capture would.
    void remember(const std::string& host, const std::string& path,
                  const std::vector<std::string>& lines);

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<CaptureSession>> sessions_;
    uint64_t retired_lines_ = 0;

    mutable std::mutex entries_mutex_;
    std::size_t recent_capacity_;
    std::deque<LogEntry> recent_;
    std::map<std::string, uint64_t> entries_by_host_;
    std::map<std::string, uint64_t> entries_by_level_;

    template <typename Pred>
    std::vector<LogEntry> last_matching(std::size_t count, Pred pred) const;
};

#include "log_streamer.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/archive.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <limits>
#include <sstream>

// ── LineBatchQueue ─────────────────────────────────────────

void LineBatchQueue::push(LineBatch batch) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        batches_.push_back(std::move(batch));
    }
    cv_.notify_one();
}

void LineBatchQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool LineBatchQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool LineBatchQueue::pop(LineBatch& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return closed_ || !batches_.empty(); });
    if (batches_.empty()) return false;
    out = std::move(batches_.front());
    batches_.pop_front();
    return true;
}

// ── Options / filter ───────────────────────────────────────

CaptureOptions CaptureOptions::from_config(const Config& config) {
    const auto& lc = config.log_capture();
    CaptureOptions o;
    o.buffer_size = lc.buffer_size;
    o.flush_interval = lc.flush_interval;
    o.max_file_size = lc.max_file_size;
    o.rotation_count = lc.rotation_count;
    o.compression = lc.compression;
    return o;
}

LineFilter::LineFilter(const std::vector<std::string>& filter_patterns,
                       const std::vector<std::string>& exclude_patterns) {
    for (const auto& p : filter_patterns) filters_.emplace_back(p);
    for (const auto& p : exclude_patterns) excludes_.emplace_back(p);
}

bool LineFilter::accepts(const std::string& line) const {
    for (const auto& p : excludes_) {
        if (p.found_in(line)) return false;
    }
    if (filters_.empty()) return true;
    for (const auto& p : filters_) {
        if (p.found_in(line)) return true;
    }
    return false;
}

// ── CaptureFile ────────────────────────────────────────────

CaptureFile::CaptureFile(fs::path dir, const std::string& host, std::size_t max_size,
                         int rotation_count, bool compress)
    : dir_(std::move(dir)),
      max_size_(max_size),
      rotation_count_(rotation_count),
      compress_(compress) {
    fs::create_directories(dir_);
    path_ = dir_ / (host + ".log");
    open();
}

fs::path CaptureFile::rotated_path(int n) const {
    std::string name = path_.filename().string() + "." + std::to_string(n);
    if (compress_) name += ".gz";
    return dir_ / name;
}

void CaptureFile::open() {
    out_.open(path_, std::ios::app | std::ios::binary);
    if (!out_) throw std::runtime_error("Cannot open capture file " + path_.string());
    std::error_code ec;
    auto existing = fs::file_size(path_, ec);
    size_ = ec ? 0 : static_cast<std::size_t>(existing);
}

void CaptureFile::append(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        out_ << line << '\n';
        size_ += line.size() + 1;
        if (max_size_ > 0 && size_ >= max_size_) {
            out_.flush();
            rotate();
        }
    }
    out_.flush();
}

void CaptureFile::rotate() {
    out_.close();
    std::error_code ec;

    if (rotation_count_ <= 0) {
        fs::remove(path_, ec);
        open();
        return;
    }

    fs::remove(rotated_path(rotation_count_), ec);
    for (int i = rotation_count_ - 1; i >= 1; --i) {
        if (fs::exists(rotated_path(i))) {
            fs::rename(rotated_path(i), rotated_path(i + 1), ec);
        }
    }

    bool moved = false;
    if (compress_) {
        auto gz = platform::gzip_file(path_, rotated_path(1));
        if (gz.is_ok()) {
            fs::remove(path_, ec);
            moved = true;
        } else {
            fs::remove(rotated_path(1), ec);
            fs::path plain = dir_ / (path_.filename().string() + ".1");
            fleetrun_log(fmt::format("Capture file {}: compression failed ({}), kept as {}",
                                     path_.string(), gz.error, plain.string()));
            fs::rename(path_, plain, ec);
            moved = true;
        }
    }
    if (!moved) fs::rename(path_, rotated_path(1), ec);
    fleetrun_log(fmt::format("Capture file {} rotated", path_.string()));
    open();
}

// ── Remote commands ────────────────────────────────────────

std::string capture_stat_command(const std::string& path) {
    return fmt::format("stat -L -c '%i %s' {} 2>/dev/null", shell_quote(path));
}

std::string capture_read_command(const std::string& path, uint64_t offset, uint64_t length) {
    return fmt::format("tail -c +{} {} 2>/dev/null | head -c {}",
                       offset + 1, shell_quote(path), length);
}

// ── CaptureSession ─────────────────────────────────────────

CaptureSession::CaptureSession(Token, std::string host, std::string path, ConnectionLease lease,
                               CaptureOptions options)
    : host_(std::move(host)),
      path_(std::move(path)),
      lease_(std::move(lease)),
      options_(std::move(options)),
      filter_(options_.filter_patterns, options_.exclude_patterns) {
    if (!options_.output_dir.empty()) {
        file_ = std::make_unique<CaptureFile>(options_.output_dir, host_, options_.max_file_size,
                                              options_.rotation_count, options_.compression);
    }
}

CaptureSession::~CaptureSession() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

CaptureStats CaptureSession::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::string CaptureSession::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

ErrorKind CaptureSession::error_kind() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_kind_;
}

bool CaptureSession::wait_for_stop(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(mutex_);
    stop_cv_.wait_for(lock, d, [&] { return stop_requested_; });
    return stop_requested_;
}

void CaptureSession::fail(const std::string& error, ErrorKind kind) {
    fleetrun_log(fmt::format("Capture {}:{} stopped: {}", host_, path_, error));
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = error;
    error_kind_ = kind;
}

void CaptureSession::run() {
    last_flush_ = std::chrono::steady_clock::now();
    fleetrun_log(fmt::format("Capture {}:{} started (follow={})", host_, path_, options_.follow));

    while (!wait_for_stop(std::chrono::milliseconds(0))) {
        bool finished = false;
        if (!poll_once(finished)) {
            lease_.mark_unhealthy();
            break;
        }
        maybe_flush();
        if (finished) break;
        if (wait_for_stop(std::chrono::milliseconds(options_.poll_ms))) break;
    }

    flush();
    queue_->close();
    running_ = false;
    fleetrun_log(fmt::format("Capture {}:{} finished", host_, path_));
}

bool CaptureSession::poll_once(bool& finished) {
    auto& session = lease_.session();

    SSHResult st = session.exec(capture_stat_command(path_));
    if (st.kind != ErrorKind::None) {
        fail(st.get_output().empty() ? "stat failed" : st.get_output(), st.kind);
        return false;
    }

    uint64_t inode = 0, size = 0;
    std::istringstream iss(st.stdout_data);
    if (st.exit_code != 0 || !(iss >> inode >> size)) {
        if (!options_.follow) {
            fail("No such file: " + path_, ErrorKind::CommandFailed);
            return false;
        }
        if (!missing_logged_) {
            fleetrun_log(fmt::format("Capture {}:{} file missing, waiting", host_, path_));
            missing_logged_ = true;
        }
        return true;
    }
    missing_logged_ = false;

    if (have_inode_ && (inode != inode_ || size < offset_)) {
        fleetrun_log(fmt::format("Capture {}:{} rotated or truncated (inode {} -> {}, size {} < {})",
                                 host_, path_, inode_, inode, size, offset_));
        offset_ = 0;
        carry_.clear();
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.rotations++;
    }
    inode_ = inode;
    have_inode_ = true;

    if (size > offset_) {
        SSHResult rd = session.exec(capture_read_command(path_, offset_, size - offset_));
        if (rd.kind != ErrorKind::None) {
            fail(rd.get_output().empty() ? "read failed" : rd.get_output(), rd.kind);
            return false;
        }
        if (rd.exit_code == 0 && !rd.stdout_data.empty()) {
            offset_ += rd.stdout_data.size();
            accept_data(rd.stdout_data);
        }
    }

    if (!options_.follow && offset_ >= size) {
        if (!carry_.empty()) {
            take_line(std::move(carry_));
            carry_.clear();
        }
        finished = true;
    }
    return true;
}

void CaptureSession::accept_data(const std::string& data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.bytes_read += data.size();
    }
    carry_ += data;

    size_t start = 0;
    size_t nl;
    while ((nl = carry_.find('\n', start)) != std::string::npos) {
        std::string line = carry_.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        take_line(std::move(line));
        start = nl + 1;
    }
    carry_.erase(0, start);
}

void CaptureSession::take_line(std::string line) {
    bool accepted = filter_.accepts(line);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.lines_read++;
        if (accepted) stats_.lines_emitted++;
        else stats_.lines_filtered++;
    }
    if (!accepted) return;

    pending_bytes_ += line.size() + 1;
    pending_.push_back(std::move(line));
    if (pending_bytes_ >= options_.buffer_size) flush();
}

void CaptureSession::maybe_flush() {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - last_flush_);
    if (elapsed.count() >= options_.flush_interval) flush();
}

void CaptureSession::flush() {
    last_flush_ = std::chrono::steady_clock::now();
    if (pending_.empty()) return;

    if (file_) {
        try {
            file_->append(pending_);
        } catch (const std::exception& e) {
            fleetrun_log(fmt::format("Capture {}: local file disabled: {}", host_, e.what()));
            file_.reset();
        }
    }

    if (on_flush_) on_flush_(host_, path_, pending_);
    queue_->push(LineBatch{host_, std::move(pending_)});
    pending_.clear();
    pending_bytes_ = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.batches++;
}

// ── LogStreamer ────────────────────────────────────────────

LogStreamer::LogStreamer(std::size_t recent_capacity)
    : recent_capacity_(std::max<std::size_t>(1, recent_capacity)) {}

LogStreamer::~LogStreamer() {
    stop_all();
}

std::shared_ptr<CaptureSession> LogStreamer::start_capture(const std::string& host,
                                                           ConnectionLease lease,
                                                           const std::string& path,
                                                           const CaptureOptions& options) {
    auto session = std::make_shared<CaptureSession>(CaptureSession::Token{}, host, path,
                                                    std::move(lease), options);
    session->on_flush_ = [this](const std::string& h, const std::string& p,
                                const std::vector<std::string>& lines) { remember(h, p, lines); };
    session->running_ = true;
    session->thread_ = std::thread(&CaptureSession::run, session.get());

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.push_back(session);
    return session;
}

void LogStreamer::stop_capture(CaptureSession& session) {
    std::call_once(session.stop_once_, [&] {
        {
            std::lock_guard<std::mutex> lock(session.mutex_);
            session.stop_requested_ = true;
        }
        session.stop_cv_.notify_all();
        if (session.thread_.joinable()) session.thread_.join();
        session.lease_.release();
    });

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(sessions_.begin(), sessions_.end(),
                           [&](const std::shared_ptr<CaptureSession>& s) { return s.get() == &session; });
    if (it != sessions_.end()) {
        retired_lines_ += (*it)->stats().lines_emitted;
        sessions_.erase(it);
    }
}

void LogStreamer::stop_all() {
    std::vector<std::shared_ptr<CaptureSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions = sessions_;
    }
    for (auto& s : sessions) stop_capture(*s);
}

LogStatistics LogStreamer::statistics() const {
    LogStatistics stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.total_lines = retired_lines_;
        for (const auto& s : sessions_) {
            stats.total_lines += s->stats().lines_emitted;
            if (s->running()) {
                stats.active_captures++;
                stats.hosts.push_back(s->host());
            }
        }
    }
    std::lock_guard<std::mutex> lock(entries_mutex_);
    stats.entries_by_host = entries_by_host_;
    stats.entries_by_level = entries_by_level_;
    stats.buffered = recent_.size();
    return stats;
}

// ── Parsed entries ─────────────────────────────────────────

void LogStreamer::remember(const std::string& host, const std::string& path,
                           const std::vector<std::string>& lines) {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    for (const auto& line : lines) {
        LogEntry e = parse_log_entry(host, line, path);
        entries_by_host_[e.host]++;
        entries_by_level_[e.level]++;
        recent_.push_back(std::move(e));
        if (recent_.size() > recent_capacity_) recent_.pop_front();
    }
}

template <typename Pred>
std::vector<LogEntry> LogStreamer::last_matching(std::size_t count, Pred pred) const {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    std::vector<LogEntry> out;
    for (auto it = recent_.rbegin(); it != recent_.rend() && out.size() < count; ++it) {
        if (pred(*it)) out.push_back(*it);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<LogEntry> LogStreamer::recent(std::size_t count) const {
    return last_matching(count, [](const LogEntry&) { return true; });
}

std::vector<LogEntry> LogStreamer::logs_by_host(const std::string& host, std::size_t count) const {
    return last_matching(count, [&](const LogEntry& e) { return e.host == host; });
}

std::vector<LogEntry> LogStreamer::logs_by_level(const std::string& level, std::size_t count) const {
    std::string wanted = to_upper(level);
    return last_matching(count, [&](const LogEntry& e) { return e.level == wanted; });
}

Result<void> LogStreamer::export_logs(const fs::path& path, LogExportFormat format,
                                      const std::vector<std::string>& hosts,
                                      const std::vector<std::string>& levels) const {
    std::vector<std::string> wanted_levels;
    for (const auto& l : levels) wanted_levels.push_back(to_upper(l));

    auto selected = last_matching(std::numeric_limits<std::size_t>::max(), [&](const LogEntry& e) {
        if (!hosts.empty() && std::find(hosts.begin(), hosts.end(), e.host) == hosts.end()) return false;
        if (!wanted_levels.empty() &&
            std::find(wanted_levels.begin(), wanted_levels.end(), e.level) == wanted_levels.end()) {
            return false;
        }
        return true;
    });
    return write_log_entries(selected, format, path);
}

void LogStreamer::clear_recent() {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    recent_.clear();
}

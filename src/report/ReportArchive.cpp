/**
 * @file ReportArchive.cpp
 * @brief Report artifact storage and paged reads
 */

#include <tether/report/ReportArchive.hpp>

#include <tether/core/Error.hpp>
#include <tether/io/LogService.hpp>
#include <tether/session/Session.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <random>
#include <regex>
#include <sstream>

namespace tether {

namespace fs = std::filesystem;

namespace {

std::string ReadWholeFile(const std::string &path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ReportError::FileNotFound(path);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ReportError::FileNotFound(path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/// Split keeping each line's terminator so a window can be rejoined verbatim
std::vector<std::string> SplitKeepingNewlines(const std::string &text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        const auto end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start + 1));
        start = end + 1;
    }
    return lines;
}

} // namespace

ReportArchive::ReportArchive(EnvelopeConfig config) : config_(std::move(config)) {
    auto errors = config_.Validate();
    if (!errors.empty()) {
        std::string joined;
        for (const auto &e : errors) {
            joined += (joined.empty() ? "" : "; ") + e;
        }
        throw ConfigError(joined);
    }
}

fs::path ReportArchive::Prepare() {
    const fs::path dir(config_.reports_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw IOError("create directory", dir.string(), ec.message());
    }
    (void)Cleanup();
    return dir;
}

std::size_t ReportArchive::Cleanup() {
    const fs::path dir(config_.reports_dir);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return 0;
    }

    const auto max_age = std::chrono::duration_cast<fs::file_time_type::duration>(
        std::chrono::duration<double, std::ratio<3600>>(config_.report_cache_hours));
    const auto cutoff = fs::file_time_type::clock::now() - max_age;

    std::size_t removed = 0;
    for (const auto &entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".txt") {
            continue;
        }
        const auto mtime = entry.last_write_time(ec);
        if (ec || mtime >= cutoff) {
            continue;
        }
        const auto stem = entry.path().stem().string();
        if (!fs::remove(entry.path(), ec)) {
            GetLogService().Debug("could not remove expired report " + entry.path().string());
            continue;
        }
        ++removed;

        const auto underscore = stem.rfind('_');
        if (underscore != std::string::npos) {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            cache_.erase(stem.substr(underscore + 1));
        }
    }
    if (removed > 0) {
        GetLogService().Debug("removed " + std::to_string(removed) + " expired report(s)");
    }
    return removed;
}

std::string ReportArchive::NewReportId() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist;
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", dist(rng));
    return buf;
}

fs::path ReportArchive::ReportPath(const std::string &kind, const std::string &id) const {
    return fs::path(config_.reports_dir) / (kind + "_" + id + ".txt");
}

ReportRecord ReportArchive::Store(const std::string &id, const fs::path &path,
                                  const std::string &kind, const std::string &text) {
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IOError("open for writing", path.string(), "cannot create file");
        }
        out << text;
        if (!out) {
            throw IOError("write", path.string(), "short write");
        }
    }

    ReportRecord record;
    record.id = id;
    record.path = path.string();
    record.kind = kind;
    record.created = std::chrono::system_clock::now();
    record.size_bytes = text.size();
    record.line_count = CountLines(text);

    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_[id] = record;
    return record;
}

FullReport ReportArchive::GenerateFullReport(Session &session, const std::string &command,
                                             const std::string &kind,
                                             const std::optional<std::string> &destination,
                                             std::optional<std::chrono::milliseconds> timeout) {
    LogContextManager::ScopedContext ctx("report");

    const auto id = NewReportId();
    fs::path path;
    if (destination && !destination->empty()) {
        path = *destination;
        if (path.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(path.parent_path(), ec);
        }
    } else {
        Prepare();
        path = ReportPath(kind, id);
    }

    FullReport result;
    result.transaction = session.Execute(command, timeout);
    if (!result.transaction.Ok()) {
        GetLogService().Warning(std::string("report command did not complete cleanly (") +
                                CompletionKindName(result.transaction.completion) + ")");
        return result;
    }

    result.record = Store(id, path, kind, result.transaction.raw);
    GetLogService().Info("wrote " + std::to_string(result.record->size_bytes) + " bytes to " +
                         result.record->path);
    return result;
}

Envelope ReportArchive::Wrap(const std::string &content, std::size_t max_chars,
                             const std::string &kind) {
    auto envelope = MakeEnvelope(content, max_chars);
    if (!envelope.truncated) {
        return envelope;
    }
    Prepare();
    const auto id = NewReportId();
    envelope.artifact_path = Store(id, ReportPath(kind, id), kind, content).path;
    return envelope;
}

ReportRecord ReportArchive::Register(const std::string &path, const std::string &kind) {
    const auto text = ReadWholeFile(path);
    ReportRecord record;
    record.id = NewReportId();
    record.path = path;
    record.kind = kind;
    record.created = std::chrono::system_clock::now();
    record.size_bytes = text.size();
    record.line_count = CountLines(text);

    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_[record.id] = record;
    return record;
}

std::optional<ReportRecord> ReportArchive::Find(const std::string &id) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_.find(id);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ReportArchive::Resolve(const std::string &id) const {
    if (auto record = Find(id)) {
        return record->path;
    }

    const std::string suffix = "_" + id + ".txt";
    std::error_code ec;
    const fs::path dir(config_.reports_dir);
    if (fs::is_directory(dir, ec)) {
        for (const auto &entry : fs::directory_iterator(dir, ec)) {
            const auto name = entry.path().filename().string();
            if (name.size() > suffix.size() &&
                name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
                return entry.path().string();
            }
        }
    }
    throw ReportError::FileNotFound("report id " + id);
}

ReportSection ReportArchive::ReadReportSection(const std::string &path, std::size_t offset,
                                               std::size_t length) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ReportError::FileNotFound(path);
    }
    const auto total = static_cast<std::size_t>(fs::file_size(path, ec));
    if (ec) {
        throw ReportError::FileNotFound(path);
    }
    if (offset > total) {
        throw ReportError::RangeOutOfBounds(offset, total);
    }

    ReportSection section;
    section.path = path;
    section.offset = offset;
    section.total_length = total;

    // Only the requested window is read
    const std::size_t wanted = std::min(length, total - offset);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ReportError::FileNotFound(path);
    }
    in.seekg(static_cast<std::streamoff>(offset));
    section.content.resize(wanted);
    in.read(section.content.data(), static_cast<std::streamsize>(wanted));
    section.content.resize(static_cast<std::size_t>(in.gcount()));
    return section;
}

ReportLines ReportArchive::ReadReportLines(const std::string &path, std::size_t start_line,
                                           std::size_t num_lines,
                                           const std::optional<std::string> &search_pattern) {
    const auto lines = SplitKeepingNewlines(ReadWholeFile(path));

    ReportLines result;
    result.path = path;
    result.total_lines = lines.size();

    if (search_pattern && !search_pattern->empty()) {
        std::regex re;
        try {
            re = std::regex(*search_pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error &e) {
            throw ConfigError("invalid search pattern '" + *search_pattern + "': " + e.what());
        }

        result.pattern_found = false;
        for (std::size_t i = 0; i < lines.size(); ++i) {
            std::string line = lines[i];
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
                line.pop_back();
            }
            if (std::regex_search(line, re)) {
                const std::size_t before = num_lines / 4;
                start_line = i + 1 > before ? i + 1 - before : 1;
                result.pattern_found = true;
                break;
            }
        }
        if (!result.pattern_found) {
            return result;
        }
    }

    const std::size_t start_idx = start_line > 0 ? start_line - 1 : 0;
    const std::size_t end_idx = start_idx < lines.size()
                                    ? start_idx + std::min(num_lines, lines.size() - start_idx)
                                    : lines.size();

    result.start_line = start_idx + 1;
    result.end_line = end_idx;
    for (std::size_t i = start_idx; i < end_idx; ++i) {
        result.content += lines[i];
    }
    result.returned_lines = end_idx > start_idx ? end_idx - start_idx : 0;
    return result;
}

} // namespace tether

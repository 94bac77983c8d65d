#include "output_pipeline.hpp"
#include "progress_markers.hpp"
#include "job_log.hpp"
#include <core/utils.hpp>
#include <core/constants.hpp>
#include <filesystem>

// ── LineSplitter ───────────────────────────────────────────

// Cut point at or below `limit` that does not split a UTF-8 sequence.
static size_t utf8_cut(const std::string& s, size_t limit) {
    size_t cut = limit;
    for (int back = 0; back < 3 && cut > 0; ++back) {
        auto u = static_cast<unsigned char>(s[cut]);
        if ((u & 0xC0) != 0x80) break;
        --cut;
    }
    return cut > 0 ? cut : limit;
}

std::vector<std::string> LineSplitter::feed(const std::string& chunk) {
    std::vector<std::string> lines;
    pending_ += chunk;

    size_t start = 0;
    size_t nl;
    while ((nl = pending_.find('\n', start)) != std::string::npos) {
        lines.push_back(sanitize_utf8(pending_.substr(start, nl - start)));
        start = nl + 1;
    }
    pending_.erase(0, start);

    // No newline in sight (e.g. a \r-only progress bar): emit what we have
    while (pending_.size() > MAX_OUTPUT_LINE) {
        size_t cut = utf8_cut(pending_, MAX_OUTPUT_LINE);
        lines.push_back(sanitize_utf8(pending_.substr(0, cut)));
        pending_.erase(0, cut);
    }
    return lines;
}

bool LineSplitter::flush(std::string& line) {
    if (pending_.empty()) return false;
    line = sanitize_utf8(pending_);
    pending_.clear();
    return true;
}

// ── OutputPipeline ─────────────────────────────────────────

OutputPipeline::OutputPipeline(Job& job) : job_(job) {}

bool OutputPipeline::open_transcript() {
    std::filesystem::path path(job_.log_path());
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    auto opened = transcript_.open(path.string());
    if (opened.is_err()) {
        jobcast_log(fmt::format("pipeline {}: {}", job_.id(), opened.error));
        return false;
    }
    return true;
}

void OutputPipeline::process_line(const std::string& line) {
    if (transcript_.is_open() && !transcript_.write(line + '\n')) {
        jobcast_log(fmt::format("pipeline {}: transcript write failed, closing it", job_.id()));
        transcript_.close();
    }

    job_.append_line(line);

    if (auto marker = parse_progress_marker(line)) {
        job_.set_progress(marker->percent, marker->step);
    }
    if (is_done_marker(line)) {
        job_.mark_completed_marker();
    }
}

int OutputPipeline::run(platform::ProcessHandle& proc) {
    LineSplitter splitter;
    std::string chunk;
    while (proc.read_output(chunk)) {
        for (const auto& line : splitter.feed(chunk)) {
            process_line(line);
        }
    }
    std::string tail;
    if (splitter.flush(tail)) {
        process_line(tail);
    }

    int rc = proc.wait();
    job_.finish(rc);
    jobcast_log(fmt::format("pipeline {}: exited rc={}", job_.id(), rc));
    return rc;
}
